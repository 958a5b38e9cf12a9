/**
 * @file FactCandidate.hpp
 * @brief Typed observation produced from one grid cell by one engine.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/StatementType.hpp"

namespace finfacts::domain {

/**
 * @enum MatchMethod
 * @brief How the row label was mapped to a metric code.
 */
enum class MatchMethod {
    Exact,
    Pattern,
    BackgroundCode,
    Unmatched
};

inline std::string MatchMethodToString(MatchMethod method) {
    switch (method) {
        case MatchMethod::Exact: return "exact";
        case MatchMethod::Pattern: return "pattern";
        case MatchMethod::BackgroundCode: return "background_code";
        default: return "unmatched";
    }
}

inline MatchMethod MatchMethodFromString(const std::string& value) {
    if (value == "exact") return MatchMethod::Exact;
    if (value == "pattern") return MatchMethod::Pattern;
    if (value == "background_code") return MatchMethod::BackgroundCode;
    return MatchMethod::Unmatched;
}

/**
 * @struct PeriodDescriptor
 * @brief Stock facts use asOf; flow facts use [periodStart, periodEnd]. Dates are ISO (YYYY-MM-DD).
 */
struct PeriodDescriptor {
    FactType factType = FactType::Flow;
    std::string asOf;
    std::string periodStart;
    std::string periodEnd;
    int fiscalYear = 0;
    std::string label;      ///< Period vocabulary it was derived from ("current", "prior", "2024").

    /** @brief The date the fact is attributed to for consistency grouping. */
    const std::string& anchorDate() const {
        return factType == FactType::Stock ? asOf : periodEnd;
    }

    /** @brief Canonical textual form used in group keys. */
    std::string key() const {
        if (factType == FactType::Stock) return asOf;
        return periodStart + ".." + periodEnd;
    }

    bool operator==(const PeriodDescriptor& other) const {
        return factType == other.factType && asOf == other.asOf &&
               periodStart == other.periodStart && periodEnd == other.periodEnd;
    }
};

/**
 * @class FactCandidate
 * @brief All candidates are retained for audit, including unparseable and unmatched ones.
 */
class FactCandidate {
public:
    std::string candidateId;
    std::string versionId;
    std::string reportId;
    std::string metricCode;         ///< Canonical code, or raw_<hash> when unmatched.
    bool matched = false;
    MatchMethod matchMethod = MatchMethod::Unmatched;
    StatementType statementType = StatementType::Unknown;
    std::string rawLabel;
    std::string rawValue;
    std::optional<double> value;    ///< Empty when parsing failed.
    std::string unit;               ///< Normalized unit word, e.g. "yuan", "10k_yuan".
    std::string currency;           ///< ISO code, e.g. "CNY".
    std::string scope;              ///< "consolidated" or "parent".
    PeriodDescriptor period;
    std::string engine;
    int sourcePage = 0;
    int tableIndex = 0;
    int columnIndex = 0;            ///< 1-based data column.
    std::string columnLabel;
    double quality = 0.0;

    bool parseFailed() const { return !value.has_value(); }
};

} // namespace finfacts::domain
