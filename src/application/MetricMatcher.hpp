/**
 * @file MetricMatcher.hpp
 * @brief Maps free-text row labels to canonical metric codes.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "application/PipelineConfig.hpp"
#include "domain/FactCandidate.hpp"
#include "domain/MetricDictionary.hpp"
#include "domain/TableGrid.hpp"

namespace finfacts::application {

/**
 * @struct MatchResult
 */
struct MatchResult {
    std::string metricCode;     ///< Canonical code, or raw_<hash> when unmatched.
    bool matched = false;
    domain::MatchMethod method = domain::MatchMethod::Unmatched;
    domain::StatementType statementType = domain::StatementType::Unknown;
    std::string normalizedLabel;
};

/**
 * @class MetricMatcher
 * @brief Exact match first, then a constrained prefix/suffix match for long labels only.
 *
 * Labels at or below the short-label threshold only ever match exactly, and no
 * stage uses substring containment, so distinct line items are not collapsed.
 */
class MetricMatcher {
public:
    MetricMatcher(domain::MetricDictionaryPtr dictionary, const MatchingSettings& settings);

    /**
     * @param rawLabel The row label as printed.
     * @param context Statement type of the enclosing table (may be Unknown).
     * @param sectionCode Optional background-rule code routing the row to a statement.
     */
    MatchResult match(const std::string& rawLabel,
                      domain::StatementType context,
                      const std::optional<std::string>& sectionCode = std::nullopt) const;

    /** @brief Statement type from caption keywords or a bracketed section code. */
    domain::StatementType detectStatementType(const std::string& caption) const;

    /** @brief Majority statement type among exactly-matched labels; Unknown on a tie. */
    domain::StatementType inferDominantStatementType(const std::vector<std::string>& labels) const;

    /** @brief Sets the table's statement type from its context, else from its rows. */
    void annotate(domain::RawTableCandidate& table) const;

    const domain::MetricDictionary& dictionary() const { return *m_dictionary; }

    static std::string RawCode(domain::StatementType type, const std::string& normalizedLabel);

private:
    std::optional<std::string> pick(const std::vector<std::string>& codes,
                                    domain::StatementType rowType,
                                    bool routedByRule,
                                    bool ratioLabel) const;

    std::vector<std::string> affixMatches(const std::string& normalizedLabel) const;

    domain::MetricDictionaryPtr m_dictionary;
    std::vector<std::string> m_prefixes;
    std::vector<std::string> m_suffixes;
};

} // namespace finfacts::application
