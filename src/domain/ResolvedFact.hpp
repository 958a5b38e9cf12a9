/**
 * @file ResolvedFact.hpp
 * @brief Canonical output per fact group and the resolution state machine.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/FactCandidate.hpp"

namespace finfacts::domain {

/**
 * @enum ResolutionStatus
 * @brief Unresolved groups become Verified through manual review; Verified is terminal.
 */
enum class ResolutionStatus {
    AutoAgreed,         ///< Every contributing engine supports the canonical value.
    AutoSingleEngine,   ///< Only one engine contributed.
    Unresolved,         ///< Engines disagree beyond tolerance.
    Verified            ///< Manually resolved.
};

enum class ResolutionMethod {
    Consensus,
    Manual
};

inline std::string ResolutionStatusToString(ResolutionStatus status) {
    switch (status) {
        case ResolutionStatus::AutoAgreed: return "auto_agreed";
        case ResolutionStatus::AutoSingleEngine: return "auto_single_engine";
        case ResolutionStatus::Unresolved: return "unresolved";
        case ResolutionStatus::Verified: return "verified";
        default: return "unresolved";
    }
}

inline ResolutionStatus ResolutionStatusFromString(const std::string& value) {
    if (value == "auto_agreed") return ResolutionStatus::AutoAgreed;
    if (value == "auto_single_engine") return ResolutionStatus::AutoSingleEngine;
    if (value == "verified") return ResolutionStatus::Verified;
    return ResolutionStatus::Unresolved;
}

inline std::string ResolutionMethodToString(ResolutionMethod method) {
    return method == ResolutionMethod::Manual ? "manual" : "consensus";
}

inline ResolutionMethod ResolutionMethodFromString(const std::string& value) {
    return value == "manual" ? ResolutionMethod::Manual : ResolutionMethod::Consensus;
}

/**
 * @brief Checks whether a manual resolution may be applied to a group in this state.
 * Re-submitting against a verified group overwrites the previous manual choice.
 */
inline bool AcceptsManualResolution(ResolutionStatus current) {
    return current == ResolutionStatus::Unresolved || current == ResolutionStatus::Verified;
}

/**
 * @brief Whether an automatic run may overwrite an existing stored resolution.
 */
inline bool AutomaticRunMayOverwrite(ResolutionStatus existing, bool rerunVerified) {
    return existing != ResolutionStatus::Verified || rerunVerified;
}

/**
 * @struct ReviewMetadata
 */
struct ReviewMetadata {
    std::string reviewer;
    std::string reviewedAt;     ///< ISO-8601 UTC.
    std::string notes;
};

/**
 * @class ResolvedFact
 * @brief consensusStatus keeps what automatic consensus concluded, even after verification.
 */
class ResolvedFact {
public:
    std::string groupKey;
    std::string metricCode;
    StatementType statementType = StatementType::Unknown;
    FactType factType = FactType::Flow;
    PeriodDescriptor period;
    std::string scope;
    std::string currency;
    std::string unit;
    std::optional<double> value;
    std::string selectedCandidateId;
    ResolutionStatus status = ResolutionStatus::Unresolved;
    ResolutionStatus consensusStatus = ResolutionStatus::Unresolved;
    ResolutionMethod method = ResolutionMethod::Consensus;
    int engineCount = 0;
    std::vector<std::string> candidateIds;
    std::optional<ReviewMetadata> review;

    bool hasValue() const { return value.has_value(); }
    bool isDiscrepancy() const { return consensusStatus == ResolutionStatus::Unresolved; }
};

} // namespace finfacts::domain
