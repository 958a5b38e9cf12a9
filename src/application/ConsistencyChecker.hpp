/**
 * @file ConsistencyChecker.hpp
 * @brief Evaluates accounting identities over resolved facts per (scope, date, currency).
 */

#pragma once

#include <vector>

#include "application/PipelineConfig.hpp"
#include "domain/ConsistencyCheckResult.hpp"
#include "domain/ResolvedFact.hpp"

namespace finfacts::application {

/**
 * @class ConsistencyChecker
 * @brief Results are derived on demand and never block ingestion.
 */
class ConsistencyChecker {
public:
    explicit ConsistencyChecker(ConsistencySettings settings,
                                std::vector<domain::IdentityDefinition> identities = DefaultIdentities());

    /**
     * @brief Cash flow, cash roll-forward, balance sheet and net profit identities.
     */
    static std::vector<domain::IdentityDefinition> DefaultIdentities();

    /**
     * @brief Checks every identity whose left side and required terms are present.
     * Values are scaled to base units before comparison.
     */
    std::vector<domain::ConsistencyCheckResult> check(const std::vector<domain::ResolvedFact>& facts) const;

    bool withinTolerance(double lhs, double rhs) const;

private:
    ConsistencySettings m_settings;
    std::vector<domain::IdentityDefinition> m_identities;
};

} // namespace finfacts::application
