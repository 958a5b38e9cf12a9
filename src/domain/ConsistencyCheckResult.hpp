/**
 * @file ConsistencyCheckResult.hpp
 * @brief One evaluated accounting identity. Derived, never a primary entity.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace finfacts::domain {

/**
 * @struct IdentityTerm
 * @brief A signed addend of an identity's right-hand side.
 */
struct IdentityTerm {
    std::string metricCode;
    double sign = 1.0;
    bool optional = false;
};

/**
 * @struct IdentityDefinition
 * @brief lhs = sum(sign * term). Optional terms drop out when absent.
 */
struct IdentityDefinition {
    std::string name;
    std::string lhs;
    std::vector<IdentityTerm> terms;
    std::vector<std::pair<std::string, std::string>> termFallbacks; ///< (metric, substitute used when metric is absent)
};

struct ConsistencyCheckResult {
    std::string name;
    std::string scope;
    std::string date;
    std::string currency;
    std::string formula;        ///< The formula variant actually evaluated.
    double lhs = 0.0;
    double rhs = 0.0;
    double residual = 0.0;      ///< lhs - rhs, in base units.
    bool passed = false;
};

} // namespace finfacts::domain
