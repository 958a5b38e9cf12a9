/**
 * @file ConsistencyChecker.cpp
 * @brief Implementation of ConsistencyChecker.
 */

#include "application/ConsistencyChecker.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <tuple>

#include "domain/FactGroup.hpp"

namespace finfacts::application {

using domain::ConsistencyCheckResult;
using domain::IdentityDefinition;
using domain::ResolutionStatus;
using domain::ResolvedFact;

namespace {

bool CarriesValue(const ResolvedFact& fact) {
    if (!fact.value) return false;
    return fact.status == ResolutionStatus::AutoAgreed || fact.status == ResolutionStatus::AutoSingleEngine ||
           fact.status == ResolutionStatus::Verified;
}

using PartitionKey = std::tuple<std::string, std::string, std::string>;   // scope, date, currency

} // namespace

ConsistencyChecker::ConsistencyChecker(ConsistencySettings settings, std::vector<IdentityDefinition> identities)
    : m_settings(settings), m_identities(std::move(identities)) {}

std::vector<IdentityDefinition> ConsistencyChecker::DefaultIdentities() {
    std::vector<IdentityDefinition> identities;

    IdentityDefinition cashFlow;
    cashFlow.name = "cash_flow_identity";
    cashFlow.lhs = "net_cash_increase";
    cashFlow.terms = {
        {"net_cash_flow_operating", 1.0, false},
        {"net_cash_flow_investing", 1.0, false},
        {"net_cash_flow_financing", 1.0, false},
        {"fx_effect_on_cash", 1.0, true},
    };
    identities.push_back(cashFlow);

    IdentityDefinition cashRoll;
    cashRoll.name = "cash_balance_roll";
    cashRoll.lhs = "cash_end";
    cashRoll.terms = {
        {"cash_begin", 1.0, false},
        {"net_cash_increase", 1.0, false},
    };
    identities.push_back(cashRoll);

    IdentityDefinition balance;
    balance.name = "balance_sheet_identity";
    balance.lhs = "total_assets";
    balance.terms = {
        {"total_liabilities", 1.0, false},
        {"total_equity", 1.0, false},
    };
    balance.termFallbacks = {{"total_equity", "total_equity_parent"}};
    identities.push_back(balance);

    IdentityDefinition balanceTotal;
    balanceTotal.name = "assets_equal_liabilities_and_equity_total";
    balanceTotal.lhs = "total_assets";
    balanceTotal.terms = {{"total_liabilities_equity", 1.0, false}};
    identities.push_back(balanceTotal);

    IdentityDefinition netProfit;
    netProfit.name = "net_profit_identity";
    netProfit.lhs = "net_profit";
    netProfit.terms = {
        {"total_profit", 1.0, false},
        {"income_tax", -1.0, false},
    };
    identities.push_back(netProfit);

    return identities;
}

bool ConsistencyChecker::withinTolerance(double lhs, double rhs) const {
    double allowed = std::max(m_settings.absTolerance, m_settings.relTolerance * std::max(std::fabs(lhs), std::fabs(rhs)));
    return std::fabs(lhs - rhs) <= allowed;
}

std::vector<ConsistencyCheckResult> ConsistencyChecker::check(const std::vector<ResolvedFact>& facts) const {
    std::map<PartitionKey, std::map<std::string, double>> partitions;
    for (const auto& fact : facts) {
        if (!CarriesValue(fact)) continue;
        PartitionKey key{fact.scope, fact.period.anchorDate(), fact.currency};
        auto& values = partitions[key];
        // First value per metric wins; facts arrive sorted by group key.
        values.emplace(fact.metricCode, *fact.value * domain::UnitMultiplier(fact.unit));
    }

    std::vector<ConsistencyCheckResult> results;
    for (const auto& [key, values] : partitions) {
        for (const auto& identity : m_identities) {
            auto lhsIt = values.find(identity.lhs);
            if (lhsIt == values.end()) continue;

            double rhs = 0.0;
            std::string formula = identity.lhs + " =";
            bool complete = true;
            bool first = true;
            for (const auto& term : identity.terms) {
                std::string metric = term.metricCode;
                auto it = values.find(metric);
                if (it == values.end()) {
                    for (const auto& [original, substitute] : identity.termFallbacks) {
                        if (original != metric) continue;
                        it = values.find(substitute);
                        metric = substitute;
                        break;
                    }
                }
                if (it == values.end()) {
                    if (term.optional) continue;
                    complete = false;
                    break;
                }
                rhs += term.sign * it->second;
                if (first) {
                    formula += (term.sign < 0 ? " -" : "") + std::string(" ") + metric;
                } else {
                    formula += (term.sign < 0 ? " - " : " + ") + metric;
                }
                first = false;
            }
            if (!complete) continue;

            ConsistencyCheckResult result;
            result.name = identity.name;
            result.scope = std::get<0>(key);
            result.date = std::get<1>(key);
            result.currency = std::get<2>(key);
            result.formula = formula;
            result.lhs = lhsIt->second;
            result.rhs = rhs;
            result.residual = result.lhs - result.rhs;
            result.passed = withinTolerance(result.lhs, result.rhs);
            results.push_back(result);
        }
    }
    return results;
}

} // namespace finfacts::application
