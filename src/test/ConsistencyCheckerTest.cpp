#include <cassert>
#include <cmath>
#include <iostream>

#include "application/ConsistencyChecker.hpp"

using namespace finfacts::domain;
using namespace finfacts::application;

namespace {

ResolvedFact Stock(const std::string& metric, double value, const std::string& unit = "yuan",
                   const std::string& scope = "consolidated") {
    ResolvedFact fact;
    fact.metricCode = metric;
    fact.factType = FactType::Stock;
    fact.statementType = StatementType::Balance;
    fact.period.factType = FactType::Stock;
    fact.period.asOf = "2023-12-31";
    fact.scope = scope;
    fact.currency = "CNY";
    fact.unit = unit;
    fact.value = value;
    fact.status = ResolutionStatus::AutoAgreed;
    fact.groupKey = metric + "|stock|2023-12-31|" + scope + "|CNY|" + unit;
    return fact;
}

ResolvedFact Flow(const std::string& metric, double value) {
    ResolvedFact fact;
    fact.metricCode = metric;
    fact.factType = FactType::Flow;
    fact.period.factType = FactType::Flow;
    fact.period.periodStart = "2023-01-01";
    fact.period.periodEnd = "2023-12-31";
    fact.scope = "consolidated";
    fact.currency = "CNY";
    fact.unit = "yuan";
    fact.value = value;
    fact.status = ResolutionStatus::AutoSingleEngine;
    fact.groupKey = metric + "|flow|2023-01-01..2023-12-31|consolidated|CNY|yuan";
    return fact;
}

const ConsistencyCheckResult* Find(const std::vector<ConsistencyCheckResult>& results, const std::string& name,
                                   const std::string& scope = "consolidated") {
    for (const auto& result : results) {
        if (result.name == name && result.scope == scope) return &result;
    }
    return nullptr;
}

void TestBalanceSheetIdentity(const ConsistencyChecker& checker) {
    auto results = checker.check({Stock("total_assets", 1000), Stock("total_liabilities", 600), Stock("total_equity", 400),
                                  Stock("total_liabilities_equity", 1000)});
    const auto* balance = Find(results, "balance_sheet_identity");
    assert(balance && balance->passed);
    assert(balance->formula == "total_assets = total_liabilities + total_equity");
    assert(balance->date == "2023-12-31" && balance->currency == "CNY");
    const auto* total = Find(results, "assets_equal_liabilities_and_equity_total");
    assert(total && total->passed);
    std::cout << "[PASS] Balance sheet identity holds." << std::endl;
}

void TestEquityFallback(const ConsistencyChecker& checker) {
    auto results = checker.check({Stock("total_assets", 1000), Stock("total_liabilities", 600),
                                  Stock("total_equity_parent", 390)});
    const auto* balance = Find(results, "balance_sheet_identity");
    assert(balance && !balance->passed);
    assert(balance->formula.find("total_equity_parent") != std::string::npos);
    assert(std::fabs(balance->residual - 10.0) < 1e-9);
    std::cout << "[PASS] Parent equity substitutes for missing total equity." << std::endl;
}

void TestCashFlowIdentities(const ConsistencyChecker& checker) {
    auto results = checker.check({Flow("net_cash_flow_operating", 100), Flow("net_cash_flow_investing", -30),
                                  Flow("net_cash_flow_financing", -20), Flow("net_cash_increase", 50),
                                  Flow("cash_begin", 200), Flow("cash_end", 250)});
    const auto* cash = Find(results, "cash_flow_identity");
    assert(cash && cash->passed);
    assert(cash->formula.find("fx_effect_on_cash") == std::string::npos);
    const auto* roll = Find(results, "cash_balance_roll");
    assert(roll && roll->passed);

    auto withFx = checker.check({Flow("net_cash_flow_operating", 100), Flow("net_cash_flow_investing", -30),
                                 Flow("net_cash_flow_financing", -20), Flow("fx_effect_on_cash", 5),
                                 Flow("net_cash_increase", 50)});
    const auto* fx = Find(withFx, "cash_flow_identity");
    assert(fx && !fx->passed && std::fabs(fx->residual + 5.0) < 1e-9);
    std::cout << "[PASS] Cash flow identities with optional FX effect." << std::endl;
}

void TestMissingTermsAndUnresolved(const ConsistencyChecker& checker) {
    auto missing = checker.check({Stock("total_assets", 1000), Stock("total_liabilities", 600)});
    assert(Find(missing, "balance_sheet_identity") == nullptr);

    auto netProfit = Flow("net_profit", 100);
    netProfit.status = ResolutionStatus::Unresolved;
    auto results = checker.check({netProfit, Flow("total_profit", 120), Flow("income_tax", 20)});
    assert(Find(results, "net_profit_identity") == nullptr);

    netProfit.status = ResolutionStatus::Verified;
    auto verified = checker.check({netProfit, Flow("total_profit", 120), Flow("income_tax", 20)});
    const auto* identity = Find(verified, "net_profit_identity");
    assert(identity && identity->passed);
    assert(identity->formula == "net_profit = total_profit - income_tax");
    std::cout << "[PASS] Incomplete or unresolved inputs are skipped." << std::endl;
}

void TestUnitsAndScopes(const ConsistencyChecker& checker) {
    auto results = checker.check({Stock("total_assets", 1000, "10k_yuan"), Stock("total_liabilities", 6000000),
                                  Stock("total_equity", 4000000), Stock("total_assets", 50, "yuan", "parent"),
                                  Stock("total_liabilities", 20, "yuan", "parent"),
                                  Stock("total_equity", 20, "yuan", "parent")});
    const auto* consolidated = Find(results, "balance_sheet_identity");
    assert(consolidated && consolidated->passed);
    assert(consolidated->lhs == 1e7);
    const auto* parent = Find(results, "balance_sheet_identity", "parent");
    assert(parent && !parent->passed);
    std::cout << "[PASS] Values scale to base units and scopes stay separate." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConsistencyChecker Test..." << std::endl;
    ConsistencyChecker checker(ConsistencySettings{});
    TestBalanceSheetIdentity(checker);
    TestEquityFallback(checker);
    TestCashFlowIdentities(checker);
    TestMissingTermsAndUnresolved(checker);
    TestUnitsAndScopes(checker);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
