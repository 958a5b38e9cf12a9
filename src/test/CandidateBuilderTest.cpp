#include <cassert>
#include <iostream>

#include "application/CandidateBuilder.hpp"
#include "infrastructure/MetricDictionaryLoader.hpp"

using namespace finfacts::domain;
using namespace finfacts::application;
using finfacts::infrastructure::MetricDictionaryLoader;

#ifndef FINFACTS_DICTIONARY_PATH
#define FINFACTS_DICTIONARY_PATH "data/metric_dictionary.json"
#endif

namespace {

ReportContext Fy2023() {
    ReportContext context;
    context.reportId = "r1";
    context.fiscalYear = 2023;
    context.periodStart = "2023-01-01";
    context.periodEnd = "2023-12-31";
    return context;
}

const FactCandidate* FindCandidate(const TableBuildResult& result, const std::string& id) {
    for (const auto& candidate : result.candidates) {
        if (candidate.candidateId == id) return &candidate;
    }
    return nullptr;
}

void TestBalanceSheetTable(const CandidateBuilder& builder) {
    RawTableCandidate table;
    table.tableIndex = 4;
    table.page = 12;
    table.context = "合并资产负债表\n单位：万元";
    table.columnLabels = {"项目", "期末余额", "期初余额"};
    table.rows = {
        {"货币资金", "1,000", "900"},
        {"存货", "500", "-"},
        {"资产总计", "3,000", "2,800"},
        {"递延所得税资产明细", "10", "abc"},
    };

    auto result = builder.build(table, Fy2023(), "mineru", "v1");
    assert(table.statementType == StatementType::Balance);
    assert(result.accepted && table.accepted);
    assert(result.candidates.size() == 7);
    assert(result.distinctMetrics == 3);
    assert(result.matched == 5 && result.unmatched == 2);
    assert(result.parseFailures == 1);

    const auto* cash = FindCandidate(result, "v1-t4-r0-c1");
    assert(cash != nullptr);
    assert(cash->metricCode == "monetary_funds" && cash->matched);
    assert(cash->value && *cash->value == 1000.0);
    assert(cash->period.factType == FactType::Stock);
    assert(cash->period.asOf == "2023-12-31");
    assert(cash->unit == "10k_yuan" && cash->currency == "CNY");
    assert(cash->scope == "consolidated");
    assert(cash->engine == "mineru" && cash->sourcePage == 12 && cash->columnIndex == 1);
    assert(cash->quality == 1.0);

    const auto* opening = FindCandidate(result, "v1-t4-r0-c2");
    assert(opening && opening->period.asOf == "2022-12-31");
    assert(opening->period.label == "prior");

    // Placeholder dashes are not observations.
    assert(FindCandidate(result, "v1-t4-r1-c2") == nullptr);

    const auto* broken = FindCandidate(result, "v1-t4-r3-c2");
    assert(broken && !broken->matched && broken->parseFailed());
    assert(broken->rawValue == "abc");
    assert(broken->quality <= 0.2);
    std::cout << "[PASS] Balance sheet cells become typed candidates." << std::endl;
}

void TestQualityGate(const CandidateBuilder& builder) {
    RawTableCandidate table;
    table.context = "主要会计数据";
    table.columnLabels = {"项目", "2023年"};
    table.rows = {{"营业收入", "100"}, {"员工人数", "300"}};

    auto result = builder.build(table, Fy2023(), "mineru", "v1");
    assert(!result.accepted && !table.accepted);
    assert(result.candidates.empty());
    assert(result.distinctMetrics == 1);
    assert(!table.rejectReason.empty());
    std::cout << "[PASS] Tables with too few distinct metrics are rejected." << std::endl;
}

void TestPercentCells(const CandidateBuilder& builder) {
    RawTableCandidate table;
    table.context = "合并利润表";
    table.columnLabels = {"项目", "本期金额"};
    table.rows = {{"营业收入", "100"}, {"净利润", "20"}, {"加权平均净资产收益率(%)", "12.5%"}};

    auto result = builder.build(table, Fy2023(), "docling", "v2");
    assert(result.accepted);
    const auto* roe = FindCandidate(result, "v2-t0-r2-c1");
    assert(roe && roe->metricCode == "weighted_roe");
    assert(roe->unit == "percent");
    const auto* revenue = FindCandidate(result, "v2-t0-r0-c1");
    assert(revenue && revenue->period.factType == FactType::Flow);
    assert(revenue->period.periodStart == "2023-01-01" && revenue->period.periodEnd == "2023-12-31");
    assert(revenue->unit == "yuan");
    std::cout << "[PASS] Percent cells carry the percent unit." << std::endl;
}

void TestPeriodResolution(const CandidateBuilder& builder) {
    auto context = Fy2023();

    auto dated = builder.resolvePeriod("2022年12月31日", FactType::Stock, context);
    assert(dated.asOf == "2022-12-31" && dated.fiscalYear == 2022);

    auto current = builder.resolvePeriod("本期金额", FactType::Flow, context);
    assert(current.periodEnd == "2023-12-31" && current.label == "current");

    auto prior = builder.resolvePeriod("上期金额", FactType::Flow, context);
    assert(prior.periodStart == "2022-01-01" && prior.periodEnd == "2022-12-31");

    auto positional = builder.resolvePeriod("col_2", FactType::Stock, context);
    assert(positional.asOf == "2022-12-31" && positional.label == "positional");

    auto year = builder.resolvePeriod("2021年", FactType::Flow, context);
    assert(year.fiscalYear == 2021 && year.periodEnd == "2021-12-31");

    // Without a report year a vocabulary-only column stays undated.
    auto undated = builder.resolvePeriod("本期金额", FactType::Flow, ReportContext{});
    assert(undated.fiscalYear == 0 && undated.periodEnd.empty());
    std::cout << "[PASS] Column labels resolve to report periods." << std::endl;
}

void TestScope(const CandidateBuilder& builder) {
    assert(builder.resolveScope("母公司/期末余额", "") == "parent");
    assert(builder.resolveScope("期末余额", "母公司资产负债表") == "parent");
    assert(builder.resolveScope("合并/本期", "母公司利润表") == "consolidated");
    assert(builder.resolveScope("本期", "") == "consolidated");
    std::cout << "[PASS] Scope comes from column, then table, then default." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CandidateBuilder Test..." << std::endl;

    auto dictionary = MetricDictionaryLoader::Load(FINFACTS_DICTIONARY_PATH, 2);
    MetricMatcher matcher(dictionary, MatchingSettings{});
    CandidateBuilder builder(matcher, CandidateSettings{}, PeriodSettings{});

    TestBalanceSheetTable(builder);
    TestQualityGate(builder);
    TestPercentCells(builder);
    TestPeriodResolution(builder);
    TestScope(builder);

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
