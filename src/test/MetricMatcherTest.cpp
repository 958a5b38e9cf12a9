#include <cassert>
#include <iostream>

#include <nlohmann/json.hpp>

#include "application/MetricMatcher.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/MetricDictionaryLoader.hpp"

using namespace finfacts::domain;
using finfacts::application::MatchingSettings;
using finfacts::application::MetricMatcher;
using finfacts::infrastructure::MetricDictionaryLoader;

#ifndef FINFACTS_DICTIONARY_PATH
#define FINFACTS_DICTIONARY_PATH "data/metric_dictionary.json"
#endif

namespace {

void TestExactAndNoiseStripping(const MetricMatcher& matcher) {
    auto revenue = matcher.match("营业收入", StatementType::Income);
    assert(revenue.matched && revenue.metricCode == "revenue");
    assert(revenue.method == MatchMethod::Exact);

    auto numbered = matcher.match("一、营业总收入", StatementType::Income);
    assert(numbered.matched && numbered.metricCode == "revenue");

    auto subItem = matcher.match("其中：营业成本", StatementType::Income);
    assert(subItem.matched && subItem.metricCode == "operating_cost");

    auto english = matcher.match("Total Assets", StatementType::Balance);
    assert(english.matched && english.metricCode == "total_assets");
    std::cout << "[PASS] Exact match after noise stripping." << std::endl;
}

void TestConstrainedAffix(const MetricMatcher& matcher) {
    auto suffixed = matcher.match("营业收入净额", StatementType::Income);
    assert(suffixed.matched && suffixed.metricCode == "revenue");
    assert(suffixed.method == MatchMethod::Pattern);

    // Containment alone never matches: "其他" is not a benign prefix.
    auto other = matcher.match("其他营业收入", StatementType::Income);
    assert(!other.matched);
    assert(other.method == MatchMethod::Unmatched);
    assert(other.metricCode.rfind("raw_", 0) == 0);
    std::cout << "[PASS] Affix matching only accepts benign affixes." << std::endl;
}

void TestShortLabels(const MetricMatcher& matcher) {
    auto inventory = matcher.match("存货", StatementType::Balance);
    assert(inventory.matched && inventory.metricCode == "inventory");

    // A short alias never swallows a longer line item.
    auto impairment = matcher.match("存货跌价准备", StatementType::Balance);
    assert(!impairment.matched);

    auto total = matcher.match("合计", StatementType::Balance);
    assert(!total.matched);
    std::cout << "[PASS] Short labels match exactly or not at all." << std::endl;
}

void TestStopListNeverMatches(const MetricMatcher& matcher) {
    const auto stopList = DictionaryBuildOptions::Defaults().stopList;
    assert(!stopList.empty());
    for (const auto& label : stopList) {
        for (StatementType context : {StatementType::Balance, StatementType::Income, StatementType::CashFlow,
                                      StatementType::Unknown}) {
            auto result = matcher.match(label, context);
            if (result.matched) {
                std::cerr << "[FAIL] stop label matched: " << label << " -> " << result.metricCode << std::endl;
            }
            assert(!result.matched);
            assert(result.method == MatchMethod::Unmatched);
        }
    }
    std::cout << "[PASS] Every stop-list label stays unmatched." << std::endl;
}

void TestInventorySubItem(const MetricMatcher& matcher) {
    auto inventory = matcher.match("其中：存货", StatementType::Balance);
    assert(inventory.matched && inventory.metricCode == "inventory");
    assert(inventory.method == MatchMethod::Exact);

    // Near misses of an exact-only metric must not fall back to pattern matching.
    for (const char* label : {"其中：存货跌价准备", "其中：存货周转", "其中：发出存货"}) {
        auto miss = matcher.match(label, StatementType::Balance);
        assert(!miss.matched);
        assert(miss.metricCode.rfind("raw_", 0) == 0);
    }
    std::cout << "[PASS] Sub-item inventory matches exactly and only exactly." << std::endl;
}

void TestRatioAndBackgroundCodes(const MetricMatcher& matcher) {
    auto roe = matcher.match("加权平均净资产收益率(%)", StatementType::Income);
    assert(roe.matched && roe.metricCode == "weighted_roe");

    auto routed = matcher.match("[210001] 现金", StatementType::Balance);
    assert(routed.matched && routed.metricCode == "monetary_funds");
    assert(routed.method == MatchMethod::BackgroundCode);

    assert(matcher.detectStatementType("合并资产负债表") == StatementType::Balance);
    assert(matcher.detectStatementType("[510000] 附表") == StatementType::CashFlow);
    assert(matcher.detectStatementType("母公司利润表") == StatementType::Income);
    assert(matcher.detectStatementType("重要事项") == StatementType::Unknown);
    std::cout << "[PASS] Ratio labels and background codes." << std::endl;
}

void TestRawCodes(const MetricMatcher& matcher) {
    auto a = matcher.match("研发投入资本化", StatementType::Income);
    auto b = matcher.match("研发投入资本化", StatementType::Income);
    auto c = matcher.match("研发投入资本化", StatementType::Balance);
    assert(!a.matched && a.metricCode == b.metricCode);
    assert(a.metricCode != c.metricCode);
    assert(a.metricCode.size() == 16);
    std::cout << "[PASS] Unmatched labels get stable raw codes." << std::endl;
}

void TestDominantStatement(const MetricMatcher& matcher) {
    auto dominant = matcher.inferDominantStatementType({"营业收入", "营业成本", "资产总计"});
    assert(dominant == StatementType::Income);
    auto tie = matcher.inferDominantStatementType({"营业收入", "资产总计"});
    assert(tie == StatementType::Unknown);

    RawTableCandidate table;
    table.context = "单位：元";
    table.rows = {{"资产总计", "1"}, {"负债合计", "1"}};
    matcher.annotate(table);
    assert(table.statementType == StatementType::Balance);
    std::cout << "[PASS] Statement type inferred from row labels." << std::endl;
}

void TestDictionaryErrors() {
    bool threw = false;
    try {
        nlohmann::json j;
        j["metrics"] = nlohmann::json::array();
        MetricDictionaryLoader::FromJson(j, 2);
    } catch (const DictionaryLoadError&) {
        threw = true;
    }
    assert(threw && "Missing version must be rejected.");

    threw = false;
    try {
        MetricDictionaryLoader::Load("does/not/exist.json", 2);
    } catch (const DictionaryLoadError&) {
        threw = true;
    }
    assert(threw && "Missing file must be rejected.");

    threw = false;
    try {
        nlohmann::json metric = {{"metric_code", "a"}, {"metric_name_cn", "甲乙丙"}};
        nlohmann::json j;
        j["version"] = "t";
        j["metrics"] = nlohmann::json::array({metric});
        j["background_rules"]["sub_codes"]["[100001]"] = "missing";
        MetricDictionaryLoader::FromJson(j, 2);
    } catch (const DictionaryLoadError&) {
        threw = true;
    }
    assert(threw && "Sub-codes must reference known metrics.");
    std::cout << "[PASS] Dictionary load failures are fatal." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting MetricMatcher Test..." << std::endl;

    auto dictionary = MetricDictionaryLoader::Load(FINFACTS_DICTIONARY_PATH, 2);
    assert(dictionary->find("net_profit") != nullptr);
    assert(dictionary->find("cash_end")->valueNature == ValueNature::Flow);

    MetricMatcher matcher(dictionary, MatchingSettings{});
    TestExactAndNoiseStripping(matcher);
    TestConstrainedAffix(matcher);
    TestShortLabels(matcher);
    TestStopListNeverMatches(matcher);
    TestInventorySubItem(matcher);
    TestRatioAndBackgroundCodes(matcher);
    TestRawCodes(matcher);
    TestDominantStatement(matcher);
    TestDictionaryErrors();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
