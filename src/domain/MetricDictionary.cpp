/**
 * @file MetricDictionary.cpp
 * @brief Implementation of MetricDictionary.
 */

#include "domain/MetricDictionary.hpp"

#include <algorithm>
#include <set>

#include "domain/LabelText.hpp"
#include "domain/PipelineErrors.hpp"

namespace finfacts::domain {

namespace {

const std::vector<std::string> kEmpty;

void AddUnique(std::vector<std::string>& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

} // namespace

DictionaryBuildOptions DictionaryBuildOptions::Defaults() {
    DictionaryBuildOptions options;
    options.shortLabelThreshold = 2;
    options.stopList = {
        "合计", "小计", "总计", "其他", "其它", "金额", "项目", "单位", "币种", "余额",
        "本期", "上期", "本年", "上年", "期末", "期初", "年末", "年初",
        "期末余额", "期初余额", "本期发生额", "上期发生额", "本期金额", "上期金额",
        "本年金额", "上年金额", "其中", "人民币", "元", "千元", "万元", "亿元",
        "total", "subtotal", "amount", "balance", "currency", "unit", "current", "prior", "year",
        "others", "other"
    };
    options.shortLabelDenylist = {"资产", "负债", "权益", "现金", "成本", "费用", "收入", "利润"};
    return options;
}

std::shared_ptr<const MetricDictionary> MetricDictionary::Build(const std::string& version,
                                                                std::vector<MetricDefinition> metrics,
                                                                BackgroundRules rules,
                                                                const DictionaryBuildOptions& options) {
    if (metrics.empty()) {
        throw DictionaryLoadError("dictionary '" + version + "' contains no metrics");
    }

    std::shared_ptr<MetricDictionary> dict(new MetricDictionary());
    dict->m_version = version;
    dict->m_shortLabelThreshold = options.shortLabelThreshold;

    std::set<std::string> stop;
    for (const auto& label : options.stopList) {
        std::string norm = LabelText::Normalize(label);
        if (!norm.empty()) stop.insert(norm);
    }
    dict->m_stopLabels.assign(stop.begin(), stop.end());

    std::set<std::string> deny;
    for (const auto& label : options.shortLabelDenylist) {
        deny.insert(LabelText::Normalize(label));
    }

    for (size_t i = 0; i < metrics.size(); ++i) {
        const auto& metric = metrics[i];
        if (metric.code.empty()) {
            throw DictionaryLoadError("metric #" + std::to_string(i) + " has no metric_code");
        }
        if (!dict->m_byCode.emplace(metric.code, i).second) {
            throw DictionaryLoadError("duplicate metric_code '" + metric.code + "'");
        }
    }

    auto addAlias = [&](const std::string& raw, const std::string& code, bool affixEligible) {
        std::string norm = LabelText::Normalize(raw);
        if (norm.empty()) return;
        if (stop.count(norm)) {
            ++dict->m_excludedAliases;
            return;
        }
        if (LabelText::Length(norm) <= options.shortLabelThreshold) {
            if (deny.count(norm)) {
                ++dict->m_excludedAliases;
                return;
            }
            AddUnique(dict->m_exactIndex[norm], code);
            return;
        }
        AddUnique(dict->m_exactIndex[norm], code);
        if (affixEligible) {
            bool seen = std::any_of(dict->m_affixAliases.begin(), dict->m_affixAliases.end(),
                                    [&](const AffixAlias& a) { return a.alias == norm && a.metricCode == code; });
            if (!seen) dict->m_affixAliases.push_back({norm, code});
        }
    };

    for (const auto& metric : metrics) {
        addAlias(metric.nameCn, metric.code, true);
        addAlias(metric.nameEn, metric.code, true);
        for (const auto& p : metric.patterns) addAlias(p, metric.code, true);
        for (const auto& p : metric.patternsEn) addAlias(p, metric.code, true);
        for (const auto& p : metric.exactPatterns) addAlias(p, metric.code, false);
        for (const auto& p : metric.exactPatternsEn) addAlias(p, metric.code, false);
    }

    // Longest aliases first so the most specific affix match is found first.
    std::stable_sort(dict->m_affixAliases.begin(), dict->m_affixAliases.end(),
                     [](const AffixAlias& a, const AffixAlias& b) { return a.alias.size() > b.alias.size(); });

    for (const auto& [subCode, codes] : rules.subCodes) {
        for (const auto& code : codes) {
            if (!dict->m_byCode.count(code)) {
                throw DictionaryLoadError("background sub-code " + subCode + " references unknown metric '" + code + "'");
            }
        }
    }

    dict->m_metrics = std::move(metrics);
    dict->m_rules = std::move(rules);
    return dict;
}

const MetricDefinition* MetricDictionary::find(const std::string& code) const {
    auto it = m_byCode.find(code);
    if (it == m_byCode.end()) return nullptr;
    return &m_metrics[it->second];
}

const std::vector<std::string>& MetricDictionary::exactMatches(const std::string& normalizedLabel) const {
    auto it = m_exactIndex.find(normalizedLabel);
    if (it == m_exactIndex.end()) return kEmpty;
    return it->second;
}

bool MetricDictionary::isStopLabel(const std::string& normalizedLabel) const {
    return std::binary_search(m_stopLabels.begin(), m_stopLabels.end(), normalizedLabel);
}

} // namespace finfacts::domain
