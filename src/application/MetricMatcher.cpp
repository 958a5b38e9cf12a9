/**
 * @file MetricMatcher.cpp
 * @brief Implementation of MetricMatcher.
 */

#include "application/MetricMatcher.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <map>
#include <sstream>

#include "domain/LabelText.hpp"

namespace finfacts::application {

using domain::LabelText;
using domain::MatchMethod;
using domain::StatementType;
using domain::ValueNature;

namespace {

struct StatementKeywords {
    StatementType type;
    std::vector<std::string> keywords;
};

const std::vector<StatementKeywords>& Keywords() {
    static const std::vector<StatementKeywords> kKeywords = {
        {StatementType::CashFlow, {"现金流量表", "cashflowstatement", "statementofcashflows", "cashflows"}},
        {StatementType::Equity, {"所有者权益变动表", "股东权益变动表", "changesinequity"}},
        {StatementType::Income, {"利润表", "损益表", "综合收益表", "incomestatement", "profitorloss",
                                 "statementofcomprehensiveincome"}},
        {StatementType::Balance, {"资产负债表", "财务状况表", "balancesheet", "financialposition"}},
    };
    return kKeywords;
}

bool IsRatioLabel(const std::string& raw) {
    return LabelText::Contains(raw, "率") || LabelText::Contains(raw, "%") || LabelText::Contains(raw, "％");
}

uint64_t Fnv1a(const std::string& data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace

MetricMatcher::MetricMatcher(domain::MetricDictionaryPtr dictionary, const MatchingSettings& settings)
    : m_dictionary(std::move(dictionary)) {
    for (const auto& p : settings.benignPrefixes) {
        std::string norm = LabelText::Normalize(p);
        if (!norm.empty()) m_prefixes.push_back(norm);
    }
    for (const auto& s : settings.benignSuffixes) {
        std::string norm = LabelText::Normalize(s);
        if (!norm.empty()) m_suffixes.push_back(norm);
    }
}

std::string MetricMatcher::RawCode(StatementType type, const std::string& normalizedLabel) {
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0')
        << Fnv1a(domain::StatementTypeToString(type) + "|" + normalizedLabel);
    return "raw_" + oss.str().substr(0, 12);
}

MatchResult MetricMatcher::match(const std::string& rawLabel,
                                 StatementType context,
                                 const std::optional<std::string>& sectionCode) const {
    MatchResult result;
    const auto& rules = m_dictionary->backgroundRules();

    std::optional<std::string> code = LabelText::ExtractCode(rawLabel);
    StatementType rowType = context;
    bool routedByRule = false;
    for (const auto& candidate : {sectionCode, code}) {
        if (!candidate) continue;
        auto it = rules.sectionCodes.find(*candidate);
        if (it != rules.sectionCodes.end()) {
            rowType = it->second;
            routedByRule = true;
            break;
        }
    }

    std::string stripped = LabelText::StripNoise(rawLabel);
    result.normalizedLabel = LabelText::Normalize(stripped);
    result.statementType = rowType;
    result.metricCode = RawCode(rowType, result.normalizedLabel);

    if (result.normalizedLabel.empty() || m_dictionary->isStopLabel(result.normalizedLabel)) {
        return result;
    }
    bool ratioLabel = IsRatioLabel(rawLabel);

    auto accept = [&](const std::string& metricCode, MatchMethod method) {
        const auto* def = m_dictionary->find(metricCode);
        result.metricCode = metricCode;
        result.matched = true;
        result.method = method;
        result.statementType = def ? def->statementType : rowType;
        return result;
    };

    if (code) {
        auto it = rules.subCodes.find(*code);
        if (it != rules.subCodes.end()) {
            std::vector<std::string> routed;
            for (const auto& metricCode : it->second) {
                const auto* def = m_dictionary->find(metricCode);
                if (!def) continue;
                if (ratioLabel && def->valueNature != ValueNature::Ratio) continue;
                if (rowType != StatementType::Unknown && def->statementType != rowType) continue;
                routed.push_back(metricCode);
            }
            // Ambiguous sub-code mappings fall through to label matching.
            if (routed.size() == 1) return accept(routed.front(), MatchMethod::BackgroundCode);
        }
    }

    if (auto exact = pick(m_dictionary->exactMatches(result.normalizedLabel), rowType, routedByRule, ratioLabel)) {
        return accept(*exact, MatchMethod::Exact);
    }

    if (LabelText::Length(result.normalizedLabel) <= m_dictionary->shortLabelThreshold()) {
        return result;
    }

    if (auto affix = pick(affixMatches(result.normalizedLabel), rowType, routedByRule, ratioLabel)) {
        return accept(*affix, MatchMethod::Pattern);
    }
    return result;
}

std::optional<std::string> MetricMatcher::pick(const std::vector<std::string>& codes,
                                               StatementType rowType,
                                               bool routedByRule,
                                               bool ratioLabel) const {
    std::vector<std::string> allowed;
    std::vector<std::string> sameType;
    for (const auto& metricCode : codes) {
        const auto* def = m_dictionary->find(metricCode);
        if (!def) continue;
        if (ratioLabel && def->valueNature != ValueNature::Ratio) continue;
        allowed.push_back(metricCode);
        if (def->statementType == rowType) sameType.push_back(metricCode);
    }
    if (sameType.size() == 1) return sameType.front();
    if (sameType.size() > 1) return std::nullopt;
    // Rows routed by an explicit rule never cross statements.
    if (routedByRule && rowType != StatementType::Unknown) return std::nullopt;
    if (allowed.size() == 1) return allowed.front();
    return std::nullopt;
}

std::vector<std::string> MetricMatcher::affixMatches(const std::string& label) const {
    std::vector<std::string> hits;
    size_t bestLength = 0;

    std::vector<std::string> prefixes = m_prefixes;
    prefixes.insert(prefixes.begin(), std::string());

    for (const auto& alias : m_dictionary->affixAliases()) {
        if (alias.alias.size() < bestLength) break;
        if (alias.alias.size() >= label.size()) continue;
        for (const auto& prefix : prefixes) {
            if (label.compare(0, prefix.size(), prefix) != 0) continue;
            if (label.compare(prefix.size(), alias.alias.size(), alias.alias) != 0) continue;
            std::string tail = label.substr(prefix.size() + alias.alias.size());
            bool benignTail = tail.empty() || std::find(m_suffixes.begin(), m_suffixes.end(), tail) != m_suffixes.end();
            if (!benignTail || (prefix.empty() && tail.empty())) continue;
            if (std::find(hits.begin(), hits.end(), alias.metricCode) == hits.end()) {
                hits.push_back(alias.metricCode);
            }
            bestLength = alias.alias.size();
        }
    }
    return hits;
}

StatementType MetricMatcher::detectStatementType(const std::string& caption) const {
    if (auto code = LabelText::ExtractCode(caption)) {
        const auto& sections = m_dictionary->backgroundRules().sectionCodes;
        auto it = sections.find(*code);
        if (it != sections.end()) return it->second;
    }
    std::string norm = LabelText::Normalize(caption);
    for (const auto& entry : Keywords()) {
        for (const auto& keyword : entry.keywords) {
            if (norm.find(keyword) != std::string::npos) return entry.type;
        }
    }
    return StatementType::Unknown;
}

StatementType MetricMatcher::inferDominantStatementType(const std::vector<std::string>& labels) const {
    std::map<StatementType, int> counts;
    for (const auto& label : labels) {
        std::string norm = LabelText::Normalize(LabelText::StripNoise(label));
        for (const auto& metricCode : m_dictionary->exactMatches(norm)) {
            if (const auto* def = m_dictionary->find(metricCode)) ++counts[def->statementType];
        }
    }
    StatementType best = StatementType::Unknown;
    int bestCount = 0;
    bool tie = false;
    for (const auto& [type, count] : counts) {
        if (type == StatementType::Unknown) continue;
        if (count > bestCount) {
            best = type;
            bestCount = count;
            tie = false;
        } else if (count == bestCount) {
            tie = true;
        }
    }
    return tie ? StatementType::Unknown : best;
}

void MetricMatcher::annotate(domain::RawTableCandidate& table) const {
    table.statementType = detectStatementType(table.context);
    if (table.statementType != StatementType::Unknown) return;
    std::vector<std::string> labels;
    labels.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        if (!row.empty()) labels.push_back(row.front());
    }
    table.statementType = inferDominantStatementType(labels);
}

} // namespace finfacts::application
