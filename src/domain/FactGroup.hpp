/**
 * @file FactGroup.hpp
 * @brief Reconciliation unit: every candidate sharing one normalized identity key.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "domain/FactCandidate.hpp"

namespace finfacts::domain {

/**
 * @struct KeyDefaults
 * @brief Fallbacks applied identically to every candidate before keys are compared.
 */
struct KeyDefaults {
    std::string scope = "consolidated";
    std::string currency = "CNY";
    std::string unit = "yuan";
};

inline std::string AsciiLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline std::string AsciiTrim(const std::string& value) {
    size_t start = 0;
    size_t end = value.size();
    while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return value.substr(start, end - start);
}

inline std::string NormalizeScope(const std::string& raw, const KeyDefaults& defaults) {
    std::string v = AsciiLower(AsciiTrim(raw));
    if (v.empty()) return defaults.scope;
    if (v == "consolidated" || v == "group" || v == "合并") return "consolidated";
    if (v == "parent" || v == "company" || v == "母公司" || v == "公司") return "parent";
    return v;
}

inline std::string NormalizeCurrency(const std::string& raw, const KeyDefaults& defaults) {
    std::string v = AsciiTrim(raw);
    if (v.empty()) return defaults.currency;
    if (v == "人民币" || v == "rmb" || v == "RMB") return "CNY";
    if (v == "美元") return "USD";
    if (v == "港元" || v == "港币") return "HKD";
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return v;
}

inline std::string NormalizeUnit(const std::string& raw, const KeyDefaults& defaults) {
    std::string v = AsciiLower(AsciiTrim(raw));
    if (v.empty()) return defaults.unit;
    if (v == "元" || v == "1") return "yuan";
    if (v == "千元" || v == "thousand") return "1k_yuan";
    if (v == "万元" || v == "10k") return "10k_yuan";
    if (v == "百万元" || v == "million") return "1m_yuan";
    if (v == "亿元") return "100m_yuan";
    if (v == "%" || v == "percent") return "percent";
    return v;
}

/** @brief Multiplier converting a value in the unit into base units. */
inline double UnitMultiplier(const std::string& normalizedUnit) {
    if (normalizedUnit == "1k_yuan") return 1e3;
    if (normalizedUnit == "10k_yuan") return 1e4;
    if (normalizedUnit == "1m_yuan") return 1e6;
    if (normalizedUnit == "100m_yuan") return 1e8;
    return 1.0;
}

/**
 * @struct FactGroupKey
 * @brief (metric, fact type, period, scope, currency, unit), all normalized.
 */
struct FactGroupKey {
    std::string metricCode;
    FactType factType = FactType::Flow;
    PeriodDescriptor period;
    std::string scope;
    std::string currency;
    std::string unit;

    static FactGroupKey FromCandidate(const FactCandidate& candidate, const KeyDefaults& defaults) {
        FactGroupKey key;
        key.metricCode = AsciiLower(AsciiTrim(candidate.metricCode));
        key.factType = candidate.period.factType;
        key.period = candidate.period;
        key.scope = NormalizeScope(candidate.scope, defaults);
        key.currency = NormalizeCurrency(candidate.currency, defaults);
        key.unit = NormalizeUnit(candidate.unit, defaults);
        return key;
    }

    std::string toString() const {
        return metricCode + "|" + FactTypeToString(factType) + "|" + period.key() + "|" +
               scope + "|" + currency + "|" + unit;
    }
};

/**
 * @struct FactGroup
 */
struct FactGroup {
    FactGroupKey key;
    std::vector<FactCandidate> candidates;

    std::vector<std::string> engines() const {
        std::vector<std::string> names;
        for (const auto& c : candidates) {
            if (std::find(names.begin(), names.end(), c.engine) == names.end()) {
                names.push_back(c.engine);
            }
        }
        std::sort(names.begin(), names.end());
        return names;
    }
};

} // namespace finfacts::domain
