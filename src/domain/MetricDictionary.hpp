/**
 * @file MetricDictionary.hpp
 * @brief Immutable, versioned taxonomy snapshot used by the metric matcher.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "domain/StatementType.hpp"

namespace finfacts::domain {

/**
 * @struct MetricDefinition
 * @brief One canonical metric and its label aliases as curated in the dictionary file.
 */
struct MetricDefinition {
    std::string code;
    std::string nameCn;
    std::string nameEn;
    StatementType statementType = StatementType::Unknown;
    ValueNature valueNature = ValueNature::Flow;
    int sign = 1;                               ///< +1, or -1 for contra items reported as positives.
    std::string parentCode;
    std::vector<std::string> patterns;          ///< Eligible for affix matching.
    std::vector<std::string> exactPatterns;     ///< Exact match only.
    std::vector<std::string> patternsEn;
    std::vector<std::string> exactPatternsEn;
};

/**
 * @struct BackgroundRules
 * @brief Routing metadata: section codes to statement types, sub-codes to metrics.
 */
struct BackgroundRules {
    std::map<std::string, StatementType> sectionCodes;
    std::map<std::string, std::vector<std::string>> subCodes;
};

/**
 * @struct DictionaryBuildOptions
 */
struct DictionaryBuildOptions {
    size_t shortLabelThreshold = 2;             ///< Aliases at or below this length are exact-only.
    std::vector<std::string> stopList;          ///< Generic tokens never used as aliases.
    std::vector<std::string> shortLabelDenylist;///< Short aliases dropped entirely.

    static DictionaryBuildOptions Defaults();
};

/**
 * @struct AffixAlias
 * @brief A normalized alias eligible for constrained prefix/suffix matching.
 */
struct AffixAlias {
    std::string alias;
    std::string metricCode;
};

/**
 * @class MetricDictionary
 * @brief Built once per pipeline run and shared read-only between concurrent pipelines.
 */
class MetricDictionary {
public:
    /**
     * @brief Builds the lookup indexes and applies the stop-list and short-label rules.
     * @throws DictionaryLoadError on an empty or inconsistent metric list.
     */
    static std::shared_ptr<const MetricDictionary> Build(const std::string& version,
                                                         std::vector<MetricDefinition> metrics,
                                                         BackgroundRules rules,
                                                         const DictionaryBuildOptions& options);

    const std::string& version() const { return m_version; }
    size_t shortLabelThreshold() const { return m_shortLabelThreshold; }
    const std::vector<MetricDefinition>& metrics() const { return m_metrics; }
    const BackgroundRules& backgroundRules() const { return m_rules; }

    const MetricDefinition* find(const std::string& code) const;

    /** @brief Metric codes whose exact alias equals the normalized label. */
    const std::vector<std::string>& exactMatches(const std::string& normalizedLabel) const;

    /** @brief Aliases eligible for affix matching (long enough, not on any stop-list). */
    const std::vector<AffixAlias>& affixAliases() const { return m_affixAliases; }

    bool isStopLabel(const std::string& normalizedLabel) const;

    /** @brief Count of aliases discarded by the stop-list and deny-list at build time. */
    size_t excludedAliasCount() const { return m_excludedAliases; }

private:
    MetricDictionary() = default;

    std::string m_version;
    size_t m_shortLabelThreshold = 2;
    std::vector<MetricDefinition> m_metrics;
    std::map<std::string, size_t> m_byCode;
    std::map<std::string, std::vector<std::string>> m_exactIndex;
    std::vector<AffixAlias> m_affixAliases;
    std::vector<std::string> m_stopLabels;
    BackgroundRules m_rules;
    size_t m_excludedAliases = 0;
};

using MetricDictionaryPtr = std::shared_ptr<const MetricDictionary>;

} // namespace finfacts::domain
