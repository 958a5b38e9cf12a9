/**
 * @file MetricDictionaryLoader.hpp
 * @brief Reads the versioned taxonomy dictionary file into an immutable snapshot.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "domain/MetricDictionary.hpp"

namespace finfacts::infrastructure {

class MetricDictionaryLoader {
public:
    /**
     * @brief Loads and builds the dictionary.
     * @param shortLabelThreshold Aliases at or below this many code points are exact-only.
     * @throws domain::DictionaryLoadError if the file is missing, malformed or inconsistent.
     */
    static domain::MetricDictionaryPtr Load(const std::string& path, size_t shortLabelThreshold);

    /** @brief Same as Load, from an already parsed document. */
    static domain::MetricDictionaryPtr FromJson(const nlohmann::json& j, size_t shortLabelThreshold);
};

} // namespace finfacts::infrastructure
