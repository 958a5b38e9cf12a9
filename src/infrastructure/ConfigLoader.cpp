/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace finfacts::infrastructure {

using application::PipelineConfig;

namespace {

template <typename T>
void Read(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

} // namespace

PipelineConfig ConfigLoader::Load(const std::string& path) {
    PipelineConfig config;
    if (!std::filesystem::exists(path)) {
        std::cerr << "[ConfigLoader] " << path << " not found, using defaults." << std::endl;
        return config;
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;
        Apply(j, config);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
        return PipelineConfig{};
    }

    // Relative store and dictionary paths resolve against the settings file.
    std::filesystem::path base = std::filesystem::path(path).parent_path();
    if (!base.empty()) {
        if (std::filesystem::path(config.storeRoot).is_relative()) {
            config.storeRoot = (base / config.storeRoot).string();
        }
        if (std::filesystem::path(config.dictionaryPath).is_relative()) {
            config.dictionaryPath = (base / config.dictionaryPath).string();
        }
    }
    return config;
}

void ConfigLoader::Apply(const nlohmann::json& j, PipelineConfig& config) {
    Read(j, "store_root", config.storeRoot);
    Read(j, "dictionary_path", config.dictionaryPath);

    if (j.contains("engines")) {
        config.engines.clear();
        for (const auto& e : j["engines"]) {
            application::EngineSettings engine;
            Read(e, "name", engine.name);
            Read(e, "command", engine.command);
            Read(e, "output_dir", engine.outputDir);
            Read(e, "timeout_seconds", engine.timeoutSeconds);
            Read(e, "max_attempts", engine.maxAttempts);
            if (engine.name.empty()) {
                std::cerr << "[ConfigLoader] Skipping engine without a name." << std::endl;
                continue;
            }
            if (engine.maxAttempts < 1) engine.maxAttempts = 1;
            config.engines.push_back(engine);
        }
    }

    if (j.contains("consensus")) {
        const auto& c = j["consensus"];
        Read(c, "abs_tolerance", config.consensus.absTolerance);
        Read(c, "rel_tolerance", config.consensus.relTolerance);
    }
    if (j.contains("matching")) {
        const auto& m = j["matching"];
        Read(m, "short_label_threshold", config.matching.shortLabelThreshold);
        Read(m, "benign_prefixes", config.matching.benignPrefixes);
        Read(m, "benign_suffixes", config.matching.benignSuffixes);
    }
    if (j.contains("candidates")) {
        const auto& c = j["candidates"];
        Read(c, "min_distinct_metrics_per_table", config.candidates.minDistinctMetricsPerTable);
        Read(c, "default_scope", config.candidates.defaultScope);
        Read(c, "default_currency", config.candidates.defaultCurrency);
        Read(c, "default_unit", config.candidates.defaultUnit);
    }
    if (j.contains("consistency")) {
        const auto& c = j["consistency"];
        Read(c, "abs_tolerance", config.consistency.absTolerance);
        Read(c, "rel_tolerance", config.consistency.relTolerance);
    }
    if (j.contains("periods")) {
        const auto& p = j["periods"];
        Read(p, "current_labels", config.periods.currentLabels);
        Read(p, "prior_labels", config.periods.priorLabels);
    }
    if (j.contains("artifacts")) {
        Read(j["artifacts"], "known_element_types", config.knownElementTypes);
    }
    if (j.contains("review_server")) {
        const auto& r = j["review_server"];
        Read(r, "host", config.reviewServer.host);
        Read(r, "port", config.reviewServer.port);
    }
}

} // namespace finfacts::infrastructure
