/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the pipeline configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place so services receive plain
 * configuration structs.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "application/PipelineConfig.hpp"

namespace finfacts::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings from @p path. Missing keys keep their defaults.
     * A missing or malformed file is logged and yields the defaults.
     */
    static application::PipelineConfig Load(const std::string& path);

    /** @brief Applies the keys present in @p j on top of @p config. */
    static void Apply(const nlohmann::json& j, application::PipelineConfig& config);
};

} // namespace finfacts::infrastructure
