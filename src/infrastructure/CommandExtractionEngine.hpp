/**
 * @file CommandExtractionEngine.hpp
 * @brief Extraction engine backed by an external command line tool.
 */

#pragma once

#include <string>

#include "application/PipelineConfig.hpp"
#include "domain/ExtractionEngine.hpp"

namespace finfacts::infrastructure {

/**
 * @class CommandExtractionEngine
 * @brief Runs the configured command template under `timeout` and scans what it wrote.
 *
 * `{input}` expands to the source document and `{output}` to the per-version output
 * directory. Without `{output}` the engine's fixed output directory is scanned instead.
 * An empty command only scans (artifacts produced out of band).
 */
class CommandExtractionEngine : public domain::ExtractionEngine {
public:
    explicit CommandExtractionEngine(application::EngineSettings settings);

    std::string name() const override { return m_settings.name; }
    int maxAttempts() const override { return m_settings.maxAttempts; }
    std::chrono::seconds timeout() const override { return std::chrono::seconds(m_settings.timeoutSeconds); }

    domain::ExtractionOutcome extract(const domain::ExtractionRequest& request) override;

    /** @brief Expands the placeholders with shell-quoted paths. */
    static std::string ExpandTemplate(const std::string& commandTemplate,
                                      const std::string& input,
                                      const std::string& output);

    /** @brief Single-quotes @p value for /bin/sh. */
    static std::string ShellQuote(const std::string& value);

private:
    static bool HasTool(const std::string& tool);

    application::EngineSettings m_settings;
};

} // namespace finfacts::infrastructure
