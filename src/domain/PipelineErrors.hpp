/**
 * @file PipelineErrors.hpp
 * @brief Exception types for the few pipeline failures that are fatal or retryable.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace finfacts::domain {

/**
 * @brief The taxonomy dictionary could not be loaded. Always fatal.
 */
class DictionaryLoadError : public std::runtime_error {
public:
    explicit DictionaryLoadError(const std::string& message)
        : std::runtime_error("Dictionary load failed: " + message) {}
};

/**
 * @brief Fatal pipeline failure (e.g. every engine failed to extract).
 */
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Another resolver run holds the report. Safe to retry later.
 */
class ConcurrencyConflictError : public std::runtime_error {
public:
    explicit ConcurrencyConflictError(const std::string& reportId)
        : std::runtime_error("Resolver already running for report " + reportId),
          m_reportId(reportId) {}

    const std::string& reportId() const { return m_reportId; }

private:
    std::string m_reportId;
};

} // namespace finfacts::domain
