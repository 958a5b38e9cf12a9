/**
 * @file ExtractionEngine.hpp
 * @brief Interfaces for extraction engines and for reading what they leave on disk.
 */

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "domain/ReportVersion.hpp"
#include "domain/TableGrid.hpp"

namespace finfacts::domain {

/**
 * @struct ExtractionRequest
 */
struct ExtractionRequest {
    std::string reportId;
    std::string versionId;
    std::string sourcePath;     ///< The document to extract.
    std::string outputDir;      ///< Per-version scratch directory the engine may write to.
    std::chrono::seconds timeout{600};
};

/**
 * @struct ExtractionOutcome
 * @brief Artifacts are reported even when the run failed or timed out.
 */
struct ExtractionOutcome {
    bool success = false;
    bool timedOut = false;
    int exitCode = 0;
    std::string message;
    std::vector<ArtifactRef> artifacts;
};

/**
 * @class ExtractionEngine
 * @brief One external extraction engine. Implementations hold no state shared with other engines.
 */
class ExtractionEngine {
public:
    virtual ~ExtractionEngine() = default;

    virtual std::string name() const = 0;

    /** @brief Attempts allowed for one job (first run plus retries). */
    virtual int maxAttempts() const { return 2; }

    virtual std::chrono::seconds timeout() const { return std::chrono::seconds(600); }

    virtual ExtractionOutcome extract(const ExtractionRequest& request) = 0;
};

/**
 * @struct DocumentContent
 * @brief Everything the normalizer and metadata extractor need from an engine's artifacts.
 */
struct DocumentContent {
    std::vector<RawPageTable> tables;
    std::map<int, std::string> pageText;    ///< Non-table text per 1-based page.
    int pageCount = 0;
    std::vector<std::string> warnings;
};

/**
 * @class ArtifactReader
 */
class ArtifactReader {
public:
    virtual ~ArtifactReader() = default;
    virtual DocumentContent read(const std::vector<ArtifactRef>& artifacts) = 0;
};

} // namespace finfacts::domain
