/**
 * @file ReportVersion.hpp
 * @brief Domain entity for one ingestion attempt of one document by one engine.
 */

#pragma once

#include <string>
#include <vector>

namespace finfacts::domain {

/**
 * @enum VersionStatus
 * @brief Lifecycle of an extraction attempt. Only Running is non-terminal.
 */
enum class VersionStatus {
    Running,
    Succeeded,
    Failed
};

inline std::string VersionStatusToString(VersionStatus status) {
    switch (status) {
        case VersionStatus::Running: return "running";
        case VersionStatus::Succeeded: return "succeeded";
        case VersionStatus::Failed: return "failed";
        default: return "failed";
    }
}

inline VersionStatus VersionStatusFromString(const std::string& value) {
    if (value == "running") return VersionStatus::Running;
    if (value == "succeeded") return VersionStatus::Succeeded;
    return VersionStatus::Failed;
}

inline bool IsTerminal(VersionStatus status) {
    return status != VersionStatus::Running;
}

/**
 * @enum ArtifactKind
 * @brief Output formats an engine may leave behind.
 */
enum class ArtifactKind {
    ContentList,    ///< `*_content_list.json` with HTML table bodies.
    LayoutText,     ///< Positional text dump, pages split by form feed.
    Markdown,       ///< Markdown pages with embedded HTML tables.
    Unknown
};

inline std::string ArtifactKindToString(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::ContentList: return "content_list";
        case ArtifactKind::LayoutText: return "layout_text";
        case ArtifactKind::Markdown: return "markdown";
        default: return "unknown";
    }
}

inline ArtifactKind ArtifactKindFromString(const std::string& value) {
    if (value == "content_list") return ArtifactKind::ContentList;
    if (value == "layout_text") return ArtifactKind::LayoutText;
    if (value == "markdown") return ArtifactKind::Markdown;
    return ArtifactKind::Unknown;
}

/**
 * @struct ArtifactRef
 * @brief A discovered engine output file.
 */
struct ArtifactRef {
    std::string path;
    ArtifactKind kind = ArtifactKind::Unknown;
    long long sizeBytes = 0;
};

/**
 * @struct ExtractionSummary
 * @brief Counters recorded on the version when extraction finishes.
 */
struct ExtractionSummary {
    int pages = 0;
    int tablesDetected = 0;
    int tablesAccepted = 0;
    int tablesRejected = 0;
    int candidates = 0;
    int matchedCandidates = 0;
    int unmatchedCandidates = 0;
    int parseFailures = 0;
    int attempts = 0;
};

/**
 * @class ReportVersion
 * @brief Immutable once terminal. Re-ingestion creates a new version id.
 */
class ReportVersion {
public:
    std::string versionId;
    std::string reportId;
    std::string engine;
    VersionStatus status = VersionStatus::Running;
    std::vector<ArtifactRef> artifacts;
    std::string startedAt;          ///< ISO-8601 UTC.
    std::string finishedAt;
    std::string errorMessage;       ///< Set when status is Failed.
    bool timedOut = false;
    ExtractionSummary summary;
};

} // namespace finfacts::domain
