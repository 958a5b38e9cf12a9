/**
 * @file EngineArtifactScanner.hpp
 * @brief Scanner for the output files an extraction engine left behind.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/ReportVersion.hpp"

namespace finfacts::infrastructure {

/**
 * @class EngineArtifactScanner
 * @brief Finds one engine's artifacts for one source document.
 *
 * Looks in `<output>/<source stem>/` (recursively) first, then directly in `<output>/`.
 * Only the best available format is returned: content lists, else layout text, else markdown.
 * In a shared directory only files named after the source stem belong to the document.
 */
class EngineArtifactScanner {
public:
    /** @param exclusive True when @p outputDir was created for this one extraction run. */
    EngineArtifactScanner(const std::string& outputDir, bool exclusive);

    /**
     * @brief Scans for the artifacts of one document.
     * @param sourceStem File stem of the source document ("report" for "report.pdf").
     * @return Artifacts of a single kind, ordered by path. Empty when nothing was found.
     */
    std::vector<domain::ArtifactRef> scan(const std::string& sourceStem) const;

    static domain::ArtifactKind ClassifyByName(const std::string& filename);

private:
    std::vector<domain::ArtifactRef> collect(const std::string& dir, bool recursive) const;

    std::string m_outputDir;
    bool m_exclusive;
};

} // namespace finfacts::infrastructure
