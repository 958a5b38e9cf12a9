/**
 * @file EngineArtifactReader.hpp
 * @brief Turns engine artifacts (content lists, layout text, markdown) into raw page tables.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/ExtractionEngine.hpp"

namespace finfacts::infrastructure {

/**
 * @class EngineArtifactReader
 * @brief Best-effort: unreadable files and unknown elements become warnings, never errors.
 */
class EngineArtifactReader : public domain::ArtifactReader {
public:
    /** @param knownElementTypes Content-list types to accept; empty accepts everything. */
    explicit EngineArtifactReader(std::vector<std::string> knownElementTypes = {});

    domain::DocumentContent read(const std::vector<domain::ArtifactRef>& artifacts) override;

    /** @brief Parses the first HTML table in @p html into physical rows with span counts. */
    static domain::CellMatrix ParseHtmlTable(const std::string& html);

    /** @brief Strips tags and decodes the common entities of one cell's inner HTML. */
    static std::string HtmlCellText(const std::string& html);

private:
    void readContentList(const std::string& path, domain::DocumentContent& out) const;
    void readLayoutText(const std::string& path, domain::DocumentContent& out) const;
    void readMarkdown(const std::string& path, int page, domain::DocumentContent& out) const;

    std::vector<std::string> m_knownElementTypes;
};

} // namespace finfacts::infrastructure
