/**
 * @file EngineArtifactReader.cpp
 * @brief Implementation of EngineArtifactReader.
 */

#include "infrastructure/EngineArtifactReader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <regex>
#include <sstream>

#include <nlohmann/json.hpp>

#include "application/GridNormalizer.hpp"
#include "domain/LabelText.hpp"

namespace finfacts::infrastructure {

using domain::ArtifactKind;
using domain::DocumentContent;
using domain::LabelText;
using domain::PageArtifactKind;
using domain::RawPageTable;

namespace {

const std::regex kTableRe(R"(<table\b[^>]*>[\s\S]*?</table>)", std::regex::icase);
const std::regex kRowRe(R"(<tr\b[^>]*>([\s\S]*?)</tr>)", std::regex::icase);
const std::regex kCellRe(R"(<(t[dh])\b([^>]*)>([\s\S]*?)</t[dh]>)", std::regex::icase);
const std::regex kRowSpanRe(R"(rowspan\s*=\s*["']?(\d+))", std::regex::icase);
const std::regex kColSpanRe(R"(colspan\s*=\s*["']?(\d+))", std::regex::icase);
const std::regex kBreakRe(R"(<br\s*/?>)", std::regex::icase);
const std::regex kTagRe(R"(<[^>]*>)");
const std::regex kPageNumberRe(R"((?:page|p)[_-]?(\d+))", std::regex::icase);

constexpr int kMaxSpan = 1000;
constexpr size_t kContextLines = 3;

std::string ReadFile(const std::string& path, bool& ok) {
    std::ifstream in(path, std::ios::binary);
    ok = in.is_open();
    if (!ok) return "";
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

int SpanValue(const std::string& attributes, const std::regex& re) {
    std::smatch m;
    if (!std::regex_search(attributes, m, re)) return 1;
    try {
        int value = std::stoi(m[1].str());
        return std::clamp(value, 1, kMaxSpan);
    } catch (const std::exception&) {
        return 1;
    }
}

std::string ReplaceAll(std::string s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

/** @brief table_caption / table_footnote may be a string or a list of strings. */
std::string JoinTextField(const nlohmann::json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end() || it->is_null()) return "";
    if (it->is_string()) return LabelText::Trim(it->get<std::string>());
    std::string out;
    if (it->is_array()) {
        for (const auto& part : *it) {
            if (!part.is_string()) continue;
            std::string text = LabelText::Trim(part.get<std::string>());
            if (text.empty()) continue;
            if (!out.empty()) out += "\n";
            out += text;
        }
    }
    return out;
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream in(text);
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

void AppendPageText(DocumentContent& out, int page, const std::string& text) {
    if (text.empty()) return;
    auto& pageText = out.pageText[page];
    if (!pageText.empty()) pageText += "\n";
    pageText += text;
    out.pageCount = std::max(out.pageCount, page);
}

} // namespace

EngineArtifactReader::EngineArtifactReader(std::vector<std::string> knownElementTypes)
    : m_knownElementTypes(std::move(knownElementTypes)) {}

std::string EngineArtifactReader::HtmlCellText(const std::string& html) {
    std::string text = std::regex_replace(html, kBreakRe, " ");
    text = std::regex_replace(text, kTagRe, "");
    text = ReplaceAll(text, "&nbsp;", " ");
    text = ReplaceAll(text, "&lt;", "<");
    text = ReplaceAll(text, "&gt;", ">");
    text = ReplaceAll(text, "&quot;", "\"");
    text = ReplaceAll(text, "&#39;", "'");
    text = ReplaceAll(text, "&amp;", "&");
    for (char& c : text) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    return LabelText::Trim(text);
}

domain::CellMatrix EngineArtifactReader::ParseHtmlTable(const std::string& html) {
    domain::CellMatrix matrix;
    std::smatch tableMatch;
    if (!std::regex_search(html, tableMatch, kTableRe)) return matrix;
    const std::string table = tableMatch.str();

    for (auto row = std::sregex_iterator(table.begin(), table.end(), kRowRe); row != std::sregex_iterator(); ++row) {
        const std::string rowHtml = (*row)[1].str();
        std::vector<domain::SpannedCell> cells;
        for (auto cell = std::sregex_iterator(rowHtml.begin(), rowHtml.end(), kCellRe);
             cell != std::sregex_iterator(); ++cell) {
            domain::SpannedCell spanned;
            std::string tag = (*cell)[1].str();
            const std::string attributes = (*cell)[2].str();
            spanned.isHeader = std::tolower(static_cast<unsigned char>(tag[1])) == 'h';
            spanned.rowSpan = SpanValue(attributes, kRowSpanRe);
            spanned.colSpan = SpanValue(attributes, kColSpanRe);
            spanned.text = HtmlCellText((*cell)[3].str());
            cells.push_back(std::move(spanned));
        }
        // Rows made only of cells covered by spans from above have no td at all.
        matrix.push_back(std::move(cells));
    }
    return matrix;
}

DocumentContent EngineArtifactReader::read(const std::vector<domain::ArtifactRef>& artifacts) {
    DocumentContent out;
    int markdownPage = 0;
    for (const auto& artifact : artifacts) {
        switch (artifact.kind) {
            case ArtifactKind::ContentList:
                readContentList(artifact.path, out);
                break;
            case ArtifactKind::LayoutText:
                readLayoutText(artifact.path, out);
                break;
            case ArtifactKind::Markdown: {
                int page = ++markdownPage;
                std::smatch m;
                const std::string stem = std::filesystem::path(artifact.path).stem().string();
                if (std::regex_search(stem, m, kPageNumberRe)) {
                    try {
                        page = std::stoi(m[1].str());
                    } catch (const std::exception&) {
                        page = markdownPage;
                    }
                }
                readMarkdown(artifact.path, page, out);
                break;
            }
            default:
                out.warnings.push_back("unsupported artifact " + artifact.path);
                break;
        }
    }
    std::stable_sort(out.tables.begin(), out.tables.end(),
                     [](const RawPageTable& a, const RawPageTable& b) { return a.page < b.page; });
    return out;
}

void EngineArtifactReader::readContentList(const std::string& path, DocumentContent& out) const {
    bool ok = false;
    const std::string text = ReadFile(path, ok);
    if (!ok) {
        out.warnings.push_back("cannot read " + path);
        return;
    }
    nlohmann::json items;
    try {
        items = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        out.warnings.push_back("malformed content list " + path + ": " + e.what());
        return;
    }
    if (!items.is_array()) {
        out.warnings.push_back("content list " + path + " is not an array");
        return;
    }

    int skipped = 0;
    std::map<int, std::string> lastHeading;
    for (const auto& item : items) {
        if (!item.is_object()) continue;
        auto pageIt = item.find("page_idx");
        if (pageIt == item.end() || !pageIt->is_number_integer()) continue;
        const int page = pageIt->get<int>() + 1;
        out.pageCount = std::max(out.pageCount, page);

        std::string type = item.value("type", "");
        std::transform(type.begin(), type.end(), type.begin(), [](unsigned char c) { return std::tolower(c); });
        if (!type.empty() && !m_knownElementTypes.empty() &&
            std::find(m_knownElementTypes.begin(), m_knownElementTypes.end(), type) == m_knownElementTypes.end()) {
            ++skipped;
            continue;
        }

        if (type == "table") {
            RawPageTable table;
            table.page = page;
            table.kind = PageArtifactKind::Matrix;
            table.caption = JoinTextField(item, "table_caption");
            if (table.caption.empty()) table.caption = lastHeading[page];
            table.context = JoinTextField(item, "table_footnote");
            std::string body = item.value("table_body", "");
            table.matrix = ParseHtmlTable(body);
            AppendPageText(out, page, table.caption);
            AppendPageText(out, page, table.context);
            if (table.matrix.empty()) {
                out.warnings.push_back("table without body on page " + std::to_string(page));
                continue;
            }
            out.tables.push_back(std::move(table));
            continue;
        }

        auto textIt = item.find("text");
        if (textIt == item.end() || !textIt->is_string()) continue;
        const std::string itemText = LabelText::Trim(textIt->get<std::string>());
        if (itemText.empty()) continue;
        AppendPageText(out, page, itemText);
        int level = item.value("text_level", 0);
        if (level > 0 || LabelText::Length(itemText) <= 30) lastHeading[page] = itemText;
    }
    if (skipped > 0) {
        out.warnings.push_back(std::to_string(skipped) + " unknown content-list elements skipped in " + path);
    }
}

void EngineArtifactReader::readLayoutText(const std::string& path, DocumentContent& out) const {
    bool ok = false;
    const std::string text = ReadFile(path, ok);
    if (!ok) {
        out.warnings.push_back("cannot read " + path);
        return;
    }

    int page = 0;
    size_t start = 0;
    while (start <= text.size()) {
        size_t feed = text.find('\f', start);
        const std::string pageText = text.substr(start, feed == std::string::npos ? std::string::npos : feed - start);
        ++page;

        RawPageTable raw;
        raw.page = page;
        raw.kind = PageArtifactKind::TextLines;
        for (const auto& line : SplitLines(pageText)) {
            raw.lines.push_back(application::GridNormalizer::SplitLayoutLine(line));
        }
        AppendPageText(out, page, pageText);
        if (!raw.lines.empty()) out.tables.push_back(std::move(raw));

        if (feed == std::string::npos) break;
        start = feed + 1;
    }
    // A trailing form feed does not open another page.
    if (!text.empty() && text.back() == '\f') --page;
    out.pageCount = std::max(out.pageCount, page);
}

void EngineArtifactReader::readMarkdown(const std::string& path, int page, DocumentContent& out) const {
    bool ok = false;
    const std::string text = ReadFile(path, ok);
    if (!ok) {
        out.warnings.push_back("cannot read " + path);
        return;
    }
    out.pageCount = std::max(out.pageCount, page);

    std::string prose;
    size_t cursor = 0;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), kTableRe); it != std::sregex_iterator(); ++it) {
        const size_t start = static_cast<size_t>(it->position());
        const size_t end = start + static_cast<size_t>(it->length());
        const std::string before = text.substr(cursor, start - cursor);
        prose += before;

        RawPageTable table;
        table.page = page;
        table.kind = PageArtifactKind::Matrix;
        table.matrix = ParseHtmlTable(it->str());

        // Caption: the nearest non-empty line above, headings preferred.
        auto linesBefore = SplitLines(before);
        std::string nearest;
        for (auto line = linesBefore.rbegin(); line != linesBefore.rend(); ++line) {
            std::string trimmed = LabelText::Trim(*line);
            if (trimmed.empty()) continue;
            if (trimmed[0] == '#') {
                size_t textStart = trimmed.find_first_not_of('#');
                if (textStart == std::string::npos) continue;
                table.caption = LabelText::Trim(trimmed.substr(textStart));
                break;
            }
            if (nearest.empty()) nearest = trimmed;
        }
        if (table.caption.empty()) table.caption = nearest;

        // Context: the first lines following the table.
        auto next = std::next(it);
        const size_t stop = next == std::sregex_iterator() ? text.size() : static_cast<size_t>(next->position());
        std::vector<std::string> after;
        for (const auto& line : SplitLines(text.substr(end, stop - end))) {
            std::string trimmed = LabelText::Trim(line);
            if (trimmed.empty()) continue;
            after.push_back(trimmed);
            if (after.size() >= kContextLines) break;
        }
        for (const auto& line : after) {
            table.context += (table.context.empty() ? "" : "\n") + line;
        }

        if (!table.matrix.empty()) out.tables.push_back(std::move(table));
        cursor = end;
    }
    prose += text.substr(cursor);
    AppendPageText(out, page, LabelText::Trim(prose));
}

} // namespace finfacts::infrastructure
