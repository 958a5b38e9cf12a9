/**
 * @file GridNormalizer.cpp
 * @brief Implementation of GridNormalizer.
 */

#include "application/GridNormalizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

#include "application/NumberParser.hpp"
#include "domain/FactGroup.hpp"
#include "domain/LabelText.hpp"

namespace finfacts::application {

using domain::Grid;
using domain::LabelText;
using domain::RawPageTable;
using domain::RawTableCandidate;
using domain::TextFragment;
using domain::TextLine;

namespace {

constexpr size_t kMaxLabelLength = 40;
constexpr size_t kMaxHeaderLines = 3;
constexpr size_t kMaxTitleLines = 2;
constexpr int kMinTextTableRows = 2;

bool IsBlank(const std::string& s) {
    return LabelText::Trim(s).empty();
}

bool IsBareYear(const std::string& text, double value) {
    std::string t = LabelText::Trim(text);
    if (t.size() != 4) return false;
    if (!std::all_of(t.begin(), t.end(), [](unsigned char c) { return std::isdigit(c); })) return false;
    return value >= 1900 && value <= 2100;
}

// A number that can only be a reported amount, not a year heading.
bool IsDataNumber(const std::string& text) {
    ParsedNumber parsed = NumberParser::Parse(text);
    return parsed.ok() && !IsBareYear(text, parsed.value);
}

bool IsPlaceholder(const std::string& text) {
    return !IsBlank(text) && NumberParser::Parse(text).kind == ParsedNumber::Kind::Empty;
}

bool IsNarrative(const std::string& label) {
    return LabelText::Length(label) > kMaxLabelLength || LabelText::Contains(label, "。");
}

std::vector<int> FindYears(const std::string& text) {
    static const std::regex kYear("(19|20)[0-9]{2}");
    std::vector<int> years;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), kYear); it != std::sregex_iterator(); ++it) {
        int year = std::stoi(it->str());
        if (std::find(years.begin(), years.end(), year) == years.end()) years.push_back(year);
    }
    return years;
}

bool ContainsAny(const std::string& text, const std::vector<std::string>& needles) {
    std::string lowered = domain::AsciiLower(text);
    for (const auto& needle : needles) {
        if (!needle.empty() && lowered.find(domain::AsciiLower(needle)) != std::string::npos) return true;
    }
    return false;
}

std::string JoinNonEmpty(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (const auto& part : parts) {
        if (part.empty()) continue;
        if (!out.empty()) out += sep;
        out += part;
    }
    return out;
}

// Top-down merge of header segments; vertically spanned cells repeat and are collapsed.
std::string MergeSegments(const std::vector<std::string>& segments) {
    std::vector<std::string> kept;
    for (const auto& raw : segments) {
        std::string seg = LabelText::Trim(raw);
        if (seg.empty()) continue;
        if (!kept.empty() && kept.back() == seg) continue;
        kept.push_back(seg);
    }
    return JoinNonEmpty(kept, "/");
}

bool IsNoteColumnLabel(const std::string& label) {
    std::string norm = LabelText::Normalize(label);
    return norm == "附注" || norm == "注释" || norm == "note" || norm == "notes" || norm == "附注编号";
}

struct ExpandedGrid {
    Grid text;
    std::vector<std::vector<bool>> header;
};

ExpandedGrid ExpandWithFlags(const domain::CellMatrix& matrix) {
    ExpandedGrid out;
    std::vector<std::vector<bool>> occupied;
    size_t width = 0;

    auto ensure = [&](size_t r, size_t c) {
        if (out.text.size() <= r) {
            out.text.resize(r + 1);
            out.header.resize(r + 1);
            occupied.resize(r + 1);
        }
        if (out.text[r].size() <= c) {
            out.text[r].resize(c + 1);
            out.header[r].resize(c + 1, false);
            occupied[r].resize(c + 1, false);
        }
        width = std::max(width, c + 1);
    };

    for (size_t r = 0; r < matrix.size(); ++r) {
        if (out.text.size() <= r) {
            out.text.resize(r + 1);
            out.header.resize(r + 1);
            occupied.resize(r + 1);
        }
        size_t c = 0;
        for (const auto& cell : matrix[r]) {
            while (c < occupied[r].size() && occupied[r][c]) ++c;
            size_t rowSpan = static_cast<size_t>(std::max(1, cell.rowSpan));
            size_t colSpan = static_cast<size_t>(std::max(1, cell.colSpan));
            for (size_t dr = 0; dr < rowSpan; ++dr) {
                for (size_t dc = 0; dc < colSpan; ++dc) {
                    ensure(r + dr, c + dc);
                    out.text[r + dr][c + dc] = cell.text;
                    out.header[r + dr][c + dc] = cell.isHeader;
                    occupied[r + dr][c + dc] = true;
                }
            }
            c += colSpan;
        }
    }

    for (size_t r = 0; r < out.text.size(); ++r) {
        out.text[r].resize(width);
        out.header[r].resize(width, false);
    }
    return out;
}

struct Interval {
    int start = 0;
    int end = 0;    ///< Exclusive.

    double center() const { return (start + end) / 2.0; }
    bool overlaps(const Interval& other) const { return start < other.end && other.start < end; }
};

Interval FragmentInterval(const TextFragment& fragment) {
    int length = static_cast<int>(LabelText::Length(fragment.text));
    return {fragment.offset, fragment.offset + std::max(1, length)};
}

// Index of the column whose interval overlaps the fragment, else the nearest within slack.
int AssignColumn(const std::vector<Interval>& columns, const Interval& frag, double slack) {
    int nearest = -1;
    double best = 0.0;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].overlaps(frag)) return static_cast<int>(i);
        double distance = std::fabs(columns[i].center() - frag.center());
        if (nearest < 0 || distance < best) {
            nearest = static_cast<int>(i);
            best = distance;
        }
    }
    if (nearest < 0) return -1;
    double reach = (columns[nearest].end - columns[nearest].start + frag.end - frag.start) / 2.0 + slack;
    return best <= reach ? nearest : -1;
}

struct LineInfo {
    bool blank = true;
    bool data = false;
    bool heading = false;
    bool narrative = false;
    std::string label;
    std::vector<const TextFragment*> values;
    std::string text;
};

LineInfo ClassifyLine(const TextLine& line) {
    LineInfo info;
    std::vector<std::string> labelParts;
    std::vector<std::string> allParts;
    bool anyNumber = false;
    for (const auto& fragment : line.fragments) {
        if (IsBlank(fragment.text)) continue;
        info.blank = false;
        allParts.push_back(fragment.text);
        bool number = IsDataNumber(fragment.text);
        if (number || (IsPlaceholder(fragment.text) && !labelParts.empty())) {
            info.values.push_back(&fragment);
            anyNumber = anyNumber || number;
            continue;
        }
        if (info.values.empty()) labelParts.push_back(fragment.text);
    }
    info.label = JoinNonEmpty(labelParts, " ");
    info.text = JoinNonEmpty(allParts, " ");
    info.narrative = IsNarrative(info.label) || LabelText::Length(info.text) > 2 * kMaxLabelLength;
    info.data = anyNumber && !IsNarrative(info.label);
    info.heading = !info.blank && !info.data && line.fragments.size() == 1 &&
                   LabelText::Length(info.text) <= 20 && !LabelText::Contains(info.text, "。");
    return info;
}

} // namespace

GridNormalizer::GridNormalizer(PeriodSettings periods) : m_periods(std::move(periods)) {}

Grid GridNormalizer::ExpandSpans(const domain::CellMatrix& matrix) {
    return ExpandWithFlags(matrix).text;
}

TextLine GridNormalizer::SplitLayoutLine(const std::string& line) {
    TextLine out;
    std::u32string s = LabelText::Decode(line);
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && (s[i] == U' ' || s[i] == U'\t' || s[i] == 0x3000)) ++i;
        if (i >= s.size()) break;
        size_t start = i;
        size_t end = i;
        while (i < s.size()) {
            if (s[i] == U'\t') break;
            bool space = s[i] == U' ' || s[i] == 0x3000;
            if (space) {
                bool nextSpace = i + 1 < s.size() && (s[i + 1] == U' ' || s[i + 1] == U'\t' || s[i + 1] == 0x3000);
                if (nextSpace || i + 1 >= s.size()) break;
            }
            ++i;
            end = i;
        }
        std::string text = LabelText::Encode(s.substr(start, end - start));
        out.fragments.push_back({text, static_cast<int>(start)});
    }
    return out;
}

std::vector<RawTableCandidate> GridNormalizer::normalize(const RawPageTable& raw) const {
    if (raw.kind == domain::PageArtifactKind::Matrix) {
        return {normalizeMatrix(raw)};
    }
    return normalizeLines(raw);
}

RawTableCandidate GridNormalizer::normalizeMatrix(const RawPageTable& raw) const {
    RawTableCandidate table;
    table.page = raw.page;
    table.context = JoinNonEmpty({LabelText::Trim(raw.caption), LabelText::Trim(raw.context)}, "\n");

    ExpandedGrid expanded = ExpandWithFlags(raw.matrix);
    Grid grid;
    std::vector<bool> declaredHeader;
    for (size_t r = 0; r < expanded.text.size(); ++r) {
        const auto& row = expanded.text[r];
        bool empty = std::all_of(row.begin(), row.end(), [](const std::string& cell) { return IsBlank(cell); });
        if (empty) continue;
        grid.push_back(row);
        const auto& flags = expanded.header[r];
        declaredHeader.push_back(!flags.empty() && std::all_of(flags.begin(), flags.end(), [](bool f) { return f; }));
    }
    size_t width = grid.empty() ? 0 : grid.front().size();

    size_t headerRows = 0;
    std::vector<std::vector<std::string>> headerSegments(width);
    while (headerRows < grid.size()) {
        const auto& row = grid[headerRows];
        bool hasData = false;
        for (size_t c = 1; c < row.size(); ++c) {
            if (IsDataNumber(row[c])) hasData = true;
        }
        if (hasData && !declaredHeader[headerRows]) break;

        bool uniform = width > 1 && std::all_of(row.begin(), row.end(),
                                                [&](const std::string& cell) { return cell == row.front(); });
        if (uniform) {
            // Title row spanning the whole table belongs to the caption.
            table.context = JoinNonEmpty({LabelText::Trim(row.front()), table.context}, "\n");
        } else {
            for (size_t c = 0; c < width; ++c) headerSegments[c].push_back(row[c]);
        }
        ++headerRows;
    }
    table.headerRowCount = static_cast<int>(headerRows);

    std::vector<std::string> labels(width);
    for (size_t c = 0; c < width; ++c) labels[c] = MergeSegments(headerSegments[c]);

    std::vector<size_t> keep;
    for (size_t c = 0; c < width; ++c) {
        if (c > 0 && IsNoteColumnLabel(labels[c])) {
            bool anyNumber = false;
            for (size_t r = headerRows; r < grid.size(); ++r) {
                if (IsDataNumber(grid[r][c])) anyNumber = true;
            }
            if (!anyNumber) continue;
        }
        keep.push_back(c);
    }

    for (size_t k = 0; k < keep.size(); ++k) {
        std::string label = labels[keep[k]];
        if (k == 0 && label.empty()) label = "item";
        if (k > 0 && label.empty()) label = "col_" + std::to_string(k);
        table.columnLabels.push_back(label);
    }
    for (size_t r = headerRows; r < grid.size(); ++r) {
        std::vector<std::string> row;
        row.reserve(keep.size());
        for (size_t c : keep) row.push_back(LabelText::Trim(grid[r][c]));
        table.rows.push_back(std::move(row));
    }
    return table;
}

std::vector<RawTableCandidate> GridNormalizer::normalizeLines(const RawPageTable& raw) const {
    std::vector<RawTableCandidate> tables;
    std::vector<LineInfo> infos;
    infos.reserve(raw.lines.size());
    for (const auto& line : raw.lines) infos.push_back(ClassifyLine(line));

    size_t i = 0;
    while (i < infos.size()) {
        if (!infos[i].data) {
            ++i;
            continue;
        }
        size_t blockStart = i;
        size_t blockEnd = i;
        while (i < infos.size() && (infos[i].data || infos[i].heading)) {
            if (infos[i].data) blockEnd = i + 1;
            ++i;
        }

        std::vector<size_t> headerLines;
        for (size_t j = blockStart; j-- > 0 && headerLines.size() < kMaxHeaderLines;) {
            if (infos[j].blank) {
                if (headerLines.empty()) continue;
                break;
            }
            if (infos[j].data || infos[j].narrative) break;
            headerLines.insert(headerLines.begin(), j);
        }

        int dataRows = 0;
        std::vector<Interval> columns;
        for (size_t r = blockStart; r < blockEnd; ++r) {
            if (!infos[r].data) continue;
            ++dataRows;
            for (const TextFragment* value : infos[r].values) columns.push_back(FragmentInterval(*value));
        }
        if (dataRows < kMinTextTableRows || columns.empty()) continue;

        std::sort(columns.begin(), columns.end(),
                  [](const Interval& a, const Interval& b) { return a.start < b.start; });
        std::vector<Interval> merged;
        for (const auto& interval : columns) {
            if (!merged.empty() && interval.start <= merged.back().end) {
                merged.back().end = std::max(merged.back().end, interval.end);
            } else {
                merged.push_back(interval);
            }
        }
        size_t valueColumns = merged.size();

        RawTableCandidate table;
        table.page = raw.page;
        table.headerRowCount = static_cast<int>(headerLines.size());

        std::vector<std::vector<std::string>> headerSegments(valueColumns + 1);
        std::vector<std::string> headerText;
        bool aligned = false;
        for (size_t h : headerLines) {
            std::vector<std::string> lineSegments(valueColumns + 1);
            for (const auto& fragment : raw.lines[h].fragments) {
                if (IsBlank(fragment.text)) continue;
                headerText.push_back(fragment.text);
                Interval frag = FragmentInterval(fragment);
                if (frag.end <= merged.front().start) {
                    lineSegments[0] = JoinNonEmpty({lineSegments[0], fragment.text}, " ");
                    continue;
                }
                int col = AssignColumn(merged, frag, 4.0);
                if (col < 0) continue;
                lineSegments[col + 1] = JoinNonEmpty({lineSegments[col + 1], fragment.text}, " ");
                aligned = true;
            }
            for (size_t c = 0; c <= valueColumns; ++c) headerSegments[c].push_back(lineSegments[c]);
        }

        std::vector<std::string> guessed;
        if (!aligned) {
            std::string joined = JoinNonEmpty(headerText, " ");
            if (joined.empty()) joined = raw.caption;
            guessed = guessColumnLabels(joined, valueColumns);
        }
        std::string labelHeader = MergeSegments(headerSegments[0]);
        table.columnLabels.push_back(labelHeader.empty() ? "item" : labelHeader);
        for (size_t c = 1; c <= valueColumns; ++c) {
            std::string label = aligned ? MergeSegments(headerSegments[c]) : guessed[c - 1];
            if (label.empty()) label = "col_" + std::to_string(c);
            table.columnLabels.push_back(label);
        }

        for (size_t r = blockStart; r < blockEnd; ++r) {
            if (infos[r].blank) continue;
            std::vector<std::string> row(valueColumns + 1);
            row[0] = LabelText::Trim(infos[r].data ? infos[r].label : infos[r].text);
            for (const TextFragment* value : infos[r].values) {
                int col = AssignColumn(merged, FragmentInterval(*value), 0.0);
                if (col >= 0 && row[col + 1].empty()) row[col + 1] = LabelText::Trim(value->text);
            }
            table.rows.push_back(std::move(row));
        }

        // Short lines above the header (e.g. "合并资产负债表") title the block.
        std::vector<std::string> titles;
        size_t top = headerLines.empty() ? blockStart : headerLines.front();
        for (size_t j = top; j-- > 0 && titles.size() < kMaxTitleLines;) {
            if (infos[j].blank) continue;
            if (infos[j].data || LabelText::Length(infos[j].text) > kMaxLabelLength) break;
            titles.insert(titles.begin(), LabelText::Trim(infos[j].text));
        }
        table.context = JoinNonEmpty({JoinNonEmpty(titles, "\n"), LabelText::Trim(raw.caption),
                                      LabelText::Trim(raw.context)}, "\n");
        tables.push_back(std::move(table));
    }
    return tables;
}

std::vector<std::string> GridNormalizer::guessColumnLabels(const std::string& headerText, size_t valueColumns) const {
    std::vector<std::string> labels;
    bool hasCurrent = ContainsAny(headerText, m_periods.currentLabels);
    bool hasPrior = ContainsAny(headerText, m_periods.priorLabels);
    std::vector<int> years = FindYears(headerText);

    if (hasCurrent && hasPrior && valueColumns == 2) {
        labels = {"current_period", "prior_period"};
    } else if (!years.empty() && years.size() >= valueColumns) {
        for (size_t c = 0; c < valueColumns; ++c) labels.push_back(std::to_string(years[c]));
    } else if (years.size() == 1 && valueColumns == 2) {
        labels = {std::to_string(years[0]), std::to_string(years[0] - 1)};
    } else {
        for (size_t c = 1; c <= valueColumns; ++c) labels.push_back("col_" + std::to_string(c));
    }
    return labels;
}

} // namespace finfacts::application
