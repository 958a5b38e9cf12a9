/**
 * @file TableGrid.hpp
 * @brief Raw page artifacts as emitted by engines and the normalized tables derived from them.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/StatementType.hpp"

namespace finfacts::domain {

/**
 * @struct SpannedCell
 * @brief One physical cell of a merged-cell table (HTML td/th).
 */
struct SpannedCell {
    std::string text;
    int rowSpan = 1;
    int colSpan = 1;
    bool isHeader = false;   ///< Declared as a header cell (th).
};

/** @brief Physical rows of a merged-cell table, before span expansion. */
using CellMatrix = std::vector<std::vector<SpannedCell>>;

/** @brief Rectangular grid: every (row, col) resolves to exactly one string. */
using Grid = std::vector<std::vector<std::string>>;

/**
 * @struct TextFragment
 * @brief A run of text on a layout line, positioned by code-point offset.
 */
struct TextFragment {
    std::string text;
    int offset = 0;
};

/**
 * @struct TextLine
 * @brief One line of a positional text dump.
 */
struct TextLine {
    std::vector<TextFragment> fragments;
};

/**
 * @enum PageArtifactKind
 */
enum class PageArtifactKind {
    Matrix,
    TextLines
};

/**
 * @struct RawPageTable
 * @brief One engine-emitted table region of a page, in either raw form.
 */
struct RawPageTable {
    int page = 0;                       ///< 1-based page number.
    PageArtifactKind kind = PageArtifactKind::Matrix;
    CellMatrix matrix;                  ///< Used when kind == Matrix.
    std::vector<TextLine> lines;        ///< Used when kind == TextLines.
    std::string caption;                ///< Caption or heading text above the table.
    std::string context;                ///< Footnotes / text following the table.
};

/**
 * @struct RawTableCandidate
 * @brief A normalized table: column 0 holds row labels, row 0.. are data rows.
 */
struct RawTableCandidate {
    int tableIndex = 0;
    int page = 0;
    std::string context;                ///< Caption plus surrounding text.
    std::vector<std::string> columnLabels;  ///< One per grid column; [0] labels the row-label column.
    Grid rows;                          ///< Data rows only, headers merged away.
    int headerRowCount = 0;
    StatementType statementType = StatementType::Unknown;
    bool accepted = false;
    std::string rejectReason;
};

} // namespace finfacts::domain
