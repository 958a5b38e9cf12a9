/**
 * @file GridNormalizer.hpp
 * @brief Turns raw engine page output into rectangular, labelled table grids.
 */

#pragma once

#include <string>
#include <vector>

#include "application/PipelineConfig.hpp"
#include "domain/TableGrid.hpp"

namespace finfacts::application {

/**
 * @class GridNormalizer
 * @brief Degrades to positional column labels instead of rejecting irregular tables.
 */
class GridNormalizer {
public:
    explicit GridNormalizer(PeriodSettings periods = PeriodSettings{});

    /**
     * @brief Expands merged cells so every position covered by a span holds the cell's text.
     * Rows reached only by a row span are created; uncovered positions are empty strings.
     */
    static domain::Grid ExpandSpans(const domain::CellMatrix& matrix);

    /**
     * @brief Splits a positional text line into fragments separated by runs of 2+ spaces.
     * Offsets are code-point columns.
     */
    static domain::TextLine SplitLayoutLine(const std::string& line);

    /** @brief Normalizes one raw page table into zero or more table candidates. */
    std::vector<domain::RawTableCandidate> normalize(const domain::RawPageTable& raw) const;

private:
    domain::RawTableCandidate normalizeMatrix(const domain::RawPageTable& raw) const;
    std::vector<domain::RawTableCandidate> normalizeLines(const domain::RawPageTable& raw) const;

    /** @brief Falls back to period vocabulary or years found anywhere in the header text. */
    std::vector<std::string> guessColumnLabels(const std::string& headerText, size_t valueColumns) const;

    PeriodSettings m_periods;
};

} // namespace finfacts::application
