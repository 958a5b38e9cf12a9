/**
 * @file PeriodVocabulary.hpp
 * @brief Classifies merged column labels by the period they denote.
 */

#pragma once

#include <string>

#include "application/PipelineConfig.hpp"

namespace finfacts::application {

enum class ColumnRole {
    Current,        ///< Matches the configured current-period label set.
    Prior,          ///< Matches the configured prior-period label set.
    Year,           ///< Only a year is known.
    Positional,     ///< col_<n> placeholder.
    Other
};

struct ColumnClass {
    ColumnRole role = ColumnRole::Other;
    int year = 0;           ///< First year mentioned in the label, 0 if none.
    int position = 0;       ///< n of col_<n>, 0 otherwise.
};

/**
 * @brief Prior vocabulary is tested before current so "上年年末余额" is not read as current.
 */
ColumnClass ClassifyColumnLabel(const std::string& label, const PeriodSettings& periods);

} // namespace finfacts::application
