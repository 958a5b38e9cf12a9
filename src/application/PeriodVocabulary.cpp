/**
 * @file PeriodVocabulary.cpp
 * @brief Implementation of ClassifyColumnLabel.
 */

#include "application/PeriodVocabulary.hpp"

#include <cstddef>
#include <regex>

#include "domain/FactGroup.hpp"

namespace finfacts::application {

namespace {

constexpr std::ptrdiff_t kMaxPositionDigits = 6;

bool ContainsAny(const std::string& lowered, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (!needle.empty() && lowered.find(domain::AsciiLower(needle)) != std::string::npos) return true;
    }
    return false;
}

} // namespace

ColumnClass ClassifyColumnLabel(const std::string& label, const PeriodSettings& periods) {
    ColumnClass out;
    std::string lowered = domain::AsciiLower(domain::AsciiTrim(label));

    static const std::regex kPositional("^col_([0-9]+)$");
    static const std::regex kYear("(19|20)[0-9]{2}");
    std::smatch m;
    if (std::regex_match(lowered, m, kPositional)) {
        // No real table has that many columns; such labels carry no ranking information.
        if (m[1].length() > kMaxPositionDigits) return out;
        out.role = ColumnRole::Positional;
        out.position = std::stoi(m[1].str());
        return out;
    }
    if (std::regex_search(lowered, m, kYear)) {
        out.year = std::stoi(m[0].str());
    }

    if (ContainsAny(lowered, periods.priorLabels)) {
        out.role = ColumnRole::Prior;
    } else if (ContainsAny(lowered, periods.currentLabels)) {
        out.role = ColumnRole::Current;
    } else if (out.year > 0) {
        out.role = ColumnRole::Year;
    }
    return out;
}

} // namespace finfacts::application
