/**
 * @file ReportContext.hpp
 * @brief Report-level metadata that every engine's candidates are interpreted against.
 */

#pragma once

#include <string>

namespace finfacts::domain {

/**
 * @struct ReportContext
 */
struct ReportContext {
    std::string reportId;
    std::string title;
    std::string companyName;
    std::string ticker;
    std::string reportType = "annual";
    int fiscalYear = 0;
    std::string periodStart;    ///< ISO date; derived from periodEnd for annual reports.
    std::string periodEnd;      ///< ISO date.
    std::string currency;       ///< Report-wide default currency.
    std::string unit;           ///< Report-wide default unit.

    bool hasPeriod() const { return fiscalYear > 0 && !periodEnd.empty(); }
};

} // namespace finfacts::domain
