/**
 * @file CandidateBuilder.hpp
 * @brief Turns normalized table grids into typed fact candidates and applies the table quality gate.
 */

#pragma once

#include <string>
#include <vector>

#include "application/MetricMatcher.hpp"
#include "application/PipelineConfig.hpp"
#include "domain/FactCandidate.hpp"
#include "domain/ReportContext.hpp"
#include "domain/TableGrid.hpp"

namespace finfacts::application {

/**
 * @struct TableBuildResult
 * @brief Candidates are empty when the table failed the quality gate.
 */
struct TableBuildResult {
    std::vector<domain::FactCandidate> candidates;
    bool accepted = false;
    std::string rejectReason;
    int distinctMetrics = 0;
    int cellsSeen = 0;
    int matched = 0;
    int unmatched = 0;
    int parseFailures = 0;
};

class CandidateBuilder {
public:
    CandidateBuilder(const MetricMatcher& matcher, CandidateSettings settings, PeriodSettings periods);

    /**
     * @brief Builds candidates for one table; updates the table's statement type and gate outcome.
     */
    TableBuildResult build(domain::RawTableCandidate& table,
                           const domain::ReportContext& context,
                           const std::string& engine,
                           const std::string& versionId) const;

    /**
     * @brief Resolves a column label against the report period. Explicit dates win, then
     * years, then prior/current vocabulary, then positional order (col_1 current, col_2 prior).
     */
    domain::PeriodDescriptor resolvePeriod(const std::string& columnLabel,
                                           domain::FactType factType,
                                           const domain::ReportContext& context) const;

    /** @brief Column label first, then table context, then the configured default. */
    std::string resolveScope(const std::string& columnLabel, const std::string& tableContext) const;

private:
    const MetricMatcher& m_matcher;
    CandidateSettings m_settings;
    PeriodSettings m_periods;
};

} // namespace finfacts::application
