/**
 * @file RunReport.hpp
 * @brief Run-level summary artifact written after every resolver run.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/ConsensusResolver.hpp"
#include "domain/ConsistencyCheckResult.hpp"
#include "domain/ReportVersion.hpp"
#include "domain/ResolvedFact.hpp"
#include "domain/TableGrid.hpp"

namespace finfacts::application {

/**
 * @struct RunReportInput
 * @brief Everything one resolver run observed.
 */
struct RunReportInput {
    std::string runId;
    std::string reportId;
    std::string dictionaryVersion;
    std::string startedAt;
    std::string finishedAt;
    bool rerunVerified = false;
    std::vector<domain::ReportVersion> versions;     ///< Active version per engine.
    std::map<std::string, std::vector<domain::RawTableCandidate>> rejectedTables;  ///< Keyed by engine.
    ResolutionStats stats;
    std::vector<domain::ResolvedFact> facts;         ///< Stored set after the merge.
    std::vector<domain::ConsistencyCheckResult> checks;
};

class RunReport {
public:
    /**
     * @brief Builds the report document: per-engine candidate and table counts, version
     * status, unmatched-label rate, group counts by status, agreement KPI and consistency checks.
     * Rejected tables are listed per engine with the reason they produced no facts.
     */
    static nlohmann::json Build(const RunReportInput& input);

    static nlohmann::json CheckToJson(const domain::ConsistencyCheckResult& check);
};

} // namespace finfacts::application
