/**
 * @file RunReport.cpp
 * @brief Implementation of RunReport.
 */

#include "application/RunReport.hpp"

#include <map>

namespace finfacts::application {

using domain::ResolutionStatus;

nlohmann::json RunReport::CheckToJson(const domain::ConsistencyCheckResult& check) {
    return {
        {"name", check.name},
        {"scope", check.scope},
        {"date", check.date},
        {"currency", check.currency},
        {"formula", check.formula},
        {"lhs", check.lhs},
        {"rhs", check.rhs},
        {"residual", check.residual},
        {"passed", check.passed}
    };
}

nlohmann::json RunReport::Build(const RunReportInput& input) {
    nlohmann::json engines = nlohmann::json::object();
    int totalCandidates = 0;
    int totalUnmatched = 0;
    for (const auto& version : input.versions) {
        const auto& s = version.summary;
        engines[version.engine] = {
            {"version_id", version.versionId},
            {"status", domain::VersionStatusToString(version.status)},
            {"timed_out", version.timedOut},
            {"error", version.errorMessage},
            {"attempts", s.attempts},
            {"pages", s.pages},
            {"candidates", {
                {"total", s.candidates},
                {"matched", s.matchedCandidates},
                {"unmatched", s.unmatchedCandidates},
                {"parse_failures", s.parseFailures}
            }},
            {"tables", {
                {"detected", s.tablesDetected},
                {"accepted", s.tablesAccepted},
                {"rejected", s.tablesRejected}
            }}
        };
        nlohmann::json rejected = nlohmann::json::array();
        auto it = input.rejectedTables.find(version.engine);
        if (it != input.rejectedTables.end()) {
            for (const auto& table : it->second) {
                rejected.push_back({
                    {"table_index", table.tableIndex},
                    {"page", table.page},
                    {"statement_type", domain::StatementTypeToString(table.statementType)},
                    {"reason", table.rejectReason}
                });
            }
        }
        engines[version.engine]["rejected_tables"] = rejected;
        totalCandidates += s.candidates;
        totalUnmatched += s.unmatchedCandidates;
    }

    std::map<std::string, int> byStatus = {
        {"auto_agreed", 0}, {"auto_single_engine", 0}, {"unresolved", 0}, {"verified", 0}
    };
    int discrepancies = 0;
    for (const auto& fact : input.facts) {
        ++byStatus[domain::ResolutionStatusToString(fact.status)];
        if (fact.isDiscrepancy()) ++discrepancies;
    }

    AgreementKpi kpi = ConsensusResolver::ComputeAgreement(input.facts);

    nlohmann::json checks = nlohmann::json::array();
    int failed = 0;
    for (const auto& check : input.checks) {
        checks.push_back(CheckToJson(check));
        if (!check.passed) ++failed;
    }

    return {
        {"run_id", input.runId},
        {"report_id", input.reportId},
        {"dictionary_version", input.dictionaryVersion},
        {"started_at", input.startedAt},
        {"finished_at", input.finishedAt},
        {"rerun_verified", input.rerunVerified},
        {"engines", engines},
        {"unmatched_label_rate", totalCandidates > 0 ? static_cast<double>(totalUnmatched) / totalCandidates : 0.0},
        {"groups", {
            {"total", static_cast<int>(input.facts.size())},
            {"by_status", byStatus},
            {"discrepancies", discrepancies},
            {"excluded_unmatched_candidates", input.stats.excludedUnmatched},
            {"verified_preserved", input.stats.verifiedPreserved},
            {"stale_removed", input.stats.staleRemoved}
        }},
        {"agreement", {
            {"multi_engine_groups", kpi.multiEngineGroups},
            {"agreed_groups", kpi.agreedGroups},
            {"rate", kpi.rate}
        }},
        {"consistency", {
            {"evaluated", static_cast<int>(input.checks.size())},
            {"failed", failed},
            {"checks", checks}
        }}
    };
}

} // namespace finfacts::application
