/**
 * @file FactJson.cpp
 * @brief Implementation of the entity JSON mapping.
 */

#include "infrastructure/FactJson.hpp"

namespace finfacts::infrastructure {

using namespace finfacts::domain;

namespace {

json OptionalNumber(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<double> NumberFromJson(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<double>();
}

} // namespace

json ToJson(const PeriodDescriptor& period) {
    return {
        {"fact_type", FactTypeToString(period.factType)},
        {"as_of", period.asOf},
        {"period_start", period.periodStart},
        {"period_end", period.periodEnd},
        {"fiscal_year", period.fiscalYear},
        {"label", period.label}
    };
}

PeriodDescriptor PeriodFromJson(const json& j) {
    PeriodDescriptor period;
    period.factType = FactTypeFromString(j.value("fact_type", "flow"));
    period.asOf = j.value("as_of", "");
    period.periodStart = j.value("period_start", "");
    period.periodEnd = j.value("period_end", "");
    period.fiscalYear = j.value("fiscal_year", 0);
    period.label = j.value("label", "");
    return period;
}

json ToJson(const ReportVersion& version) {
    json artifacts = json::array();
    for (const auto& artifact : version.artifacts) {
        artifacts.push_back({
            {"path", artifact.path},
            {"kind", ArtifactKindToString(artifact.kind)},
            {"size_bytes", artifact.sizeBytes}
        });
    }
    const auto& s = version.summary;
    return {
        {"version_id", version.versionId},
        {"report_id", version.reportId},
        {"engine", version.engine},
        {"status", VersionStatusToString(version.status)},
        {"artifacts", artifacts},
        {"started_at", version.startedAt},
        {"finished_at", version.finishedAt},
        {"error_message", version.errorMessage},
        {"timed_out", version.timedOut},
        {"summary", {
            {"pages", s.pages},
            {"tables_detected", s.tablesDetected},
            {"tables_accepted", s.tablesAccepted},
            {"tables_rejected", s.tablesRejected},
            {"candidates", s.candidates},
            {"matched_candidates", s.matchedCandidates},
            {"unmatched_candidates", s.unmatchedCandidates},
            {"parse_failures", s.parseFailures},
            {"attempts", s.attempts}
        }}
    };
}

ReportVersion VersionFromJson(const json& j) {
    ReportVersion version;
    version.versionId = j.value("version_id", "");
    version.reportId = j.value("report_id", "");
    version.engine = j.value("engine", "");
    version.status = VersionStatusFromString(j.value("status", "failed"));
    if (j.contains("artifacts")) {
        for (const auto& a : j["artifacts"]) {
            ArtifactRef ref;
            ref.path = a.value("path", "");
            ref.kind = ArtifactKindFromString(a.value("kind", ""));
            ref.sizeBytes = a.value("size_bytes", 0LL);
            version.artifacts.push_back(ref);
        }
    }
    version.startedAt = j.value("started_at", "");
    version.finishedAt = j.value("finished_at", "");
    version.errorMessage = j.value("error_message", "");
    version.timedOut = j.value("timed_out", false);
    if (j.contains("summary")) {
        const auto& s = j["summary"];
        version.summary.pages = s.value("pages", 0);
        version.summary.tablesDetected = s.value("tables_detected", 0);
        version.summary.tablesAccepted = s.value("tables_accepted", 0);
        version.summary.tablesRejected = s.value("tables_rejected", 0);
        version.summary.candidates = s.value("candidates", 0);
        version.summary.matchedCandidates = s.value("matched_candidates", 0);
        version.summary.unmatchedCandidates = s.value("unmatched_candidates", 0);
        version.summary.parseFailures = s.value("parse_failures", 0);
        version.summary.attempts = s.value("attempts", 0);
    }
    return version;
}

json ToJson(const RawTableCandidate& table) {
    return {
        {"table_index", table.tableIndex},
        {"page", table.page},
        {"context", table.context},
        {"column_labels", table.columnLabels},
        {"rows", table.rows},
        {"header_row_count", table.headerRowCount},
        {"statement_type", StatementTypeToString(table.statementType)},
        {"accepted", table.accepted},
        {"reject_reason", table.rejectReason}
    };
}

RawTableCandidate TableFromJson(const json& j) {
    RawTableCandidate table;
    table.tableIndex = j.value("table_index", 0);
    table.page = j.value("page", 0);
    table.context = j.value("context", "");
    table.columnLabels = j.value("column_labels", std::vector<std::string>{});
    table.rows = j.value("rows", Grid{});
    table.headerRowCount = j.value("header_row_count", 0);
    table.statementType = StatementTypeFromString(j.value("statement_type", "unknown"));
    table.accepted = j.value("accepted", false);
    table.rejectReason = j.value("reject_reason", "");
    return table;
}

json ToJson(const FactCandidate& c) {
    return {
        {"candidate_id", c.candidateId},
        {"version_id", c.versionId},
        {"report_id", c.reportId},
        {"metric_code", c.metricCode},
        {"matched", c.matched},
        {"match_method", MatchMethodToString(c.matchMethod)},
        {"statement_type", StatementTypeToString(c.statementType)},
        {"raw_label", c.rawLabel},
        {"raw_value", c.rawValue},
        {"value", OptionalNumber(c.value)},
        {"unit", c.unit},
        {"currency", c.currency},
        {"scope", c.scope},
        {"period", ToJson(c.period)},
        {"engine", c.engine},
        {"source_page", c.sourcePage},
        {"table_index", c.tableIndex},
        {"column_index", c.columnIndex},
        {"column_label", c.columnLabel},
        {"quality", c.quality}
    };
}

FactCandidate CandidateFromJson(const json& j) {
    FactCandidate c;
    c.candidateId = j.value("candidate_id", "");
    c.versionId = j.value("version_id", "");
    c.reportId = j.value("report_id", "");
    c.metricCode = j.value("metric_code", "");
    c.matched = j.value("matched", false);
    c.matchMethod = MatchMethodFromString(j.value("match_method", "unmatched"));
    c.statementType = StatementTypeFromString(j.value("statement_type", "unknown"));
    c.rawLabel = j.value("raw_label", "");
    c.rawValue = j.value("raw_value", "");
    c.value = NumberFromJson(j, "value");
    c.unit = j.value("unit", "");
    c.currency = j.value("currency", "");
    c.scope = j.value("scope", "");
    if (j.contains("period")) c.period = PeriodFromJson(j["period"]);
    c.engine = j.value("engine", "");
    c.sourcePage = j.value("source_page", 0);
    c.tableIndex = j.value("table_index", 0);
    c.columnIndex = j.value("column_index", 0);
    c.columnLabel = j.value("column_label", "");
    c.quality = j.value("quality", 0.0);
    return c;
}

json ToJson(const ResolvedFact& f) {
    json j = {
        {"group_key", f.groupKey},
        {"metric_code", f.metricCode},
        {"statement_type", StatementTypeToString(f.statementType)},
        {"fact_type", FactTypeToString(f.factType)},
        {"period", ToJson(f.period)},
        {"scope", f.scope},
        {"currency", f.currency},
        {"unit", f.unit},
        {"value", OptionalNumber(f.value)},
        {"selected_candidate_id", f.selectedCandidateId},
        {"status", ResolutionStatusToString(f.status)},
        {"consensus_status", ResolutionStatusToString(f.consensusStatus)},
        {"method", ResolutionMethodToString(f.method)},
        {"engine_count", f.engineCount},
        {"candidate_ids", f.candidateIds},
        {"review", nullptr}
    };
    if (f.review) {
        j["review"] = {
            {"reviewer", f.review->reviewer},
            {"reviewed_at", f.review->reviewedAt},
            {"notes", f.review->notes}
        };
    }
    return j;
}

ResolvedFact ResolvedFactFromJson(const json& j) {
    ResolvedFact f;
    f.groupKey = j.value("group_key", "");
    f.metricCode = j.value("metric_code", "");
    f.statementType = StatementTypeFromString(j.value("statement_type", "unknown"));
    f.factType = FactTypeFromString(j.value("fact_type", "flow"));
    if (j.contains("period")) f.period = PeriodFromJson(j["period"]);
    f.scope = j.value("scope", "");
    f.currency = j.value("currency", "");
    f.unit = j.value("unit", "");
    f.value = NumberFromJson(j, "value");
    f.selectedCandidateId = j.value("selected_candidate_id", "");
    f.status = ResolutionStatusFromString(j.value("status", "unresolved"));
    f.consensusStatus = ResolutionStatusFromString(j.value("consensus_status", "unresolved"));
    f.method = ResolutionMethodFromString(j.value("method", "consensus"));
    f.engineCount = j.value("engine_count", 0);
    f.candidateIds = j.value("candidate_ids", std::vector<std::string>{});
    auto review = j.find("review");
    if (review != j.end() && review->is_object()) {
        f.review = ReviewMetadata{review->value("reviewer", ""),
                                  review->value("reviewed_at", ""),
                                  review->value("notes", "")};
    }
    return f;
}

} // namespace finfacts::infrastructure
