#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/CandidateSet.hpp"
#include "application/ConsensusResolver.hpp"
#include "application/DiscrepancyReviewService.hpp"
#include "infrastructure/FileSystemFactRepository.hpp"
#include "infrastructure/ReviewHttpServer.hpp"

using namespace finfacts::domain;
using namespace finfacts::application;
using finfacts::infrastructure::FileSystemFactRepository;
using finfacts::infrastructure::ReviewApi;

namespace {

const std::string kReport = "acme-2023";

FactCandidate Make(const std::string& engine, const std::string& metric, int row, double value, FactType type,
                   const std::string& reportId = kReport, int revision = 1) {
    FactCandidate c;
    c.versionId = engine + "-v" + std::to_string(revision);
    c.candidateId = c.versionId + "-t0-r" + std::to_string(row) + "-c1";
    c.reportId = reportId;
    c.metricCode = metric;
    c.matched = true;
    c.matchMethod = MatchMethod::Exact;
    c.statementType = type == FactType::Stock ? StatementType::Balance : StatementType::Income;
    c.rawLabel = metric;
    c.rawValue = std::to_string(value);
    c.value = value;
    c.engine = engine;
    c.columnLabel = "本期";
    c.columnIndex = 1;
    c.scope = "consolidated";
    c.currency = "CNY";
    c.unit = "yuan";
    c.period.factType = type;
    c.period.fiscalYear = 2023;
    if (type == FactType::Stock) {
        c.period.asOf = "2023-12-31";
    } else {
        c.period.periodStart = "2023-01-01";
        c.period.periodEnd = "2023-12-31";
    }
    c.quality = 1.0;
    return c;
}

ReportVersion Version(const std::string& engine, const std::string& reportId = kReport, int revision = 1) {
    ReportVersion v;
    v.versionId = engine + "-v" + std::to_string(revision);
    v.reportId = reportId;
    v.engine = engine;
    v.status = VersionStatus::Succeeded;
    v.startedAt = "2026-10-19T0" + std::to_string(7 + revision) + ":00:00Z";
    v.finishedAt = "2026-10-19T0" + std::to_string(7 + revision) + ":01:00Z";
    v.artifacts = {{"/tmp/" + engine + "/doc_content_list.json", ArtifactKind::ContentList, 42}};
    v.summary.pages = 3;
    v.summary.candidates = 2;
    return v;
}

std::vector<ResolvedFact> Fresh(FileSystemFactRepository& repo, const std::string& reportId, ResolutionStats& stats) {
    ConsensusResolver resolver(ConsensusSettings{}, PeriodSettings{}, KeyDefaults{});
    return resolver.resolve(LoadActiveCandidates(repo, reportId), &stats);
}

void Resolve(FileSystemFactRepository& repo, const std::string& reportId = kReport) {
    ResolutionStats stats;
    auto fresh = Fresh(repo, reportId, stats);
    repo.updateResolvedFacts(reportId, [&](std::vector<ResolvedFact>& stored) {
        ConsensusResolver::Merge(stored, fresh, false, stats);
    });
}

std::string Body(const std::string& factType, const std::string& candidateId, const std::string& reviewer) {
    nlohmann::json body;
    body["fact_type"] = factType;
    body["candidate_id"] = candidateId;
    body["reviewer"] = reviewer;
    body["notes"] = "matches the printed statement";
    return body.dump();
}

const ResolvedFact* FindMetric(const std::vector<ResolvedFact>& facts, const std::string& metric) {
    for (const auto& fact : facts) {
        if (fact.metricCode == metric) return &fact;
    }
    return nullptr;
}

void SaveDisagreeingRevenue(FileSystemFactRepository& repo, const std::string& reportId) {
    repo.saveVersion(Version("mineru", reportId), {}, {Make("mineru", "revenue", 0, 100.0, FactType::Flow, reportId)});
    repo.saveVersion(Version("docling", reportId), {}, {Make("docling", "revenue", 0, 200.0, FactType::Flow, reportId)});
}

// The resolver and the review server hold separate repository instances on one store.
void TestCrossInstanceSerialization(const std::string& root) {
    const std::string reportId = "beta-2023";
    auto resolverRepo = std::make_shared<FileSystemFactRepository>(root);
    auto serverRepo = std::make_shared<FileSystemFactRepository>(root);
    SaveDisagreeingRevenue(*resolverRepo, reportId);
    Resolve(*resolverRepo, reportId);

    ReviewApi api(std::make_shared<DiscrepancyReviewService>(serverRepo, KeyDefaults{}), serverRepo);
    ResolutionStats stats;
    auto fresh = Fresh(*resolverRepo, reportId, stats);

    std::thread reviewer;
    std::atomic<int> reviewStatus{0};
    resolverRepo->updateResolvedFacts(reportId, [&](std::vector<ResolvedFact>& stored) {
        reviewer = std::thread([&]() {
            reviewStatus = api.submitResolution(reportId, Body("flow", "docling-v1-t0-r0-c1", "carol")).status;
        });
        // The review must wait for this update instead of being overwritten by it.
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        assert(reviewStatus == 0);
        ConsensusResolver::Merge(stored, fresh, false, stats);
    });
    reviewer.join();
    assert(reviewStatus == 200);

    auto facts = FileSystemFactRepository(root).loadResolvedFacts(reportId);
    const ResolvedFact* revenue = FindMetric(facts, "revenue");
    assert(revenue && revenue->status == ResolutionStatus::Verified);
    assert(revenue->selectedCandidateId == "docling-v1-t0-r0-c1");
    assert(revenue->review && revenue->review->reviewer == "carol");
    std::cout << "[PASS] Reviews and resolver runs from separate instances serialize." << std::endl;
}

// A re-ingested engine brings new candidate ids into an already verified group.
void TestVerifiedGroupSeesReingestedCandidates(const std::string& root) {
    const std::string reportId = "gamma-2023";
    auto repo = std::make_shared<FileSystemFactRepository>(root);
    SaveDisagreeingRevenue(*repo, reportId);
    Resolve(*repo, reportId);

    ReviewApi api(std::make_shared<DiscrepancyReviewService>(repo, KeyDefaults{}), repo);
    assert(api.submitResolution(reportId, Body("flow", "docling-v1-t0-r0-c1", "alice")).status == 200);

    repo->saveVersion(Version("docling", reportId, 2), {},
                      {Make("docling", "revenue", 0, 150.0, FactType::Flow, reportId, 2)});
    Resolve(*repo, reportId);

    auto facts = repo->loadResolvedFacts(reportId);
    const ResolvedFact* revenue = FindMetric(facts, "revenue");
    assert(revenue && revenue->status == ResolutionStatus::Verified);
    assert(revenue->selectedCandidateId == "docling-v1-t0-r0-c1");

    auto listed = api.listDiscrepancies(reportId, {});
    assert(listed.status == 200 && listed.body["count"] == 1);
    bool offered = false;
    for (const auto& candidate : listed.body["discrepancies"][0]["candidates"]) {
        if (candidate["candidate_id"] == "docling-v2-t0-r0-c1") offered = true;
        assert(candidate["candidate_id"] != "docling-v1-t0-r0-c1");
    }
    assert(offered);

    auto replaced = api.submitResolution(reportId, Body("flow", "docling-v2-t0-r0-c1", "alice"));
    assert(replaced.status == 200 && replaced.body["value"] == 150.0);
    std::cout << "[PASS] Verified groups offer candidates from re-ingested versions." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Discrepancy Review Round-Trip Test..." << std::endl;

    const std::string testRoot = "test_review_root";
    std::filesystem::remove_all(testRoot);

    auto repo = std::make_shared<FileSystemFactRepository>(testRoot);
    repo->saveVersion(Version("mineru"), {},
                      {Make("mineru", "revenue", 0, 100.0, FactType::Flow),
                       Make("mineru", "total_assets", 1, 500.0, FactType::Stock)});
    repo->saveVersion(Version("docling"), {},
                      {Make("docling", "revenue", 0, 200.0, FactType::Flow),
                       Make("docling", "total_assets", 1, 500.0, FactType::Stock)});

    // Terminal versions are immutable.
    bool rejected = false;
    try {
        repo->saveVersion(Version("mineru"), {}, {});
    } catch (const std::logic_error&) {
        rejected = true;
    }
    assert(rejected && "Rewriting a terminal version must fail.");

    Resolve(*repo);

    // Everything must survive a reopen of the store.
    auto reopened = std::make_shared<FileSystemFactRepository>(testRoot);
    auto version = reopened->findVersion(kReport, "mineru-v1");
    assert(version && version->status == VersionStatus::Succeeded);
    assert(version->artifacts.size() == 1 && version->artifacts[0].kind == ArtifactKind::ContentList);
    assert(version->summary.pages == 3);
    assert(reopened->loadCandidates(kReport, "docling-v1").size() == 2);
    auto facts = reopened->loadResolvedFacts(kReport);
    assert(facts.size() == 2);
    assert(facts[0].groupKey < facts[1].groupKey);
    std::cout << "[PASS] Versions, candidates and facts persist." << std::endl;

    auto review = std::make_shared<DiscrepancyReviewService>(reopened, KeyDefaults{});
    DiscrepancyFilter filter;
    filter.reportId = kReport;
    auto discrepancies = review->listDiscrepancies(filter);
    assert(discrepancies.size() == 1);
    assert(discrepancies[0].fact.metricCode == "revenue");
    assert(discrepancies[0].candidates.size() == 2);
    filter.factType = FactType::Stock;
    assert(review->listDiscrepancies(filter).empty());
    filter.factType.reset();
    filter.fiscalYear = 2022;
    assert(review->listDiscrepancies(filter).empty());
    std::cout << "[PASS] Discrepancies list with their competing candidates." << std::endl;

    ReviewApi api(review, reopened);
    assert(api.health().status == 200);
    assert(api.latestRunReport(kReport).status == 404);
    assert(api.listDiscrepancies(kReport, {{"fact_type", "ratio"}}).status == 400);
    assert(api.listDiscrepancies(kReport, {{"fiscal_year", "abc"}}).status == 400);
    auto listed = api.listDiscrepancies(kReport, {{"fact_type", "flow"}, {"fiscal_year", "2023"}});
    assert(listed.status == 200 && listed.body["count"] == 1);

    assert(api.submitResolution(kReport, "{not json").status == 400);
    assert(api.submitResolution(kReport, R"({"fact_type": "flow", "candidate_id": "mineru-v1-t0-r0-c1"})").status == 400);
    assert(api.submitResolution(kReport, Body("flow", "nobody-v1-t0-r0-c1", "alice")).status == 404);
    assert(api.submitResolution(kReport, Body("stock", "mineru-v1-t0-r0-c1", "alice")).status == 400);
    // Groups the engines agreed on do not accept a manual choice.
    assert(api.submitResolution(kReport, Body("stock", "mineru-v1-t0-r1-c1", "alice")).status == 409);
    assert(api.facts("..").status == 400);
    std::cout << "[PASS] Invalid review requests map to HTTP errors." << std::endl;

    auto accepted = api.submitResolution(kReport, Body("flow", "docling-v1-t0-r0-c1", "alice"));
    assert(accepted.status == 200);
    assert(accepted.body["status"] == "verified");
    assert(accepted.body["consensus_status"] == "unresolved");
    assert(accepted.body["value"] == 200.0);
    assert(accepted.body["review"]["reviewer"] == "alice");

    // Re-submitting on a verified group replaces the manual choice.
    auto replaced = api.submitResolution(kReport, Body("flow", "mineru-v1-t0-r0-c1", "bob"));
    assert(replaced.status == 200 && replaced.body["value"] == 100.0);
    std::cout << "[PASS] Manual resolution verifies the group." << std::endl;

    // A later automatic run keeps the verified choice.
    Resolve(*reopened);
    for (const auto& fact : reopened->loadResolvedFacts(kReport)) {
        if (fact.metricCode != "revenue") continue;
        assert(fact.status == ResolutionStatus::Verified);
        assert(fact.selectedCandidateId == "mineru-v1-t0-r0-c1");
        assert(fact.review && fact.review->reviewer == "bob");
    }
    // Verified discrepancies stay listed for audit.
    assert(api.listDiscrepancies(kReport, {}).body["count"] == 1);
    std::cout << "[PASS] Automatic runs preserve verified groups." << std::endl;

    // Concurrent reviewers serialize on the report.
    std::vector<std::thread> reviewers;
    std::atomic<int> ok{0};
    for (int i = 0; i < 8; ++i) {
        reviewers.emplace_back([&, i]() {
            const std::string candidate = i % 2 == 0 ? "mineru-v1-t0-r0-c1" : "docling-v1-t0-r0-c1";
            if (api.submitResolution(kReport, Body("flow", candidate, "reviewer" + std::to_string(i))).status == 200) {
                ++ok;
            }
        });
    }
    for (auto& t : reviewers) t.join();
    assert(ok == 8);
    auto finalFacts = reopened->loadResolvedFacts(kReport);
    assert(finalFacts.size() == 2);
    std::cout << "[PASS] Concurrent submissions leave a consistent fact set." << std::endl;

    reopened->saveRunReport(kReport, "run-1", R"({"run_id": "run-1"})");
    auto runReport = api.latestRunReport(kReport);
    assert(runReport.status == 200 && runReport.body["run_id"] == "run-1");

    // Resolver lock: exclusive in-process, stale holders are taken over.
    assert(reopened->tryLockReport(kReport));
    assert(!reopened->tryLockReport(kReport));
    assert(!repo->tryLockReport(kReport));
    reopened->unlockReport(kReport);
    assert(repo->tryLockReport(kReport));
    repo->unlockReport(kReport);
    {
        std::ofstream stale(std::filesystem::path(testRoot) / "reports" / kReport / "resolver.lock");
        stale << 4194303;
    }
    assert(repo->tryLockReport(kReport));
    repo->unlockReport(kReport);
    std::cout << "[PASS] Resolver lock is exclusive and recovers from stale holders." << std::endl;

    TestCrossInstanceSerialization(testRoot);
    TestVerifiedGroupSeesReingestedCandidates(testRoot);

    auto reports = api.reports();
    assert(reports.status == 200 && reports.body["count"] == 3);
    assert(reports.body["reports"][0] == kReport);
    assert(reports.body["reports"][1] == "beta-2023");
    assert(reports.body["reports"][2] == "gamma-2023");
    std::cout << "[PASS] Stored reports are listed in order." << std::endl;

    std::filesystem::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
