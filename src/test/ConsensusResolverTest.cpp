#include <algorithm>
#include <cassert>
#include <iostream>

#include "application/ConsensusResolver.hpp"
#include "application/PeriodVocabulary.hpp"

using namespace finfacts::domain;
using namespace finfacts::application;

namespace {

FactCandidate Make(const std::string& id, const std::string& engine, const std::string& metric,
                   std::optional<double> value, const std::string& columnLabel = "本期金额") {
    FactCandidate c;
    c.candidateId = id;
    c.versionId = engine + "-v";
    c.reportId = "r1";
    c.metricCode = metric;
    c.matched = true;
    c.matchMethod = MatchMethod::Exact;
    c.statementType = StatementType::Income;
    c.rawValue = value ? std::to_string(*value) : "n/a";
    c.value = value;
    c.engine = engine;
    c.columnLabel = columnLabel;
    c.scope = "consolidated";
    c.currency = "CNY";
    c.unit = "yuan";
    c.period.factType = FactType::Flow;
    c.period.periodStart = "2023-01-01";
    c.period.periodEnd = "2023-12-31";
    c.period.fiscalYear = 2023;
    c.quality = 1.0;
    return c;
}

ConsensusResolver MakeResolver() {
    return ConsensusResolver(ConsensusSettings{}, PeriodSettings{}, KeyDefaults{});
}

void TestAgreementWithinTolerance() {
    auto resolver = MakeResolver();
    ResolutionStats stats;
    auto facts = resolver.resolve({Make("b-1", "pdftotext", "revenue", 100.005), Make("a-1", "mineru", "revenue", 100.0)},
                                  &stats);
    assert(facts.size() == 1);
    const auto& fact = facts.front();
    assert(fact.status == ResolutionStatus::AutoAgreed);
    assert(fact.consensusStatus == ResolutionStatus::AutoAgreed);
    assert(fact.engineCount == 2);
    assert(fact.selectedCandidateId == "a-1" && fact.value && *fact.value == 100.0);
    assert(fact.candidateIds.size() == 2 && fact.candidateIds[0] == "a-1");
    assert(stats.groups == 1 && stats.autoAgreed == 1);
    std::cout << "[PASS] Engines within tolerance agree." << std::endl;
}

void TestDisagreement() {
    auto resolver = MakeResolver();
    auto facts = resolver.resolve({Make("a-1", "mineru", "revenue", 100.0), Make("b-1", "docling", "revenue", 200.0)});
    assert(facts.size() == 1);
    assert(facts[0].status == ResolutionStatus::Unresolved);
    assert(!facts[0].hasValue() && facts[0].selectedCandidateId.empty());
    assert(facts[0].isDiscrepancy());

    // Two of three engines agreeing is still a discrepancy.
    auto partial = resolver.resolve({Make("a-1", "mineru", "revenue", 100.0), Make("b-1", "docling", "revenue", 100.0),
                                     Make("c-1", "pdftotext", "revenue", 150.0)});
    assert(partial[0].status == ResolutionStatus::Unresolved);
    assert(partial[0].engineCount == 3);
    std::cout << "[PASS] Disagreement leaves the group unresolved." << std::endl;
}

void TestSingleEngine() {
    auto resolver = MakeResolver();
    auto facts = resolver.resolve({Make("a-2", "mineru", "revenue", 60.0, "col_1"),
                                   Make("a-1", "mineru", "revenue", 50.0, "本期金额")});
    assert(facts.size() == 1);
    assert(facts[0].status == ResolutionStatus::AutoSingleEngine);
    assert(facts[0].engineCount == 1);
    // A vocabulary-labelled column outranks a positional one.
    assert(facts[0].selectedCandidateId == "a-1" && *facts[0].value == 50.0);

    // An engine whose cells all failed to parse does not dissent.
    auto parsed = resolver.resolve({Make("a-1", "mineru", "net_profit", 10.0), Make("b-1", "docling", "net_profit", std::nullopt)});
    assert(parsed[0].status == ResolutionStatus::AutoSingleEngine);
    assert(parsed[0].engineCount == 1);
    assert(parsed[0].candidateIds.size() == 2);

    auto none = resolver.resolve({Make("b-1", "docling", "net_profit", std::nullopt)});
    assert(none[0].status == ResolutionStatus::Unresolved && !none[0].hasValue());
    std::cout << "[PASS] Single-engine groups resolve to the best-ranked value." << std::endl;
}

void TestAgreedPrefersCurrentColumn() {
    auto resolver = MakeResolver();
    // The same period may come from a prior-period column (e.g. a later report's comparatives).
    auto facts = resolver.resolve({Make("a-1", "mineru", "revenue", 100.0, "上期金额"),
                                   Make("b-1", "docling", "revenue", 100.0, "本期金额")});
    assert(facts.size() == 1);
    assert(facts[0].status == ResolutionStatus::AutoAgreed);
    assert(facts[0].selectedCandidateId == "b-1");

    auto byYear = resolver.resolve({Make("a-1", "mineru", "revenue", 100.0, "2022年"),
                                    Make("b-1", "docling", "revenue", 100.0, "2023年")});
    assert(byYear[0].selectedCandidateId == "b-1");
    std::cout << "[PASS] Agreed groups select the current-period column." << std::endl;
}

void TestOversizedPositionalLabel() {
    ColumnClass huge = ClassifyColumnLabel("col_99999999999", PeriodSettings{});
    assert(huge.role == ColumnRole::Other && huge.position == 0);
    ColumnClass small = ClassifyColumnLabel("col_3", PeriodSettings{});
    assert(small.role == ColumnRole::Positional && small.position == 3);

    auto resolver = MakeResolver();
    auto facts = resolver.resolve({Make("a-1", "mineru", "revenue", 100.0, "col_99999999999"),
                                   Make("a-2", "mineru", "revenue", 90.0, "col_2")});
    assert(facts.size() == 1);
    assert(facts[0].status == ResolutionStatus::AutoSingleEngine);
    assert(facts[0].selectedCandidateId == "a-2");
    std::cout << "[PASS] Oversized positional labels rank last instead of failing." << std::endl;
}

void TestGrouping() {
    auto resolver = MakeResolver();
    auto a = Make("a-1", "mineru", "revenue", 100.0);
    auto b = Make("b-1", "docling", "revenue", 100.0);
    b.scope = "合并";
    b.currency = "人民币";
    b.unit = "";
    auto c = Make("c-1", "pdftotext", "revenue", 1.0);
    c.unit = "10k_yuan";
    auto unmatched = Make("d-1", "pdftotext", "raw_0123456789ab", 7.0);
    unmatched.matched = false;
    unmatched.matchMethod = MatchMethod::Unmatched;

    int excluded = 0;
    auto groups = resolver.group({a, b, c, unmatched}, &excluded);
    assert(groups.size() == 2);
    assert(excluded == 1);
    size_t sizes = groups[0].candidates.size() + groups[1].candidates.size();
    assert(sizes == 3);
    for (const auto& group : groups) {
        if (group.key.unit == "yuan") {
            assert(group.candidates.size() == 2);
            assert(group.engines().size() == 2);
        } else {
            assert(group.key.unit == "10k_yuan");
        }
    }
    std::cout << "[PASS] Keys normalize scope, currency and unit." << std::endl;
}

void TestDeterminism() {
    auto resolver = MakeResolver();
    std::vector<FactCandidate> input = {
        Make("a-1", "mineru", "revenue", 100.0), Make("b-1", "docling", "revenue", 100.0),
        Make("a-2", "mineru", "net_profit", 10.0), Make("b-2", "docling", "net_profit", 12.0),
        Make("c-1", "pdftotext", "total_profit", 15.0),
    };
    auto first = resolver.resolve(input);
    std::reverse(input.begin(), input.end());
    auto second = resolver.resolve(input);
    assert(first.size() == second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        assert(first[i].groupKey == second[i].groupKey);
        assert(first[i].status == second[i].status);
        assert(first[i].selectedCandidateId == second[i].selectedCandidateId);
    }
    std::cout << "[PASS] Resolution is independent of input order." << std::endl;
}

void TestMergePreservesVerified() {
    auto resolver = MakeResolver();
    auto fresh = resolver.resolve({Make("a-1", "mineru", "revenue", 100.0), Make("b-1", "docling", "revenue", 200.0),
                                   Make("a-2", "mineru", "net_profit", 10.0)});
    assert(fresh.size() == 2);
    const std::string revenueKey = fresh[0].metricCode == "revenue" ? fresh[0].groupKey : fresh[1].groupKey;

    ResolvedFact verified;
    for (const auto& f : fresh) {
        if (f.groupKey == revenueKey) verified = f;
    }
    verified.status = ResolutionStatus::Verified;
    verified.method = ResolutionMethod::Manual;
    verified.value = 200.0;
    verified.selectedCandidateId = "b-1";
    verified.review = ReviewMetadata{"alice", "2026-10-19T00:00:00Z", "checked PDF"};

    ResolvedFact stale;
    stale.groupKey = "total_assets|stock|2023-12-31|consolidated|CNY|yuan";
    stale.status = ResolutionStatus::AutoSingleEngine;

    std::vector<ResolvedFact> stored = {verified, stale};
    ResolutionStats stats;
    ConsensusResolver::Merge(stored, fresh, false, stats);
    assert(stored.size() == 2);
    assert(stats.verifiedPreserved == 1 && stats.staleRemoved == 1 && stats.verified == 1);
    for (const auto& fact : stored) {
        if (fact.groupKey == revenueKey) {
            assert(fact.status == ResolutionStatus::Verified);
            assert(*fact.value == 200.0 && fact.review && fact.review->reviewer == "alice");
        }
    }

    std::vector<ResolvedFact> rerun = {verified};
    ResolutionStats rerunStats;
    ConsensusResolver::Merge(rerun, fresh, true, rerunStats);
    for (const auto& fact : rerun) {
        if (fact.groupKey == revenueKey) {
            assert(fact.status == ResolutionStatus::Unresolved);
            assert(!fact.review);
        }
    }
    assert(rerunStats.verified == 0);
    std::cout << "[PASS] Verified groups survive automatic runs unless re-run is requested." << std::endl;
}

void TestMergeRefreshesVerifiedCompetitors() {
    auto resolver = MakeResolver();
    auto before = resolver.resolve({Make("mineru-v1-c1", "mineru", "revenue", 100.0),
                                    Make("docling-v1-c1", "docling", "revenue", 200.0)});
    ResolvedFact verified = before[0];
    verified.status = ResolutionStatus::Verified;
    verified.method = ResolutionMethod::Manual;
    verified.value = 200.0;
    verified.selectedCandidateId = "docling-v1-c1";
    verified.review = ReviewMetadata{"alice", "2026-10-19T00:00:00Z", ""};

    // docling was re-ingested and a third engine joined.
    auto after = resolver.resolve({Make("mineru-v1-c1", "mineru", "revenue", 100.0),
                                   Make("docling-v2-c1", "docling", "revenue", 200.0),
                                   Make("pdftotext-v1-c1", "pdftotext", "revenue", 300.0)});
    std::vector<ResolvedFact> stored = {verified};
    ResolutionStats stats;
    ConsensusResolver::Merge(stored, after, false, stats);
    assert(stored.size() == 1);
    const auto& fact = stored[0];
    assert(fact.status == ResolutionStatus::Verified && fact.method == ResolutionMethod::Manual);
    assert(fact.selectedCandidateId == "docling-v1-c1" && *fact.value == 200.0);
    assert(fact.review && fact.review->reviewer == "alice");
    assert(fact.engineCount == 3);
    assert(fact.consensusStatus == ResolutionStatus::Unresolved);
    assert(fact.candidateIds == after[0].candidateIds);
    assert(std::find(fact.candidateIds.begin(), fact.candidateIds.end(), "docling-v2-c1") != fact.candidateIds.end());

    // Unchanged candidates leave a verified group exactly as stored.
    std::vector<ResolvedFact> again = stored;
    ResolutionStats againStats;
    ConsensusResolver::Merge(again, after, false, againStats);
    assert(again[0].candidateIds == stored[0].candidateIds);
    assert(again[0].engineCount == stored[0].engineCount);
    assert(again[0].selectedCandidateId == stored[0].selectedCandidateId);
    std::cout << "[PASS] Verified groups track the current competing candidates." << std::endl;
}

void TestAgreementKpi() {
    std::vector<ResolvedFact> facts(4);
    facts[0].engineCount = 2;
    facts[0].consensusStatus = ResolutionStatus::AutoAgreed;
    facts[1].engineCount = 3;
    facts[1].consensusStatus = ResolutionStatus::Unresolved;
    facts[2].engineCount = 1;
    facts[2].consensusStatus = ResolutionStatus::AutoSingleEngine;
    facts[3].engineCount = 2;
    facts[3].status = ResolutionStatus::Verified;
    facts[3].consensusStatus = ResolutionStatus::Unresolved;

    auto kpi = ConsensusResolver::ComputeAgreement(facts);
    assert(kpi.multiEngineGroups == 3);
    assert(kpi.agreedGroups == 1);
    assert(kpi.rate > 0.333 && kpi.rate < 0.334);

    auto empty = ConsensusResolver::ComputeAgreement({});
    assert(empty.multiEngineGroups == 0 && empty.rate == 0.0);
    std::cout << "[PASS] Agreement rate counts multi-engine groups only." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConsensusResolver Test..." << std::endl;
    TestAgreementWithinTolerance();
    TestDisagreement();
    TestSingleEngine();
    TestAgreedPrefersCurrentColumn();
    TestOversizedPositionalLabel();
    TestGrouping();
    TestDeterminism();
    TestMergePreservesVerified();
    TestMergeRefreshesVerifiedCompetitors();
    TestAgreementKpi();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
