/**
 * @file ConsensusResolver.cpp
 * @brief Implementation of ConsensusResolver.
 */

#include "application/ConsensusResolver.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <tuple>

#include "application/PeriodVocabulary.hpp"

namespace finfacts::application {

using domain::FactCandidate;
using domain::FactGroup;
using domain::ResolutionMethod;
using domain::ResolutionStatus;
using domain::ResolvedFact;

namespace {

int RoleRank(ColumnRole role) {
    switch (role) {
        case ColumnRole::Current: return 0;
        case ColumnRole::Year: return 1;
        case ColumnRole::Positional: return 2;
        case ColumnRole::Other: return 3;
        case ColumnRole::Prior: return 4;
        default: return 3;
    }
}

} // namespace

ConsensusResolver::ConsensusResolver(ConsensusSettings settings, PeriodSettings periods, domain::KeyDefaults defaults)
    : m_settings(settings), m_periods(std::move(periods)), m_defaults(std::move(defaults)) {}

bool ConsensusResolver::withinTolerance(double a, double b) const {
    double allowed = std::max(m_settings.absTolerance, m_settings.relTolerance * std::max(std::fabs(a), std::fabs(b)));
    return std::fabs(a - b) <= allowed;
}

bool ConsensusResolver::ranksBefore(const FactCandidate& a, const FactCandidate& b) const {
    ColumnClass ca = ClassifyColumnLabel(a.columnLabel, m_periods);
    ColumnClass cb = ClassifyColumnLabel(b.columnLabel, m_periods);
    auto keyA = std::make_tuple(RoleRank(ca.role), -ca.year, ca.position, -a.quality);
    auto keyB = std::make_tuple(RoleRank(cb.role), -cb.year, cb.position, -b.quality);
    if (keyA != keyB) return keyA < keyB;
    return a.candidateId < b.candidateId;
}

std::vector<FactGroup> ConsensusResolver::group(const std::vector<FactCandidate>& candidates,
                                                int* excludedUnmatched) const {
    std::map<std::string, FactGroup> groups;
    int excluded = 0;
    for (const auto& candidate : candidates) {
        if (!candidate.matched) {
            ++excluded;
            continue;
        }
        domain::FactGroupKey key = domain::FactGroupKey::FromCandidate(candidate, m_defaults);
        auto& group = groups[key.toString()];
        if (group.candidates.empty()) group.key = key;
        group.candidates.push_back(candidate);
    }
    if (excludedUnmatched) *excludedUnmatched = excluded;

    std::vector<FactGroup> out;
    out.reserve(groups.size());
    for (auto& [key, group] : groups) {
        std::sort(group.candidates.begin(), group.candidates.end(),
                  [](const FactCandidate& a, const FactCandidate& b) { return a.candidateId < b.candidateId; });
        out.push_back(std::move(group));
    }
    return out;
}

ResolvedFact ConsensusResolver::resolveGroup(const FactGroup& group) const {
    ResolvedFact fact;
    fact.groupKey = group.key.toString();
    fact.metricCode = group.key.metricCode;
    fact.factType = group.key.factType;
    fact.period = group.key.period;
    fact.scope = group.key.scope;
    fact.currency = group.key.currency;
    fact.unit = group.key.unit;
    fact.method = ResolutionMethod::Consensus;
    if (!group.candidates.empty()) fact.statementType = group.candidates.front().statementType;

    std::vector<const FactCandidate*> valued;
    std::set<std::string> engines;
    for (const auto& candidate : group.candidates) {
        fact.candidateIds.push_back(candidate.candidateId);
        if (candidate.value) {
            valued.push_back(&candidate);
            engines.insert(candidate.engine);
        }
    }
    std::sort(fact.candidateIds.begin(), fact.candidateIds.end());
    // Engines whose every cell failed to parse do not count as dissent.
    fact.engineCount = static_cast<int>(engines.empty() ? group.engines().size() : engines.size());

    auto finish = [&fact](ResolutionStatus status, const FactCandidate* chosen) {
        fact.status = status;
        fact.consensusStatus = status;
        if (chosen) {
            fact.value = chosen->value;
            fact.selectedCandidateId = chosen->candidateId;
        }
        return fact;
    };

    if (valued.empty()) return finish(ResolutionStatus::Unresolved, nullptr);

    std::sort(valued.begin(), valued.end(),
              [this](const FactCandidate* a, const FactCandidate* b) { return ranksBefore(*a, *b); });

    if (engines.size() == 1) return finish(ResolutionStatus::AutoSingleEngine, valued.front());

    // Each candidate anchors a cluster of values within tolerance of it.
    const FactCandidate* bestAnchor = nullptr;
    size_t bestSize = 0;
    for (const FactCandidate* anchor : valued) {
        std::set<std::string> support;
        size_t size = 0;
        for (const FactCandidate* other : valued) {
            if (withinTolerance(*anchor->value, *other->value)) {
                support.insert(other->engine);
                ++size;
            }
        }
        if (support.size() == engines.size() && size > bestSize) {
            bestAnchor = anchor;
            bestSize = size;
        }
    }
    if (!bestAnchor) return finish(ResolutionStatus::Unresolved, nullptr);

    // Majority value within the agreeing cluster; ties go to the better-ranked candidate.
    std::map<double, int> votes;
    for (const FactCandidate* c : valued) {
        if (withinTolerance(*bestAnchor->value, *c->value)) ++votes[*c->value];
    }
    int topVotes = 0;
    for (const auto& [value, count] : votes) topVotes = std::max(topVotes, count);
    for (const FactCandidate* c : valued) {
        if (withinTolerance(*bestAnchor->value, *c->value) && votes[*c->value] == topVotes) {
            return finish(ResolutionStatus::AutoAgreed, c);
        }
    }
    return finish(ResolutionStatus::Unresolved, nullptr);
}

std::vector<ResolvedFact> ConsensusResolver::resolve(const std::vector<FactCandidate>& candidates,
                                                     ResolutionStats* stats) const {
    int excluded = 0;
    std::vector<FactGroup> groups = group(candidates, &excluded);
    std::vector<ResolvedFact> facts;
    facts.reserve(groups.size());
    for (const auto& g : groups) facts.push_back(resolveGroup(g));

    if (stats) {
        stats->excludedUnmatched = excluded;
        stats->groups = static_cast<int>(facts.size());
        for (const auto& fact : facts) {
            if (fact.status == ResolutionStatus::AutoAgreed) ++stats->autoAgreed;
            else if (fact.status == ResolutionStatus::AutoSingleEngine) ++stats->autoSingleEngine;
            else ++stats->unresolved;
        }
    }
    return facts;
}

void ConsensusResolver::Merge(std::vector<ResolvedFact>& stored,
                              const std::vector<ResolvedFact>& fresh,
                              bool rerunVerified,
                              ResolutionStats& stats) {
    std::map<std::string, ResolvedFact> merged;
    std::map<std::string, const ResolvedFact*> freshByKey;
    for (const auto& fact : fresh) freshByKey[fact.groupKey] = &fact;

    for (const auto& existing : stored) {
        if (existing.status == ResolutionStatus::Verified &&
            !domain::AutomaticRunMayOverwrite(existing.status, rerunVerified)) {
            ResolvedFact kept = existing;
            auto current = freshByKey.find(existing.groupKey);
            if (current != freshByKey.end()) {
                // The manual choice stays; the competing set follows the active versions.
                kept.candidateIds = current->second->candidateIds;
                kept.engineCount = current->second->engineCount;
                kept.consensusStatus = current->second->consensusStatus;
                ++stats.verifiedPreserved;
            }
            merged[existing.groupKey] = std::move(kept);
        } else if (!freshByKey.count(existing.groupKey)) {
            ++stats.staleRemoved;
        }
    }
    for (const auto& fact : fresh) {
        if (merged.count(fact.groupKey)) continue;
        merged[fact.groupKey] = fact;
    }

    stored.clear();
    stats.verified = 0;
    for (auto& [key, fact] : merged) {
        if (fact.status == ResolutionStatus::Verified) ++stats.verified;
        stored.push_back(std::move(fact));
    }
}

AgreementKpi ConsensusResolver::ComputeAgreement(const std::vector<ResolvedFact>& facts) {
    AgreementKpi kpi;
    for (const auto& fact : facts) {
        if (fact.engineCount < 2) continue;
        ++kpi.multiEngineGroups;
        if (fact.consensusStatus == ResolutionStatus::AutoAgreed) ++kpi.agreedGroups;
    }
    if (kpi.multiEngineGroups > 0) {
        kpi.rate = static_cast<double>(kpi.agreedGroups) / kpi.multiEngineGroups;
    }
    return kpi;
}

} // namespace finfacts::application
