/**
 * @file DiscrepancyReviewService.cpp
 * @brief Implementation of DiscrepancyReviewService.
 */

#include "application/DiscrepancyReviewService.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "application/CandidateSet.hpp"
#include "application/TimeUtils.hpp"

namespace finfacts::application {

using domain::FactCandidate;
using domain::ResolutionMethod;
using domain::ResolutionStatus;
using domain::ResolvedFact;

DiscrepancyReviewService::DiscrepancyReviewService(std::shared_ptr<domain::FactRepository> repository,
                                                   domain::KeyDefaults defaults)
    : m_repository(std::move(repository)), m_defaults(std::move(defaults)) {}

std::vector<Discrepancy> DiscrepancyReviewService::listDiscrepancies(const DiscrepancyFilter& filter) const {
    std::vector<Discrepancy> out;
    if (filter.reportId.empty()) {
        throw std::invalid_argument("report id is required");
    }

    auto facts = m_repository->loadResolvedFacts(filter.reportId);
    auto candidates = LoadActiveCandidates(*m_repository, filter.reportId);

    for (const auto& fact : facts) {
        if (!fact.isDiscrepancy()) continue;
        if (filter.factType && fact.factType != *filter.factType) continue;
        if (filter.fiscalYear && fact.period.fiscalYear != *filter.fiscalYear) continue;
        if (!filter.period.empty() && filter.period != fact.period.key() &&
            filter.period != fact.period.anchorDate() && filter.period != fact.period.label) {
            continue;
        }

        Discrepancy item;
        item.fact = fact;
        for (const auto& candidate : candidates) {
            if (std::binary_search(fact.candidateIds.begin(), fact.candidateIds.end(), candidate.candidateId)) {
                item.candidates.push_back(candidate);
            }
        }
        out.push_back(std::move(item));
    }
    return out;
}

ResolvedFact DiscrepancyReviewService::submitResolution(const ResolutionRequest& request) {
    if (request.reportId.empty() || request.candidateId.empty()) {
        throw std::invalid_argument("report_id and candidate_id are required");
    }
    if (request.reviewer.empty()) {
        throw std::invalid_argument("reviewer is required");
    }
    if (request.factType != "stock" && request.factType != "flow") {
        throw std::invalid_argument("fact_type must be 'stock' or 'flow'");
    }

    auto candidates = LoadActiveCandidates(*m_repository, request.reportId);
    auto it = std::find_if(candidates.begin(), candidates.end(),
                           [&](const FactCandidate& c) { return c.candidateId == request.candidateId; });
    if (it == candidates.end()) {
        throw std::out_of_range("unknown candidate " + request.candidateId);
    }
    const FactCandidate& chosen = *it;
    if (!chosen.matched) {
        throw std::invalid_argument("candidate " + chosen.candidateId + " is unmatched and belongs to no group");
    }
    if (domain::FactTypeToString(chosen.period.factType) != request.factType) {
        throw std::invalid_argument("candidate " + chosen.candidateId + " is a " +
                                    domain::FactTypeToString(chosen.period.factType) + " fact");
    }
    if (!chosen.value) {
        throw std::invalid_argument("candidate " + chosen.candidateId + " has no numeric value");
    }

    const std::string groupKey = domain::FactGroupKey::FromCandidate(chosen, m_defaults).toString();
    ResolvedFact updated;
    m_repository->updateResolvedFacts(request.reportId, [&](std::vector<ResolvedFact>& facts) {
        auto factIt = std::find_if(facts.begin(), facts.end(),
                                   [&](const ResolvedFact& f) { return f.groupKey == groupKey; });
        if (factIt == facts.end()) {
            throw std::out_of_range("no resolved group " + groupKey);
        }
        if (!domain::AcceptsManualResolution(factIt->status)) {
            throw std::logic_error("group " + groupKey + " is " + domain::ResolutionStatusToString(factIt->status) +
                                   "; only unresolved or verified groups accept manual resolution");
        }
        if (std::find(factIt->candidateIds.begin(), factIt->candidateIds.end(), chosen.candidateId) ==
            factIt->candidateIds.end()) {
            throw std::logic_error("candidate " + chosen.candidateId + " does not compete in group " + groupKey);
        }

        factIt->value = chosen.value;
        factIt->selectedCandidateId = chosen.candidateId;
        factIt->status = ResolutionStatus::Verified;
        factIt->method = ResolutionMethod::Manual;
        factIt->review = domain::ReviewMetadata{request.reviewer, NowIsoTimestamp(), request.notes};
        updated = *factIt;
    });

    std::cout << "[DiscrepancyReview] " << request.reportId << " " << groupKey << " verified by "
              << request.reviewer << " -> " << chosen.candidateId << std::endl;
    return updated;
}

std::vector<ResolvedFact> DiscrepancyReviewService::listFacts(const std::string& reportId) const {
    return m_repository->loadResolvedFacts(reportId);
}

} // namespace finfacts::application
