/**
 * @file DiscrepancyReviewService.hpp
 * @brief Lists discrepancies and applies manual resolutions to the canonical fact set.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/FactCandidate.hpp"
#include "domain/FactGroup.hpp"
#include "domain/FactRepository.hpp"
#include "domain/ResolvedFact.hpp"

namespace finfacts::application {

struct DiscrepancyFilter {
    std::string reportId;
    std::optional<domain::FactType> factType;
    std::optional<int> fiscalYear;
    std::string period;         ///< Matches the period key, its anchor date or its label.
};

/**
 * @struct Discrepancy
 * @brief A group whose engines disagreed, with every competing candidate.
 */
struct Discrepancy {
    domain::ResolvedFact fact;
    std::vector<domain::FactCandidate> candidates;
};

struct ResolutionRequest {
    std::string reportId;
    std::string factType;       ///< "stock" or "flow".
    std::string candidateId;
    std::string reviewer;
    std::string notes;
};

/**
 * @class DiscrepancyReviewService
 * @brief unresolved -> verified. Re-submitting on a verified group replaces the manual choice.
 */
class DiscrepancyReviewService {
public:
    DiscrepancyReviewService(std::shared_ptr<domain::FactRepository> repository, domain::KeyDefaults defaults);

    /** @brief Groups whose automatic consensus was unresolved, including those since verified. */
    std::vector<Discrepancy> listDiscrepancies(const DiscrepancyFilter& filter) const;

    /**
     * @brief Applies a manual resolution inside the report's critical section.
     * @throws std::invalid_argument for malformed requests or a fact-type mismatch.
     * @throws std::out_of_range for an unknown candidate or group.
     * @throws std::logic_error when the group is not unresolved or verified.
     */
    domain::ResolvedFact submitResolution(const ResolutionRequest& request);

    std::vector<domain::ResolvedFact> listFacts(const std::string& reportId) const;

private:
    std::shared_ptr<domain::FactRepository> m_repository;
    domain::KeyDefaults m_defaults;
};

} // namespace finfacts::application
