/**
 * @file ConsensusResolver.hpp
 * @brief Groups candidates across engines and resolves one canonical value per group.
 */

#pragma once

#include <string>
#include <vector>

#include "application/PipelineConfig.hpp"
#include "domain/FactCandidate.hpp"
#include "domain/FactGroup.hpp"
#include "domain/ResolvedFact.hpp"

namespace finfacts::application {

/**
 * @struct AgreementKpi
 * @brief Engine agreement rate, derived from stored resolved facts only.
 */
struct AgreementKpi {
    int multiEngineGroups = 0;
    int agreedGroups = 0;
    double rate = 0.0;      ///< agreed / multi-engine; 0 when there are no multi-engine groups.
};

/**
 * @struct ResolutionStats
 */
struct ResolutionStats {
    int groups = 0;
    int autoAgreed = 0;
    int autoSingleEngine = 0;
    int unresolved = 0;
    int verified = 0;
    int verifiedPreserved = 0;
    int staleRemoved = 0;
    int excludedUnmatched = 0;
};

/**
 * @class ConsensusResolver
 * @brief Pure function of the candidate set; the same input always yields the same facts.
 */
class ConsensusResolver {
public:
    ConsensusResolver(ConsensusSettings settings, PeriodSettings periods, domain::KeyDefaults defaults);

    /** @brief Groups matched candidates by normalized key. Unmatched raw_* candidates are skipped. */
    std::vector<domain::FactGroup> group(const std::vector<domain::FactCandidate>& candidates,
                                         int* excludedUnmatched = nullptr) const;

    domain::ResolvedFact resolveGroup(const domain::FactGroup& group) const;

    std::vector<domain::ResolvedFact> resolve(const std::vector<domain::FactCandidate>& candidates,
                                              ResolutionStats* stats = nullptr) const;

    /**
     * @brief Merges a fresh resolution into the stored set. Verified groups are kept as-is
     * unless @p rerunVerified; stale automatic groups with no candidates left are dropped.
     */
    static void Merge(std::vector<domain::ResolvedFact>& stored,
                      const std::vector<domain::ResolvedFact>& fresh,
                      bool rerunVerified,
                      ResolutionStats& stats);

    static AgreementKpi ComputeAgreement(const std::vector<domain::ResolvedFact>& facts);

    bool withinTolerance(double a, double b) const;

private:
    /** @brief Lower ranks first: current label, later year, lower position, quality, id. */
    bool ranksBefore(const domain::FactCandidate& a, const domain::FactCandidate& b) const;

    ConsensusSettings m_settings;
    PeriodSettings m_periods;
    domain::KeyDefaults m_defaults;
};

} // namespace finfacts::application
