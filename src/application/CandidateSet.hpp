/**
 * @file CandidateSet.hpp
 * @brief Selects the candidate set a report is resolved from.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/FactCandidate.hpp"
#include "domain/FactRepository.hpp"
#include "domain/ReportVersion.hpp"

namespace finfacts::application {

/**
 * @brief Latest terminal version per engine (failed versions included; their partial
 * output is still consumed). Running versions are ignored.
 */
std::vector<domain::ReportVersion> SelectActiveVersions(const std::vector<domain::ReportVersion>& versions);

/** @brief All candidates of the active versions, ordered by candidate id. */
std::vector<domain::FactCandidate> LoadActiveCandidates(domain::FactRepository& repository,
                                                        const std::string& reportId);

} // namespace finfacts::application
