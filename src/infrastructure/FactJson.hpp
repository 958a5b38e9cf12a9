/**
 * @file FactJson.hpp
 * @brief JSON mapping of the persisted pipeline entities.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "domain/FactCandidate.hpp"
#include "domain/ReportVersion.hpp"
#include "domain/ResolvedFact.hpp"
#include "domain/TableGrid.hpp"

namespace finfacts::infrastructure {

using json = nlohmann::json;

json ToJson(const domain::PeriodDescriptor& period);
json ToJson(const domain::ReportVersion& version);
json ToJson(const domain::RawTableCandidate& table);
json ToJson(const domain::FactCandidate& candidate);
json ToJson(const domain::ResolvedFact& fact);

/** @brief Readers use value() with defaults so older files with fewer keys still load. */
domain::PeriodDescriptor PeriodFromJson(const json& j);
domain::ReportVersion VersionFromJson(const json& j);
domain::RawTableCandidate TableFromJson(const json& j);
domain::FactCandidate CandidateFromJson(const json& j);
domain::ResolvedFact ResolvedFactFromJson(const json& j);

} // namespace finfacts::infrastructure
