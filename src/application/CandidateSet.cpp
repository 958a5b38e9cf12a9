/**
 * @file CandidateSet.cpp
 * @brief Implementation of the active candidate set selection.
 */

#include "application/CandidateSet.hpp"

#include <algorithm>
#include <map>
#include <tuple>

namespace finfacts::application {

using domain::ReportVersion;

std::vector<ReportVersion> SelectActiveVersions(const std::vector<ReportVersion>& versions) {
    std::map<std::string, const ReportVersion*> latest;
    for (const auto& version : versions) {
        if (!domain::IsTerminal(version.status)) continue;
        auto it = latest.find(version.engine);
        if (it == latest.end()) {
            latest[version.engine] = &version;
            continue;
        }
        const ReportVersion* current = it->second;
        if (std::tie(version.startedAt, version.versionId) > std::tie(current->startedAt, current->versionId)) {
            it->second = &version;
        }
    }
    std::vector<ReportVersion> out;
    for (const auto& [engine, version] : latest) out.push_back(*version);
    return out;
}

std::vector<domain::FactCandidate> LoadActiveCandidates(domain::FactRepository& repository,
                                                        const std::string& reportId) {
    std::vector<domain::FactCandidate> all;
    for (const auto& version : SelectActiveVersions(repository.listVersions(reportId))) {
        auto candidates = repository.loadCandidates(reportId, version.versionId);
        all.insert(all.end(), std::make_move_iterator(candidates.begin()), std::make_move_iterator(candidates.end()));
    }
    std::sort(all.begin(), all.end(), [](const domain::FactCandidate& a, const domain::FactCandidate& b) {
        return a.candidateId < b.candidateId;
    });
    return all;
}

} // namespace finfacts::application
