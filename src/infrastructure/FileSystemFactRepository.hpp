/**
 * @file FileSystemFactRepository.hpp
 * @brief Filesystem implementation of the FactRepository.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/FactRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace finfacts::infrastructure {

/**
 * @class FileSystemFactRepository
 * @brief Stores one directory per report under `<root>/reports/<report id>/`.
 *
 * Layout:
 * - `versions/<version id>.json`   version metadata, tables and candidates
 * - `resolved_facts.json`          canonical fact set
 * - `run_reports/<run id>.json`    and `run_report_latest.json`
 * - `resolver.lock`                cross-process resolver lock (holder pid)
 * - `facts.lock`                   flock target serializing resolved-fact updates across processes
 */
class FileSystemFactRepository : public domain::FactRepository {
public:
    explicit FileSystemFactRepository(const std::string& rootPath);

    void saveVersion(const domain::ReportVersion& version,
                     const std::vector<domain::RawTableCandidate>& tables,
                     const std::vector<domain::FactCandidate>& candidates) override;

    std::optional<domain::ReportVersion> findVersion(const std::string& reportId,
                                                     const std::string& versionId) override;
    std::vector<domain::ReportVersion> listVersions(const std::string& reportId) override;
    std::vector<domain::FactCandidate> loadCandidates(const std::string& reportId,
                                                      const std::string& versionId) override;
    std::vector<domain::RawTableCandidate> loadTables(const std::string& reportId,
                                                      const std::string& versionId) override;

    std::vector<domain::ResolvedFact> loadResolvedFacts(const std::string& reportId) override;
    void updateResolvedFacts(const std::string& reportId, const ResolvedFactMutator& mutator) override;

    /** @brief Queued on the persistence worker; the latest report is readable after loadLatestRunReport. */
    void saveRunReport(const std::string& reportId, const std::string& runId,
                       const std::string& reportJson) override;
    std::optional<std::string> loadLatestRunReport(const std::string& reportId) override;

    std::vector<std::string> listReports() override;

    bool tryLockReport(const std::string& reportId) override;
    void unlockReport(const std::string& reportId) override;

    const std::string& rootPath() const { return m_rootPath; }

    /** @brief Rejects ids that would escape the store ("", "..", path separators). */
    static void ValidateId(const std::string& id, const char* what);

private:
    std::string reportDir(const std::string& reportId) const;
    std::string versionPath(const std::string& reportId, const std::string& versionId) const;
    std::string resolvedPath(const std::string& reportId) const;
    std::string lockPath(const std::string& reportId) const;
    std::string factsLockPath(const std::string& reportId) const;

    /** @brief The mutex guarding one report's read-modify-write sections. */
    std::shared_ptr<std::mutex> reportMutex(const std::string& reportId);

    std::optional<nlohmann::json> readJson(const std::string& path) const;
    std::vector<domain::ResolvedFact> readResolvedFacts(const std::string& reportId) const;

    std::string m_rootPath;
    PersistenceService m_persistence;

    std::mutex m_registryMutex;
    std::map<std::string, std::shared_ptr<std::mutex>> m_reportMutexes;
    std::set<std::string> m_heldLocks;
};

} // namespace finfacts::infrastructure
