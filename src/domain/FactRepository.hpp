/**
 * @file FactRepository.hpp
 * @brief Repository interface for report versions, candidates, resolved facts and run reports.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/FactCandidate.hpp"
#include "domain/ReportVersion.hpp"
#include "domain/ResolvedFact.hpp"
#include "domain/TableGrid.hpp"

namespace finfacts::domain {

/**
 * @class FactRepository
 * @brief Persistence boundary of the pipeline. A version write is the transaction unit.
 */
class FactRepository {
public:
    using ResolvedFactMutator = std::function<void(std::vector<ResolvedFact>&)>;

    virtual ~FactRepository() = default;

    /**
     * @brief Writes a version together with its tables and candidates in one atomic step.
     * @throws std::logic_error if the stored version already reached a terminal status.
     */
    virtual void saveVersion(const ReportVersion& version,
                             const std::vector<RawTableCandidate>& tables,
                             const std::vector<FactCandidate>& candidates) = 0;

    virtual std::optional<ReportVersion> findVersion(const std::string& reportId,
                                                     const std::string& versionId) = 0;
    virtual std::vector<ReportVersion> listVersions(const std::string& reportId) = 0;
    virtual std::vector<FactCandidate> loadCandidates(const std::string& reportId,
                                                      const std::string& versionId) = 0;
    virtual std::vector<RawTableCandidate> loadTables(const std::string& reportId,
                                                      const std::string& versionId) = 0;

    virtual std::vector<ResolvedFact> loadResolvedFacts(const std::string& reportId) = 0;

    /**
     * @brief Read-modify-write of a report's resolved facts inside the report's critical section.
     * Both automatic resolution and manual review go through here.
     */
    virtual void updateResolvedFacts(const std::string& reportId, const ResolvedFactMutator& mutator) = 0;

    virtual void saveRunReport(const std::string& reportId, const std::string& runId,
                               const std::string& reportJson) = 0;
    virtual std::optional<std::string> loadLatestRunReport(const std::string& reportId) = 0;

    virtual std::vector<std::string> listReports() = 0;

    /**
     * @brief Cross-process resolver lock. Returns false if another holder exists.
     */
    virtual bool tryLockReport(const std::string& reportId) = 0;
    virtual void unlockReport(const std::string& reportId) = 0;
};

} // namespace finfacts::domain
