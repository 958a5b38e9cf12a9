/**
 * @file FileSystemFactRepository.cpp
 * @brief Implementation of FileSystemFactRepository.
 */

#include "infrastructure/FileSystemFactRepository.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/types.h>
#include <unistd.h>

#include "infrastructure/FactJson.hpp"

namespace fs = std::filesystem;

namespace finfacts::infrastructure {

using namespace finfacts::domain;

namespace {

constexpr const char* kResolvedFile = "resolved_facts.json";
constexpr const char* kLatestRunReport = "run_report_latest.json";
constexpr const char* kLockFile = "resolver.lock";
constexpr const char* kFactsLockFile = "facts.lock";

std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return "";
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

/** @brief A lock file whose holder process no longer exists may be taken over. */
bool LockHolderAlive(const std::string& path) {
    std::string content = ReadFile(path);
    long pid = 0;
    try {
        pid = std::stol(content);
    } catch (const std::exception&) {
        return true;    // Unknown holder (being written or foreign); treat as held.
    }
    if (pid <= 0) return true;
    if (::kill(static_cast<pid_t>(pid), 0) == 0) return true;
    return errno != ESRCH;
}

/**
 * @brief Exclusive flock held for the lifetime of the guard.
 * Separate open file descriptions conflict, so this also orders writers inside one process.
 */
class FileLockGuard {
public:
    explicit FileLockGuard(const std::string& path) {
        m_fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (m_fd < 0) {
            throw std::runtime_error("Cannot open lock file " + path + ": " + std::strerror(errno));
        }
        while (::flock(m_fd, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            const int error = errno;
            ::close(m_fd);
            throw std::runtime_error("Cannot lock " + path + ": " + std::strerror(error));
        }
    }

    ~FileLockGuard() {
        ::flock(m_fd, LOCK_UN);
        ::close(m_fd);
    }

    FileLockGuard(const FileLockGuard&) = delete;
    FileLockGuard& operator=(const FileLockGuard&) = delete;

private:
    int m_fd = -1;
};

} // namespace

FileSystemFactRepository::FileSystemFactRepository(const std::string& rootPath)
    : m_rootPath(rootPath) {
    std::error_code ec;
    fs::create_directories(fs::path(m_rootPath) / "reports", ec);
    if (ec) {
        throw std::runtime_error("Cannot create fact store at " + m_rootPath + ": " + ec.message());
    }
}

void FileSystemFactRepository::ValidateId(const std::string& id, const char* what) {
    if (id.empty() || id == "." || id == ".." ||
        id.find('/') != std::string::npos || id.find('\\') != std::string::npos) {
        throw std::invalid_argument(std::string("invalid ") + what + ": '" + id + "'");
    }
}

std::string FileSystemFactRepository::reportDir(const std::string& reportId) const {
    ValidateId(reportId, "report id");
    return (fs::path(m_rootPath) / "reports" / reportId).string();
}

std::string FileSystemFactRepository::versionPath(const std::string& reportId,
                                                  const std::string& versionId) const {
    ValidateId(versionId, "version id");
    return (fs::path(reportDir(reportId)) / "versions" / (versionId + ".json")).string();
}

std::string FileSystemFactRepository::resolvedPath(const std::string& reportId) const {
    return (fs::path(reportDir(reportId)) / kResolvedFile).string();
}

std::string FileSystemFactRepository::lockPath(const std::string& reportId) const {
    return (fs::path(reportDir(reportId)) / kLockFile).string();
}

std::string FileSystemFactRepository::factsLockPath(const std::string& reportId) const {
    return (fs::path(reportDir(reportId)) / kFactsLockFile).string();
}

std::shared_ptr<std::mutex> FileSystemFactRepository::reportMutex(const std::string& reportId) {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    auto& entry = m_reportMutexes[reportId];
    if (!entry) entry = std::make_shared<std::mutex>();
    return entry;
}

std::optional<nlohmann::json> FileSystemFactRepository::readJson(const std::string& path) const {
    if (!fs::exists(path)) return std::nullopt;
    try {
        return json::parse(ReadFile(path));
    } catch (const json::exception& e) {
        std::cerr << "[FactRepository] Corrupt file " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

void FileSystemFactRepository::saveVersion(const ReportVersion& version,
                                           const std::vector<RawTableCandidate>& tables,
                                           const std::vector<FactCandidate>& candidates) {
    const std::string path = versionPath(version.reportId, version.versionId);
    auto mutex = reportMutex(version.reportId);
    std::lock_guard<std::mutex> lock(*mutex);

    if (auto existing = readJson(path)) {
        if (existing->contains("version")) {
            auto stored = VersionFromJson((*existing)["version"]);
            if (IsTerminal(stored.status)) {
                throw std::logic_error("version " + version.versionId + " is already " +
                                       VersionStatusToString(stored.status) + " and cannot be rewritten");
            }
        }
    }

    json doc;
    doc["version"] = ToJson(version);
    doc["tables"] = json::array();
    for (const auto& table : tables) doc["tables"].push_back(ToJson(table));
    doc["candidates"] = json::array();
    for (const auto& candidate : candidates) doc["candidates"].push_back(ToJson(candidate));

    m_persistence.saveText(path, doc.dump(2));
}

std::optional<ReportVersion> FileSystemFactRepository::findVersion(const std::string& reportId,
                                                                   const std::string& versionId) {
    auto doc = readJson(versionPath(reportId, versionId));
    if (!doc || !doc->contains("version")) return std::nullopt;
    return VersionFromJson((*doc)["version"]);
}

std::vector<ReportVersion> FileSystemFactRepository::listVersions(const std::string& reportId) {
    std::vector<ReportVersion> versions;
    fs::path dir = fs::path(reportDir(reportId)) / "versions";
    if (!fs::exists(dir)) return versions;

    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        auto doc = readJson(entry.path().string());
        if (doc && doc->contains("version")) {
            versions.push_back(VersionFromJson((*doc)["version"]));
        }
    }
    std::sort(versions.begin(), versions.end(), [](const ReportVersion& a, const ReportVersion& b) {
        return a.versionId < b.versionId;
    });
    return versions;
}

std::vector<FactCandidate> FileSystemFactRepository::loadCandidates(const std::string& reportId,
                                                                    const std::string& versionId) {
    std::vector<FactCandidate> candidates;
    auto doc = readJson(versionPath(reportId, versionId));
    if (!doc || !doc->contains("candidates")) return candidates;
    for (const auto& c : (*doc)["candidates"]) candidates.push_back(CandidateFromJson(c));
    return candidates;
}

std::vector<RawTableCandidate> FileSystemFactRepository::loadTables(const std::string& reportId,
                                                                   const std::string& versionId) {
    std::vector<RawTableCandidate> tables;
    auto doc = readJson(versionPath(reportId, versionId));
    if (!doc || !doc->contains("tables")) return tables;
    for (const auto& t : (*doc)["tables"]) tables.push_back(TableFromJson(t));
    return tables;
}

std::vector<ResolvedFact> FileSystemFactRepository::readResolvedFacts(const std::string& reportId) const {
    std::vector<ResolvedFact> facts;
    auto doc = readJson(resolvedPath(reportId));
    if (!doc || !doc->contains("facts")) return facts;
    for (const auto& f : (*doc)["facts"]) facts.push_back(ResolvedFactFromJson(f));
    return facts;
}

std::vector<ResolvedFact> FileSystemFactRepository::loadResolvedFacts(const std::string& reportId) {
    auto mutex = reportMutex(reportId);
    std::lock_guard<std::mutex> lock(*mutex);
    return readResolvedFacts(reportId);
}

void FileSystemFactRepository::updateResolvedFacts(const std::string& reportId,
                                                   const ResolvedFactMutator& mutator) {
    auto mutex = reportMutex(reportId);
    std::lock_guard<std::mutex> lock(*mutex);

    // The resolver and the review server usually run as separate processes.
    const std::string lockFile = factsLockPath(reportId);
    std::error_code ec;
    fs::create_directories(fs::path(lockFile).parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Cannot create report directory " + reportDir(reportId) + ": " + ec.message());
    }
    FileLockGuard fileLock(lockFile);

    auto facts = readResolvedFacts(reportId);
    mutator(facts);     // An exception here leaves the stored set untouched.

    std::sort(facts.begin(), facts.end(), [](const ResolvedFact& a, const ResolvedFact& b) {
        return a.groupKey < b.groupKey;
    });
    json doc;
    doc["report_id"] = reportId;
    doc["facts"] = json::array();
    for (const auto& fact : facts) doc["facts"].push_back(ToJson(fact));
    m_persistence.saveText(resolvedPath(reportId), doc.dump(2));
}

void FileSystemFactRepository::saveRunReport(const std::string& reportId, const std::string& runId,
                                             const std::string& reportJson) {
    ValidateId(runId, "run id");
    fs::path dir = reportDir(reportId);
    m_persistence.saveTextAsync((dir / "run_reports" / (runId + ".json")).string(), reportJson);
    m_persistence.saveTextAsync((dir / kLatestRunReport).string(), reportJson);
}

std::optional<std::string> FileSystemFactRepository::loadLatestRunReport(const std::string& reportId) {
    m_persistence.flush();
    fs::path path = fs::path(reportDir(reportId)) / kLatestRunReport;
    if (!fs::exists(path)) return std::nullopt;
    return ReadFile(path.string());
}

std::vector<std::string> FileSystemFactRepository::listReports() {
    std::vector<std::string> reports;
    fs::path dir = fs::path(m_rootPath) / "reports";
    if (!fs::exists(dir)) return reports;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_directory()) reports.push_back(entry.path().filename().string());
    }
    std::sort(reports.begin(), reports.end());
    return reports;
}

bool FileSystemFactRepository::tryLockReport(const std::string& reportId) {
    const std::string path = lockPath(reportId);
    std::lock_guard<std::mutex> lock(m_registryMutex);
    if (m_heldLocks.count(reportId)) return false;

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Cannot create report directory for lock: " + ec.message());
    }

    for (int attempt = 0; attempt < 2; ++attempt) {
        int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
        if (fd >= 0) {
            const std::string pid = std::to_string(::getpid());
            ssize_t written = ::write(fd, pid.data(), pid.size());
            ::close(fd);
            if (written != static_cast<ssize_t>(pid.size())) {
                std::cerr << "[FactRepository] Short write on lock file " << path << std::endl;
            }
            m_heldLocks.insert(reportId);
            return true;
        }
        if (errno != EEXIST) {
            throw std::runtime_error("Cannot create lock file " + path + ": " + std::strerror(errno));
        }
        if (LockHolderAlive(path)) return false;

        std::cerr << "[FactRepository] Removing stale resolver lock " << path << std::endl;
        fs::remove(path, ec);
    }
    return false;
}

void FileSystemFactRepository::unlockReport(const std::string& reportId) {
    const std::string path = lockPath(reportId);
    std::lock_guard<std::mutex> lock(m_registryMutex);
    if (!m_heldLocks.erase(reportId)) return;
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[FactRepository] Failed to remove lock " << path << ": " << ec.message() << std::endl;
    }
}

} // namespace finfacts::infrastructure
