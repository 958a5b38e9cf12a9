/**
 * @file ReportPipelineService.cpp
 * @brief Implementation of ReportPipelineService.
 */

#include "application/ReportPipelineService.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "application/CandidateSet.hpp"
#include "application/ReportMetadataExtractor.hpp"
#include "application/RunReport.hpp"
#include "application/TimeUtils.hpp"
#include "domain/PipelineErrors.hpp"

namespace fs = std::filesystem;

namespace finfacts::application {

using domain::ExtractionOutcome;
using domain::FactCandidate;
using domain::RawTableCandidate;
using domain::ReportContext;
using domain::ReportVersion;
using domain::ResolvedFact;
using domain::VersionStatus;

namespace {

/** @brief Releases the resolver lock when the run ends, successfully or not. */
class ReportLock {
public:
    ReportLock(domain::FactRepository& repository, std::string reportId)
        : m_repository(repository), m_reportId(std::move(reportId)) {}

    ~ReportLock() {
        try {
            m_repository.unlockReport(m_reportId);
        } catch (const std::exception& e) {
            std::cerr << "[ReportPipeline] Failed to release lock for " << m_reportId << ": " << e.what()
                      << std::endl;
        }
    }

    ReportLock(const ReportLock&) = delete;
    ReportLock& operator=(const ReportLock&) = delete;

private:
    domain::FactRepository& m_repository;
    std::string m_reportId;
};

domain::KeyDefaults DefaultsFrom(const CandidateSettings& settings) {
    domain::KeyDefaults defaults;
    defaults.scope = settings.defaultScope;
    defaults.currency = settings.defaultCurrency;
    defaults.unit = settings.defaultUnit;
    return defaults;
}

} // namespace

ReportPipelineService::ReportPipelineService(PipelineConfig config,
                                             domain::MetricDictionaryPtr dictionary,
                                             std::shared_ptr<domain::FactRepository> repository,
                                             std::vector<std::shared_ptr<domain::ExtractionEngine>> engines,
                                             std::shared_ptr<domain::ArtifactReader> reader,
                                             std::shared_ptr<AsyncTaskManager> taskManager)
    : m_config(std::move(config)),
      m_dictionary(std::move(dictionary)),
      m_repository(std::move(repository)),
      m_engines(std::move(engines)),
      m_reader(std::move(reader)),
      m_taskManager(std::move(taskManager)),
      m_normalizer(m_config.periods),
      m_matcher(m_dictionary, m_config.matching),
      m_builder(m_matcher, m_config.candidates, m_config.periods),
      m_resolver(m_config.consensus, m_config.periods, DefaultsFrom(m_config.candidates)),
      m_checker(m_config.consistency) {}

std::string ReportPipelineService::nextId(const std::string& prefix) {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::ostringstream oss;
    oss << prefix << CompactTimestamp(now) << "-" << std::setw(3) << std::setfill('0') << ms << "-"
        << std::setw(4) << std::setfill('0') << (m_sequence++ % 10000);
    return oss.str();
}

std::vector<std::shared_ptr<domain::ExtractionEngine>>
ReportPipelineService::selectEngines(const std::vector<std::string>& names) const {
    if (names.empty()) return m_engines;
    std::vector<std::shared_ptr<domain::ExtractionEngine>> selected;
    for (const auto& name : names) {
        auto it = std::find_if(m_engines.begin(), m_engines.end(),
                               [&](const auto& engine) { return engine->name() == name; });
        if (it == m_engines.end()) {
            throw std::invalid_argument("unknown engine '" + name + "'");
        }
        if (std::find(selected.begin(), selected.end(), *it) == selected.end()) selected.push_back(*it);
    }
    return selected;
}

IngestResult ReportPipelineService::ingest(const IngestOptions& options) {
    if (options.reportId.empty()) {
        throw std::invalid_argument("report id is required");
    }
    auto engines = selectEngines(options.engines);
    if (engines.empty()) {
        throw std::invalid_argument("no extraction engines configured");
    }
    std::cout << "[ReportPipeline] Ingesting " << options.reportId << " from " << options.sourcePath << " with "
              << engines.size() << " engine(s)" << std::endl;

    std::vector<JobOutput> outputs(engines.size());
    std::vector<domain::ExtractionRequest> requests(engines.size());
    for (size_t i = 0; i < engines.size(); ++i) {
        ReportVersion& version = outputs[i].version;
        version.versionId = nextId(engines[i]->name() + "-");
        version.reportId = options.reportId;
        version.engine = engines[i]->name();
        version.status = VersionStatus::Running;
        version.startedAt = NowIsoTimestamp();
        m_repository->saveVersion(version, {}, {});

        auto& request = requests[i];
        request.reportId = options.reportId;
        request.versionId = version.versionId;
        request.sourcePath = options.sourcePath;
        request.outputDir = (fs::path(m_config.storeRoot) / "reports" / options.reportId / "artifacts" /
                             version.versionId).string();
        request.timeout = engines[i]->timeout();
    }

    std::vector<std::shared_ptr<TaskStatus>> tasks;
    for (size_t i = 0; i < engines.size(); ++i) {
        auto engine = engines[i];
        auto* request = &requests[i];
        auto* output = &outputs[i];
        tasks.push_back(m_taskManager->SubmitTask(
            TaskType::Extraction, "Extract " + options.reportId + " with " + engine->name(),
            [this, engine, request, output](std::shared_ptr<TaskStatus> status) {
                runExtractionJob(*engine, *request, *output);
                status->progress = 1.0f;
            }));
    }
    AsyncTaskManager::WaitAll(tasks);

    for (size_t i = 0; i < tasks.size(); ++i) {
        if (!tasks[i]->failed) continue;
        outputs[i].usable = false;
        outputs[i].version.status = VersionStatus::Failed;
        outputs[i].version.errorMessage = tasks[i]->errorMessage;
    }

    IngestResult result;
    result.context = sharedContext(options, outputs);

    std::vector<std::string> failures;
    bool anyUsable = false;
    for (auto& output : outputs) {
        buildAndStore(output, result.context);
        anyUsable = anyUsable || output.usable;
        if (output.version.status == VersionStatus::Failed) {
            failures.push_back(output.version.engine + ": " + output.version.errorMessage);
        }
        result.versions.push_back(output.version);
    }

    if (!anyUsable) {
        std::string message = "every engine failed for report " + options.reportId;
        for (const auto& failure : failures) message += "; " + failure;
        std::cerr << "[ReportPipeline] " << message << std::endl;
        throw domain::PipelineError(message);
    }

    if (options.resolve) {
        result.resolution = resolve(options.reportId, options.rerunVerified);
    }
    return result;
}

void ReportPipelineService::runExtractionJob(domain::ExtractionEngine& engine,
                                             const domain::ExtractionRequest& request,
                                             JobOutput& output) const {
    ReportVersion& version = output.version;
    const int maxAttempts = std::max(1, engine.maxAttempts());
    ExtractionOutcome outcome;

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        version.summary.attempts = attempt;
        try {
            outcome = engine.extract(request);
        } catch (const std::exception& e) {
            outcome = ExtractionOutcome{};
            outcome.message = std::string("engine threw: ") + e.what();
        }
        if (outcome.success) break;
        if (outcome.timedOut) {
            std::cerr << "[ExtractionJob] " << engine.name() << " timed out on " << request.reportId
                      << "; not retrying." << std::endl;
            break;
        }
        std::cerr << "[ExtractionJob] " << engine.name() << " attempt " << attempt << "/" << maxAttempts
                  << " failed: " << outcome.message << std::endl;
    }

    version.artifacts = outcome.artifacts;
    version.timedOut = outcome.timedOut;
    if (!outcome.success) {
        version.status = VersionStatus::Failed;
        version.errorMessage = outcome.message;
    }

    if (!version.artifacts.empty()) {
        output.content = m_reader->read(version.artifacts);
        for (const auto& warning : output.content.warnings) {
            std::cerr << "[ExtractionJob] " << engine.name() << ": " << warning << std::endl;
        }
        output.usable = !output.content.tables.empty() || !output.content.pageText.empty();
    }
    if (outcome.success && !output.usable) {
        version.status = VersionStatus::Failed;
        version.errorMessage = engine.name() + " produced no readable content";
    }
    std::cout << "[ExtractionJob] " << engine.name() << " finished " << request.reportId << ": "
              << version.artifacts.size() << " artifact(s), " << output.content.tables.size() << " table region(s)"
              << (output.usable ? "" : " (unusable)") << std::endl;
}

ReportContext ReportPipelineService::sharedContext(const IngestOptions& options,
                                                   const std::vector<JobOutput>& outputs) const {
    ReportContext overrides = options.overrides;
    overrides.reportId = options.reportId;

    std::optional<ReportContext> fallback;
    for (const auto& output : outputs) {
        if (!output.usable) continue;
        ReportContext detected = ReportMetadataExtractor::Extract(options.reportId, output.content);
        ReportContext merged = ReportMetadataExtractor::Merge(overrides, detected);
        if (merged.hasPeriod()) {
            std::cout << "[ReportPipeline] Period " << merged.periodStart << ".." << merged.periodEnd
                      << " (from " << output.version.engine << ")" << std::endl;
            return merged;
        }
        if (!fallback) fallback = merged;
    }
    ReportContext context = fallback ? *fallback : ReportMetadataExtractor::Merge(overrides, ReportContext{});
    if (!context.hasPeriod()) {
        std::cerr << "[ReportPipeline] No report period detected for " << options.reportId
                  << "; periods come from column labels only." << std::endl;
    }
    return context;
}

void ReportPipelineService::buildAndStore(JobOutput& output, const ReportContext& context) const {
    ReportVersion& version = output.version;
    auto& summary = version.summary;
    std::vector<RawTableCandidate> tables;
    std::vector<FactCandidate> candidates;

    if (output.usable) {
        try {
            int index = 0;
            for (const auto& raw : output.content.tables) {
                for (auto& table : m_normalizer.normalize(raw)) {
                    table.tableIndex = index++;
                    TableBuildResult built = m_builder.build(table, context, version.engine, version.versionId);
                    ++summary.tablesDetected;
                    if (built.accepted) {
                        ++summary.tablesAccepted;
                    } else {
                        ++summary.tablesRejected;
                    }
                    for (auto& candidate : built.candidates) {
                        if (candidate.matched) ++summary.matchedCandidates;
                        else ++summary.unmatchedCandidates;
                        if (candidate.parseFailed()) ++summary.parseFailures;
                        candidates.push_back(std::move(candidate));
                    }
                    tables.push_back(std::move(table));
                }
            }
            summary.pages = output.content.pageCount;
            summary.candidates = static_cast<int>(candidates.size());
        } catch (const std::exception& e) {
            version.status = VersionStatus::Failed;
            version.errorMessage = std::string("candidate building failed: ") + e.what();
            tables.clear();
            candidates.clear();
            output.usable = false;
        }
    }

    if (version.status == VersionStatus::Running) version.status = VersionStatus::Succeeded;
    version.finishedAt = NowIsoTimestamp();
    m_repository->saveVersion(version, tables, candidates);

    std::cout << "[ReportPipeline] " << version.engine << " " << version.versionId << " "
              << domain::VersionStatusToString(version.status) << ": " << summary.tablesAccepted << "/"
              << summary.tablesDetected << " tables accepted, " << summary.candidates << " candidates ("
              << summary.unmatchedCandidates << " unmatched, " << summary.parseFailures << " unparsed)"
              << std::endl;
}

ResolveResult ReportPipelineService::resolve(const std::string& reportId, bool rerunVerified) {
    ResolveResult result;
    const std::string startedAt = NowIsoTimestamp();

    if (!m_repository->tryLockReport(reportId)) {
        std::cerr << "[ReportPipeline] Resolver already running for " << reportId << std::endl;
        throw domain::ConcurrencyConflictError(reportId);
    }
    ReportLock lock(*m_repository, reportId);

    auto versions = SelectActiveVersions(m_repository->listVersions(reportId));
    auto candidates = LoadActiveCandidates(*m_repository, reportId);
    auto fresh = m_resolver.resolve(candidates, &result.stats);

    std::vector<ResolvedFact> merged;
    m_repository->updateResolvedFacts(reportId, [&](std::vector<ResolvedFact>& stored) {
        // Verified tags are re-checked here, inside the same critical section reviews write in.
        ConsensusResolver::Merge(stored, fresh, rerunVerified, result.stats);
        merged = stored;
    });

    result.kpi = ConsensusResolver::ComputeAgreement(merged);
    result.checks = m_checker.check(merged);
    result.runId = nextId("run-");

    RunReportInput input;
    input.runId = result.runId;
    input.reportId = reportId;
    input.dictionaryVersion = m_dictionary->version();
    input.startedAt = startedAt;
    input.finishedAt = NowIsoTimestamp();
    input.rerunVerified = rerunVerified;
    input.versions = versions;
    for (const auto& version : versions) {
        auto& rejected = input.rejectedTables[version.engine];
        for (auto& table : m_repository->loadTables(reportId, version.versionId)) {
            if (!table.accepted) rejected.push_back(std::move(table));
        }
    }
    input.stats = result.stats;
    input.facts = merged;
    input.checks = result.checks;
    result.runReport = RunReport::Build(input);
    m_repository->saveRunReport(reportId, result.runId, result.runReport.dump(2));

    std::cout << "[ReportPipeline] Resolved " << reportId << " (" << result.runId << "): " << merged.size()
              << " groups, " << result.stats.autoAgreed << " agreed, " << result.stats.autoSingleEngine
              << " single-engine, " << result.stats.unresolved << " unresolved, " << result.stats.verified
              << " verified; agreement " << result.kpi.agreedGroups << "/" << result.kpi.multiEngineGroups
              << std::endl;
    for (const auto& check : result.checks) {
        if (check.passed) continue;
        std::cerr << "[ConsistencyCheck] " << reportId << " " << check.name << " " << check.scope << " "
                  << check.date << " residual " << check.residual << " (" << check.formula << ")" << std::endl;
    }
    return result;
}

} // namespace finfacts::application
