/**
 * @file ReportPipelineService.hpp
 * @brief Orchestrates multi-engine extraction, candidate building, consensus and consistency checks.
 */

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/AsyncTaskManager.hpp"
#include "application/CandidateBuilder.hpp"
#include "application/ConsensusResolver.hpp"
#include "application/ConsistencyChecker.hpp"
#include "application/GridNormalizer.hpp"
#include "application/MetricMatcher.hpp"
#include "application/PipelineConfig.hpp"
#include "domain/ExtractionEngine.hpp"
#include "domain/FactRepository.hpp"
#include "domain/MetricDictionary.hpp"
#include "domain/ReportContext.hpp"

namespace finfacts::application {

/**
 * @struct IngestOptions
 */
struct IngestOptions {
    std::string reportId;
    std::string sourcePath;
    std::vector<std::string> engines;   ///< Subset of configured engines; empty runs all.
    domain::ReportContext overrides;    ///< Explicit metadata; wins over detection.
    bool resolve = true;                ///< Run the resolver once every engine finished.
    bool rerunVerified = false;
};

/**
 * @struct ResolveResult
 */
struct ResolveResult {
    std::string runId;
    ResolutionStats stats;
    AgreementKpi kpi;
    std::vector<domain::ConsistencyCheckResult> checks;
    nlohmann::json runReport;
};

/**
 * @struct IngestResult
 */
struct IngestResult {
    domain::ReportContext context;              ///< Period context shared by all engines.
    std::vector<domain::ReportVersion> versions;
    std::optional<ResolveResult> resolution;
};

/**
 * @class ReportPipelineService
 * @brief One instance serves many reports; per-report state lives in the repository.
 *
 * Extraction jobs run concurrently, one per engine. The resolver starts only after
 * every job reached a terminal state, and at most one resolver runs per report.
 */
class ReportPipelineService {
public:
    ReportPipelineService(PipelineConfig config,
                          domain::MetricDictionaryPtr dictionary,
                          std::shared_ptr<domain::FactRepository> repository,
                          std::vector<std::shared_ptr<domain::ExtractionEngine>> engines,
                          std::shared_ptr<domain::ArtifactReader> reader,
                          std::shared_ptr<AsyncTaskManager> taskManager);

    /**
     * @brief Extracts the document with every selected engine, then resolves.
     * @throws domain::PipelineError if no engine produced a usable artifact.
     * @throws domain::ConcurrencyConflictError if a resolver already runs for the report.
     * @throws std::invalid_argument for unknown engine names or an invalid report id.
     */
    IngestResult ingest(const IngestOptions& options);

    /**
     * @brief Re-resolves the report from the latest terminal version of each engine.
     * @throws domain::ConcurrencyConflictError if another resolver holds the report.
     */
    ResolveResult resolve(const std::string& reportId, bool rerunVerified = false);

    const domain::MetricDictionary& dictionary() const { return *m_dictionary; }

private:
    /** @brief What one extraction job hands to the fan-in step. */
    struct JobOutput {
        domain::ReportVersion version;
        domain::DocumentContent content;
        bool usable = false;
    };

    std::vector<std::shared_ptr<domain::ExtractionEngine>> selectEngines(const std::vector<std::string>& names) const;

    /** @brief Runs one engine with timeout and a single retry on non-timeout failure. */
    void runExtractionJob(domain::ExtractionEngine& engine,
                          const domain::ExtractionRequest& request,
                          JobOutput& output) const;

    /** @brief Normalizes, matches and builds candidates, then stores the terminal version. */
    void buildAndStore(JobOutput& output, const domain::ReportContext& context) const;

    /** @brief Merges explicit overrides with the first engine that detected a period. */
    domain::ReportContext sharedContext(const IngestOptions& options,
                                        const std::vector<JobOutput>& outputs) const;

    std::string nextId(const std::string& prefix);

    PipelineConfig m_config;
    domain::MetricDictionaryPtr m_dictionary;
    std::shared_ptr<domain::FactRepository> m_repository;
    std::vector<std::shared_ptr<domain::ExtractionEngine>> m_engines;
    std::shared_ptr<domain::ArtifactReader> m_reader;
    std::shared_ptr<AsyncTaskManager> m_taskManager;

    GridNormalizer m_normalizer;
    MetricMatcher m_matcher;
    CandidateBuilder m_builder;
    ConsensusResolver m_resolver;
    ConsistencyChecker m_checker;

    std::atomic<unsigned> m_sequence{0};
};

} // namespace finfacts::application
