/**
 * @file FinFactsApp.cpp
 * @brief Implementation of the FinFactsApp class.
 */
#include "app/FinFactsApp.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "application/ReportMetadataExtractor.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/CommandExtractionEngine.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/EngineArtifactReader.hpp"
#include "infrastructure/FactJson.hpp"
#include "infrastructure/FileSystemFactRepository.hpp"
#include "infrastructure/MetricDictionaryLoader.hpp"
#include "infrastructure/ReviewHttpServer.hpp"

namespace finfacts::app {

namespace {

domain::KeyDefaults KeyDefaultsFrom(const application::PipelineConfig& config) {
    domain::KeyDefaults defaults;
    defaults.scope = config.candidates.defaultScope;
    defaults.currency = config.candidates.defaultCurrency;
    defaults.unit = config.candidates.defaultUnit;
    return defaults;
}

} // namespace

void FinFactsApp::Init(const std::string& configPath, bool withPipeline) {
    m_services.config = infrastructure::ConfigLoader::Load(configPath);
    const auto& config = m_services.config;

    m_services.repository = std::make_shared<infrastructure::FileSystemFactRepository>(config.storeRoot);
    m_services.taskManager = std::make_shared<application::AsyncTaskManager>();
    m_services.reviewService = std::make_shared<application::DiscrepancyReviewService>(
        m_services.repository, KeyDefaultsFrom(config));

    if (!withPipeline) return;

    // Fatal on failure: nothing can be matched without the taxonomy.
    m_services.dictionary = infrastructure::MetricDictionaryLoader::Load(
        config.dictionaryPath, config.matching.shortLabelThreshold);

    std::vector<std::shared_ptr<domain::ExtractionEngine>> engines;
    for (const auto& settings : config.engines) {
        engines.push_back(std::make_shared<infrastructure::CommandExtractionEngine>(settings));
    }
    if (engines.empty()) {
        std::cerr << "[FinFactsApp] WARNING: No extraction engines configured in " << configPath << std::endl;
    }
    auto reader = std::make_shared<infrastructure::EngineArtifactReader>(config.knownElementTypes);

    m_services.pipelineService = std::make_unique<application::ReportPipelineService>(
        config, m_services.dictionary, m_services.repository, std::move(engines), std::move(reader),
        m_services.taskManager);
}

int FinFactsApp::Run(int argc, char** argv) {
    CLI::App cli{"finfacts: multi-engine fact extraction and reconciliation for financial reports"};
    std::string configPath = "settings.json";
    cli.add_option("--config", configPath, "Path to settings.json");
    cli.require_subcommand(1);

    IngestArgs ingestArgs;
    auto* ingest = cli.add_subcommand("ingest", "Extract a report with every engine, then resolve");
    ingest->add_option("report_id", ingestArgs.reportId, "Report identifier")->required();
    ingest->add_option("source_path", ingestArgs.sourcePath, "Document to extract")->required();
    ingest->add_option("--engines", ingestArgs.engines, "Comma-separated engine names")->delimiter(',');
    ingest->add_option("--fiscal-year", ingestArgs.fiscalYear, "Fiscal year override");
    ingest->add_option("--period-end", ingestArgs.periodEnd, "Period end override (YYYY-MM-DD)");
    ingest->add_flag("--no-resolve", ingestArgs.noResolve, "Stop after extraction");
    ingest->add_flag("--rerun-verified", ingestArgs.rerunVerified, "Let consensus overwrite verified groups");

    std::string reportId;
    bool rerunVerified = false;
    auto* resolve = cli.add_subcommand("resolve", "Re-run consensus over the latest versions");
    resolve->add_option("report_id", reportId, "Report identifier")->required();
    resolve->add_flag("--rerun-verified", rerunVerified, "Let consensus overwrite verified groups");

    std::string factType;
    int fiscalYear = 0;
    auto* discrepancies = cli.add_subcommand("discrepancies", "List groups the engines disagreed on");
    discrepancies->add_option("report_id", reportId, "Report identifier")->required();
    discrepancies->add_option("--fact-type", factType, "stock or flow");
    discrepancies->add_option("--fiscal-year", fiscalYear, "Fiscal year filter");

    std::string candidateId;
    std::string reviewer;
    std::string notes;
    auto* verify = cli.add_subcommand("verify", "Resolve a discrepancy by choosing a candidate");
    verify->add_option("report_id", reportId, "Report identifier")->required();
    verify->add_option("fact_type", factType, "stock or flow")->required();
    verify->add_option("candidate_id", candidateId, "Chosen candidate")->required();
    verify->add_option("reviewer", reviewer, "Reviewer name")->required();
    verify->add_option("notes", notes, "Free-text notes");

    auto* serve = cli.add_subcommand("serve", "Serve the review HTTP API");

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int code = cli.exit(e);
        return code == 0 ? kExitOk : kExitUsage;
    }

    const bool withPipeline = ingest->parsed() || resolve->parsed();
    try {
        Init(configPath, withPipeline);

        if (ingest->parsed()) return Ingest(ingestArgs);
        if (resolve->parsed()) return Resolve(reportId, rerunVerified);
        if (discrepancies->parsed()) return Discrepancies(reportId, factType, fiscalYear);
        if (verify->parsed()) return Verify(reportId, factType, candidateId, reviewer, notes);
        if (serve->parsed()) return Serve();
    } catch (const domain::ConcurrencyConflictError& e) {
        std::cerr << "[FinFactsApp] " << e.what() << std::endl;
        return kExitConflict;
    } catch (const domain::DictionaryLoadError& e) {
        std::cerr << "[FinFactsApp] FATAL: " << e.what() << std::endl;
        return kExitFatal;
    } catch (const domain::PipelineError& e) {
        std::cerr << "[FinFactsApp] FATAL: " << e.what() << std::endl;
        return kExitFatal;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[FinFactsApp] Invalid argument: " << e.what() << std::endl;
        return kExitUsage;
    } catch (const std::out_of_range& e) {
        std::cerr << "[FinFactsApp] Not found: " << e.what() << std::endl;
        return kExitFatal;
    } catch (const std::exception& e) {
        std::cerr << "[FinFactsApp] Error: " << e.what() << std::endl;
        return kExitFatal;
    }
    return kExitUsage;
}

int FinFactsApp::Ingest(const IngestArgs& args) {
    application::IngestOptions options;
    options.reportId = args.reportId;
    options.sourcePath = args.sourcePath;
    options.engines = args.engines;
    options.resolve = !args.noResolve;
    options.rerunVerified = args.rerunVerified;
    options.overrides.reportId = args.reportId;
    options.overrides.fiscalYear = args.fiscalYear;
    if (!args.periodEnd.empty()) {
        auto date = application::ReportMetadataExtractor::ParseDate(args.periodEnd);
        if (!date) {
            throw std::invalid_argument("--period-end must be a date (YYYY-MM-DD), got '" + args.periodEnd + "'");
        }
        options.overrides.periodEnd = *date;
    }

    auto result = m_services.pipelineService->ingest(options);

    std::cout << "[FinFactsApp] Report " << args.reportId << " period: FY" << result.context.fiscalYear
              << " ending " << (result.context.periodEnd.empty() ? "?" : result.context.periodEnd) << std::endl;
    for (const auto& version : result.versions) {
        std::cout << "  " << version.engine << " " << version.versionId << " "
                  << domain::VersionStatusToString(version.status)
                  << (version.timedOut ? " (timed out)" : "")
                  << " candidates=" << version.summary.candidates
                  << " matched=" << version.summary.matchedCandidates;
        if (!version.errorMessage.empty()) std::cout << " error=\"" << version.errorMessage << "\"";
        std::cout << std::endl;
    }
    if (result.resolution) PrintResolution(*result.resolution);
    return kExitOk;
}

int FinFactsApp::Resolve(const std::string& reportId, bool rerunVerified) {
    PrintResolution(m_services.pipelineService->resolve(reportId, rerunVerified));
    return kExitOk;
}

void FinFactsApp::PrintResolution(const application::ResolveResult& result) const {
    const auto& s = result.stats;
    std::cout << "[FinFactsApp] Run " << result.runId << ": " << s.groups << " groups ("
              << s.autoAgreed << " agreed, " << s.autoSingleEngine << " single-engine, "
              << s.unresolved << " unresolved, " << s.verified << " verified)" << std::endl;
    std::cout << "  agreement " << result.kpi.agreedGroups << "/" << result.kpi.multiEngineGroups
              << " = " << result.kpi.rate << std::endl;
    int failed = 0;
    for (const auto& check : result.checks) {
        if (!check.passed) ++failed;
    }
    std::cout << "  consistency checks: " << result.checks.size() << " evaluated, " << failed << " failed" << std::endl;
}

int FinFactsApp::Discrepancies(const std::string& reportId, const std::string& factType, int fiscalYear) {
    application::DiscrepancyFilter filter;
    filter.reportId = reportId;
    if (!factType.empty()) {
        if (factType != "stock" && factType != "flow") {
            throw std::invalid_argument("--fact-type must be 'stock' or 'flow'");
        }
        filter.factType = domain::FactTypeFromString(factType);
    }
    if (fiscalYear > 0) filter.fiscalYear = fiscalYear;

    nlohmann::json items = nlohmann::json::array();
    for (const auto& discrepancy : m_services.reviewService->listDiscrepancies(filter)) {
        auto item = infrastructure::ToJson(discrepancy.fact);
        item["candidates"] = nlohmann::json::array();
        for (const auto& candidate : discrepancy.candidates) {
            item["candidates"].push_back(infrastructure::ToJson(candidate));
        }
        items.push_back(std::move(item));
    }
    std::cout << items.dump(2) << std::endl;
    return kExitOk;
}

int FinFactsApp::Verify(const std::string& reportId, const std::string& factType, const std::string& candidateId,
                        const std::string& reviewer, const std::string& notes) {
    application::ResolutionRequest request;
    request.reportId = reportId;
    request.factType = factType;
    request.candidateId = candidateId;
    request.reviewer = reviewer;
    request.notes = notes;

    try {
        auto fact = m_services.reviewService->submitResolution(request);
        std::cout << infrastructure::ToJson(fact).dump(2) << std::endl;
    } catch (const std::out_of_range& e) {
        std::cerr << "[FinFactsApp] " << e.what() << std::endl;
        return kExitUsage;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[FinFactsApp] " << e.what() << std::endl;
        return kExitUsage;
    } catch (const std::logic_error& e) {
        std::cerr << "[FinFactsApp] Rejected: " << e.what() << std::endl;
        return kExitConflict;
    }
    return kExitOk;
}

int FinFactsApp::Serve() {
    auto api = std::make_shared<infrastructure::ReviewApi>(m_services.reviewService, m_services.repository);
    infrastructure::ReviewHttpServer server(api);
    const auto& settings = m_services.config.reviewServer;
    std::cout << "[FinFactsApp] Review API on http://" << settings.host << ":" << settings.port << std::endl;
    if (!server.listen(settings.host, settings.port)) {
        std::cerr << "[FinFactsApp] Could not bind " << settings.host << ":" << settings.port << std::endl;
        return kExitFatal;
    }
    return kExitOk;
}

} // namespace finfacts::app
