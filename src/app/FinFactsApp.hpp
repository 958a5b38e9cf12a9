/**
 * @file FinFactsApp.hpp
 * @brief Command-line front end: wires the services together and runs one command.
 */

#pragma once

#include <string>
#include <vector>

#include "application/AppServices.hpp"

namespace finfacts::app {

/**
 * @class FinFactsApp
 * @brief Orchestrates the process lifecycle: configuration, service wiring, command dispatch.
 *
 * Exit codes: 0 success, 1 fatal pipeline error, 2 usage error, 3 concurrency conflict.
 */
class FinFactsApp {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitFatal = 1;
    static constexpr int kExitUsage = 2;
    static constexpr int kExitConflict = 3;

    /**
     * @brief Parses the command line and runs the selected command.
     * @return Process exit code.
     */
    int Run(int argc, char** argv);

private:
    /**
     * @brief Loads settings and builds the repository and review service.
     * @param withPipeline Also load the dictionary and build the extraction pipeline.
     */
    void Init(const std::string& configPath, bool withPipeline);

    struct IngestArgs {
        std::string reportId;
        std::string sourcePath;
        std::vector<std::string> engines;
        int fiscalYear = 0;
        std::string periodEnd;
        bool noResolve = false;
        bool rerunVerified = false;
    };

    int Ingest(const IngestArgs& args);
    int Resolve(const std::string& reportId, bool rerunVerified);
    int Discrepancies(const std::string& reportId, const std::string& factType, int fiscalYear);
    int Verify(const std::string& reportId, const std::string& factType, const std::string& candidateId,
               const std::string& reviewer, const std::string& notes);
    int Serve();

    void PrintResolution(const application::ResolveResult& result) const;

    application::AppServices m_services; ///< Composition root.
};

} // namespace finfacts::app
