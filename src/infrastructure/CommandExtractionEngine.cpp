/**
 * @file CommandExtractionEngine.cpp
 * @brief Implementation of CommandExtractionEngine.
 */

#include "infrastructure/CommandExtractionEngine.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

#include <sys/wait.h>

#include "infrastructure/EngineArtifactScanner.hpp"

namespace finfacts::infrastructure {

namespace fs = std::filesystem;

namespace {

// Exit codes of coreutils `timeout`: 124 on expiry, 128+9 when the KILL signal was needed.
constexpr int kTimeoutExit = 124;
constexpr int kKilledExit = 137;
constexpr int kKillGraceSeconds = 5;

std::string ReplaceAll(std::string s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

} // namespace

CommandExtractionEngine::CommandExtractionEngine(application::EngineSettings settings)
    : m_settings(std::move(settings)) {}

std::string CommandExtractionEngine::ShellQuote(const std::string& value) {
    return "'" + ReplaceAll(value, "'", "'\\''") + "'";
}

std::string CommandExtractionEngine::ExpandTemplate(const std::string& commandTemplate,
                                                    const std::string& input,
                                                    const std::string& output) {
    std::string cmd = ReplaceAll(commandTemplate, "{input}", ShellQuote(input));
    return ReplaceAll(cmd, "{output}", ShellQuote(output));
}

bool CommandExtractionEngine::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    int result = std::system(cmd.c_str());
    return result == 0;
}

domain::ExtractionOutcome CommandExtractionEngine::extract(const domain::ExtractionRequest& request) {
    domain::ExtractionOutcome outcome;
    const bool templatedOutput = m_settings.command.find("{output}") != std::string::npos;
    const std::string scanDir = templatedOutput || m_settings.outputDir.empty() ? request.outputDir
                                                                               : m_settings.outputDir;
    const std::string stem = fs::path(request.sourcePath).stem().string();

    std::error_code ec;
    fs::create_directories(request.outputDir, ec);
    if (ec) {
        outcome.message = "cannot create output directory " + request.outputDir + ": " + ec.message();
        return outcome;
    }

    if (!m_settings.command.empty()) {
        std::string cmd = ExpandTemplate(m_settings.command, request.sourcePath, request.outputDir);
        const std::string logPath = (fs::path(request.outputDir) / (m_settings.name + ".log")).string();
        const long seconds = static_cast<long>(request.timeout.count());

        std::string wrapped;
        if (seconds > 0 && HasTool("timeout")) {
            wrapped = "timeout --kill-after=" + std::to_string(kKillGraceSeconds) + " " + std::to_string(seconds) +
                      " sh -c " + ShellQuote(cmd);
        } else {
            if (seconds > 0) {
                std::cerr << "[ExtractionJob] 'timeout' not available; " << m_settings.name
                          << " runs unbounded." << std::endl;
            }
            wrapped = "sh -c " + ShellQuote(cmd);
        }
        wrapped += " >>" + ShellQuote(logPath) + " 2>&1";

        std::cout << "[ExtractionJob] " << m_settings.name << ": " << cmd << std::endl;
        int status = std::system(wrapped.c_str());
        if (status == -1) {
            outcome.message = "failed to launch shell for " + m_settings.name;
            return outcome;
        }
        if (WIFEXITED(status)) {
            outcome.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            outcome.exitCode = 128 + WTERMSIG(status);
        }
        outcome.timedOut = outcome.exitCode == kTimeoutExit || outcome.exitCode == kKilledExit;
    }

    // Whatever the tool managed to write is consumed, even after a failure.
    outcome.artifacts = EngineArtifactScanner(scanDir, scanDir == request.outputDir).scan(stem);

    if (outcome.timedOut) {
        outcome.message = m_settings.name + " timed out after " + std::to_string(request.timeout.count()) + "s";
    } else if (outcome.exitCode != 0) {
        outcome.message = m_settings.name + " exited with code " + std::to_string(outcome.exitCode);
    } else if (outcome.artifacts.empty()) {
        outcome.message = m_settings.name + " produced no artifacts in " + scanDir;
    } else {
        outcome.success = true;
    }
    return outcome;
}

} // namespace finfacts::infrastructure
