/**
 * @file EngineArtifactScanner.cpp
 * @brief Implementation of the EngineArtifactScanner.
 */

#include "infrastructure/EngineArtifactScanner.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace finfacts::infrastructure {

using domain::ArtifactKind;
using domain::ArtifactRef;

namespace {

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int KindRank(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::ContentList: return 0;
        case ArtifactKind::LayoutText: return 1;
        case ArtifactKind::Markdown: return 2;
        default: return 3;
    }
}

/** @brief Keeps only the preferred kind present. */
std::vector<ArtifactRef> BestKind(std::vector<ArtifactRef> artifacts) {
    if (artifacts.empty()) return artifacts;
    int best = 3;
    for (const auto& a : artifacts) best = std::min(best, KindRank(a.kind));
    artifacts.erase(std::remove_if(artifacts.begin(), artifacts.end(),
                                   [best](const ArtifactRef& a) { return KindRank(a.kind) != best; }),
                    artifacts.end());
    std::sort(artifacts.begin(), artifacts.end(),
              [](const ArtifactRef& a, const ArtifactRef& b) { return a.path < b.path; });
    return artifacts;
}

} // namespace

EngineArtifactScanner::EngineArtifactScanner(const std::string& outputDir, bool exclusive)
    : m_outputDir(outputDir), m_exclusive(exclusive) {}

ArtifactKind EngineArtifactScanner::ClassifyByName(const std::string& filename) {
    std::string name = filename;
    // Convert to lowercase for robust check
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return std::tolower(c); });

    if (EndsWith(name, "_content_list.json")) return ArtifactKind::ContentList;
    if (EndsWith(name, ".layout.txt") || EndsWith(name, ".txt")) return ArtifactKind::LayoutText;
    if (EndsWith(name, ".md")) return ArtifactKind::Markdown;
    return ArtifactKind::Unknown;
}

std::vector<ArtifactRef> EngineArtifactScanner::collect(const std::string& dir, bool recursive) const {
    std::vector<ArtifactRef> artifacts;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return artifacts;
    }

    auto consider = [&](const fs::directory_entry& entry) {
        if (!entry.is_regular_file(ec)) return;
        ArtifactKind kind = ClassifyByName(entry.path().filename().string());
        if (kind == ArtifactKind::Unknown) return;

        ArtifactRef artifact;
        artifact.path = entry.path().string();
        artifact.kind = kind;
        artifact.sizeBytes = static_cast<long long>(entry.file_size(ec));
        if (ec) artifact.sizeBytes = 0;
        artifacts.push_back(artifact);
    };

    if (recursive) {
        for (auto it = fs::recursive_directory_iterator(dir, ec); !ec && it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            consider(*it);
        }
    } else {
        for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
            consider(*it);
        }
    }
    return artifacts;
}

std::vector<ArtifactRef> EngineArtifactScanner::scan(const std::string& sourceStem) const {
    if (m_outputDir.empty()) return {};

    if (!sourceStem.empty()) {
        auto nested = BestKind(collect((fs::path(m_outputDir) / sourceStem).string(), true));
        if (!nested.empty()) return nested;
    }
    auto flat = collect(m_outputDir, false);
    std::vector<ArtifactRef> named;
    for (const auto& artifact : flat) {
        if (!sourceStem.empty() && fs::path(artifact.path).filename().string().rfind(sourceStem, 0) == 0) {
            named.push_back(artifact);
        }
    }
    if (!named.empty()) return BestKind(named);
    // Unnamed files are ours only when nobody else writes into the directory.
    if (!m_exclusive) {
        if (!flat.empty()) {
            std::cerr << "[ArtifactScanner] " << flat.size() << " file(s) in shared " << m_outputDir
                      << " but none named after '" << sourceStem << "'; ignoring them." << std::endl;
        }
        return {};
    }
    return BestKind(flat);
}

} // namespace finfacts::infrastructure
