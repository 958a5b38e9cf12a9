/**
 * @file MetricDictionaryLoader.cpp
 * @brief Implementation of MetricDictionaryLoader.
 */

#include "infrastructure/MetricDictionaryLoader.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

#include "domain/PipelineErrors.hpp"

namespace finfacts::infrastructure {

using namespace finfacts::domain;

namespace {

std::vector<std::string> StringList(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return out;
    if (it->is_string()) {
        out.push_back(it->get<std::string>());
        return out;
    }
    for (const auto& item : *it) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

std::string StringValue(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

/** @brief "[210000]" and "210000" name the same code. */
std::string BareCode(std::string code) {
    if (!code.empty() && (code.front() == '[')) code.erase(0, 1);
    if (!code.empty() && (code.back() == ']')) code.pop_back();
    return code;
}

} // namespace

MetricDictionaryPtr MetricDictionaryLoader::Load(const std::string& path, size_t shortLabelThreshold) {
    if (!std::filesystem::exists(path)) {
        throw DictionaryLoadError("file not found: " + path);
    }
    nlohmann::json j;
    try {
        std::ifstream f(path);
        f >> j;
    } catch (const nlohmann::json::exception& e) {
        throw DictionaryLoadError(path + ": " + e.what());
    }
    auto dictionary = FromJson(j, shortLabelThreshold);
    std::cout << "[MetricDictionary] Loaded " << dictionary->metrics().size() << " metrics, version "
              << dictionary->version() << " (" << dictionary->excludedAliasCount()
              << " aliases excluded)" << std::endl;
    return dictionary;
}

MetricDictionaryPtr MetricDictionaryLoader::FromJson(const nlohmann::json& j, size_t shortLabelThreshold) {
    if (!j.is_object()) {
        throw DictionaryLoadError("document root must be an object");
    }
    const std::string version = StringValue(j, "version");
    if (version.empty()) {
        throw DictionaryLoadError("missing 'version'");
    }
    if (!j.contains("metrics") || !j["metrics"].is_array()) {
        throw DictionaryLoadError("missing 'metrics' array");
    }

    std::vector<MetricDefinition> metrics;
    try {
        for (const auto& m : j["metrics"]) {
            MetricDefinition def;
            def.code = StringValue(m, "metric_code");
            def.nameCn = StringValue(m, "metric_name_cn");
            def.nameEn = StringValue(m, "metric_name_en");
            def.statementType = StatementTypeFromString(StringValue(m, "statement_type"));
            def.valueNature = ValueNatureFromString(StringValue(m, "value_nature"));
            def.sign = m.value("sign", 1) < 0 ? -1 : 1;
            def.parentCode = StringValue(m, "parent_metric_code");
            def.patterns = StringList(m, "patterns_cn");
            def.exactPatterns = StringList(m, "patterns_cn_exact");
            def.patternsEn = StringList(m, "patterns_en");
            def.exactPatternsEn = StringList(m, "patterns_en_exact");
            metrics.push_back(std::move(def));
        }
    } catch (const nlohmann::json::exception& e) {
        throw DictionaryLoadError(std::string("malformed metric entry: ") + e.what());
    }

    BackgroundRules rules;
    if (j.contains("background_rules")) {
        const auto& br = j["background_rules"];
        if (br.contains("section_codes")) {
            for (const auto& [code, type] : br["section_codes"].items()) {
                if (!type.is_string()) continue;
                StatementType statement = StatementTypeFromString(type.get<std::string>());
                if (statement == StatementType::Unknown) {
                    throw DictionaryLoadError("section code " + code + " names an unknown statement type");
                }
                rules.sectionCodes[BareCode(code)] = statement;
            }
        }
        if (br.contains("sub_codes")) {
            for (const auto& [code, targets] : br["sub_codes"].items()) {
                std::vector<std::string> codes;
                if (targets.is_string()) {
                    codes.push_back(targets.get<std::string>());
                } else if (targets.is_array()) {
                    for (const auto& t : targets) {
                        if (t.is_string()) codes.push_back(t.get<std::string>());
                    }
                }
                rules.subCodes[BareCode(code)] = codes;
            }
        }
    }

    DictionaryBuildOptions options = DictionaryBuildOptions::Defaults();
    options.shortLabelThreshold = shortLabelThreshold;
    for (auto& token : StringList(j, "stop_list")) options.stopList.push_back(token);
    for (auto& token : StringList(j, "short_label_denylist")) options.shortLabelDenylist.push_back(token);

    return MetricDictionary::Build(version, std::move(metrics), std::move(rules), options);
}

} // namespace finfacts::infrastructure
