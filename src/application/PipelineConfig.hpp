/**
 * @file PipelineConfig.hpp
 * @brief Tunable settings for the pipeline. Calibrated constants live here, not in code.
 */

#pragma once

#include <string>
#include <vector>

namespace finfacts::application {

struct EngineSettings {
    std::string name;
    std::string command;            ///< Template with {input} and optional {output}; empty = discovery only.
    std::string outputDir;          ///< Fallback directory scanned when the command has no {output}.
    int timeoutSeconds = 600;
    int maxAttempts = 2;            ///< One retry on non-timeout failure.
};

struct ConsensusSettings {
    double absTolerance = 0.01;
    double relTolerance = 1e-6;
};

struct MatchingSettings {
    size_t shortLabelThreshold = 2;
    std::vector<std::string> benignPrefixes = {
        "加", "减", "其中", "add", "less"
    };
    std::vector<std::string> benignSuffixes = {
        "净额", "余额", "期末余额", "金额", "总额", "合计", "总计", "元", "千元", "万元",
        "百万元", "亿元", "人民币", "net", "amount", "balance", "total"
    };
};

struct CandidateSettings {
    int minDistinctMetricsPerTable = 2;
    std::string defaultScope = "consolidated";
    std::string defaultCurrency = "CNY";
    std::string defaultUnit = "yuan";
};

struct ConsistencySettings {
    double absTolerance = 1.0;
    double relTolerance = 1e-6;
};

struct PeriodSettings {
    std::vector<std::string> currentLabels = {
        "本期", "本年", "本期金额", "本年金额", "本期发生额", "本年发生额", "期末", "期末余额",
        "年末", "年末余额", "current", "current_period", "current year", "this year"
    };
    std::vector<std::string> priorLabels = {
        "上期", "上年", "上期金额", "上年金额", "上期发生额", "上年发生额", "期初", "期初余额",
        "年初", "年初余额", "上年年末余额", "prior", "prior_period", "prior year", "last year"
    };
};

struct ReviewServerSettings {
    std::string host = "127.0.0.1";
    int port = 8765;
};

/**
 * @struct PipelineConfig
 */
struct PipelineConfig {
    std::string storeRoot = "finfacts_store";
    std::string dictionaryPath = "data/metric_dictionary.json";
    std::vector<EngineSettings> engines;
    ConsensusSettings consensus;
    MatchingSettings matching;
    CandidateSettings candidates;
    ConsistencySettings consistency;
    PeriodSettings periods;
    std::vector<std::string> knownElementTypes = {
        "text", "title", "table", "image", "equation", "list", "header", "footer", "page_number"
    };
    ReviewServerSettings reviewServer;
};

} // namespace finfacts::application
