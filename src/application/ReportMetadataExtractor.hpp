/**
 * @file ReportMetadataExtractor.hpp
 * @brief Detects report-level metadata (period, currency, unit, issuer) from page text.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/ExtractionEngine.hpp"
#include "domain/ReportContext.hpp"

namespace finfacts::application {

/**
 * @struct UnitHint
 * @brief Unit/currency declared in a piece of text, e.g. "单位：人民币万元".
 */
struct UnitHint {
    std::optional<std::string> unit;        ///< Normalized unit ("10k_yuan", ...).
    std::optional<std::string> currency;    ///< ISO code.
};

class ReportMetadataExtractor {
public:
    /**
     * @brief Reads the first pages of one engine's output.
     * @param maxPages Pages inspected for title, issuer and period.
     */
    static domain::ReportContext Extract(const std::string& reportId,
                                         const domain::DocumentContent& content,
                                         int maxPages = 5);

    /**
     * @brief Finds an explicit unit declaration ("单位：万元", "（千元）", "RMB'000").
     * Bare "元" inside running text is ignored.
     */
    static UnitHint DetectUnit(const std::string& text);

    /** @brief Parses "2024-12-31", "2024/12/31" or "2024年12月31日" into ISO form. */
    static std::optional<std::string> ParseDate(const std::string& text);

    /**
     * @brief Fills blanks of @p detected from @p overrides; explicit values always win.
     */
    static domain::ReportContext Merge(const domain::ReportContext& overrides,
                                       const domain::ReportContext& detected);
};

} // namespace finfacts::application
