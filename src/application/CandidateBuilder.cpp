/**
 * @file CandidateBuilder.cpp
 * @brief Implementation of CandidateBuilder.
 */

#include "application/CandidateBuilder.hpp"

#include <algorithm>
#include <cstdio>
#include <set>

#include "application/NumberParser.hpp"
#include "application/PeriodVocabulary.hpp"
#include "application/ReportMetadataExtractor.hpp"
#include "domain/FactGroup.hpp"
#include "domain/LabelText.hpp"

namespace finfacts::application {

using domain::FactCandidate;
using domain::FactType;
using domain::LabelText;
using domain::MatchMethod;
using domain::PeriodDescriptor;
using domain::StatementType;

namespace {

constexpr double kParseFailureCap = 0.2;
constexpr double kPositionalPenalty = 0.1;

double BaseQuality(MatchMethod method) {
    switch (method) {
        case MatchMethod::Exact: return 1.0;
        case MatchMethod::BackgroundCode: return 0.95;
        case MatchMethod::Pattern: return 0.85;
        default: return 0.3;
    }
}

std::string FormatDate(int year, const std::string& monthDay) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "%04d", year);
    return std::string(buffer) + "-" + monthDay;
}

} // namespace

CandidateBuilder::CandidateBuilder(const MetricMatcher& matcher, CandidateSettings settings, PeriodSettings periods)
    : m_matcher(matcher), m_settings(std::move(settings)), m_periods(std::move(periods)) {}

PeriodDescriptor CandidateBuilder::resolvePeriod(const std::string& columnLabel,
                                                 FactType factType,
                                                 const domain::ReportContext& context) const {
    PeriodDescriptor period;
    period.factType = factType;

    std::string endMonthDay = "12-31";
    std::string startMonthDay = "01-01";
    if (context.periodEnd.size() == 10) endMonthDay = context.periodEnd.substr(5);
    if (context.periodStart.size() == 10) startMonthDay = context.periodStart.substr(5);

    int year = 0;
    if (auto date = ReportMetadataExtractor::ParseDate(columnLabel)) {
        year = std::stoi(date->substr(0, 4));
        endMonthDay = date->substr(5);
        period.label = "date";
    } else {
        ColumnClass cls = ClassifyColumnLabel(columnLabel, m_periods);
        int offset = 0;
        switch (cls.role) {
            case ColumnRole::Prior:
                offset = 1;
                period.label = "prior";
                break;
            case ColumnRole::Current:
                period.label = "current";
                break;
            case ColumnRole::Positional:
                offset = std::max(0, cls.position - 1);
                period.label = "positional";
                break;
            default:
                period.label = cls.year > 0 ? "year" : "default";
                break;
        }
        if (cls.year > 0 && cls.role != ColumnRole::Positional) {
            year = cls.year;
        } else if (context.fiscalYear > 0) {
            year = context.fiscalYear - offset;
        }
    }

    if (year <= 0) return period;
    period.fiscalYear = year;
    if (factType == FactType::Stock) {
        period.asOf = FormatDate(year, endMonthDay);
    } else {
        period.periodStart = FormatDate(year, startMonthDay);
        period.periodEnd = FormatDate(year, endMonthDay);
    }
    return period;
}

std::string CandidateBuilder::resolveScope(const std::string& columnLabel, const std::string& tableContext) const {
    auto scopeOf = [](const std::string& text) -> std::string {
        std::string lowered = domain::AsciiLower(text);
        bool parent = LabelText::Contains(text, "母公司") || lowered.find("parent") != std::string::npos;
        bool consolidated = LabelText::Contains(text, "合并") || lowered.find("consolidated") != std::string::npos;
        if (parent && !consolidated) return "parent";
        if (consolidated && !parent) return "consolidated";
        return "";
    };
    std::string scope = scopeOf(columnLabel);
    if (scope.empty()) scope = scopeOf(tableContext);
    if (scope.empty()) scope = m_settings.defaultScope;
    return scope;
}

TableBuildResult CandidateBuilder::build(domain::RawTableCandidate& table,
                                         const domain::ReportContext& context,
                                         const std::string& engine,
                                         const std::string& versionId) const {
    TableBuildResult result;
    if (table.statementType == StatementType::Unknown) m_matcher.annotate(table);

    UnitHint tableHint = ReportMetadataExtractor::DetectUnit(table.context);
    std::set<std::string> distinct;

    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        if (row.empty() || LabelText::Trim(row[0]).empty()) continue;

        const std::string& label = row[0];
        MatchResult match = m_matcher.match(label, table.statementType);
        const auto* def = match.matched ? m_matcher.dictionary().find(match.metricCode) : nullptr;
        UnitHint rowHint = ReportMetadataExtractor::DetectUnit(label);

        for (size_t c = 1; c < row.size(); ++c) {
            ParsedNumber parsed = NumberParser::Parse(row[c]);
            if (parsed.kind == ParsedNumber::Kind::Empty) continue;
            ++result.cellsSeen;

            FactCandidate candidate;
            candidate.candidateId = versionId + "-t" + std::to_string(table.tableIndex) + "-r" +
                                    std::to_string(r) + "-c" + std::to_string(c);
            candidate.versionId = versionId;
            candidate.reportId = context.reportId;
            candidate.metricCode = match.metricCode;
            candidate.matched = match.matched;
            candidate.matchMethod = match.method;
            candidate.statementType = match.statementType;
            candidate.rawLabel = label;
            candidate.rawValue = row[c];
            candidate.engine = engine;
            candidate.sourcePage = table.page;
            candidate.tableIndex = table.tableIndex;
            candidate.columnIndex = static_cast<int>(c);
            candidate.columnLabel = c < table.columnLabels.size() ? table.columnLabels[c] : "col_" + std::to_string(c);

            FactType factType = def ? domain::DefaultFactType(def->statementType, def->valueNature)
                                    : (match.statementType == StatementType::Balance ? FactType::Stock : FactType::Flow);
            candidate.period = resolvePeriod(candidate.columnLabel, factType, context);
            candidate.scope = resolveScope(candidate.columnLabel, table.context);

            if (parsed.isPercent) {
                candidate.unit = "percent";
            } else {
                candidate.unit = rowHint.unit.value_or(tableHint.unit.value_or(
                    context.unit.empty() ? m_settings.defaultUnit : context.unit));
            }
            candidate.currency = rowHint.currency.value_or(tableHint.currency.value_or(
                context.currency.empty() ? m_settings.defaultCurrency : context.currency));

            double quality = BaseQuality(match.method);
            if (parsed.ok()) {
                candidate.value = parsed.value;
            } else {
                quality = std::min(quality, kParseFailureCap);
                ++result.parseFailures;
            }
            if (ClassifyColumnLabel(candidate.columnLabel, m_periods).role == ColumnRole::Positional) {
                quality -= kPositionalPenalty;
            }
            candidate.quality = std::clamp(quality, 0.0, 1.0);

            if (candidate.matched) {
                ++result.matched;
                distinct.insert(candidate.metricCode);
            } else {
                ++result.unmatched;
            }
            result.candidates.push_back(std::move(candidate));
        }
    }

    result.distinctMetrics = static_cast<int>(distinct.size());
    if (result.distinctMetrics < m_settings.minDistinctMetricsPerTable) {
        result.accepted = false;
        result.rejectReason = "matched " + std::to_string(result.distinctMetrics) + " distinct metric(s), minimum " +
                              std::to_string(m_settings.minDistinctMetricsPerTable);
        result.candidates.clear();
    } else {
        result.accepted = true;
    }
    table.accepted = result.accepted;
    table.rejectReason = result.rejectReason;
    return result;
}

} // namespace finfacts::application
