/**
 * @file ReportMetadataExtractor.cpp
 * @brief Implementation of ReportMetadataExtractor.
 */

#include "application/ReportMetadataExtractor.hpp"

#include <cstdio>
#include <map>
#include <regex>
#include <sstream>

#include "domain/FactGroup.hpp"
#include "domain/LabelText.hpp"

namespace finfacts::application {

using domain::LabelText;
using domain::ReportContext;

namespace {

const char* kUnitAlternatives = "(百万元|亿元|千元|万元|元)";

std::string CurrencyFromWord(const std::string& word) {
    if (word.empty()) return "";
    if (word == "人民币" || word == "RMB" || word == "rmb" || word == "CNY") return "CNY";
    if (word == "美元" || word == "USD") return "USD";
    if (word == "港元" || word == "港币" || word == "HKD") return "HKD";
    return "";
}

std::string FormatDate(int year, int month, int day) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

const std::regex& DateRegex() {
    static const std::regex kDate(
        "((?:19|20)[0-9]{2})\\s*(?:-|/|\\.|年)\\s*([0-9]{1,2})\\s*(?:-|/|\\.|月)\\s*([0-9]{1,2})");
    return kDate;
}

std::optional<std::string> DateFromMatch(const std::smatch& m) {
    int year = std::stoi(m[1].str());
    int month = std::stoi(m[2].str());
    int day = std::stoi(m[3].str());
    if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;
    return FormatDate(year, month, day);
}

bool IsCjk(char32_t c) {
    return c >= 0x4E00 && c <= 0x9FFF;
}

std::string FindCompanyName(const std::string& text) {
    std::u32string s = LabelText::Decode(text);
    for (const std::u32string& suffix : {std::u32string(U"股份有限公司"), std::u32string(U"有限公司")}) {
        size_t pos = s.find(suffix);
        if (pos == std::u32string::npos) continue;
        size_t start = pos;
        while (start > 0 && pos - start < 30 && IsCjk(s[start - 1])) --start;
        if (start == pos) continue;
        return LabelText::Encode(s.substr(start, pos - start + suffix.size()));
    }
    return "";
}

std::string FindTitle(const std::string& pageText) {
    std::istringstream stream(pageText);
    std::string line;
    while (std::getline(stream, line)) {
        std::string trimmed = LabelText::Trim(line);
        if (trimmed.empty()) continue;
        if (LabelText::Contains(trimmed, "报告") && LabelText::Length(trimmed) <= 60) return trimmed;
        if (domain::AsciiLower(trimmed).find("annual report") != std::string::npos) return trimmed;
    }
    return "";
}

} // namespace

UnitHint ReportMetadataExtractor::DetectUnit(const std::string& text) {
    UnitHint hint;
    static const std::regex kDeclared(
        std::string("(?:金额单位|货币单位|单位)\\s*(?:：|:)\\s*(人民币|美元|港元|RMB|USD|HKD)?\\s*") + kUnitAlternatives);
    static const std::regex kParenthetical(
        std::string("(?:（|\\()\\s*(?:单位(?:：|:))?\\s*(人民币|美元|港元|RMB|USD|HKD)?\\s*") + kUnitAlternatives +
        "\\s*(?:）|\\))");
    static const std::regex kThousandsEn("(RMB|USD|HKD)\\s*'?\\s*000");
    static const std::regex kMillionsEn("(RMB|USD|HKD)\\s*(?:million|mn|m)\\b", std::regex::icase);

    std::smatch m;
    if (std::regex_search(text, m, kDeclared) || std::regex_search(text, m, kParenthetical)) {
        hint.unit = domain::NormalizeUnit(m[2].str(), domain::KeyDefaults{});
        std::string currency = CurrencyFromWord(m[1].str());
        if (!currency.empty()) hint.currency = currency;
    } else if (std::regex_search(text, m, kThousandsEn)) {
        hint.unit = "1k_yuan";
        hint.currency = CurrencyFromWord(m[1].str());
    } else if (std::regex_search(text, m, kMillionsEn)) {
        hint.unit = "1m_yuan";
        hint.currency = CurrencyFromWord(m[1].str());
    }

    if (!hint.currency) {
        if (LabelText::Contains(text, "人民币")) hint.currency = "CNY";
        else if (LabelText::Contains(text, "美元")) hint.currency = "USD";
        else if (LabelText::Contains(text, "港元") || LabelText::Contains(text, "港币")) hint.currency = "HKD";
    }
    return hint;
}

std::optional<std::string> ReportMetadataExtractor::ParseDate(const std::string& text) {
    std::smatch m;
    if (!std::regex_search(text, m, DateRegex())) return std::nullopt;
    return DateFromMatch(m);
}

ReportContext ReportMetadataExtractor::Extract(const std::string& reportId,
                                               const domain::DocumentContent& content,
                                               int maxPages) {
    ReportContext ctx;
    ctx.reportId = reportId;

    std::string text;
    for (const auto& [page, pageText] : content.pageText) {
        if (page > maxPages) break;
        if (ctx.title.empty()) ctx.title = FindTitle(pageText);
        text += pageText;
        text += "\n";
    }
    for (const auto& table : content.tables) {
        if (table.page > maxPages) continue;
        text += table.caption + "\n" + table.context + "\n";
    }

    ctx.companyName = FindCompanyName(text);

    static const std::regex kTicker("(?:股票代码|证券代码|Stock Code)\\s*(?:：|:)?\\s*([0-9]{6})");
    std::smatch m;
    if (std::regex_search(text, m, kTicker)) ctx.ticker = m[1].str();

    static const std::regex kAnnualCn("((?:19|20)[0-9]{2})\\s*年\\s*(?:年度报告|年报|年度)");
    static const std::regex kAnnualEn("(?:annual report|Annual Report|ANNUAL REPORT)\\s*((?:19|20)[0-9]{2})");
    static const std::regex kHalfCn("((?:19|20)[0-9]{2})\\s*年\\s*(?:半年度报告|半年报|中期报告)");
    if (std::regex_search(text, m, kHalfCn)) {
        ctx.fiscalYear = std::stoi(m[1].str());
        ctx.reportType = "semiannual";
    } else if (std::regex_search(text, m, kAnnualCn) || std::regex_search(text, m, kAnnualEn)) {
        ctx.fiscalYear = std::stoi(m[1].str());
        ctx.reportType = "annual";
    } else {
        static const std::regex kYear("(?:19|20)[0-9]{2}");
        std::map<int, int> counts;
        for (auto it = std::sregex_iterator(text.begin(), text.end(), kYear); it != std::sregex_iterator(); ++it) {
            ++counts[std::stoi(it->str())];
        }
        int bestCount = 0;
        for (const auto& [year, count] : counts) {
            if (count > bestCount || (count == bestCount && year > ctx.fiscalYear)) {
                ctx.fiscalYear = year;
                bestCount = count;
            }
        }
    }

    if (ctx.fiscalYear > 0) {
        std::string expected = ctx.reportType == "semiannual"
                                   ? FormatDate(ctx.fiscalYear, 6, 30)
                                   : FormatDate(ctx.fiscalYear, 12, 31);
        // An explicit period-end date in the fiscal year wins over the calendar default.
        std::optional<std::string> found;
        for (auto it = std::sregex_iterator(text.begin(), text.end(), DateRegex()); it != std::sregex_iterator(); ++it) {
            auto date = DateFromMatch(*it);
            if (!date || date->compare(0, 4, std::to_string(ctx.fiscalYear)) != 0) continue;
            if (*date == expected || date->substr(5) == "12-31" || date->substr(5) == "06-30") {
                found = date;
                if (*date == expected) break;
            }
        }
        ctx.periodEnd = found ? *found : expected;
        ctx.periodStart = FormatDate(ctx.fiscalYear, 1, 1);
    }

    UnitHint hint = DetectUnit(text);
    if (hint.unit) ctx.unit = *hint.unit;
    if (hint.currency) ctx.currency = *hint.currency;
    return ctx;
}

ReportContext ReportMetadataExtractor::Merge(const ReportContext& overrides, const ReportContext& detected) {
    ReportContext out = detected;
    auto take = [](std::string& target, const std::string& value) {
        if (!value.empty()) target = value;
    };
    take(out.reportId, overrides.reportId);
    take(out.title, overrides.title);
    take(out.companyName, overrides.companyName);
    take(out.ticker, overrides.ticker);
    take(out.currency, overrides.currency);
    take(out.unit, overrides.unit);
    if (overrides.fiscalYear > 0) {
        out.fiscalYear = overrides.fiscalYear;
        out.periodEnd = FormatDate(overrides.fiscalYear, 12, 31);
        out.periodStart = FormatDate(overrides.fiscalYear, 1, 1);
        out.reportType = "annual";
    }
    if (!overrides.periodEnd.empty()) {
        out.periodEnd = overrides.periodEnd;
        int year = std::stoi(overrides.periodEnd.substr(0, 4));
        if (overrides.fiscalYear == 0) out.fiscalYear = year;
        out.periodStart = overrides.periodStart.empty() ? FormatDate(year, 1, 1) : overrides.periodStart;
    }
    return out;
}

} // namespace finfacts::application
