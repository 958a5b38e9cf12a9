/**
 * @file NumberParser.cpp
 * @brief Implementation of NumberParser.
 */

#include "application/NumberParser.hpp"

#include <cstdlib>

#include "domain/LabelText.hpp"

namespace finfacts::application {

using domain::LabelText;

namespace {

bool IsDashOnly(const std::u32string& s) {
    if (s.empty()) return false;
    for (char32_t c : s) {
        if (c != U'-' && c != U'—' && c != U'–' && c != U'－' && c != U'−' && c != U'/') return false;
    }
    return true;
}

} // namespace

ParsedNumber NumberParser::Parse(const std::string& text) {
    ParsedNumber result;

    std::u32string folded;
    for (char32_t c : LabelText::Decode(text)) {
        if (c == U' ' || c == U'\t' || c == 0x3000 || c == 0x00A0 || c == U'\n' || c == U'\r') continue;
        if (c >= 0xFF01 && c <= 0xFF5E) c -= 0xFEE0;
        if (c == U'−') c = U'-';
        folded.push_back(c);
    }

    if (folded.empty() || IsDashOnly(folded)) {
        result.kind = ParsedNumber::Kind::Empty;
        return result;
    }

    bool negative = false;
    if (folded.size() >= 2 && folded.front() == U'(' && folded.back() == U')') {
        negative = true;
        folded = folded.substr(1, folded.size() - 2);
    }
    if (!folded.empty() && folded.back() == U'%') {
        result.isPercent = true;
        folded.pop_back();
    }
    if (!folded.empty() && (folded.front() == U'-' || folded.front() == U'+')) {
        if (folded.front() == U'-') negative = !negative;
        folded.erase(0, 1);
    }

    std::string digits;
    bool seenDot = false;
    bool seenDigit = false;
    for (char32_t c : folded) {
        if (c == U',' || c == U'，' || c == U'\'') continue;
        if (c == U'.') {
            if (seenDot) {
                result.kind = ParsedNumber::Kind::Invalid;
                return result;
            }
            seenDot = true;
            digits.push_back('.');
            continue;
        }
        if (c >= U'0' && c <= U'9') {
            seenDigit = true;
            digits.push_back(static_cast<char>(c));
            continue;
        }
        result.kind = ParsedNumber::Kind::Invalid;
        return result;
    }
    if (!seenDigit) {
        result.kind = ParsedNumber::Kind::Invalid;
        return result;
    }

    result.value = std::strtod(digits.c_str(), nullptr);
    if (negative) result.value = -result.value;
    result.kind = ParsedNumber::Kind::Number;
    return result;
}

} // namespace finfacts::application
