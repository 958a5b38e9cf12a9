/**
 * @file LabelText.cpp
 * @brief Implementation of LabelText.
 */

#include "domain/LabelText.hpp"

#include <vector>

namespace finfacts::domain {

namespace {

bool IsSpace(char32_t c) {
    return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r' || c == U'\f' || c == U'\v' ||
           c == 0x3000 || c == 0x00A0;
}

char32_t ToHalfWidth(char32_t c) {
    if (c >= 0xFF01 && c <= 0xFF5E) return c - 0xFEE0;
    return c;
}

bool IsLabelPunct(char32_t c) {
    static const std::u32string kPunct =
        U":()[]{},.;!?-_/\\'\"`~|<>=+&^"
        U"、。：；，．（）【】《》〈〉“”‘’·—–…「」『』";
    return kPunct.find(c) != std::u32string::npos;
}

bool IsCjkNumeral(char32_t c) {
    static const std::u32string kNumerals = U"一二三四五六七八九十百零〇";
    return kNumerals.find(c) != std::u32string::npos;
}

bool IsDigit(char32_t c) {
    return c >= U'0' && c <= U'9';
}

bool IsCircledNumber(char32_t c) {
    return (c >= 0x2460 && c <= 0x2473) || (c >= 0x2776 && c <= 0x277F);
}

bool IsMarkerGlyph(char32_t c) {
    static const std::u32string kMarkers = U"△▲*※#☆★▪•";
    return kMarkers.find(c) != std::u32string::npos;
}

bool IsOpenParen(char32_t c) { return c == U'(' || c == U'（'; }
bool IsCloseParen(char32_t c) { return c == U')' || c == U'）'; }

char32_t AsciiLower(char32_t c) {
    if (c >= U'A' && c <= U'Z') return c + 32;
    return c;
}

std::u32string TrimU32(const std::u32string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && IsSpace(s[start])) ++start;
    while (end > start && IsSpace(s[end - 1])) --end;
    return s.substr(start, end - start);
}

bool StartsWithFolded(const std::u32string& s, const std::u32string& prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (AsciiLower(ToHalfWidth(s[i])) != prefix[i]) return false;
    }
    return true;
}

// Prefixes that mark a sub-item or an adjustment line; matched after full-width folding.
const std::vector<std::u32string>& SubItemPrefixes() {
    static const std::vector<std::u32string> kPrefixes = {
        U"其中:", U"其中", U"加:", U"减:", U"less:", U"add:", U"including:", U"of which:",
        U"incl."
    };
    return kPrefixes;
}

bool StripLeadingMarker(std::u32string& s) {
    if (s.empty()) return false;

    if (IsMarkerGlyph(s[0]) || IsCircledNumber(s[0])) {
        s.erase(0, 1);
        return true;
    }

    // (一) / （1）
    if (IsOpenParen(s[0])) {
        size_t i = 1;
        while (i < s.size() && i <= 4 && (IsCjkNumeral(s[i]) || IsDigit(ToHalfWidth(s[i])))) ++i;
        if (i > 1 && i < s.size() && IsCloseParen(s[i])) {
            s.erase(0, i + 1);
            return true;
        }
    }

    // 一、 / 十二、
    size_t n = 0;
    while (n < s.size() && IsCjkNumeral(s[n])) ++n;
    if (n > 0 && n < s.size() && (s[n] == U'、' || s[n] == U'．' || s[n] == U'.')) {
        s.erase(0, n + 1);
        return true;
    }

    // 1. / 1、 / 1) but not 1.5
    n = 0;
    while (n < s.size() && IsDigit(ToHalfWidth(s[n]))) ++n;
    if (n > 0 && n < s.size()) {
        char32_t sep = ToHalfWidth(s[n]);
        bool nextIsDigit = (n + 1 < s.size()) && IsDigit(ToHalfWidth(s[n + 1]));
        if ((sep == U'.' && !nextIsDigit) || s[n] == U'、' || sep == U')') {
            s.erase(0, n + 1);
            return true;
        }
    }

    for (const auto& prefix : SubItemPrefixes()) {
        if (StartsWithFolded(s, prefix)) {
            // "其中" alone would leave nothing behind
            if (prefix.size() >= s.size()) return false;
            s.erase(0, prefix.size());
            return true;
        }
    }
    return false;
}

bool IsUnitWord(const std::u32string& rawContent) {
    std::u32string content = TrimU32(rawContent);
    for (const std::u32string& prefix : {std::u32string(U"单位："), std::u32string(U"单位:")}) {
        if (content.compare(0, prefix.size(), prefix) == 0) content = TrimU32(content.substr(prefix.size()));
    }
    if (content.compare(0, 3, U"人民币") == 0) content = content.substr(3);
    static const std::vector<std::u32string> kUnits = {
        U"", U"元", U"千元", U"万元", U"百万元", U"亿元", U"%", U"％"
    };
    for (const auto& unit : kUnits) {
        if (content == unit) return true;
    }
    return false;
}

bool IsFootnoteContent(const std::u32string& content) {
    std::u32string trimmed = TrimU32(content);
    return StartsWithFolded(trimmed, U"附注") || StartsWithFolded(trimmed, U"注释") ||
           StartsWithFolded(trimmed, U"注") || StartsWithFolded(trimmed, U"note");
}

bool IsCodeContent(const std::u32string& content) {
    std::u32string trimmed = TrimU32(content);
    if (trimmed.size() < 6 || trimmed.size() > 7) return false;
    for (size_t i = 0; i < 6; ++i) {
        if (!IsDigit(trimmed[i])) return false;
    }
    return trimmed.size() == 6 || (trimmed[6] >= U'a' && trimmed[6] <= U'z');
}

bool StripTrailingParenthetical(std::u32string& s) {
    if (s.empty() || !IsCloseParen(s.back())) return false;
    size_t open = std::u32string::npos;
    for (size_t i = s.size() - 1; i-- > 0;) {
        if (IsOpenParen(s[i])) {
            open = i;
            break;
        }
    }
    if (open == std::u32string::npos || open == 0) return false;
    std::u32string content = s.substr(open + 1, s.size() - open - 2);
    if (IsFootnoteContent(content) || IsUnitWord(content)) {
        s.erase(open);
        return true;
    }
    return false;
}

void StripBracketCodes(std::u32string& s) {
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == U'[' || s[i] == U'【') {
            size_t close = i + 1;
            while (close < s.size() && s[close] != U']' && s[close] != U'】') ++close;
            if (close < s.size() && IsCodeContent(s.substr(i + 1, close - i - 1))) {
                s.erase(i, close - i + 1);
                continue;
            }
        }
        ++i;
    }
}

} // namespace

std::u32string LabelText::Decode(const std::string& utf8) {
    std::u32string out;
    out.reserve(utf8.size());
    size_t i = 0;
    while (i < utf8.size()) {
        unsigned char c = static_cast<unsigned char>(utf8[i]);
        char32_t cp = 0;
        size_t extra = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            out.push_back(0xFFFD);
            ++i;
            continue;
        }
        if (i + extra >= utf8.size()) {
            out.push_back(0xFFFD);
            break;
        }
        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(utf8[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) {
            out.push_back(0xFFFD);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

std::string LabelText::Encode(const std::u32string& text) {
    std::string out;
    out.reserve(text.size() * 3);
    for (char32_t cp : text) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

size_t LabelText::Length(const std::string& utf8) {
    size_t count = 0;
    for (unsigned char c : utf8) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

std::string LabelText::Normalize(const std::string& label) {
    std::u32string in = Decode(label);
    std::u32string out;
    out.reserve(in.size());
    for (char32_t c : in) {
        if (IsSpace(c)) continue;
        char32_t folded = ToHalfWidth(c);
        if (IsLabelPunct(folded) || IsLabelPunct(c)) continue;
        out.push_back(AsciiLower(folded));
    }
    return Encode(out);
}

std::string LabelText::StripNoise(const std::string& label) {
    std::u32string s = TrimU32(Decode(label));
    StripBracketCodes(s);
    s = TrimU32(s);

    bool changed = true;
    while (changed && !s.empty()) {
        changed = StripLeadingMarker(s);
        s = TrimU32(s);
    }
    changed = true;
    while (changed && !s.empty()) {
        changed = StripTrailingParenthetical(s);
        s = TrimU32(s);
    }
    // Trailing marker glyphs ("营业收入*")
    while (!s.empty() && IsMarkerGlyph(s.back())) {
        s.pop_back();
    }
    return Encode(TrimU32(s));
}

std::optional<std::string> LabelText::ExtractCode(const std::string& label) {
    std::u32string s = Decode(label);
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != U'[' && s[i] != U'【') continue;
        size_t close = i + 1;
        while (close < s.size() && s[close] != U']' && s[close] != U'】') ++close;
        if (close >= s.size()) return std::nullopt;
        std::u32string content = TrimU32(s.substr(i + 1, close - i - 1));
        if (IsCodeContent(content)) return Encode(content);
        i = close;
    }
    return std::nullopt;
}

std::string LabelText::Trim(const std::string& text) {
    return Encode(TrimU32(Decode(text)));
}

} // namespace finfacts::domain
