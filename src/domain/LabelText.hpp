/**
 * @file LabelText.hpp
 * @brief UTF-8 aware text utilities for row labels (noise stripping and normalization).
 */

#pragma once

#include <optional>
#include <string>

namespace finfacts::domain {

class LabelText {
public:
    static std::u32string Decode(const std::string& utf8);
    static std::string Encode(const std::u32string& text);

    /** @brief Number of Unicode code points (not bytes). */
    static size_t Length(const std::string& utf8);

    /**
     * @brief Canonical comparison form: no whitespace or punctuation, full-width
     * ASCII folded to half-width, ASCII lower-cased.
     */
    static std::string Normalize(const std::string& label);

    /**
     * @brief Removes numbering markers ("一、", "（一）", "1.", circled digits),
     * sub-item prefixes ("其中：", "加：", "减：", "Less:"), marker glyphs,
     * trailing footnote or unit parentheticals and bracketed section codes.
     */
    static std::string StripNoise(const std::string& label);

    /**
     * @brief Extracts a bracketed 6-digit code such as "[821110]" or "【210000】".
     */
    static std::optional<std::string> ExtractCode(const std::string& label);

    /** @brief Trims ASCII and ideographic whitespace from both ends. */
    static std::string Trim(const std::string& text);

    static bool Contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }
};

} // namespace finfacts::domain
