/**
 * @file NumberParser.hpp
 * @brief Parses financial-statement cell text into numbers.
 */

#pragma once

#include <optional>
#include <string>

namespace finfacts::application {

/**
 * @struct ParsedNumber
 */
struct ParsedNumber {
    enum class Kind {
        Empty,      ///< Blank or placeholder dash; not an observation.
        Number,
        Invalid     ///< Has text but is not a number.
    };

    Kind kind = Kind::Empty;
    double value = 0.0;
    bool isPercent = false;

    bool ok() const { return kind == Kind::Number; }
};

class NumberParser {
public:
    /**
     * @brief Accepts thousands separators, "(123)" and "（123）" as negatives,
     * leading "-", "−" or "－", full-width digits and a trailing "%".
     */
    static ParsedNumber Parse(const std::string& text);

    /** @brief True if the text parses as a number (used for header/data row detection). */
    static bool LooksNumeric(const std::string& text) { return Parse(text).ok(); }
};

} // namespace finfacts::application
