#include <cassert>
#include <cmath>
#include <iostream>

#include "application/NumberParser.hpp"

using finfacts::application::NumberParser;
using finfacts::application::ParsedNumber;

namespace {

bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

} // namespace

int main() {
    std::cout << "[Test] Starting NumberParser Test..." << std::endl;

    auto plain = NumberParser::Parse("1,234,567.89");
    assert(plain.ok() && Near(plain.value, 1234567.89));

    auto parens = NumberParser::Parse("(1,000.00)");
    assert(parens.ok() && Near(parens.value, -1000.0));

    auto fullWidthParens = NumberParser::Parse("（２,５００）");
    assert(fullWidthParens.ok() && Near(fullWidthParens.value, -2500.0));

    auto fullWidthMinus = NumberParser::Parse("－300");
    assert(fullWidthMinus.ok() && Near(fullWidthMinus.value, -300.0));

    auto mathMinus = NumberParser::Parse("−42.5");
    assert(mathMinus.ok() && Near(mathMinus.value, -42.5));
    std::cout << "[PASS] Separators and negative notations." << std::endl;

    auto percent = NumberParser::Parse("12.5%");
    assert(percent.ok() && percent.isPercent && Near(percent.value, 12.5));
    std::cout << "[PASS] Percentages keep their face value." << std::endl;

    assert(NumberParser::Parse("").kind == ParsedNumber::Kind::Empty);
    assert(NumberParser::Parse("  ").kind == ParsedNumber::Kind::Empty);
    assert(NumberParser::Parse("-").kind == ParsedNumber::Kind::Empty);
    assert(NumberParser::Parse("—").kind == ParsedNumber::Kind::Empty);
    std::cout << "[PASS] Blanks and dashes are not observations." << std::endl;

    assert(NumberParser::Parse("五、1").kind == ParsedNumber::Kind::Invalid);
    assert(NumberParser::Parse("1.2.3").kind == ParsedNumber::Kind::Invalid);
    assert(NumberParser::Parse("2023年").kind == ParsedNumber::Kind::Invalid);
    assert(!NumberParser::LooksNumeric("营业收入"));
    std::cout << "[PASS] Text is rejected." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
