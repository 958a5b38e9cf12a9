/**
 * @file StatementType.hpp
 * @brief Value objects classifying financial statements, metric natures and fact types.
 */

#pragma once

#include <string>

namespace finfacts::domain {

/**
 * @enum StatementType
 * @brief The financial statement a line item belongs to.
 */
enum class StatementType {
    Balance,    ///< Balance sheet (point-in-time).
    Income,     ///< Income statement (period).
    CashFlow,   ///< Cash flow statement (period).
    Equity,     ///< Statement of changes in equity.
    Unknown
};

/**
 * @enum ValueNature
 * @brief How a metric value relates to time.
 */
enum class ValueNature {
    Stock,
    Flow,
    Ratio
};

/**
 * @enum FactType
 * @brief Stock facts carry an as-of date, flow facts a period range.
 */
enum class FactType {
    Stock,
    Flow
};

inline std::string StatementTypeToString(StatementType type) {
    switch (type) {
        case StatementType::Balance: return "balance";
        case StatementType::Income: return "income";
        case StatementType::CashFlow: return "cashflow";
        case StatementType::Equity: return "equity";
        default: return "unknown";
    }
}

inline StatementType StatementTypeFromString(const std::string& value) {
    if (value == "balance") return StatementType::Balance;
    if (value == "income") return StatementType::Income;
    if (value == "cashflow" || value == "cash_flow") return StatementType::CashFlow;
    if (value == "equity") return StatementType::Equity;
    return StatementType::Unknown;
}

inline std::string ValueNatureToString(ValueNature nature) {
    switch (nature) {
        case ValueNature::Stock: return "stock";
        case ValueNature::Flow: return "flow";
        case ValueNature::Ratio: return "ratio";
        default: return "flow";
    }
}

inline ValueNature ValueNatureFromString(const std::string& value) {
    if (value == "stock") return ValueNature::Stock;
    if (value == "ratio") return ValueNature::Ratio;
    return ValueNature::Flow;
}

inline std::string FactTypeToString(FactType type) {
    return type == FactType::Stock ? "stock" : "flow";
}

inline FactType FactTypeFromString(const std::string& value) {
    return value == "stock" ? FactType::Stock : FactType::Flow;
}

/**
 * @brief Balance-sheet items are stocks; everything else is measured over a period.
 * Ratios follow the statement they are reported in.
 */
inline FactType DefaultFactType(StatementType statement, ValueNature nature) {
    if (nature == ValueNature::Stock) return FactType::Stock;
    if (nature == ValueNature::Flow) return FactType::Flow;
    return statement == StatementType::Balance ? FactType::Stock : FactType::Flow;
}

} // namespace finfacts::domain
