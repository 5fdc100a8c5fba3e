#pragma once

/// @file value.h
/// @brief Result type of formula evaluation: number, text or NA

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace chartcalc::formula {

/// @brief Value produced by resolving a token or evaluating a formula
///
/// The NA sentinel ("not applicable") means the value could not be computed.
/// It is a distinct kind and never compares equal to the number 0. A number
/// is always finite: constructing one from NaN or +/-Inf yields NA.
class FormulaValue {
public:
    enum class Kind {
        kNotApplicable,
        kNumber,
        kText
    };

    /// @brief Default-constructed values are NA
    FormulaValue() = default;

    static FormulaValue NotApplicable() { return FormulaValue(); }
    static FormulaValue FromNumber(double value);
    static FormulaValue FromText(std::string text);

    Kind GetKind() const;

    bool IsNumber() const { return std::holds_alternative<double>(value_); }
    bool IsText() const { return std::holds_alternative<std::string>(value_); }
    bool IsNotApplicable() const { return std::holds_alternative<std::monostate>(value_); }

    /// @brief Numeric payload; callers must check IsNumber() first
    double GetNumber() const { return std::get<double>(value_); }

    /// @brief Text payload; callers must check IsText() first
    const std::string& GetText() const { return std::get<std::string>(value_); }

    /// @brief Numeric payload, nullopt for text and NA
    std::optional<double> AsNumber() const;

    /// @brief Display form: "NA", shortest round-trip number, or the text
    std::string ToString() const;

    bool operator==(const FormulaValue& other) const { return value_ == other.value_; }
    bool operator!=(const FormulaValue& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, double, std::string> value_;
};

/// @brief Literal shown wherever a value is NA
inline constexpr std::string_view kNotApplicableText = "NA";

/// @brief Shortest decimal text that reads back as the same double
std::string FormatNumber(double value);

std::ostream& operator<<(std::ostream& os, const FormulaValue& value);

}  // namespace chartcalc::formula
