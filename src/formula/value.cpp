#include "formula/value.h"

#include <array>
#include <charconv>
#include <cmath>

namespace chartcalc::formula {

FormulaValue FormulaValue::FromNumber(double value) {
    FormulaValue result;
    if (std::isfinite(value)) {
        // Normalise -0 so that "-0" never reaches a chart
        result.value_ = value == 0.0 ? 0.0 : value;
    }
    return result;
}

FormulaValue FormulaValue::FromText(std::string text) {
    FormulaValue result;
    result.value_ = std::move(text);
    return result;
}

FormulaValue::Kind FormulaValue::GetKind() const {
    if (IsNumber()) {
        return Kind::kNumber;
    }
    if (IsText()) {
        return Kind::kText;
    }
    return Kind::kNotApplicable;
}

std::optional<double> FormulaValue::AsNumber() const {
    if (IsNumber()) {
        return GetNumber();
    }
    return std::nullopt;
}

std::string FormulaValue::ToString() const {
    switch (GetKind()) {
        case Kind::kNumber:
            return FormatNumber(GetNumber());
        case Kind::kText:
            return GetText();
        case Kind::kNotApplicable:
        default:
            return std::string(kNotApplicableText);
    }
}

std::string FormatNumber(double value) {
    if (!std::isfinite(value)) {
        return std::string(kNotApplicableText);
    }
    std::array<char, 32> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc()) {
        return std::string(kNotApplicableText);
    }
    return std::string(buffer.data(), end);
}

std::ostream& operator<<(std::ostream& os, const FormulaValue& value) {
    return os << value.ToString();
}

}  // namespace chartcalc::formula
