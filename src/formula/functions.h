#pragma once

/// @file functions.h
/// @brief Built-in math functions callable from formulas

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "formula/value.h"

namespace chartcalc::formula {

/// @brief MAX(a, b, ...): largest numeric argument, NA if none are numbers
FormulaValue Max(const std::vector<FormulaValue>& args);

/// @brief MIN(a, b, ...): smallest numeric argument, NA if none are numbers
FormulaValue Min(const std::vector<FormulaValue>& args);

/// @brief ROUND(x): nearest integer, halves rounded away from zero
FormulaValue Round(const std::vector<FormulaValue>& args);

/// @brief ABS(x)
FormulaValue Abs(const std::vector<FormulaValue>& args);

/// @brief Name -> implementation table consulted by the parser and evaluator
///
/// Every function is total: bad arity or non-numeric input yields NA rather
/// than an error.
class FunctionLibrary {
public:
    using Function = std::function<FormulaValue(const std::vector<FormulaValue>&)>;

    FunctionLibrary() = default;

    /// @brief MAX, MIN, ROUND and ABS
    static const FunctionLibrary& Default();

    /// @brief Add or replace a function; names are matched exactly
    void Register(std::string name, Function function);

    bool Contains(std::string_view name) const;

    /// @brief Invoke @p name, NA if it is not registered
    FormulaValue Call(std::string_view name, const std::vector<FormulaValue>& args) const;

    /// @brief Registered names in lexical order
    std::vector<std::string> Names() const;

private:
    std::unordered_map<std::string, Function> functions_;
};

}  // namespace chartcalc::formula
