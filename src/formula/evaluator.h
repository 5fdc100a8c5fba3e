#pragma once

/// @file evaluator.h
/// @brief Tree-walking evaluation of parsed formulas

#include <functional>
#include <string_view>

#include "formula/ast.h"
#include "formula/functions.h"
#include "formula/value.h"

namespace chartcalc::formula {

/// @brief Supplies the value of a Reference node
using ReferenceResolver = std::function<FormulaValue(const Token&)>;

/// @brief Evaluate @p node
///
/// Arithmetic is performed on numbers only: a text or NA operand, division
/// by zero, or a non-finite intermediate all make the result NA. A bare
/// Text node or a lone reference that resolves to text evaluates to text.
FormulaValue Evaluate(const Node& node,
                      const ReferenceResolver& resolver,
                      const FunctionLibrary& functions = FunctionLibrary::Default());

/// @brief Evaluate a fully substituted arithmetic expression
///
/// Accepts numbers, unary minus and plus, + - * / and parentheses. Literal
/// division by a bare 0 ("/0" not followed by a digit or '.') is rejected
/// before parsing. Any failure yields NA; this function never throws.
FormulaValue EvaluateArithmetic(std::string_view expression);

/// @brief True if @p expression contains "/0" not followed by a digit or '.'
///
/// Whitespace is ignored, so "1 / 0" matches while "1/0.5" and "1/01" do not.
bool HasLiteralDivisionByZero(std::string_view expression);

}  // namespace chartcalc::formula
