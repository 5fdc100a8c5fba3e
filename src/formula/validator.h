#pragma once

/// @file validator.h
/// @brief Pre-save checks for formulas and the data they depend on

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>

#include "formula/statistics_record.h"
#include "formula/value.h"
#include "metadata/types.h"

namespace chartcalc::formula {

inline constexpr std::string_view kUnbalancedClosingMessage =
    "Unbalanced parentheses: closing parenthesis without opening";
inline constexpr std::string_view kUnclosedOpeningMessage =
    "Unbalanced parentheses: unclosed opening parenthesis";

struct FormulaValidationResult {
    bool is_valid = false;

    /// Empty when valid
    std::string error;

    /// Token bodies in order of first appearance
    std::vector<std::string> used_variables;

    /// Trial result against SyntheticUnitRecord(), set when valid
    std::optional<FormulaValue> evaluated_result;
};

/// @brief Check parenthesis balance, then parse and trial-evaluate
///
/// A valid formula is only mechanically well-formed; against real data it
/// may still produce NA.
FormulaValidationResult ValidateFormula(std::string_view formula);

/// @brief Running '(' / ')' count that must stay >= 0 and end at 0
absl::Status CheckParenthesisBalance(std::string_view formula);

/// @brief Every base field set to 1
StatisticsRecord SyntheticUnitRecord();

/// @brief Which field tokens of a formula a record can satisfy
struct StatsCoverage {
    /// No field is missing
    bool valid = true;
    std::vector<std::string> missing_variables;
    std::vector<std::string> available_variables;

    /// Missing fields default to 0, so evaluation is always possible
    bool can_evaluate = true;
};

/// @brief Field tokens of @p formula that @p stats does not store
///
/// Derived fields always count as available. Parameter, manual and asset
/// tokens are not checked.
StatsCoverage ValidateStatsForFormula(std::string_view formula, const StatisticsRecord& stats);

/// @brief Whether @p name is a legitimate token body for the registry
///
/// PARAM:, MANUAL:, MEDIA: and TEXT: tokens are always known. An empty
/// registry (not yet fetched, or the fetch failed) accepts everything.
bool IsKnownVariable(std::string_view name,
                     const std::vector<metadata::VariableMetadata>& registry);

/// @brief Registry example usage for @p name, nullopt if none
std::optional<std::string> VariableExample(std::string_view name,
                                           const std::vector<metadata::VariableMetadata>& registry);

struct SafeEvaluation {
    std::string formula;
    FormulaValue result;

    /// Every field the formula references is present in the record
    bool valid = false;
};

/// @brief Evaluate each formula and report whether its inputs were complete
std::vector<SafeEvaluation> EvaluateFormulaBatchSafe(const std::vector<std::string>& formulas,
                                                     const StatisticsRecord& stats);

}  // namespace chartcalc::formula
