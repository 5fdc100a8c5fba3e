/// @file validator_test.cpp
/// @brief Tests for formula validation helpers

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "formula/validator.h"

namespace chartcalc::formula {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

metadata::VariableMetadata Variable(std::string name, std::string example = "") {
    metadata::VariableMetadata variable;
    variable.name = std::move(name);
    variable.example_usage = std::move(example);
    return variable;
}

TEST(ValidateFormulaTest, BalancedFormulaIsValid) {
    auto result = ValidateFormula("([female]+[male])/[approvedImages]");
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.error.empty());
    EXPECT_THAT(result.used_variables, ElementsAre("female", "male", "approvedImages"));
    ASSERT_TRUE(result.evaluated_result.has_value());
    EXPECT_EQ(*result.evaluated_result, FormulaValue::FromNumber(2));
}

TEST(ValidateFormulaTest, ParenthesisMessages) {
    auto unclosed = ValidateFormula("(1+2");
    EXPECT_FALSE(unclosed.is_valid);
    EXPECT_EQ(unclosed.error, kUnclosedOpeningMessage);
    EXPECT_FALSE(unclosed.evaluated_result.has_value());

    auto extra = ValidateFormula("1+2)");
    EXPECT_FALSE(extra.is_valid);
    EXPECT_EQ(extra.error, kUnbalancedClosingMessage);

    // Balanced count but closing first
    EXPECT_EQ(ValidateFormula(")1+2(").error, kUnbalancedClosingMessage);

    EXPECT_TRUE(ValidateFormula("(1+2)").is_valid);
}

TEST(ValidateFormulaTest, UsedVariablesReportedOnFailure) {
    auto result = ValidateFormula("([a]+[b]");
    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.used_variables, ElementsAre("a", "b"));
}

TEST(ValidateFormulaTest, ParserErrorsInvalidate) {
    auto result = ValidateFormula("SQRT([a])");
    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.error, ::testing::HasSubstr("Unknown function"));

    EXPECT_FALSE(ValidateFormula("[a] +").is_valid);
}

TEST(ValidateFormulaTest, TrialResultMayBeNotApplicable) {
    // Mechanically well-formed even though it divides by zero
    auto result = ValidateFormula("[female]/([male]-[male])");
    EXPECT_TRUE(result.is_valid);
    ASSERT_TRUE(result.evaluated_result.has_value());
    EXPECT_TRUE(result.evaluated_result->IsNotApplicable());
}

TEST(CheckParenthesisBalanceTest, StatusCodes) {
    EXPECT_TRUE(CheckParenthesisBalance("((a))").ok());
    EXPECT_EQ(CheckParenthesisBalance("(").code(), absl::StatusCode::kInvalidArgument);
}

TEST(SyntheticUnitRecordTest, EveryBaseFieldIsOne) {
    auto record = SyntheticUnitRecord();
    EXPECT_EQ(record.Size(), StatisticsRecord::BaseFieldNames().size());
    EXPECT_EQ(record.GetNumber("eventResultVisitor"), 1);
}

TEST(ValidateStatsForFormulaTest, ReportsMissingFields) {
    StatisticsRecord stats = {{"female", 1}};
    auto coverage = ValidateStatsForFormula(
        "[female]+[male]+[totalFans]+[PARAM:p]+[MANUAL:m]+[MEDIA:logo]", stats);

    EXPECT_FALSE(coverage.valid);
    EXPECT_TRUE(coverage.can_evaluate);
    EXPECT_THAT(coverage.missing_variables, ElementsAre("male"));
    EXPECT_THAT(coverage.available_variables, ElementsAre("female", "totalFans"));
}

TEST(ValidateStatsForFormulaTest, CompleteRecordIsValid) {
    StatisticsRecord stats = {{"female", 1}, {"male", 2}};
    auto coverage = ValidateStatsForFormula("[stats.female]/[male]", stats);
    EXPECT_TRUE(coverage.valid);
    EXPECT_THAT(coverage.missing_variables, IsEmpty());
}

TEST(IsKnownVariableTest, PrefixedTokensAlwaysKnown) {
    std::vector<metadata::VariableMetadata> registry = {Variable("female")};
    EXPECT_TRUE(IsKnownVariable("PARAM:anything", registry));
    EXPECT_TRUE(IsKnownVariable("MANUAL:anything", registry));
    EXPECT_TRUE(IsKnownVariable("female", registry));
    EXPECT_FALSE(IsKnownVariable("male", registry));
}

TEST(IsKnownVariableTest, EmptyRegistryIsPermissive) {
    EXPECT_TRUE(IsKnownVariable("anything", {}));
}

TEST(VariableExampleTest, LooksUpExampleUsage) {
    std::vector<metadata::VariableMetadata> registry = {
        Variable("female", "[female]/[male]"),
        Variable("male"),
    };
    EXPECT_EQ(VariableExample("female", registry), "[female]/[male]");
    EXPECT_FALSE(VariableExample("male", registry).has_value());
    EXPECT_FALSE(VariableExample("other", registry).has_value());
}

TEST(EvaluateFormulaBatchSafeTest, ResultAndValidity) {
    StatisticsRecord stats = {{"a", 6}};
    auto results = EvaluateFormulaBatchSafe({"[a]/2", "[a]+[b]"}, stats);

    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].formula, "[a]/2");
    EXPECT_EQ(results[0].result, FormulaValue::FromNumber(3));
    EXPECT_TRUE(results[0].valid);
    EXPECT_EQ(results[1].result, FormulaValue::FromNumber(6));
    EXPECT_FALSE(results[1].valid);
}

}  // namespace
}  // namespace chartcalc::formula
