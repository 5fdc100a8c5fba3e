/// @file value_test.cpp
/// @brief Tests for FormulaValue and number formatting

#include <cmath>
#include <limits>
#include <sstream>

#include <gtest/gtest.h>

#include "formula/value.h"

namespace chartcalc::formula {
namespace {

TEST(FormulaValueTest, DefaultIsNotApplicable) {
    FormulaValue value;
    EXPECT_TRUE(value.IsNotApplicable());
    EXPECT_EQ(value.GetKind(), FormulaValue::Kind::kNotApplicable);
    EXPECT_EQ(value.ToString(), "NA");
    EXPECT_FALSE(value.AsNumber().has_value());
}

TEST(FormulaValueTest, NotApplicableIsNotZero) {
    EXPECT_NE(FormulaValue::NotApplicable(), FormulaValue::FromNumber(0.0));
    EXPECT_NE(FormulaValue::NotApplicable(), FormulaValue::FromText("NA"));
}

TEST(FormulaValueTest, NonFiniteNumbersBecomeNotApplicable) {
    EXPECT_TRUE(FormulaValue::FromNumber(std::numeric_limits<double>::infinity()).IsNotApplicable());
    EXPECT_TRUE(FormulaValue::FromNumber(-std::numeric_limits<double>::infinity()).IsNotApplicable());
    EXPECT_TRUE(FormulaValue::FromNumber(std::nan("")).IsNotApplicable());
}

TEST(FormulaValueTest, NegativeZeroIsNormalised) {
    auto value = FormulaValue::FromNumber(-0.0);
    ASSERT_TRUE(value.IsNumber());
    EXPECT_FALSE(std::signbit(value.GetNumber()));
    EXPECT_EQ(value.ToString(), "0");
}

TEST(FormulaValueTest, ToString) {
    EXPECT_EQ(FormulaValue::FromNumber(5).ToString(), "5");
    EXPECT_EQ(FormulaValue::FromNumber(0.1).ToString(), "0.1");
    EXPECT_EQ(FormulaValue::FromNumber(-2.5).ToString(), "-2.5");
    EXPECT_EQ(FormulaValue::FromText("https://x/y.png").ToString(), "https://x/y.png");

    std::ostringstream oss;
    oss << FormulaValue::NotApplicable() << " " << FormulaValue::FromNumber(7);
    EXPECT_EQ(oss.str(), "NA 7");
}

TEST(FormulaValueTest, FormatNumberRoundTrips) {
    const double value = 280.0 / 45.0;
    EXPECT_DOUBLE_EQ(std::stod(FormatNumber(value)), value);
}

}  // namespace
}  // namespace chartcalc::formula
