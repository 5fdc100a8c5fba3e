/// @file functions_test.cpp
/// @brief Tests for the built-in math functions

#include <gtest/gtest.h>

#include "formula/functions.h"

namespace chartcalc::formula {
namespace {

FormulaValue Num(double value) {
    return FormulaValue::FromNumber(value);
}

TEST(FunctionsTest, MaxAndMin) {
    EXPECT_EQ(Max({Num(3), Num(7), Num(2)}), Num(7));
    EXPECT_EQ(Min({Num(3), Num(7), Num(2)}), Num(2));
}

TEST(FunctionsTest, MaxAndMinIgnoreNonNumbers) {
    EXPECT_EQ(Max({FormulaValue::NotApplicable(), Num(-1), FormulaValue::FromText("x")}), Num(-1));
    EXPECT_TRUE(Max({}).IsNotApplicable());
    EXPECT_TRUE(Min({FormulaValue::NotApplicable()}).IsNotApplicable());
}

TEST(FunctionsTest, RoundHalfAwayFromZero) {
    EXPECT_EQ(Round({Num(2.5)}), Num(3));
    EXPECT_EQ(Round({Num(-2.5)}), Num(-3));
    EXPECT_EQ(Round({Num(2.4)}), Num(2));
    EXPECT_TRUE(Round({FormulaValue::NotApplicable()}).IsNotApplicable());
    EXPECT_TRUE(Round({Num(1), Num(2)}).IsNotApplicable());
}

TEST(FunctionsTest, Abs) {
    EXPECT_EQ(Abs({Num(-4)}), Num(4));
    EXPECT_EQ(Abs({Num(4)}), Num(4));
    EXPECT_TRUE(Abs({}).IsNotApplicable());
    EXPECT_TRUE(Abs({FormulaValue::FromText("a")}).IsNotApplicable());
}

TEST(FunctionLibraryTest, DefaultRegistersFourFunctions) {
    const auto& library = FunctionLibrary::Default();
    EXPECT_EQ(library.Names(), (std::vector<std::string>{"ABS", "MAX", "MIN", "ROUND"}));
    EXPECT_TRUE(library.Contains("MAX"));
    EXPECT_FALSE(library.Contains("max"));
}

TEST(FunctionLibraryTest, CallUnknownIsNotApplicable) {
    EXPECT_TRUE(FunctionLibrary::Default().Call("SQRT", {Num(4)}).IsNotApplicable());
    EXPECT_EQ(FunctionLibrary::Default().Call("MIN", {Num(4), Num(1)}), Num(1));
}

TEST(FunctionLibraryTest, RegisterCustomFunction) {
    FunctionLibrary library;
    library.Register("DOUBLE", [](const std::vector<FormulaValue>& args) {
        if (args.size() != 1 || !args[0].IsNumber()) {
            return FormulaValue::NotApplicable();
        }
        return FormulaValue::FromNumber(args[0].GetNumber() * 2);
    });

    EXPECT_TRUE(library.Contains("DOUBLE"));
    EXPECT_EQ(library.Call("DOUBLE", {Num(21)}), Num(42));
}

}  // namespace
}  // namespace chartcalc::formula
