#include "formula/functions.h"

#include <algorithm>
#include <cmath>

namespace chartcalc::formula {

namespace {

std::vector<double> NumericArguments(const std::vector<FormulaValue>& args) {
    std::vector<double> numbers;
    numbers.reserve(args.size());
    for (const auto& arg : args) {
        if (arg.IsNumber()) {
            numbers.push_back(arg.GetNumber());
        }
    }
    return numbers;
}

template <typename Op>
FormulaValue Unary(const std::vector<FormulaValue>& args, Op op) {
    if (args.size() != 1 || !args.front().IsNumber()) {
        return FormulaValue::NotApplicable();
    }
    return FormulaValue::FromNumber(op(args.front().GetNumber()));
}

}  // namespace

FormulaValue Max(const std::vector<FormulaValue>& args) {
    const auto numbers = NumericArguments(args);
    if (numbers.empty()) {
        return FormulaValue::NotApplicable();
    }
    return FormulaValue::FromNumber(*std::max_element(numbers.begin(), numbers.end()));
}

FormulaValue Min(const std::vector<FormulaValue>& args) {
    const auto numbers = NumericArguments(args);
    if (numbers.empty()) {
        return FormulaValue::NotApplicable();
    }
    return FormulaValue::FromNumber(*std::min_element(numbers.begin(), numbers.end()));
}

FormulaValue Round(const std::vector<FormulaValue>& args) {
    return Unary(args, [](double x) { return std::round(x); });
}

FormulaValue Abs(const std::vector<FormulaValue>& args) {
    return Unary(args, [](double x) { return std::fabs(x); });
}

const FunctionLibrary& FunctionLibrary::Default() {
    static const FunctionLibrary kLibrary = [] {
        FunctionLibrary library;
        library.Register("MAX", Max);
        library.Register("MIN", Min);
        library.Register("ROUND", Round);
        library.Register("ABS", Abs);
        return library;
    }();
    return kLibrary;
}

void FunctionLibrary::Register(std::string name, Function function) {
    functions_[std::move(name)] = std::move(function);
}

bool FunctionLibrary::Contains(std::string_view name) const {
    return functions_.find(std::string(name)) != functions_.end();
}

FormulaValue FunctionLibrary::Call(std::string_view name,
                                   const std::vector<FormulaValue>& args) const {
    auto it = functions_.find(std::string(name));
    if (it == functions_.end()) {
        return FormulaValue::NotApplicable();
    }
    return it->second(args);
}

std::vector<std::string> FunctionLibrary::Names() const {
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto& [name, _] : functions_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace chartcalc::formula
