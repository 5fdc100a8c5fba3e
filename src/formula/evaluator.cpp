#include "formula/evaluator.h"

#include <cctype>
#include <string>
#include <vector>

#include "common/logging.h"
#include "formula/parser.h"

namespace chartcalc::formula {

namespace {

FormulaValue ApplyUnary(char op, const FormulaValue& operand) {
    if (!operand.IsNumber()) {
        return FormulaValue::NotApplicable();
    }
    return FormulaValue::FromNumber(op == '-' ? -operand.GetNumber() : operand.GetNumber());
}

FormulaValue ApplyBinary(char op, const FormulaValue& lhs, const FormulaValue& rhs) {
    if (!lhs.IsNumber() || !rhs.IsNumber()) {
        return FormulaValue::NotApplicable();
    }
    const double a = lhs.GetNumber();
    const double b = rhs.GetNumber();
    switch (op) {
        case '+':
            return FormulaValue::FromNumber(a + b);
        case '-':
            return FormulaValue::FromNumber(a - b);
        case '*':
            return FormulaValue::FromNumber(a * b);
        case '/':
            if (b == 0.0) {
                return FormulaValue::NotApplicable();
            }
            return FormulaValue::FromNumber(a / b);
        default:
            return FormulaValue::NotApplicable();
    }
}

}  // namespace

FormulaValue Evaluate(const Node& node,
                      const ReferenceResolver& resolver,
                      const FunctionLibrary& functions) {
    switch (node.kind) {
        case Node::Kind::kNumber:
            return FormulaValue::FromNumber(node.number);

        case Node::Kind::kText:
            return FormulaValue::FromText(node.text);

        case Node::Kind::kReference:
            return resolver ? resolver(node.token) : FormulaValue::NotApplicable();

        case Node::Kind::kUnary:
            return ApplyUnary(node.op, Evaluate(*node.children[0], resolver, functions));

        case Node::Kind::kBinary: {
            FormulaValue lhs = Evaluate(*node.children[0], resolver, functions);
            if (lhs.IsNotApplicable()) {
                return lhs;
            }
            return ApplyBinary(node.op, lhs, Evaluate(*node.children[1], resolver, functions));
        }

        case Node::Kind::kCall: {
            std::vector<FormulaValue> args;
            args.reserve(node.children.size());
            for (const auto& child : node.children) {
                args.push_back(Evaluate(*child, resolver, functions));
            }
            return functions.Call(node.function, args);
        }
    }
    return FormulaValue::NotApplicable();
}

bool HasLiteralDivisionByZero(std::string_view expression) {
    std::string compact;
    compact.reserve(expression.size());
    for (char c : expression) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }

    for (size_t i = 0; i + 1 < compact.size(); ++i) {
        if (compact[i] != '/' || compact[i + 1] != '0') {
            continue;
        }
        const size_t next = i + 2;
        if (next >= compact.size()) {
            return true;
        }
        const char c = compact[next];
        if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.') {
            return true;
        }
    }
    return false;
}

FormulaValue EvaluateArithmetic(std::string_view expression) {
    if (HasLiteralDivisionByZero(expression)) {
        CHARTCALC_LOG_DEBUG("Literal division by zero in '{}'", expression);
        return FormulaValue::NotApplicable();
    }

    static const Parser kParser = Parser::Arithmetic();
    auto tree = kParser.Parse(expression);
    if (!tree.ok()) {
        CHARTCALC_LOG_DEBUG("Rejected arithmetic '{}': {}", expression, tree.status().message());
        return FormulaValue::NotApplicable();
    }

    FormulaValue result = Evaluate(**tree, ReferenceResolver{});
    if (!result.IsNumber()) {
        return FormulaValue::NotApplicable();
    }
    return result;
}

}  // namespace chartcalc::formula
