#pragma once

/// @file ast.h
/// @brief Syntax tree produced by the formula parser

#include <memory>
#include <string>
#include <vector>

#include "formula/token.h"

namespace chartcalc::formula {

struct Node;
using NodePtr = std::shared_ptr<const Node>;

/// @brief One syntax tree node
///
/// Only the fields relevant to @c kind are populated:
///   kNumber    -> number
///   kText      -> text
///   kReference -> token
///   kUnary     -> op ('-' or '+'), children[0]
///   kBinary    -> op ('+', '-', '*', '/'), children[0..1]
///   kCall      -> function, children = arguments
struct Node {
    enum class Kind {
        kNumber,
        kText,
        kReference,
        kUnary,
        kBinary,
        kCall
    };

    Kind kind = Kind::kNumber;
    double number = 0.0;
    std::string text;
    Token token;
    char op = 0;
    std::string function;
    std::vector<NodePtr> children;

    static NodePtr MakeNumber(double value);
    static NodePtr MakeText(std::string value);
    static NodePtr MakeReference(Token token);
    static NodePtr MakeUnary(char op, NodePtr operand);
    static NodePtr MakeBinary(char op, NodePtr lhs, NodePtr rhs);
    static NodePtr MakeCall(std::string function, std::vector<NodePtr> args);
};

/// @brief Fully parenthesised rendering, e.g. "(+ 1 (* 2 3))"
std::string ToSExpression(const Node& node);

/// @brief Tokens referenced anywhere below @p node, in visiting order
void CollectReferences(const Node& node, std::vector<Token>* out);

}  // namespace chartcalc::formula
