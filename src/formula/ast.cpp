#include "formula/ast.h"

#include <absl/strings/str_cat.h>

#include "formula/value.h"

namespace chartcalc::formula {

NodePtr Node::MakeNumber(double value) {
    auto node = std::make_shared<Node>();
    node->kind = Kind::kNumber;
    node->number = value;
    return node;
}

NodePtr Node::MakeText(std::string value) {
    auto node = std::make_shared<Node>();
    node->kind = Kind::kText;
    node->text = std::move(value);
    return node;
}

NodePtr Node::MakeReference(Token token) {
    auto node = std::make_shared<Node>();
    node->kind = Kind::kReference;
    node->token = std::move(token);
    return node;
}

NodePtr Node::MakeUnary(char op, NodePtr operand) {
    auto node = std::make_shared<Node>();
    node->kind = Kind::kUnary;
    node->op = op;
    node->children.push_back(std::move(operand));
    return node;
}

NodePtr Node::MakeBinary(char op, NodePtr lhs, NodePtr rhs) {
    auto node = std::make_shared<Node>();
    node->kind = Kind::kBinary;
    node->op = op;
    node->children.push_back(std::move(lhs));
    node->children.push_back(std::move(rhs));
    return node;
}

NodePtr Node::MakeCall(std::string function, std::vector<NodePtr> args) {
    auto node = std::make_shared<Node>();
    node->kind = Kind::kCall;
    node->function = std::move(function);
    node->children = std::move(args);
    return node;
}

std::string ToSExpression(const Node& node) {
    switch (node.kind) {
        case Node::Kind::kNumber:
            return FormatNumber(node.number);
        case Node::Kind::kText:
            return absl::StrCat("\"", node.text, "\"");
        case Node::Kind::kReference:
            return node.token.Literal();
        case Node::Kind::kUnary:
            return absl::StrCat("(", std::string(1, node.op), " ",
                                ToSExpression(*node.children[0]), ")");
        case Node::Kind::kBinary:
            return absl::StrCat("(", std::string(1, node.op), " ",
                                ToSExpression(*node.children[0]), " ",
                                ToSExpression(*node.children[1]), ")");
        case Node::Kind::kCall: {
            std::string out = absl::StrCat("(", node.function);
            for (const auto& child : node.children) {
                absl::StrAppend(&out, " ", ToSExpression(*child));
            }
            absl::StrAppend(&out, ")");
            return out;
        }
    }
    return "";
}

void CollectReferences(const Node& node, std::vector<Token>* out) {
    if (node.kind == Node::Kind::kReference) {
        out->push_back(node.token);
        return;
    }
    for (const auto& child : node.children) {
        CollectReferences(*child, out);
    }
}

}  // namespace chartcalc::formula
