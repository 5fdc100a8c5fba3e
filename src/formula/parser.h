#pragma once

/// @file parser.h
/// @brief Recursive-descent parser for chart formulas
///
/// Grammar:
/// @code
///   expr    := term (("+" | "-") term)*
///   term    := unary (("*" | "/") unary)*
///   unary   := ("-" | "+") unary | primary
///   primary := number | string | token | call | "(" expr ")"
///   call    := NAME "(" [expr ("," expr)*] ")"
/// @endcode
/// Tokens ("[female]", "[PARAM:price]") become Reference nodes whose kind
/// is fixed here; calls become Call nodes, so function arguments may nest to
/// any depth. Nothing outside this grammar is accepted: there are no
/// identifiers other than registered function names and no member access.

#include <cstddef>
#include <string_view>

#include <absl/status/statusor.h>

#include "formula/ast.h"
#include "formula/functions.h"

namespace chartcalc::formula {

/// @brief Which constructs the parser admits
struct ParseOptions {
    /// [name], [PARAM:key], ... tokens
    bool allow_references = true;

    /// MAX(...), MIN(...), ...
    bool allow_calls = true;

    /// Double-quoted string literals (substituted asset values)
    bool allow_text = true;
};

class Parser {
public:
    static constexpr size_t kMaxFormulaLength = 16 * 1024;
    static constexpr int kMaxNestingDepth = 64;

    explicit Parser(ParseOptions options = {},
                    const FunctionLibrary& functions = FunctionLibrary::Default());

    /// @brief Parser for fully substituted arithmetic: numbers, + - * / ( )
    static Parser Arithmetic();

    /// @brief Parse @p input into a syntax tree
    /// @return InvalidArgument with a position-bearing message on failure
    absl::StatusOr<NodePtr> Parse(std::string_view input) const;

    const ParseOptions& GetOptions() const { return options_; }

private:
    ParseOptions options_;
    const FunctionLibrary* functions_;
};

}  // namespace chartcalc::formula
