#include "formula/parser.h"

#include <cctype>
#include <string>
#include <vector>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace chartcalc::formula {

namespace {

struct Lexeme {
    enum class Type {
        kNumber,
        kString,
        kReference,
        kIdentifier,
        kOperator,
        kLParen,
        kRParen,
        kComma,
        kEnd
    };

    Type type = Type::kEnd;
    size_t position = 0;
    double number = 0.0;
    std::string text;   // string payload, token body or identifier
    char op = 0;
};

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

bool IsIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

absl::Status ErrorAt(size_t position, std::string_view message) {
    return ParseError(absl::StrCat(message, " at position ", position));
}

class Lexer {
public:
    Lexer(std::string_view input, const ParseOptions& options)
        : input_(input), options_(options) {}

    absl::StatusOr<std::vector<Lexeme>> Tokenize() {
        std::vector<Lexeme> lexemes;
        while (pos_ < input_.size()) {
            const char c = input_[pos_];
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
                continue;
            }

            Lexeme lexeme;
            lexeme.position = pos_;

            if (IsDigit(c) || (c == '.' && pos_ + 1 < input_.size() && IsDigit(input_[pos_ + 1]))) {
                CHARTCALC_RETURN_IF_ERROR(LexNumber(&lexeme));
            } else if (c == '[') {
                CHARTCALC_RETURN_IF_ERROR(LexReference(&lexeme));
            } else if (c == '"') {
                CHARTCALC_RETURN_IF_ERROR(LexString(&lexeme));
            } else if (IsIdentifierStart(c)) {
                const size_t start = pos_;
                while (pos_ < input_.size() && IsIdentifierChar(input_[pos_])) {
                    ++pos_;
                }
                lexeme.type = Lexeme::Type::kIdentifier;
                lexeme.text = std::string(input_.substr(start, pos_ - start));
            } else if (c == '+' || c == '-' || c == '*' || c == '/') {
                lexeme.type = Lexeme::Type::kOperator;
                lexeme.op = c;
                ++pos_;
            } else if (c == '(') {
                lexeme.type = Lexeme::Type::kLParen;
                ++pos_;
            } else if (c == ')') {
                lexeme.type = Lexeme::Type::kRParen;
                ++pos_;
            } else if (c == ',') {
                lexeme.type = Lexeme::Type::kComma;
                ++pos_;
            } else {
                return ErrorAt(pos_, absl::StrCat("Unexpected character '", std::string(1, c), "'"));
            }
            lexemes.push_back(std::move(lexeme));
        }

        Lexeme end;
        end.type = Lexeme::Type::kEnd;
        end.position = input_.size();
        lexemes.push_back(end);
        return lexemes;
    }

private:
    absl::Status LexNumber(Lexeme* lexeme) {
        const size_t start = pos_;
        while (pos_ < input_.size() && IsDigit(input_[pos_])) {
            ++pos_;
        }
        if (pos_ < input_.size() && input_[pos_] == '.') {
            ++pos_;
            while (pos_ < input_.size() && IsDigit(input_[pos_])) {
                ++pos_;
            }
        }
        // Exponent only when digits follow, so "2e" stays a lex error below
        if (pos_ < input_.size() && (input_[pos_] == 'e' || input_[pos_] == 'E')) {
            size_t cursor = pos_ + 1;
            if (cursor < input_.size() && (input_[cursor] == '+' || input_[cursor] == '-')) {
                ++cursor;
            }
            if (cursor < input_.size() && IsDigit(input_[cursor])) {
                while (cursor < input_.size() && IsDigit(input_[cursor])) {
                    ++cursor;
                }
                pos_ = cursor;
            }
        }
        if (pos_ < input_.size() && (input_[pos_] == '.' || IsIdentifierChar(input_[pos_]))) {
            return ErrorAt(start, "Malformed number");
        }

        double value = 0.0;
        if (!absl::SimpleAtod(input_.substr(start, pos_ - start), &value)) {
            return ErrorAt(start, "Malformed number");
        }
        lexeme->type = Lexeme::Type::kNumber;
        lexeme->number = value;
        return absl::OkStatus();
    }

    absl::Status LexReference(Lexeme* lexeme) {
        const size_t start = pos_;
        if (!options_.allow_references) {
            return ErrorAt(start, "Token references are not allowed here");
        }
        ++pos_;
        const size_t body_start = pos_;
        while (pos_ < input_.size() && IsTokenBodyChar(input_[pos_])) {
            ++pos_;
        }
        if (pos_ >= input_.size() || input_[pos_] != ']' || pos_ == body_start) {
            return ErrorAt(start, "Malformed token");
        }
        lexeme->type = Lexeme::Type::kReference;
        lexeme->text = std::string(input_.substr(body_start, pos_ - body_start));
        ++pos_;
        return absl::OkStatus();
    }

    absl::Status LexString(Lexeme* lexeme) {
        const size_t start = pos_;
        if (!options_.allow_text) {
            return ErrorAt(start, "String literals are not allowed here");
        }
        ++pos_;
        std::string value;
        while (pos_ < input_.size() && input_[pos_] != '"') {
            if (input_[pos_] == '\\' && pos_ + 1 < input_.size()) {
                ++pos_;
            }
            value.push_back(input_[pos_]);
            ++pos_;
        }
        if (pos_ >= input_.size()) {
            return ErrorAt(start, "Unterminated string literal");
        }
        ++pos_;
        lexeme->type = Lexeme::Type::kString;
        lexeme->text = std::move(value);
        return absl::OkStatus();
    }

    std::string_view input_;
    const ParseOptions& options_;
    size_t pos_ = 0;
};

class Grammar {
public:
    Grammar(std::vector<Lexeme> lexemes, const ParseOptions& options,
            const FunctionLibrary& functions)
        : lexemes_(std::move(lexemes)), options_(options), functions_(functions) {}

    absl::StatusOr<NodePtr> ParseAll() {
        CHARTCALC_ASSIGN_OR_RETURN(NodePtr root, ParseExpression());
        if (Peek().type != Lexeme::Type::kEnd) {
            return ErrorAt(Peek().position, "Unexpected input after expression");
        }
        return root;
    }

private:
    const Lexeme& Peek() const { return lexemes_[pos_]; }
    const Lexeme& Advance() { return lexemes_[pos_++]; }

    bool PeekOperator(char a, char b) const {
        const Lexeme& lexeme = Peek();
        return lexeme.type == Lexeme::Type::kOperator && (lexeme.op == a || lexeme.op == b);
    }

    absl::Status Enter() {
        if (++depth_ > Parser::kMaxNestingDepth) {
            return ErrorAt(Peek().position, "Expression nested too deeply");
        }
        return absl::OkStatus();
    }

    absl::StatusOr<NodePtr> ParseExpression() {
        CHARTCALC_RETURN_IF_ERROR(Enter());
        CHARTCALC_ASSIGN_OR_RETURN(NodePtr lhs, ParseTerm());
        while (PeekOperator('+', '-')) {
            const char op = Advance().op;
            CHARTCALC_ASSIGN_OR_RETURN(NodePtr rhs, ParseTerm());
            lhs = Node::MakeBinary(op, std::move(lhs), std::move(rhs));
        }
        --depth_;
        return lhs;
    }

    absl::StatusOr<NodePtr> ParseTerm() {
        CHARTCALC_ASSIGN_OR_RETURN(NodePtr lhs, ParseUnary());
        while (PeekOperator('*', '/')) {
            const char op = Advance().op;
            CHARTCALC_ASSIGN_OR_RETURN(NodePtr rhs, ParseUnary());
            lhs = Node::MakeBinary(op, std::move(lhs), std::move(rhs));
        }
        return lhs;
    }

    absl::StatusOr<NodePtr> ParseUnary() {
        if (PeekOperator('-', '+')) {
            CHARTCALC_RETURN_IF_ERROR(Enter());
            const char op = Advance().op;
            CHARTCALC_ASSIGN_OR_RETURN(NodePtr operand, ParseUnary());
            --depth_;
            return Node::MakeUnary(op, std::move(operand));
        }
        return ParsePrimary();
    }

    absl::StatusOr<NodePtr> ParsePrimary() {
        const Lexeme& lexeme = Advance();
        switch (lexeme.type) {
            case Lexeme::Type::kNumber:
                return Node::MakeNumber(lexeme.number);

            case Lexeme::Type::kString:
                return Node::MakeText(lexeme.text);

            case Lexeme::Type::kReference: {
                auto token = ParseTokenBody(lexeme.text);
                if (!token.ok()) {
                    return ErrorAt(lexeme.position, token.status().message());
                }
                return Node::MakeReference(*std::move(token));
            }

            case Lexeme::Type::kIdentifier:
                return ParseCall(lexeme);

            case Lexeme::Type::kLParen: {
                CHARTCALC_ASSIGN_OR_RETURN(NodePtr inner, ParseExpression());
                if (Peek().type != Lexeme::Type::kRParen) {
                    return ErrorAt(Peek().position, "Expected ')'");
                }
                Advance();
                return inner;
            }

            case Lexeme::Type::kEnd:
                return ErrorAt(lexeme.position, "Unexpected end of formula");

            default:
                return ErrorAt(lexeme.position, "Unexpected symbol");
        }
    }

    absl::StatusOr<NodePtr> ParseCall(const Lexeme& name) {
        if (!options_.allow_calls) {
            return ErrorAt(name.position, absl::StrCat("Identifier '", name.text, "' is not allowed here"));
        }
        if (!functions_.Contains(name.text)) {
            return MakeError(ErrorCode::kUnknownFunction,
                             absl::StrCat("Unknown function '", name.text, "' at position ",
                                          name.position));
        }
        if (Peek().type != Lexeme::Type::kLParen) {
            return ErrorAt(Peek().position, absl::StrCat("Expected '(' after ", name.text));
        }
        Advance();

        std::vector<NodePtr> args;
        if (Peek().type != Lexeme::Type::kRParen) {
            CHARTCALC_ASSIGN_OR_RETURN(NodePtr first, ParseExpression());
            args.push_back(std::move(first));
            while (Peek().type == Lexeme::Type::kComma) {
                Advance();
                CHARTCALC_ASSIGN_OR_RETURN(NodePtr next, ParseExpression());
                args.push_back(std::move(next));
            }
        }
        if (Peek().type != Lexeme::Type::kRParen) {
            return ErrorAt(Peek().position,
                           absl::StrCat("Expected ')' after arguments of ", name.text));
        }
        Advance();
        return Node::MakeCall(name.text, std::move(args));
    }

    std::vector<Lexeme> lexemes_;
    const ParseOptions& options_;
    const FunctionLibrary& functions_;
    size_t pos_ = 0;
    int depth_ = 0;
};

}  // namespace

Parser::Parser(ParseOptions options, const FunctionLibrary& functions)
    : options_(options), functions_(&functions) {}

Parser Parser::Arithmetic() {
    ParseOptions options;
    options.allow_references = false;
    options.allow_calls = false;
    options.allow_text = false;
    return Parser(options);
}

absl::StatusOr<NodePtr> Parser::Parse(std::string_view input) const {
    if (input.size() > kMaxFormulaLength) {
        return ParseError(absl::StrCat("Formula exceeds maximum length of ", kMaxFormulaLength));
    }

    Lexer lexer(input, options_);
    CHARTCALC_ASSIGN_OR_RETURN(std::vector<Lexeme> lexemes, lexer.Tokenize());

    Grammar grammar(std::move(lexemes), options_, *functions_);
    return grammar.ParseAll();
}

}  // namespace chartcalc::formula
