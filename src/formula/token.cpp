#include "formula/token.h"

#include <algorithm>
#include <cctype>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

namespace chartcalc::formula {

namespace {

bool IsFieldChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

bool IsKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool IsSlugChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

template <typename Pred>
bool AllOf(std::string_view text, Pred pred) {
    return !text.empty() && std::all_of(text.begin(), text.end(), pred);
}

absl::StatusOr<Token> MakePrefixed(TokenKind kind, std::string_view body,
                                   std::string_view prefix, bool (*valid_char)(char)) {
    std::string_view key = body.substr(prefix.size());
    if (!AllOf(key, valid_char)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid ", TokenKindToString(kind), " token: [", body, "]"));
    }
    Token token;
    token.kind = kind;
    token.body = std::string(body);
    token.key = std::string(key);
    return token;
}

}  // namespace

bool IsTokenBodyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '_' || c == ':' || c == '.' || c == '-';
}

absl::StatusOr<Token> ParseTokenBody(std::string_view body) {
    if (absl::StartsWith(body, kParameterPrefix)) {
        return MakePrefixed(TokenKind::kParameter, body, kParameterPrefix, IsKeyChar);
    }
    if (absl::StartsWith(body, kManualPrefix)) {
        return MakePrefixed(TokenKind::kManual, body, kManualPrefix, IsKeyChar);
    }
    if (absl::StartsWith(body, kMediaPrefix)) {
        return MakePrefixed(TokenKind::kMedia, body, kMediaPrefix, IsSlugChar);
    }
    if (absl::StartsWith(body, kTextPrefix)) {
        return MakePrefixed(TokenKind::kText, body, kTextPrefix, IsSlugChar);
    }

    if (!AllOf(body, IsFieldChar)) {
        return absl::InvalidArgumentError(absl::StrCat("Invalid field token: [", body, "]"));
    }
    Token token;
    token.kind = TokenKind::kField;
    token.body = std::string(body);
    token.key = std::string(body);
    return token;
}

std::vector<TokenSpan> FindTokenSpans(std::string_view formula) {
    std::vector<TokenSpan> spans;
    size_t pos = 0;
    while (pos < formula.size()) {
        const size_t open = formula.find('[', pos);
        if (open == std::string_view::npos) {
            break;
        }
        size_t cursor = open + 1;
        while (cursor < formula.size() && IsTokenBodyChar(formula[cursor])) {
            ++cursor;
        }
        if (cursor < formula.size() && formula[cursor] == ']' && cursor > open + 1) {
            spans.push_back({open, cursor + 1,
                             std::string(formula.substr(open + 1, cursor - open - 1))});
            pos = cursor + 1;
        } else {
            // Not a token here; a later '[' may still start one
            pos = open + 1;
        }
    }
    return spans;
}

std::vector<std::string> ExtractVariables(std::string_view formula) {
    std::vector<std::string> variables;
    for (auto& span : FindTokenSpans(formula)) {
        if (std::find(variables.begin(), variables.end(), span.body) == variables.end()) {
            variables.push_back(std::move(span.body));
        }
    }
    return variables;
}

std::vector<std::string> ExtractAssetSlugs(std::string_view formula) {
    std::vector<std::string> slugs;
    for (const auto& span : FindTokenSpans(formula)) {
        auto token = ParseTokenBody(span.body);
        if (!token.ok() || !token->IsAsset()) {
            continue;
        }
        if (std::find(slugs.begin(), slugs.end(), token->key) == slugs.end()) {
            slugs.push_back(token->key);
        }
    }
    return slugs;
}

std::string_view TokenKindToString(TokenKind kind) {
    switch (kind) {
        case TokenKind::kField: return "FIELD";
        case TokenKind::kParameter: return "PARAM";
        case TokenKind::kManual: return "MANUAL";
        case TokenKind::kMedia: return "MEDIA";
        case TokenKind::kText: return "TEXT";
    }
    return "FIELD";
}

}  // namespace chartcalc::formula
