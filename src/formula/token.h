#pragma once

/// @file token.h
/// @brief Bracketed token references inside formula strings
///
/// Token grammar:
/// @code
///   token      := "[" token-body "]"
///   token-body := field-ref | "PARAM:" key | "MANUAL:" key
///               | "MEDIA:" slug | "TEXT:" slug
///   field-ref  := [A-Za-z0-9_.]+
///   key        := [A-Za-z0-9_]+
///   slug       := [a-z0-9-]+
/// @endcode

#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

namespace chartcalc::formula {

enum class TokenKind {
    kField,      ///< [name], statistics record or derived field
    kParameter,  ///< [PARAM:key]
    kManual,     ///< [MANUAL:key]
    kMedia,      ///< [MEDIA:slug], image asset URL
    kText        ///< [TEXT:slug], text asset body
};

/// @brief A token whose kind has been decided from its prefix
struct Token {
    TokenKind kind = TokenKind::kField;

    /// Text between the brackets, e.g. "PARAM:jerseyPrice"
    std::string body;

    /// Field name, parameter key, manual key or asset slug
    std::string key;

    /// @brief The token as written in a formula, e.g. "[PARAM:jerseyPrice]"
    std::string Literal() const { return "[" + body + "]"; }

    bool IsAsset() const { return kind == TokenKind::kMedia || kind == TokenKind::kText; }

    bool operator==(const Token& other) const {
        return kind == other.kind && body == other.body && key == other.key;
    }
};

inline constexpr std::string_view kParameterPrefix = "PARAM:";
inline constexpr std::string_view kManualPrefix = "MANUAL:";
inline constexpr std::string_view kMediaPrefix = "MEDIA:";
inline constexpr std::string_view kTextPrefix = "TEXT:";

/// @brief Characters accepted between brackets by the extractor
bool IsTokenBodyChar(char c);

/// @brief Classify a token body and check it against the grammar
/// @return InvalidArgument if the key or slug has characters its kind forbids
absl::StatusOr<Token> ParseTokenBody(std::string_view body);

/// @brief Distinct token bodies in order of first appearance
///
/// Only spans "[" body "]" where every body character passes
/// IsTokenBodyChar() are reported. Unterminated brackets are skipped.
std::vector<std::string> ExtractVariables(std::string_view formula);

/// @brief Distinct slugs referenced by [MEDIA:slug] and [TEXT:slug] tokens
std::vector<std::string> ExtractAssetSlugs(std::string_view formula);

/// @brief Inverse of the prefix convention, e.g. kMedia -> "MEDIA"
std::string_view TokenKindToString(TokenKind kind);

/// @brief A located token occurrence (used by substitution)
struct TokenSpan {
    size_t begin = 0;   ///< index of '['
    size_t end = 0;     ///< one past ']'
    std::string body;
};

/// @brief Every well-formed token occurrence, duplicates included
std::vector<TokenSpan> FindTokenSpans(std::string_view formula);

}  // namespace chartcalc::formula
