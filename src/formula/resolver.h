#pragma once

/// @file resolver.h
/// @brief Resolution of tokens against statistics, parameters, manual data and assets

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "formula/statistics_record.h"
#include "formula/token.h"
#include "formula/value.h"
#include "metadata/types.h"

namespace chartcalc::formula {

using ParameterMap = std::unordered_map<std::string, double>;
using ManualDataMap = std::unordered_map<std::string, double>;

/// @brief Data sources a formula is evaluated against
///
/// Every pointer is optional and non-owning; the pointees must outlive the
/// evaluation.
struct EvaluationContext {
    const StatisticsRecord* stats = nullptr;
    const ParameterMap* parameters = nullptr;
    const ManualDataMap* manual_data = nullptr;
    const std::vector<metadata::ContentAsset>* assets = nullptr;
};

/// @brief Maps a Token to a value using an EvaluationContext
///
/// Resolution rules:
///   [PARAM:key]  -> parameter map, 0 when missing
///   [MANUAL:key] -> manual-data map, 0 when missing
///   [MEDIA:slug] -> URL of the image asset with that slug, NA otherwise
///   [TEXT:slug]  -> body of the text asset with that slug, NA otherwise
///   [name]       -> derived field, then stored field, 0 when missing
class TokenResolver {
public:
    explicit TokenResolver(const EvaluationContext& context) : context_(context) {}

    FormulaValue Resolve(const Token& token) const;

    FormulaValue operator()(const Token& token) const { return Resolve(token); }

private:
    FormulaValue ResolveField(const std::string& name) const;
    FormulaValue ResolveAsset(const Token& token) const;

    EvaluationContext context_;
};

/// @brief Double-quoted literal with '\' and '"' escaped
std::string QuoteText(std::string_view text);

/// @brief Replace every well-formed token with its resolved literal
///
/// Numbers are written in shortest round-trip form, negative numbers in
/// parentheses; text and NA asset values become quoted strings. Tokens whose
/// body breaks the token grammar are left untouched.
std::string SubstituteVariables(std::string_view formula, const EvaluationContext& context);

}  // namespace chartcalc::formula
