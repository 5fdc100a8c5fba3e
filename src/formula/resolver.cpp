#include "formula/resolver.h"

#include <absl/strings/str_cat.h>

namespace chartcalc::formula {

namespace {

FormulaValue LookupOrZero(const std::unordered_map<std::string, double>* map,
                          const std::string& key) {
    if (map == nullptr) {
        return FormulaValue::FromNumber(0.0);
    }
    auto it = map->find(key);
    return FormulaValue::FromNumber(it == map->end() ? 0.0 : it->second);
}

std::string ToLiteral(const FormulaValue& value) {
    switch (value.GetKind()) {
        case FormulaValue::Kind::kNumber: {
            const double number = value.GetNumber();
            std::string text = FormatNumber(number);
            return number < 0 ? absl::StrCat("(", text, ")") : text;
        }
        case FormulaValue::Kind::kText:
            return QuoteText(value.GetText());
        case FormulaValue::Kind::kNotApplicable:
            break;
    }
    return QuoteText(kNotApplicableText);
}

}  // namespace

FormulaValue TokenResolver::Resolve(const Token& token) const {
    switch (token.kind) {
        case TokenKind::kParameter:
            return LookupOrZero(context_.parameters, token.key);
        case TokenKind::kManual:
            return LookupOrZero(context_.manual_data, token.key);
        case TokenKind::kMedia:
        case TokenKind::kText:
            return ResolveAsset(token);
        case TokenKind::kField:
            return ResolveField(token.key);
    }
    return FormulaValue::NotApplicable();
}

FormulaValue TokenResolver::ResolveField(const std::string& name) const {
    if (context_.stats == nullptr) {
        return FormulaValue::FromNumber(0.0);
    }
    auto value = context_.stats->Lookup(name);
    if (!value) {
        return FormulaValue::FromNumber(0.0);
    }
    if (const auto* text = std::get_if<std::string>(&*value)) {
        return FormulaValue::FromText(*text);
    }
    return FormulaValue::FromNumber(std::get<double>(*value));
}

FormulaValue TokenResolver::ResolveAsset(const Token& token) const {
    if (context_.assets == nullptr) {
        return FormulaValue::NotApplicable();
    }
    const metadata::ContentAsset* asset = metadata::FindAsset(*context_.assets, token.key);
    if (asset == nullptr) {
        return FormulaValue::NotApplicable();
    }
    const auto expected = token.kind == TokenKind::kMedia ? metadata::AssetType::kImage
                                                          : metadata::AssetType::kText;
    if (asset->type != expected) {
        return FormulaValue::NotApplicable();
    }
    return FormulaValue::FromText(asset->Content());
}

std::string QuoteText(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char c : text) {
        if (c == '\\' || c == '"') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string SubstituteVariables(std::string_view formula, const EvaluationContext& context) {
    TokenResolver resolver(context);
    std::string out;
    out.reserve(formula.size());

    size_t cursor = 0;
    for (const auto& span : FindTokenSpans(formula)) {
        out.append(formula.substr(cursor, span.begin - cursor));
        auto token = ParseTokenBody(span.body);
        if (token.ok()) {
            out.append(ToLiteral(resolver.Resolve(*token)));
        } else {
            out.append(formula.substr(span.begin, span.end - span.begin));
        }
        cursor = span.end;
    }
    out.append(formula.substr(cursor));
    return out;
}

}  // namespace chartcalc::formula
