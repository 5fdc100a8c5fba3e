#include "formula/validator.h"

#include "common/error.h"
#include "common/logging.h"
#include "formula/formula_engine.h"
#include "formula/token.h"

namespace chartcalc::formula {

absl::Status CheckParenthesisBalance(std::string_view formula) {
    int depth = 0;
    for (char c : formula) {
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            --depth;
        }
        if (depth < 0) {
            return MakeError(ErrorCode::kUnbalancedParentheses, kUnbalancedClosingMessage);
        }
    }
    if (depth > 0) {
        return MakeError(ErrorCode::kUnbalancedParentheses, kUnclosedOpeningMessage);
    }
    return absl::OkStatus();
}

StatisticsRecord SyntheticUnitRecord() {
    StatisticsRecord record;
    for (const auto& name : StatisticsRecord::BaseFieldNames()) {
        record.Set(name, 1.0);
    }
    return record;
}

FormulaValidationResult ValidateFormula(std::string_view formula) {
    FormulaValidationResult result;
    result.used_variables = ExtractVariables(formula);

    if (auto status = CheckParenthesisBalance(formula); !status.ok()) {
        result.error = std::string(status.message());
        return result;
    }

    CompiledFormula compiled = CompiledFormula::Compile(formula);
    if (!compiled.ok()) {
        result.error = std::string(compiled.status().message());
        return result;
    }

    const StatisticsRecord unit = SyntheticUnitRecord();
    EvaluationContext context;
    context.stats = &unit;

    result.is_valid = true;
    result.evaluated_result = compiled.Evaluate(context);
    return result;
}

StatsCoverage ValidateStatsForFormula(std::string_view formula, const StatisticsRecord& stats) {
    StatsCoverage coverage;
    for (const auto& body : ExtractVariables(formula)) {
        auto token = ParseTokenBody(body);
        if (token.ok() && token->kind != TokenKind::kField) {
            continue;
        }
        const std::string& name = token.ok() ? token->key : body;
        if (StatisticsRecord::IsDerivedField(name) || stats.Lookup(name).has_value()) {
            coverage.available_variables.push_back(body);
        } else {
            coverage.missing_variables.push_back(body);
        }
    }
    coverage.valid = coverage.missing_variables.empty();
    return coverage;
}

bool IsKnownVariable(std::string_view name,
                     const std::vector<metadata::VariableMetadata>& registry) {
    auto token = ParseTokenBody(name);
    if (token.ok() && token->kind != TokenKind::kField) {
        return true;
    }
    if (registry.empty()) {
        CHARTCALC_LOG_WARN("Variable registry is empty, cannot validate: {}", name);
        return true;
    }
    return metadata::FindVariable(registry, name).has_value();
}

std::optional<std::string> VariableExample(std::string_view name,
                                           const std::vector<metadata::VariableMetadata>& registry) {
    auto variable = metadata::FindVariable(registry, name);
    if (!variable || variable->example_usage.empty()) {
        return std::nullopt;
    }
    return variable->example_usage;
}

std::vector<SafeEvaluation> EvaluateFormulaBatchSafe(const std::vector<std::string>& formulas,
                                                     const StatisticsRecord& stats) {
    std::vector<SafeEvaluation> results;
    results.reserve(formulas.size());
    for (const auto& formula : formulas) {
        SafeEvaluation evaluation;
        evaluation.formula = formula;
        evaluation.valid = ValidateStatsForFormula(formula, stats).valid;
        evaluation.result = EvaluateFormula(formula, stats);
        results.push_back(std::move(evaluation));
    }
    return results;
}

}  // namespace chartcalc::formula
