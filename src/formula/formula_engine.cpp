#include "formula/formula_engine.h"

#include <absl/strings/ascii.h>

#include "common/logging.h"
#include "common/metrics.h"
#include "formula/evaluator.h"
#include "formula/parser.h"

namespace chartcalc::formula {

namespace {

// Looked up once; the registry never removes a metric
struct EngineMetrics {
    Counter& evaluations = CHARTCALC_COUNTER("formula_evaluations_total");
    Counter& na_results = CHARTCALC_COUNTER("formula_na_results_total");
    Counter& parse_errors = CHARTCALC_COUNTER("formula_parse_errors_total");
    Histogram& latency = CHARTCALC_HISTOGRAM("formula_evaluation_seconds");
};

EngineMetrics& Metrics() {
    static EngineMetrics metrics;
    return metrics;
}

FormulaValue Finish(const FormulaValue& value, std::string_view formula) {
    Metrics().evaluations.Increment();
    if (value.IsNotApplicable()) {
        Metrics().na_results.Increment();
        CHARTCALC_LOG_DEBUG("Formula '{}' evaluated to NA", formula);
    }
    return value;
}

}  // namespace

CompiledFormula CompiledFormula::Compile(std::string_view formula,
                                         const FunctionLibrary& functions) {
    CompiledFormula compiled;
    compiled.source_ = std::string(formula);
    compiled.functions_ = &functions;
    compiled.variables_ = ExtractVariables(formula);

    auto tree = Parser(ParseOptions{}, functions).Parse(formula);
    if (tree.ok()) {
        compiled.tree_ = *std::move(tree);
    } else {
        Metrics().parse_errors.Increment();
        CHARTCALC_LOG_DEBUG("Cannot parse formula '{}': {}", formula, tree.status().message());
        compiled.status_ = tree.status();
    }
    return compiled;
}

FormulaValue CompiledFormula::Evaluate(const EvaluationContext& context) const {
    ScopedTimer timer(Metrics().latency);
    if (!tree_) {
        return Finish(FormulaValue::NotApplicable(), source_);
    }
    TokenResolver resolver(context);
    return Finish(formula::Evaluate(*tree_, resolver, *functions_), source_);
}

FormulaValue EvaluateFormula(std::string_view formula, const EvaluationContext& context) {
    return CompiledFormula::Compile(formula).Evaluate(context);
}

FormulaValue EvaluateFormula(std::string_view formula,
                             const StatisticsRecord& stats,
                             const ParameterMap* parameters,
                             const ManualDataMap* manual_data) {
    EvaluationContext context;
    context.stats = &stats;
    context.parameters = parameters;
    context.manual_data = manual_data;
    return EvaluateFormula(formula, context);
}

std::vector<FormulaValue> EvaluateFormulasBatch(const std::vector<std::string>& formulas,
                                                const EvaluationContext& context) {
    std::vector<FormulaValue> results;
    results.reserve(formulas.size());
    for (const auto& formula : formulas) {
        results.push_back(EvaluateFormula(formula, context));
    }
    return results;
}

std::optional<std::string> ResolveContentAssetToken(
    std::string_view formula, const std::vector<metadata::ContentAsset>& assets) {
    const std::string_view trimmed = absl::StripAsciiWhitespace(formula);
    if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
        return std::nullopt;
    }

    auto token = ParseTokenBody(trimmed.substr(1, trimmed.size() - 2));
    if (!token.ok() || !token->IsAsset()) {
        return std::nullopt;
    }

    EvaluationContext context;
    context.assets = &assets;
    FormulaValue value = TokenResolver(context).Resolve(*token);
    if (!value.IsText()) {
        return std::nullopt;
    }
    return value.GetText();
}

const StatisticsRecord& SampleStatistics() {
    static const StatisticsRecord kSample = {
        {"remoteImages", 10}, {"hostessImages", 25}, {"selfies", 15},
        {"indoor", 50}, {"outdoor", 30}, {"stadium", 200},
        {"female", 120}, {"male", 160},
        {"genAlpha", 20}, {"genYZ", 100}, {"genX", 80}, {"boomer", 80},
        {"merched", 40}, {"jersey", 15}, {"scarf", 8}, {"flags", 12},
        {"baseballCap", 5}, {"other", 3},
        {"approvedImages", 45}, {"rejectedImages", 5},
        {"eventAttendees", 1000}, {"eventTicketPurchases", 850},
        {"eventResultHome", 2}, {"eventResultVisitor", 1},
        // Merchandise prices in EUR
        {"jerseyPrice", 85}, {"scarfPrice", 25}, {"flagsPrice", 15},
        {"capPrice", 20}, {"otherPrice", 10},
    };
    return kSample;
}

FormulaTestResult TestFormula(std::string_view formula) {
    FormulaTestResult test;
    test.sample_data = SampleStatistics();
    test.result = EvaluateFormula(formula, test.sample_data);
    return test;
}

FormulaEngine::FormulaEngine(std::shared_ptr<metadata::MetadataCache> metadata,
                             const FunctionLibrary& functions)
    : metadata_(std::move(metadata)), functions_(&functions) {}

FormulaValue FormulaEngine::Evaluate(std::string_view formula,
                                     const StatisticsRecord& stats,
                                     const ParameterMap* parameters,
                                     const ManualDataMap* manual_data) const {
    // Keeps the snapshot alive for the duration of the call
    metadata::MetadataCache::AssetsCache::Data assets;
    if (metadata_) {
        assets = metadata_->Assets().GetCached();
    }

    EvaluationContext context;
    context.stats = &stats;
    context.parameters = parameters;
    context.manual_data = manual_data;
    context.assets = assets.get();
    return CompiledFormula::Compile(formula, *functions_).Evaluate(context);
}

std::vector<FormulaValue> FormulaEngine::EvaluateBatch(const std::vector<std::string>& formulas,
                                                       const StatisticsRecord& stats,
                                                       const ParameterMap* parameters,
                                                       const ManualDataMap* manual_data) const {
    std::vector<FormulaValue> results;
    results.reserve(formulas.size());
    for (const auto& formula : formulas) {
        results.push_back(Evaluate(formula, stats, parameters, manual_data));
    }
    return results;
}

}  // namespace chartcalc::formula
