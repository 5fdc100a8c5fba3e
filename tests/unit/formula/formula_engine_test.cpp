/// @file formula_engine_test.cpp
/// @brief End-to-end tests for formula evaluation

#include <memory>
#include <sstream>

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include "common/logging.h"
#include "common/metrics.h"
#include "formula/formula_engine.h"

namespace chartcalc::formula {
namespace {

FormulaValue Num(double value) {
    return FormulaValue::FromNumber(value);
}

class StaticSource : public metadata::MetadataSource {
public:
    absl::StatusOr<std::vector<metadata::VariableMetadata>> FetchVariables() override {
        return std::vector<metadata::VariableMetadata>{};
    }

    absl::StatusOr<std::vector<metadata::ContentAsset>> FetchContentAssets() override {
        metadata::ContentAsset logo;
        logo.slug = "logo-1";
        logo.type = metadata::AssetType::kImage;
        logo.url = "https://x/y.png";
        return std::vector<metadata::ContentAsset>{logo};
    }
};

TEST(FormulaEngineTest, EndToEndScenario) {
    StatisticsRecord stats = {{"female", 120}, {"male", 160}, {"approvedImages", 45}};

    auto result = EvaluateFormula("([female]+[male])/[approvedImages]", stats);
    ASSERT_TRUE(result.IsNumber());
    EXPECT_DOUBLE_EQ(result.GetNumber(), 280.0 / 45.0);

    EXPECT_EQ(EvaluateFormula("ROUND(([female]+[male])/[approvedImages])", stats), Num(6));
}

TEST(FormulaEngineTest, MissingFieldsDefaultToZero) {
    StatisticsRecord stats = {{"a", 5}};
    EXPECT_EQ(EvaluateFormula("[a]+[b]", stats), Num(5));
    EXPECT_EQ(EvaluateFormula("[missingField]", stats), Num(0));
    EXPECT_EQ(EvaluateFormula("[missingField]+0", stats), Num(0));
}

TEST(FormulaEngineTest, LoneFieldReturnsStoredValue) {
    StatisticsRecord stats = {{"female", 120.25}};
    EXPECT_EQ(EvaluateFormula("[female]", stats), Num(120.25));
}

TEST(FormulaEngineTest, DivisionByZero) {
    EXPECT_TRUE(EvaluateFormula("[a]/[b]", StatisticsRecord{{"a", 10}, {"b", 0}}).IsNotApplicable());
    EXPECT_EQ(EvaluateFormula("[a]/[b]", StatisticsRecord{{"a", 10}, {"b", 2}}), Num(5));
    EXPECT_TRUE(EvaluateFormula("[a]/[missing]", StatisticsRecord{{"a", 10}}).IsNotApplicable());
}

TEST(FormulaEngineTest, Functions) {
    StatisticsRecord stats;
    EXPECT_EQ(EvaluateFormula("MAX(3,7,2)", stats), Num(7));
    EXPECT_EQ(EvaluateFormula("MIN(3,7,2)", stats), Num(2));
    EXPECT_EQ(EvaluateFormula("ROUND(2.5)", stats), Num(3));
    EXPECT_EQ(EvaluateFormula("ABS(-4)", stats), Num(4));
    EXPECT_TRUE(EvaluateFormula("MAX()", stats).IsNotApplicable());
    EXPECT_EQ(EvaluateFormula("MAX(ROUND(1.5), ABS(-3), MIN(1, 2))", stats), Num(3));
}

TEST(FormulaEngineTest, DerivedFields) {
    StatisticsRecord stats = {{"remoteImages", 10}, {"hostessImages", 5}, {"selfies", 3}};
    EXPECT_EQ(EvaluateFormula("[allImages]", stats), Num(18));
    EXPECT_EQ(EvaluateFormula("[stats.allImages]*2", stats), Num(36));
}

TEST(FormulaEngineTest, ParametersAndManualData) {
    StatisticsRecord stats = {{"jersey", 15}};
    ParameterMap parameters = {{"jerseyPrice", 85}};
    ManualDataMap manual = {{"bonus", 5}};

    EXPECT_EQ(EvaluateFormula("[jersey]*[PARAM:jerseyPrice]", stats, &parameters), Num(1275));
    EXPECT_EQ(EvaluateFormula("[jersey]*[PARAM:jerseyPrice]", stats), Num(0));
    EXPECT_EQ(EvaluateFormula("[MANUAL:bonus]+1", stats, &parameters, &manual), Num(6));
}

TEST(FormulaEngineTest, AssetTokens) {
    std::vector<metadata::ContentAsset> assets(1);
    assets[0].slug = "logo-1";
    assets[0].type = metadata::AssetType::kImage;
    assets[0].url = "https://x/y.png";

    EvaluationContext context;
    context.assets = &assets;
    EXPECT_EQ(EvaluateFormula("[MEDIA:logo-1]", context), FormulaValue::FromText("https://x/y.png"));

    assets[0].type = metadata::AssetType::kText;
    EXPECT_TRUE(EvaluateFormula("[MEDIA:logo-1]", context).IsNotApplicable());
}

TEST(FormulaEngineTest, UnparseableFormulasAreNotApplicable) {
    StatisticsRecord stats = {{"a", 1}};
    EXPECT_TRUE(EvaluateFormula("[a] +", stats).IsNotApplicable());
    EXPECT_TRUE(EvaluateFormula("(1+2", stats).IsNotApplicable());
    EXPECT_TRUE(EvaluateFormula("process.exit(1)", stats).IsNotApplicable());
    EXPECT_TRUE(EvaluateFormula("", stats).IsNotApplicable());
}

TEST(FormulaEngineTest, Idempotent) {
    StatisticsRecord stats = {{"female", 120}, {"male", 160}};
    const std::string formula = "[female]/([male]+[remoteFans])";
    EXPECT_EQ(EvaluateFormula(formula, stats), EvaluateFormula(formula, stats));
}

TEST(FormulaEngineTest, Batch) {
    StatisticsRecord stats = {{"a", 4}};
    EvaluationContext context;
    context.stats = &stats;

    auto results = EvaluateFormulasBatch({"[a]*2", "[a]/0", "MIN([a], 1)"}, context);
    ASSERT_EQ(results.size(), 3);
    EXPECT_EQ(results[0], Num(8));
    EXPECT_TRUE(results[1].IsNotApplicable());
    EXPECT_EQ(results[2], Num(1));
}

TEST(CompiledFormulaTest, CompileOnceEvaluateMany) {
    auto compiled = CompiledFormula::Compile("[a]+[PARAM:b]");
    ASSERT_TRUE(compiled.ok());
    EXPECT_EQ(compiled.variables(), (std::vector<std::string>{"a", "PARAM:b"}));

    StatisticsRecord first = {{"a", 1}};
    StatisticsRecord second = {{"a", 2}};
    EvaluationContext context;
    context.stats = &first;
    EXPECT_EQ(compiled.Evaluate(context), Num(1));
    context.stats = &second;
    EXPECT_EQ(compiled.Evaluate(context), Num(2));
}

TEST(CompiledFormulaTest, ParseFailureIsReported) {
    auto compiled = CompiledFormula::Compile("FOO(1)");
    EXPECT_FALSE(compiled.ok());
    EXPECT_EQ(compiled.tree(), nullptr);
    EXPECT_TRUE(compiled.Evaluate(EvaluationContext{}).IsNotApplicable());
}

TEST(FormulaEngineTest, CountsEvaluations) {
    MetricsRegistry::Instance().Reset();

    StatisticsRecord stats;
    EvaluateFormula("1+1", stats);
    EvaluateFormula("1/0", stats);
    EvaluateFormula("1 +", stats);

    EXPECT_EQ(CHARTCALC_COUNTER("formula_evaluations_total").Value(), 3);
    EXPECT_EQ(CHARTCALC_COUNTER("formula_na_results_total").Value(), 2);
    EXPECT_EQ(CHARTCALC_COUNTER("formula_parse_errors_total").Value(), 1);
    EXPECT_EQ(CHARTCALC_HISTOGRAM("formula_evaluation_seconds").Count(), 3);
}

TEST(FormulaEngineTest, CountsEvaluationsAfterRegistryReset) {
    StatisticsRecord stats;
    EvaluateFormula("2*3", stats);

    MetricsRegistry::Instance().Reset();
    EvaluateFormula("2*3", stats);
    EvaluateFormula("[x]/0", stats);

    EXPECT_EQ(CHARTCALC_COUNTER("formula_evaluations_total").Value(), 2);
    EXPECT_EQ(CHARTCALC_COUNTER("formula_na_results_total").Value(), 1);
}

TEST(FormulaEngineTest, LogsNotApplicableOutcomesAtDebug) {
    auto logger = GetLogger();
    std::ostringstream captured;
    logger->sinks().push_back(std::make_shared<spdlog::sinks::ostream_sink_mt>(captured));
    SetLogLevel(LogLevel::kDebug);

    StatisticsRecord stats;
    EvaluateFormula("1/0", stats);
    EvaluateFormula("FOO(1)", stats);
    logger->flush();

    logger->sinks().pop_back();
    SetLogLevel(LogLevel::kInfo);

    const std::string output = captured.str();
    EXPECT_NE(output.find("Formula '1/0' evaluated to NA"), std::string::npos);
    EXPECT_NE(output.find("Cannot parse formula 'FOO(1)'"), std::string::npos);
}

TEST(ResolveContentAssetTokenTest, LoneAssetToken) {
    std::vector<metadata::ContentAsset> assets(2);
    assets[0].slug = "logo-1";
    assets[0].type = metadata::AssetType::kImage;
    assets[0].url = "https://x/y.png";
    assets[1].slug = "intro";
    assets[1].type = metadata::AssetType::kText;
    assets[1].text = "Welcome";

    EXPECT_EQ(ResolveContentAssetToken("[MEDIA:logo-1]", assets), "https://x/y.png");
    EXPECT_EQ(ResolveContentAssetToken(" [TEXT:intro] ", assets), "Welcome");
    EXPECT_FALSE(ResolveContentAssetToken("[TEXT:logo-1]", assets).has_value());
    EXPECT_FALSE(ResolveContentAssetToken("[MEDIA:other]", assets).has_value());
    EXPECT_FALSE(ResolveContentAssetToken("[female]", assets).has_value());
    EXPECT_FALSE(ResolveContentAssetToken("[MEDIA:logo-1]+1", assets).has_value());
}

TEST(TestFormulaTest, UsesSampleStatistics) {
    auto test = TestFormula("([female]+[male])/[approvedImages]");
    ASSERT_TRUE(test.result.IsNumber());
    EXPECT_DOUBLE_EQ(test.result.GetNumber(), 280.0 / 45.0);
    EXPECT_EQ(test.sample_data.GetNumber("jerseyPrice"), 85);

    EXPECT_EQ(TestFormula("[totalFans]").result, Num(280));
    EXPECT_EQ(TestFormula("[allImages]").result, Num(50));
}

TEST(FormulaEngineClassTest, UsesCachedAssetsOnly) {
    auto cache = std::make_shared<metadata::MetadataCache>(std::make_shared<StaticSource>());
    FormulaEngine engine(cache);
    StatisticsRecord stats;

    // Nothing fetched yet, so the asset is unknown
    EXPECT_TRUE(engine.Evaluate("[MEDIA:logo-1]", stats).IsNotApplicable());

    cache->Refresh();
    EXPECT_EQ(engine.Evaluate("[MEDIA:logo-1]", stats), FormulaValue::FromText("https://x/y.png"));
}

TEST(FormulaEngineClassTest, WorksWithoutMetadata) {
    FormulaEngine engine;
    StatisticsRecord stats = {{"a", 2}};
    auto results = engine.EvaluateBatch({"[a]*[a]", "[MEDIA:x]"}, stats);
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0], Num(4));
    EXPECT_TRUE(results[1].IsNotApplicable());
}

}  // namespace
}  // namespace chartcalc::formula
