#pragma once

/// @file formula_engine.h
/// @brief Formula evaluation entry points

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>

#include "formula/ast.h"
#include "formula/functions.h"
#include "formula/resolver.h"
#include "formula/statistics_record.h"
#include "formula/value.h"
#include "metadata/metadata_cache.h"

namespace chartcalc::formula {

/// @brief A formula parsed once and evaluated many times
///
/// A formula that fails to parse still compiles; it evaluates to NA and
/// status() reports why.
class CompiledFormula {
public:
    static CompiledFormula Compile(std::string_view formula,
                                   const FunctionLibrary& functions = FunctionLibrary::Default());

    bool ok() const { return status_.ok(); }
    const absl::Status& status() const { return status_; }

    const std::string& source() const { return source_; }

    /// @brief Distinct token bodies referenced by the formula
    const std::vector<std::string>& variables() const { return variables_; }

    /// @brief Parsed tree, nullptr when !ok()
    const NodePtr& tree() const { return tree_; }

    /// @brief Evaluate against @p context; never throws
    FormulaValue Evaluate(const EvaluationContext& context) const;

private:
    CompiledFormula() = default;

    std::string source_;
    absl::Status status_;
    NodePtr tree_;
    std::vector<std::string> variables_;
    const FunctionLibrary* functions_ = nullptr;
};

/// @brief Parse and evaluate @p formula against @p context
///
/// Missing fields, parameters and manual values count as 0. Unparseable
/// input, division by zero and non-finite results give NA.
FormulaValue EvaluateFormula(std::string_view formula, const EvaluationContext& context);

FormulaValue EvaluateFormula(std::string_view formula,
                             const StatisticsRecord& stats,
                             const ParameterMap* parameters = nullptr,
                             const ManualDataMap* manual_data = nullptr);

/// @brief One result per formula, in input order
std::vector<FormulaValue> EvaluateFormulasBatch(const std::vector<std::string>& formulas,
                                                const EvaluationContext& context);

/// @brief Content of the asset named by a formula that is a lone asset token
///
/// "[MEDIA:logo]" yields the image URL and "[TEXT:intro]" the text body.
/// Returns nullopt for any other formula, an unknown slug or a type mismatch.
std::optional<std::string> ResolveContentAssetToken(
    std::string_view formula, const std::vector<metadata::ContentAsset>& assets);

/// @brief Representative event statistics for trying formulas out
const StatisticsRecord& SampleStatistics();

struct FormulaTestResult {
    FormulaValue result;
    StatisticsRecord sample_data;
};

/// @brief Evaluate @p formula against SampleStatistics()
FormulaTestResult TestFormula(std::string_view formula);

/// @brief Evaluation bound to a metadata cache for asset tokens
///
/// Asset lookups use the cache's current snapshot only, so evaluation never
/// waits on a refresh.
class FormulaEngine {
public:
    explicit FormulaEngine(std::shared_ptr<metadata::MetadataCache> metadata = nullptr,
                           const FunctionLibrary& functions = FunctionLibrary::Default());

    FormulaValue Evaluate(std::string_view formula,
                          const StatisticsRecord& stats,
                          const ParameterMap* parameters = nullptr,
                          const ManualDataMap* manual_data = nullptr) const;

    std::vector<FormulaValue> EvaluateBatch(const std::vector<std::string>& formulas,
                                            const StatisticsRecord& stats,
                                            const ParameterMap* parameters = nullptr,
                                            const ManualDataMap* manual_data = nullptr) const;

    const std::shared_ptr<metadata::MetadataCache>& Metadata() const { return metadata_; }

private:
    std::shared_ptr<metadata::MetadataCache> metadata_;
    const FunctionLibrary* functions_;
};

}  // namespace chartcalc::formula
