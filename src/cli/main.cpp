/// @file main.cpp
/// @brief chartcalc command-line entry point

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <CLI/CLI.hpp>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "common/config.h"
#include "common/logging.h"
#include "common/metrics.h"
#include "formula/ast.h"
#include "formula/formula_engine.h"
#include "formula/parser.h"
#include "formula/resolver.h"
#include "formula/validator.h"
#include "metadata/engine_config.h"
#include "metadata/metadata_cache.h"
#include "metadata/metadata_client.h"

namespace {

constexpr const char* kVersion = "1.0.0";

constexpr int kExitValue = 0;
constexpr int kExitUsage = 1;
constexpr int kExitNotApplicable = 2;
constexpr int kExitInvalid = 3;

/// Parses repeated "key=value" options into a numeric map
absl::StatusOr<std::unordered_map<std::string, double>> ParseAssignments(
    const std::vector<std::string>& assignments, const char* option) {
    std::unordered_map<std::string, double> values;
    for (const auto& assignment : assignments) {
        std::vector<std::string> parts = absl::StrSplit(assignment, absl::MaxSplits('=', 1));
        double value = 0.0;
        if (parts.size() != 2 || parts[0].empty() || !absl::SimpleAtod(parts[1], &value)) {
            return absl::InvalidArgumentError(
                absl::StrCat(option, " expects key=number, got '", assignment, "'"));
        }
        values[parts[0]] = value;
    }
    return values;
}

absl::StatusOr<chartcalc::formula::StatisticsRecord> LoadStatistics(const std::string& path) {
    if (path.empty()) {
        return chartcalc::formula::StatisticsRecord();
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        return absl::NotFoundError(absl::StrCat("Cannot open statistics file: ", path));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return chartcalc::formula::StatisticsRecord::FromJsonString(buffer.str());
}

absl::StatusOr<chartcalc::metadata::EngineConfig> LoadEngineConfig(const std::string& path) {
    std::optional<std::filesystem::path> config_path;
    if (!path.empty()) {
        config_path = path;
    }
    // File values first, CHARTCALC_* environment variables on top
    auto status = chartcalc::InitGlobalConfig(config_path);
    if (!status.ok()) {
        return status;
    }
    return chartcalc::metadata::EngineConfig::FromConfig(chartcalc::GlobalConfig());
}

int RunValidation(const std::string& formula,
                  const std::shared_ptr<chartcalc::metadata::MetadataCache>& metadata) {
    auto result = chartcalc::formula::ValidateFormula(formula);
    if (!result.is_valid) {
        std::cout << "invalid: " << result.error << std::endl;
        return kExitInvalid;
    }

    if (metadata) {
        auto registry = metadata->Variables().GetCached();
        for (const auto& name : result.used_variables) {
            if (!chartcalc::formula::IsKnownVariable(name, *registry)) {
                std::cout << "unknown variable: " << name << std::endl;
                return kExitInvalid;
            }
        }
    }

    std::cout << "valid";
    if (result.evaluated_result) {
        std::cout << " (trial result " << *result.evaluated_result << ")";
    }
    std::cout << std::endl;
    return kExitValue;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"chartcalc - evaluate report chart formulas against event statistics"};

    std::string formula;
    std::string stats_path;
    std::string config_path;
    std::string log_level;
    std::vector<std::string> param_assignments;
    std::vector<std::string> manual_assignments;
    bool validate_flag = false;
    bool explain_flag = false;
    bool fetch_metadata_flag = false;
    bool metrics_flag = false;
    bool version_flag = false;

    app.add_option("-f,--formula", formula, "Formula to evaluate, e.g. \"[female]/[male]\"");
    app.add_option("-s,--stats", stats_path, "JSON file with the event statistics");
    app.add_option("-p,--param", param_assignments, "Parameter value key=number (repeatable)");
    app.add_option("-m,--manual", manual_assignments, "Manual data value key=number (repeatable)");
    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_flag("--validate", validate_flag, "Validate the formula instead of evaluating it");
    app.add_flag("--explain", explain_flag, "Print the substituted formula and its syntax tree");
    app.add_flag("--fetch-metadata", fetch_metadata_flag,
                 "Load variables and content assets from the metadata API first");
    app.add_flag("--metrics", metrics_flag, "Print engine metrics to stderr before exiting");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e) == 0 ? kExitValue : kExitUsage;
    }

    if (version_flag) {
        std::cout << "chartcalc v" << kVersion << std::endl;
        return kExitValue;
    }
    if (formula.empty()) {
        std::cerr << "--formula is required" << std::endl;
        return kExitUsage;
    }

    auto engine_config = LoadEngineConfig(config_path);
    if (!engine_config.ok()) {
        std::cerr << "Failed to load config: " << engine_config.status().message() << std::endl;
        return kExitUsage;
    }

    chartcalc::LogConfig log_config = engine_config->logging;
    if (!log_level.empty()) {
        auto level = chartcalc::ParseLogLevel(log_level);
        if (!level.ok()) {
            std::cerr << level.status().message() << std::endl;
            return kExitUsage;
        }
        log_config.level = *level;
    }
    chartcalc::InitLogging(log_config);

    auto stats = LoadStatistics(stats_path);
    if (!stats.ok()) {
        CHARTCALC_LOG_ERROR("Failed to load statistics: {}", stats.status().message());
        return kExitUsage;
    }
    auto parameters = ParseAssignments(param_assignments, "--param");
    auto manual_data = ParseAssignments(manual_assignments, "--manual");
    if (!parameters.ok() || !manual_data.ok()) {
        std::cerr << (parameters.ok() ? manual_data.status() : parameters.status()).message()
                  << std::endl;
        return kExitUsage;
    }

    std::shared_ptr<chartcalc::metadata::MetadataCache> metadata;
    if (fetch_metadata_flag) {
        auto client = std::make_shared<chartcalc::metadata::MetadataClient>(engine_config->client);
        metadata = std::make_shared<chartcalc::metadata::MetadataCache>(client,
                                                                        engine_config->cache_ttl);
        metadata->Refresh();
        CHARTCALC_LOG_INFO("Metadata: {} variables, {} content assets",
                           metadata->Variables().GetCached()->size(),
                           metadata->Assets().GetCached()->size());
    }

    int exit_code = kExitValue;
    if (validate_flag) {
        exit_code = RunValidation(formula, metadata);
    } else {
        if (explain_flag) {
            auto assets = metadata ? metadata->Assets().GetCached() : nullptr;
            chartcalc::formula::EvaluationContext context;
            context.stats = &*stats;
            context.parameters = &*parameters;
            context.manual_data = &*manual_data;
            context.assets = assets.get();
            std::cout << "substituted: "
                      << chartcalc::formula::SubstituteVariables(formula, context) << std::endl;

            auto tree = chartcalc::formula::Parser().Parse(formula);
            if (tree.ok()) {
                std::cout << "tree: " << chartcalc::formula::ToSExpression(**tree) << std::endl;
            } else {
                std::cout << "parse error: " << tree.status().message() << std::endl;
            }
        }

        chartcalc::formula::FormulaEngine engine(metadata);
        auto value = engine.Evaluate(formula, *stats, &*parameters, &*manual_data);
        std::cout << value << std::endl;
        exit_code = value.IsNotApplicable() ? kExitNotApplicable : kExitValue;
    }

    if (metrics_flag) {
        std::cerr << chartcalc::MetricsRegistry::Instance().ExportText();
    }

    chartcalc::ShutdownLogging();
    return exit_code;
}
