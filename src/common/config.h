#pragma once

/// @file config.h
/// @brief YAML-backed configuration with environment overrides

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace chartcalc {

/// @brief Scalar or list value accepted by Config::Set
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// @brief Hierarchical configuration addressed with dotted keys
///
/// Keys such as "metadata.cache_ttl_seconds" walk nested YAML maps. Missing
/// keys and type mismatches fall back to the supplied default.
class Config {
public:
    Config() = default;

    /// @brief Load configuration from a YAML file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from YAML text
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Collect the known CHARTCALC_* environment overrides
    /// @param prefix Variable prefix, "CHARTCALC_" by default
    static Config LoadFromEnvironment(std::string_view prefix = "CHARTCALC_");

    /// @brief Deep-merge another configuration into this one (other wins)
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Sequence of scalars under @p key, empty when absent
    std::vector<std::string> GetStringList(std::string_view key) const;

    bool HasKey(std::string_view key) const;

    /// @brief Set a value, creating intermediate maps as needed
    void Set(std::string_view key, ConfigValue value);

    const YAML::Node& GetNode() const { return root_; }

    /// @brief Render the configuration as JSON (for --dump-config style output)
    nlohmann::json ToJson() const;

private:
    YAML::Node root_;

    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

/// @brief Process-wide configuration
Config& GlobalConfig();

/// @brief Build the global configuration from an optional file plus environment
absl::Status InitGlobalConfig(
    const std::optional<std::filesystem::path>& config_path = std::nullopt,
    std::string_view env_prefix = "CHARTCALC_");

}  // namespace chartcalc
