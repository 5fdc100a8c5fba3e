#include "config.h"

#include <cstdlib>
#include <functional>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "logging.h"

namespace chartcalc {

namespace {

Config g_global_config;

nlohmann::json ScalarToJson(const YAML::Node& node) {
    const std::string text = node.Scalar();
    int64_t as_int = 0;
    if (absl::SimpleAtoi(text, &as_int)) {
        return as_int;
    }
    double as_double = 0.0;
    if (absl::SimpleAtod(text, &as_double)) {
        return as_double;
    }
    if (text == "true" || text == "false") {
        return text == "true";
    }
    return text;
}

nlohmann::json NodeToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return ScalarToJson(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(NodeToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& kv : node) {
                object[kv.first.as<std::string>()] = NodeToJson(kv.second);
            }
            return object;
        }
        default:
            return nullptr;
    }
}

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse ", path.string(), ": ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    auto get_env = [&prefix](const char* suffix) -> std::optional<std::string> {
        const std::string name = absl::StrCat(prefix, suffix);
        const char* value = std::getenv(name.c_str());
        if (value != nullptr && *value != '\0') {
            return std::string(value);
        }
        return std::nullopt;
    };

    if (auto val = get_env("METADATA_HOST")) {
        config.Set("metadata.host", *val);
    }
    if (auto val = get_env("METADATA_PORT")) {
        int64_t port = 0;
        if (absl::SimpleAtoi(*val, &port)) {
            config.Set("metadata.port", port);
        } else {
            CHARTCALC_LOG_WARN("Ignoring non-numeric {}METADATA_PORT={}", prefix, *val);
        }
    }
    if (auto val = get_env("CACHE_TTL_SECONDS")) {
        int64_t ttl = 0;
        if (absl::SimpleAtoi(*val, &ttl)) {
            config.Set("metadata.cache_ttl_seconds", ttl);
        } else {
            CHARTCALC_LOG_WARN("Ignoring non-numeric {}CACHE_TTL_SECONDS={}", prefix, *val);
        }
    }
    if (auto val = get_env("LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }

    return config;
}

void Config::Merge(const Config& other) {
    std::function<void(YAML::Node, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node base, const YAML::Node& overlay) {
        if (!overlay.IsMap()) {
            return;
        }
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                merge_nodes(base[key], kv.second);
            } else {
                base[key] = YAML::Clone(kv.second);
            }
        }
    };

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    const std::vector<std::string> parts = absl::StrSplit(key, '.');
    YAML::Node current;
    current.reset(root_);

    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& as_const = current;
        YAML::Node child = as_const[part];
        current.reset(child);
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }
    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<int64_t>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<double>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<bool>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    const std::vector<std::string> parts = absl::StrSplit(key, '.');

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    YAML::Node current;
    current.reset(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = current[parts[i]];
        if (!child.IsMap()) {
            child = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(child);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

nlohmann::json Config::ToJson() const {
    return NodeToJson(root_);
}

Config& GlobalConfig() {
    return g_global_config;
}

absl::Status InitGlobalConfig(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix) {
    g_global_config = Config();

    if (config_path.has_value()) {
        auto file_config = Config::LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        g_global_config.Merge(*file_config);
    }

    g_global_config.Merge(Config::LoadFromEnvironment(env_prefix));
    return absl::OkStatus();
}

}  // namespace chartcalc
