#include "metadata/engine_config.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace chartcalc::metadata {

absl::StatusOr<EngineConfig> EngineConfig::FromConfig(const Config& config) {
    EngineConfig engine;
    MetadataClientConfig& client = engine.client;

    client.host = config.GetString("metadata.host", client.host);
    if (client.host.empty()) {
        return ConfigurationError("metadata.host must not be empty");
    }

    const int64_t port = config.GetInt("metadata.port", client.port);
    if (port <= 0 || port > 65535) {
        return ConfigurationError(absl::StrCat("metadata.port out of range: ", port));
    }
    client.port = static_cast<uint16_t>(port);

    client.variables_path = config.GetString("metadata.variables_path", client.variables_path);
    client.assets_path = config.GetString("metadata.assets_path", client.assets_path);
    client.api_token = config.GetString("metadata.api_token");

    const int64_t timeout = config.GetInt("metadata.timeout_seconds", client.read_timeout.count());
    if (timeout <= 0) {
        return ConfigurationError(absl::StrCat("metadata.timeout_seconds must be positive: ", timeout));
    }
    client.connection_timeout = std::chrono::seconds(timeout);
    client.read_timeout = std::chrono::seconds(timeout);

    const int64_t ttl = config.GetInt("metadata.cache_ttl_seconds", engine.cache_ttl.count());
    if (ttl <= 0) {
        return ConfigurationError(absl::StrCat("metadata.cache_ttl_seconds must be positive: ", ttl));
    }
    engine.cache_ttl = std::chrono::seconds(ttl);

    auto level = ParseLogLevel(config.GetString("logging.level", "info"));
    if (!level.ok()) {
        return ConfigurationError(level.status().message());
    }
    engine.logging.level = *level;
    engine.logging.file_path = config.GetString("logging.file");

    return engine;
}

}  // namespace chartcalc::metadata
