#pragma once

/// @file engine_config.h
/// @brief Typed view of the chartcalc YAML configuration

#include <chrono>

#include <absl/status/statusor.h>

#include "common/config.h"
#include "common/logging.h"
#include "metadata/metadata_client.h"

namespace chartcalc::metadata {

/// @brief Settings read from the "metadata" and "logging" sections
///
/// @code
///   metadata:
///     host: localhost
///     port: 3000
///     variables_path: /api/variables-config
///     assets_path: /api/content-assets
///     timeout_seconds: 5
///     cache_ttl_seconds: 300
///   logging:
///     level: info
///     file: ""
/// @endcode
struct EngineConfig {
    MetadataClientConfig client;
    std::chrono::seconds cache_ttl{300};
    LogConfig logging;

    /// @brief Read and check @p config; absent keys keep their defaults
    /// @return Configuration error for an out-of-range port, a non-positive
    ///         TTL or timeout, or an unknown log level
    static absl::StatusOr<EngineConfig> FromConfig(const Config& config);
};

}  // namespace chartcalc::metadata
