#pragma once

/// @file metadata_client.h
/// @brief HTTP client for the variables-config and content-assets endpoints

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "metadata/metadata_source.h"

namespace chartcalc::metadata {

/// @brief Metadata API location and timeouts
struct MetadataClientConfig {
    std::string host = "localhost";
    uint16_t port = 3000;
    std::string variables_path = "/api/variables-config";
    std::string assets_path = "/api/content-assets";

    /// Sent as "Authorization: Bearer <token>" when set
    std::string api_token;

    std::chrono::seconds connection_timeout{5};
    std::chrono::seconds read_timeout{5};
};

/// @brief MetadataSource backed by the application's REST API
///
/// Each fetch is a single GET. Transport failures map to Unavailable, HTTP
/// errors to NotFound or Internal, and unusable bodies to the malformed
/// response code.
class MetadataClient : public MetadataSource {
public:
    explicit MetadataClient(MetadataClientConfig config);
    ~MetadataClient() override;

    MetadataClient(const MetadataClient&) = delete;
    MetadataClient& operator=(const MetadataClient&) = delete;

    MetadataClient(MetadataClient&&) noexcept;
    MetadataClient& operator=(MetadataClient&&) noexcept;

    absl::StatusOr<std::vector<VariableMetadata>> FetchVariables() override;
    absl::StatusOr<std::vector<ContentAsset>> FetchContentAssets() override;

    const MetadataClientConfig& GetConfig() const { return config_; }

private:
    class Impl;

    MetadataClientConfig config_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace chartcalc::metadata
