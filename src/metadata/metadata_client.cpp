#include "metadata/metadata_client.h"

#include <mutex>

#include <absl/strings/str_cat.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "common/error.h"
#include "common/logging.h"

namespace chartcalc::metadata {

class MetadataClient::Impl {
public:
    explicit Impl(const MetadataClientConfig& config) : config_(config) {}

    absl::StatusOr<nlohmann::json> GetJson(const std::string& path) {
        CHARTCALC_ASSIGN_OR_RETURN(std::string body, Get(path));

        auto json = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
        if (json.is_discarded()) {
            return MalformedResponseError(absl::StrCat("Invalid JSON from ", path));
        }
        return json;
    }

private:
    absl::StatusOr<std::string> Get(const std::string& path) {
        // httplib::Client is not safe for concurrent requests
        std::lock_guard<std::mutex> lock(mutex_);
        if (!client_) {
            client_ = std::make_unique<httplib::Client>(config_.host, config_.port);
            client_->set_connection_timeout(config_.connection_timeout);
            client_->set_read_timeout(config_.read_timeout);
            if (!config_.api_token.empty()) {
                client_->set_bearer_token_auth(config_.api_token);
            }
        }

        CHARTCALC_LOG_DEBUG("GET {}:{}{}", config_.host, config_.port, path);
        return HandleResponse(client_->Get(path));
    }

    absl::StatusOr<std::string> HandleResponse(const httplib::Result& res) {
        if (!res) {
            const std::string detail = httplib::to_string(res.error());
            if (res.error() == httplib::Error::ConnectionTimeout) {
                return TimeoutError(absl::StrCat("Metadata request timed out: ", detail));
            }
            return FetchFailedError(absl::StrCat("Metadata request failed: ", detail));
        }

        if (res->status == 404) {
            return absl::NotFoundError("Resource not found");
        }

        if (res->status >= 400) {
            return absl::InternalError("HTTP error " + std::to_string(res->status) +
                                       ": " + res->body);
        }

        return res->body;
    }

    MetadataClientConfig config_;
    std::mutex mutex_;
    std::unique_ptr<httplib::Client> client_;
};

MetadataClient::MetadataClient(MetadataClientConfig config)
    : config_(std::move(config)), impl_(std::make_unique<Impl>(config_)) {}

MetadataClient::~MetadataClient() = default;

MetadataClient::MetadataClient(MetadataClient&&) noexcept = default;
MetadataClient& MetadataClient::operator=(MetadataClient&&) noexcept = default;

absl::StatusOr<std::vector<VariableMetadata>> MetadataClient::FetchVariables() {
    CHARTCALC_ASSIGN_OR_RETURN(nlohmann::json body, impl_->GetJson(config_.variables_path));
    return ParseVariablesResponse(body);
}

absl::StatusOr<std::vector<ContentAsset>> MetadataClient::FetchContentAssets() {
    CHARTCALC_ASSIGN_OR_RETURN(nlohmann::json body, impl_->GetJson(config_.assets_path));
    return ParseContentAssetsResponse(body);
}

}  // namespace chartcalc::metadata
