#pragma once

/// @file types.h
/// @brief Variable registry entries and content assets served by the metadata API

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

namespace chartcalc::metadata {

enum class AssetType {
    kImage,
    kText
};

std::string_view AssetTypeToString(AssetType type);

/// @brief "image" or "text"; anything else is InvalidArgument
absl::StatusOr<AssetType> ParseAssetType(std::string_view name);

/// @brief Media or text block referenced by [MEDIA:slug] / [TEXT:slug]
struct ContentAsset {
    std::string slug;
    std::string title;
    AssetType type = AssetType::kImage;

    /// Set for images
    std::string url;

    /// Set for text assets
    std::string text;

    /// @brief url for images, text for text assets
    const std::string& Content() const { return type == AssetType::kImage ? url : text; }

    static absl::StatusOr<ContentAsset> FromJson(const nlohmann::json& json);
    nlohmann::json ToJson() const;
};

/// @brief One entry of the variable registry
struct VariableMetadata {
    std::string name;
    std::string label;
    std::string category;
    std::string type;
    bool derived = false;
    std::string formula;
    std::string description;
    std::string example_usage;
    std::string unit;

    static absl::StatusOr<VariableMetadata> FromJson(const nlohmann::json& json);
    nlohmann::json ToJson() const;
};

/// @brief Decode {"success": true, "variables": [...]}
absl::StatusOr<std::vector<VariableMetadata>> ParseVariablesResponse(const nlohmann::json& body);

/// @brief Decode {"success": true, "assets": [...]}
absl::StatusOr<std::vector<ContentAsset>> ParseContentAssetsResponse(const nlohmann::json& body);

/// @brief First asset whose slug equals @p slug, nullptr if none
const ContentAsset* FindAsset(const std::vector<ContentAsset>& assets, std::string_view slug);

/// @brief Registry entry named @p name, nullopt if none
std::optional<VariableMetadata> FindVariable(const std::vector<VariableMetadata>& variables,
                                             std::string_view name);

}  // namespace chartcalc::metadata
