#include "metadata/types.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace chartcalc::metadata {

namespace {

std::string StringField(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

absl::Status CheckEnvelope(const nlohmann::json& body, const char* array_key) {
    if (!body.is_object()) {
        return MalformedResponseError("Response body is not a JSON object");
    }
    auto success = body.find("success");
    if (success == body.end() || !success->is_boolean() || !success->get<bool>()) {
        auto error = body.find("error");
        std::string detail = (error != body.end() && error->is_string())
                                 ? error->get<std::string>()
                                 : "success flag not set";
        return MakeError(ErrorCode::kFetchFailed, absl::StrCat("Metadata API error: ", detail));
    }
    auto array = body.find(array_key);
    if (array == body.end() || !array->is_array()) {
        return MalformedResponseError(absl::StrCat("Response has no '", array_key, "' array"));
    }
    return absl::OkStatus();
}

}  // namespace

std::string_view AssetTypeToString(AssetType type) {
    switch (type) {
        case AssetType::kImage:
            return "image";
        case AssetType::kText:
            return "text";
    }
    return "image";
}

absl::StatusOr<AssetType> ParseAssetType(std::string_view name) {
    if (name == "image") {
        return AssetType::kImage;
    }
    if (name == "text") {
        return AssetType::kText;
    }
    return absl::InvalidArgumentError(absl::StrCat("Unknown asset type: ", name));
}

absl::StatusOr<ContentAsset> ContentAsset::FromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return MalformedResponseError("Content asset is not an object");
    }

    ContentAsset asset;
    asset.slug = StringField(json, "slug");
    if (asset.slug.empty()) {
        return MalformedResponseError("Content asset has no slug");
    }
    asset.title = StringField(json, "title");

    auto type = ParseAssetType(StringField(json, "type"));
    if (!type.ok()) {
        return MalformedResponseError(
            absl::StrCat("Content asset '", asset.slug, "': ", type.status().message()));
    }
    asset.type = *type;

    auto content = json.find("content");
    if (content != json.end() && content->is_object()) {
        asset.url = StringField(*content, "url");
        asset.text = StringField(*content, "text");
    }
    return asset;
}

nlohmann::json ContentAsset::ToJson() const {
    nlohmann::json content = nlohmann::json::object();
    if (type == AssetType::kImage) {
        content["url"] = url;
    } else {
        content["text"] = text;
    }
    return {
        {"slug", slug},
        {"title", title},
        {"type", std::string(AssetTypeToString(type))},
        {"content", content},
    };
}

absl::StatusOr<VariableMetadata> VariableMetadata::FromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return MalformedResponseError("Variable entry is not an object");
    }

    VariableMetadata variable;
    variable.name = StringField(json, "name");
    if (variable.name.empty()) {
        return MalformedResponseError("Variable entry has no name");
    }
    variable.label = StringField(json, "label");
    variable.category = StringField(json, "category");
    variable.type = StringField(json, "type");
    variable.formula = StringField(json, "formula");
    variable.description = StringField(json, "description");
    variable.example_usage = StringField(json, "exampleUsage");
    variable.unit = StringField(json, "unit");

    auto derived = json.find("derived");
    variable.derived = derived != json.end() && derived->is_boolean() && derived->get<bool>();
    return variable;
}

nlohmann::json VariableMetadata::ToJson() const {
    nlohmann::json json = {
        {"name", name},
        {"label", label},
        {"category", category},
        {"type", type},
        {"derived", derived},
    };
    if (!formula.empty()) json["formula"] = formula;
    if (!description.empty()) json["description"] = description;
    if (!example_usage.empty()) json["exampleUsage"] = example_usage;
    if (!unit.empty()) json["unit"] = unit;
    return json;
}

absl::StatusOr<std::vector<VariableMetadata>> ParseVariablesResponse(const nlohmann::json& body) {
    CHARTCALC_RETURN_IF_ERROR(CheckEnvelope(body, "variables"));

    std::vector<VariableMetadata> variables;
    variables.reserve(body["variables"].size());
    for (const auto& entry : body["variables"]) {
        auto variable = VariableMetadata::FromJson(entry);
        if (!variable.ok()) {
            CHARTCALC_LOG_WARN("Skipping variable entry: {}", variable.status().message());
            continue;
        }
        variables.push_back(*std::move(variable));
    }
    return variables;
}

absl::StatusOr<std::vector<ContentAsset>> ParseContentAssetsResponse(const nlohmann::json& body) {
    CHARTCALC_RETURN_IF_ERROR(CheckEnvelope(body, "assets"));

    std::vector<ContentAsset> assets;
    assets.reserve(body["assets"].size());
    for (const auto& entry : body["assets"]) {
        auto asset = ContentAsset::FromJson(entry);
        if (!asset.ok()) {
            CHARTCALC_LOG_WARN("Skipping content asset: {}", asset.status().message());
            continue;
        }
        assets.push_back(*std::move(asset));
    }
    return assets;
}

const ContentAsset* FindAsset(const std::vector<ContentAsset>& assets, std::string_view slug) {
    for (const auto& asset : assets) {
        if (asset.slug == slug) {
            return &asset;
        }
    }
    return nullptr;
}

std::optional<VariableMetadata> FindVariable(const std::vector<VariableMetadata>& variables,
                                             std::string_view name) {
    for (const auto& variable : variables) {
        if (variable.name == name) {
            return variable;
        }
    }
    return std::nullopt;
}

}  // namespace chartcalc::metadata
