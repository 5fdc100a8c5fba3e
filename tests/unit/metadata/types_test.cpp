/// @file types_test.cpp
/// @brief Tests for metadata API payload decoding

#include <gtest/gtest.h>

#include "metadata/types.h"

namespace chartcalc::metadata {
namespace {

TEST(AssetTypeTest, RoundTrip) {
    EXPECT_EQ(*ParseAssetType("image"), AssetType::kImage);
    EXPECT_EQ(*ParseAssetType("text"), AssetType::kText);
    EXPECT_FALSE(ParseAssetType("video").ok());
    EXPECT_EQ(AssetTypeToString(AssetType::kText), "text");
}

TEST(ContentAssetTest, FromJson) {
    auto image = ContentAsset::FromJson(nlohmann::json::parse(R"({
        "slug": "logo-1", "title": "Logo", "type": "image",
        "content": {"url": "https://x/y.png", "width": 1200}
    })"));
    ASSERT_TRUE(image.ok()) << image.status().message();
    EXPECT_EQ(image->slug, "logo-1");
    EXPECT_EQ(image->title, "Logo");
    EXPECT_EQ(image->type, AssetType::kImage);
    EXPECT_EQ(image->Content(), "https://x/y.png");

    auto text = ContentAsset::FromJson(nlohmann::json::parse(R"({
        "slug": "intro", "type": "text", "content": {"text": "Hello"}
    })"));
    ASSERT_TRUE(text.ok());
    EXPECT_EQ(text->Content(), "Hello");
}

TEST(ContentAssetTest, FromJsonRejectsIncompleteAssets) {
    EXPECT_FALSE(ContentAsset::FromJson(nlohmann::json::parse(R"({"type": "image"})")).ok());
    EXPECT_FALSE(ContentAsset::FromJson(nlohmann::json::parse(R"({"slug": "a", "type": "gif"})")).ok());
    EXPECT_FALSE(ContentAsset::FromJson(nlohmann::json::array()).ok());
}

TEST(ContentAssetTest, ToJsonMatchesApiShape) {
    ContentAsset asset;
    asset.slug = "logo-1";
    asset.type = AssetType::kImage;
    asset.url = "https://x/y.png";

    auto json = asset.ToJson();
    EXPECT_EQ(json["type"], "image");
    EXPECT_EQ(json["content"]["url"], "https://x/y.png");

    auto parsed = ContentAsset::FromJson(json);
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(parsed->url, asset.url);
}

TEST(VariableMetadataTest, FromJson) {
    auto variable = VariableMetadata::FromJson(nlohmann::json::parse(R"({
        "name": "totalFans", "label": "Total Fans", "category": "Fans",
        "type": "count", "derived": true, "formula": "[remoteFans]+[stadium]",
        "exampleUsage": "[totalFans]/[eventAttendees]", "flags": {"visibleInClicker": true}
    })"));
    ASSERT_TRUE(variable.ok());
    EXPECT_EQ(variable->name, "totalFans");
    EXPECT_EQ(variable->label, "Total Fans");
    EXPECT_TRUE(variable->derived);
    EXPECT_EQ(variable->formula, "[remoteFans]+[stadium]");
    EXPECT_EQ(variable->example_usage, "[totalFans]/[eventAttendees]");
    EXPECT_TRUE(variable->unit.empty());
}

TEST(ParseVariablesResponseTest, SkipsBadEntries) {
    auto variables = ParseVariablesResponse(nlohmann::json::parse(R"({
        "success": true,
        "variables": [{"name": "female"}, {"label": "no name"}, {"name": "male"}]
    })"));
    ASSERT_TRUE(variables.ok());
    ASSERT_EQ(variables->size(), 2);
    EXPECT_EQ((*variables)[1].name, "male");
}

TEST(ParseVariablesResponseTest, RejectsFailedEnvelope) {
    auto failed = ParseVariablesResponse(nlohmann::json::parse(
        R"({"success": false, "error": "Failed to fetch variables-config"})"));
    ASSERT_FALSE(failed.ok());
    EXPECT_NE(failed.status().message().find("Failed to fetch"), std::string::npos);

    EXPECT_FALSE(ParseVariablesResponse(nlohmann::json::parse(R"({"success": true})")).ok());
    EXPECT_FALSE(ParseVariablesResponse(nlohmann::json::parse("[]")).ok());
}

TEST(ParseContentAssetsResponseTest, DecodesAssets) {
    auto assets = ParseContentAssetsResponse(nlohmann::json::parse(R"({
        "success": true,
        "assets": [
            {"slug": "logo-1", "type": "image", "content": {"url": "u"}},
            {"slug": "intro", "type": "text", "content": {"text": "t"}}
        ]
    })"));
    ASSERT_TRUE(assets.ok());
    ASSERT_EQ(assets->size(), 2);

    const ContentAsset* intro = FindAsset(*assets, "intro");
    ASSERT_NE(intro, nullptr);
    EXPECT_EQ(intro->text, "t");
    EXPECT_EQ(FindAsset(*assets, "none"), nullptr);
}

}  // namespace
}  // namespace chartcalc::metadata
