/// @file engine_config_test.cpp
/// @brief Tests for the typed engine configuration

#include <gtest/gtest.h>

#include "metadata/engine_config.h"

namespace chartcalc::metadata {
namespace {

TEST(EngineConfigTest, Defaults) {
    auto engine = EngineConfig::FromConfig(Config());
    ASSERT_TRUE(engine.ok()) << engine.status().message();

    EXPECT_EQ(engine->client.host, "localhost");
    EXPECT_EQ(engine->client.port, 3000);
    EXPECT_EQ(engine->client.variables_path, "/api/variables-config");
    EXPECT_EQ(engine->client.assets_path, "/api/content-assets");
    EXPECT_EQ(engine->client.read_timeout, std::chrono::seconds(5));
    EXPECT_EQ(engine->cache_ttl, std::chrono::seconds(300));
    EXPECT_EQ(engine->logging.level, LogLevel::kInfo);
    EXPECT_TRUE(engine->logging.file_path.empty());
}

TEST(EngineConfigTest, FromYaml) {
    auto config = Config::LoadFromString(R"(
metadata:
  host: metadata.internal
  port: 8443
  variables_path: /v2/variables
  timeout_seconds: 2
  cache_ttl_seconds: 60
logging:
  level: debug
  file: /tmp/chartcalc.log
)");
    ASSERT_TRUE(config.ok());

    auto engine = EngineConfig::FromConfig(*config);
    ASSERT_TRUE(engine.ok()) << engine.status().message();
    EXPECT_EQ(engine->client.host, "metadata.internal");
    EXPECT_EQ(engine->client.port, 8443);
    EXPECT_EQ(engine->client.variables_path, "/v2/variables");
    EXPECT_EQ(engine->client.assets_path, "/api/content-assets");
    EXPECT_EQ(engine->client.connection_timeout, std::chrono::seconds(2));
    EXPECT_EQ(engine->cache_ttl, std::chrono::seconds(60));
    EXPECT_EQ(engine->logging.level, LogLevel::kDebug);
    EXPECT_EQ(engine->logging.file_path, "/tmp/chartcalc.log");
}

TEST(EngineConfigTest, RejectsBadValues) {
    Config bad_port;
    bad_port.Set("metadata.port", static_cast<int64_t>(70000));
    EXPECT_FALSE(EngineConfig::FromConfig(bad_port).ok());

    Config bad_ttl;
    bad_ttl.Set("metadata.cache_ttl_seconds", static_cast<int64_t>(0));
    EXPECT_FALSE(EngineConfig::FromConfig(bad_ttl).ok());

    Config bad_level;
    bad_level.Set("logging.level", std::string("loud"));
    auto result = EngineConfig::FromConfig(bad_level);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kFailedPrecondition);
}

}  // namespace
}  // namespace chartcalc::metadata
