// SPDX-License-Identifier: MIT

// tests/config_test.cpp
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "src/config.hpp"

using namespace stage_pipe;

TEST(ConfigTest, EmptyObjectGivesDefaults) {
    auto config = ParseConfig("{}");
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->debug);
    EXPECT_FALSE(config->middlewares.live_reload.enabled);

    const SessionConfig& session = config->middlewares.session;
    EXPECT_EQ(session.cookie_name, "id");
    EXPECT_EQ(session.path, "/");
    EXPECT_TRUE(session.secure);
    EXPECT_TRUE(session.http_only);
    EXPECT_EQ(session.same_site, SameSite::Strict);
    EXPECT_FALSE(session.expiry.has_value());
}

TEST(ConfigTest, ReadsAllFields) {
    auto config = ParseConfig(R"({
        "debug": true,
        "middlewares": {
            "live_reload": { "enabled": true },
            "session": {
                "cookie_name": "sid",
                "secure": false,
                "http_only": false,
                "same_site": "lax",
                "path": "/app",
                "expiry_seconds": 3600
            }
        }
    })");
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->debug);
    EXPECT_TRUE(config->middlewares.live_reload.enabled);

    const SessionConfig& session = config->middlewares.session;
    EXPECT_EQ(session.cookie_name, "sid");
    EXPECT_FALSE(session.secure);
    EXPECT_FALSE(session.http_only);
    EXPECT_EQ(session.same_site, SameSite::Lax);
    EXPECT_EQ(session.path, "/app");
    EXPECT_EQ(session.expiry, std::chrono::seconds(3600));
}

TEST(ConfigTest, WrongTypesFallBackToDefaults) {
    auto config = ParseConfig(R"({
        "debug": "yes",
        "middlewares": {
            "live_reload": { "enabled": "true" },
            "session": { "cookie_name": 7, "same_site": "sometimes", "expiry_seconds": -5 }
        }
    })");
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->debug);
    EXPECT_FALSE(config->middlewares.live_reload.enabled);
    EXPECT_EQ(config->middlewares.session.cookie_name, "id");
    EXPECT_EQ(config->middlewares.session.same_site, SameSite::Strict);
    EXPECT_FALSE(config->middlewares.session.expiry.has_value());
}

TEST(ConfigTest, NonObjectSectionIsIgnored) {
    auto config = ParseConfig(R"({"middlewares": {"live_reload": true}})");
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->middlewares.live_reload.enabled);
}

TEST(ConfigTest, InvalidJsonIsParseError) {
    auto config = ParseConfig("{\"debug\": ");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParse);
    EXPECT_EQ(error_category(config.error().code), "config");
}

TEST(ConfigTest, NonObjectRootIsParseError) {
    auto config = ParseConfig("[1, 2]");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParse);
}

TEST(ConfigTest, MissingFileIsIoError) {
    auto config = LoadConfig("/nonexistent/stage_pipe/config.json");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigIo);
}

TEST(ConfigTest, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "stage_pipe_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"middlewares": {"live_reload": {"enabled": true}}})";
    }
    auto config = LoadConfig(path);
    std::remove(path.c_str());

    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->middlewares.live_reload.enabled);
}
