#include "config.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace switchyard {
namespace test {

using json = nlohmann::json;
using namespace std::chrono_literals;

TEST(ConfigTest, Defaults) {
    ServerConfig config = json::object().get<ServerConfig>();

    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.logLevel, "info");
    EXPECT_EQ(config.router.findPublisherAttempts, 10);
    EXPECT_EQ(config.router.findPublisherInterval, 500ms);
    EXPECT_EQ(config.router.trackWaitTimeout, 3000ms);
    ASSERT_EQ(config.session.iceServers.size(), 1u);
    EXPECT_EQ(config.session.iceServers[0], "stun:stun.l.google.com:19302");
    EXPECT_FALSE(config.session.bindAddress.has_value());
    EXPECT_FALSE(config.session.maxMessageSize.has_value());
}

TEST(ConfigTest, ParsesEverySection) {
    auto j = json::parse(R"({
        "port": 9000,
        "logLevel": "debug",
        "router": {
            "findPublisherAttempts": 4,
            "findPublisherIntervalMs": 250,
            "trackWaitTimeoutMs": 1000
        },
        "session": {
            "iceServers": ["stun:stun.example.org:3478"],
            "bindAddress": "10.0.0.5",
            "portRangeBegin": 40000,
            "portRangeEnd": 40100,
            "enableIceTcp": true,
            "maxMessageSize": 65536
        }
    })");

    auto config = j.get<ServerConfig>();
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.logLevel, "debug");
    EXPECT_EQ(config.router.findPublisherAttempts, 4);
    EXPECT_EQ(config.router.findPublisherInterval, 250ms);
    EXPECT_EQ(config.router.trackWaitTimeout, 1000ms);
    EXPECT_EQ(config.session.iceServers, std::vector<std::string>{"stun:stun.example.org:3478"});
    EXPECT_EQ(config.session.bindAddress, "10.0.0.5");
    EXPECT_EQ(config.session.portRangeBegin, 40000);
    EXPECT_EQ(config.session.portRangeEnd, 40100);
    EXPECT_TRUE(config.session.enableIceTcp);
    EXPECT_EQ(config.session.maxMessageSize, 65536u);
}

TEST(ConfigTest, PartialRouterSectionKeepsDefaults) {
    auto config = json::parse(R"({"findPublisherAttempts": 3})").get<RouterConfig>();

    EXPECT_EQ(config.findPublisherAttempts, 3);
    EXPECT_EQ(config.findPublisherInterval, 500ms);
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(json::parse(R"({"findPublisherAttempts": 0})").get<RouterConfig>(), std::invalid_argument);
    EXPECT_THROW(json::parse(R"({"portRangeBegin": 5000, "portRangeEnd": 4000})").get<SessionConfig>(),
                 std::invalid_argument);
    EXPECT_THROW(json::parse(R"({"port": "eighty"})").get<ServerConfig>(), json::exception);
}

TEST(ConfigTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "switchyard_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"port": 8443, "router": {"findPublisherIntervalMs": 100}})";
    }

    auto config = LoadServerConfig(path);
    std::remove(path.c_str());

    EXPECT_EQ(config.port, 8443);
    EXPECT_EQ(config.router.findPublisherInterval, 100ms);
}

TEST(ConfigTest, MissingFile) {
    EXPECT_THROW(LoadServerConfig("/nonexistent/switchyard.json"), std::runtime_error);
}

} // namespace test
} // namespace switchyard
