// test_config.cpp — PairingServerConfig

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "meterlink/Config.h"

using namespace MeterLink;
using json = nlohmann::json;

TEST(ConfigTest, DefaultsAreValid) {
    PairingServerConfig c;
    EXPECT_TRUE(c.isValid());
    EXPECT_EQ(c.port, 0);
    EXPECT_EQ(c.bindAddress, "0.0.0.0");
    EXPECT_EQ(c.tokenLifetime, std::chrono::seconds(60));
    EXPECT_EQ(c.purgeGrace, std::chrono::milliseconds(1000));
    EXPECT_EQ(c.authFailureGrace, std::chrono::milliseconds(100));
    EXPECT_EQ(c.idleTimeout.count(), 0);
}

TEST(ConfigTest, FromJsonOverridesOnlyGivenKeys) {
    auto c = PairingServerConfig::fromJson(R"({
        "tokenLifetimeMs": 5000,
        "idleTimeoutMs": 30000,
        "hostDisplayName": "Studio Mac",
        "somethingNew": true
    })");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->tokenLifetime, std::chrono::milliseconds(5000));
    EXPECT_EQ(c->idleTimeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(c->hostDisplayName, "Studio Mac");
    EXPECT_EQ(c->bindAddress, "0.0.0.0");
    EXPECT_EQ(c->sendTimeout, std::chrono::milliseconds(DEFAULT_SEND_TIMEOUT_MS));
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_FALSE(PairingServerConfig::fromJson(R"({"tokenLifetimeMs": 0})").has_value());
    EXPECT_FALSE(PairingServerConfig::fromJson(R"({"purgeGraceMs": -1})").has_value());
    EXPECT_FALSE(PairingServerConfig::fromJson(R"({"idleTimeoutMs": -5})").has_value());
    EXPECT_FALSE(PairingServerConfig::fromJson(R"({"listenBacklog": 0})").has_value());
    EXPECT_FALSE(PairingServerConfig::fromJson(R"({"port": "eighty"})").has_value());
    EXPECT_FALSE(PairingServerConfig::fromJson("[1, 2]").has_value());
    EXPECT_FALSE(PairingServerConfig::fromJson("{").has_value());
}

TEST(ConfigTest, RejectsPortOutsideUint16) {
    EXPECT_FALSE(PairingServerConfig::fromJson(R"({"port": 70000})").has_value());
    EXPECT_FALSE(PairingServerConfig::fromJson(R"({"port": 65536})").has_value());
    EXPECT_FALSE(PairingServerConfig::fromJson(R"({"port": -1})").has_value());
    EXPECT_FALSE(PairingServerConfig::fromJson(R"({"port": 80.5})").has_value());

    auto max = PairingServerConfig::fromJson(R"({"port": 65535})");
    ASSERT_TRUE(max.has_value());
    EXPECT_EQ(max->port, 65535);
}

TEST(ConfigTest, RejectsDurationsAboveOneDay) {
    EXPECT_FALSE(PairingServerConfig::fromJson(
        R"({"tokenLifetimeMs": 9223372036854775807})").has_value());
    EXPECT_FALSE(PairingServerConfig::fromJson(R"({"purgeGraceMs": 86400001})").has_value());
    EXPECT_FALSE(PairingServerConfig::fromJson(R"({"authFailureGraceMs": 86400001})").has_value());
    EXPECT_FALSE(PairingServerConfig::fromJson(R"({"sendTimeoutMs": 5000000000})").has_value());
    EXPECT_FALSE(PairingServerConfig::fromJson(R"({"idleTimeoutMs": 86400001})").has_value());

    PairingServerConfig c;
    c.tokenLifetime = std::chrono::milliseconds(MAX_DURATION_MS);
    c.idleTimeout = std::chrono::milliseconds(MAX_DURATION_MS);
    EXPECT_TRUE(c.isValid());

    c.sendTimeout = std::chrono::hours(25);
    EXPECT_FALSE(c.isValid());
}

TEST(ConfigTest, ToJsonUsesMillisecondKeys) {
    PairingServerConfig c;
    c.port = 45700;
    auto j = json::parse(c.toJson());

    EXPECT_EQ(j["port"], 45700);
    EXPECT_EQ(j["tokenLifetimeMs"], 60000);
    EXPECT_EQ(j["purgeGraceMs"], 1000);
    EXPECT_EQ(j["authFailureGraceMs"], 100);
    EXPECT_EQ(j["idleTimeoutMs"], 0);

    auto back = PairingServerConfig::fromJson(j.dump());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->port, 45700);
}
