// test_json_contracts.cpp — имена полей JSON, которые читает мобильный клиент
// Переименование любого ключа ломает совместимость с уже установленными приложениями

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "meterlink/Network/PairingProtocol.h"
#include "meterlink/Models.h"
#include "meterlink/Config.h"

using namespace MeterLink;
using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// Envelope
// ═══════════════════════════════════════════════════════════

TEST(JsonContractsTest, EnvelopeFields) {
    AuthPayload auth;
    auth.token = "tok";
    auth.deviceName = "Phone";

    auto j = json::parse(PairingMessage(MessageType::Auth, auth.toJson()).toJson());
    EXPECT_EQ(j["type"], "auth");
    ASSERT_TRUE(j.contains("timestamp"));
    EXPECT_TRUE(j["timestamp"].is_string());

    // payload вложен объектом, а не строкой
    ASSERT_TRUE(j["payload"].is_object());
    EXPECT_EQ(j["payload"]["token"], "tok");
    EXPECT_EQ(j["payload"]["deviceName"], "Phone");
}

TEST(JsonContractsTest, EnvelopeWithoutPayload) {
    auto j = json::parse(PairingMessage(MessageType::AuthSuccess).toJson());
    EXPECT_EQ(j["type"], "authSuccess");
    EXPECT_FALSE(j.contains("payload"));
}

TEST(JsonContractsTest, ClientAuthMessageAccepted) {
    // Так сообщение формирует мобильное приложение
    const char* wire = R"({
        "type": "auth",
        "payload": {"token": "8d3f1c2e-1111-4222-8333-444455556666", "deviceName": "Anna's iPhone"},
        "timestamp": "2024-05-01T12:00:00Z"
    })";

    auto msg = PairingMessage::fromJson(wire);
    ASSERT_TRUE(msg.has_value());
    ASSERT_TRUE(msg->payload.has_value());

    auto auth = AuthPayload::fromJson(*msg->payload);
    ASSERT_TRUE(auth.has_value());
    EXPECT_EQ(auth->deviceName, "Anna's iPhone");
}

TEST(JsonContractsTest, SnapshotPayloadEmbedded) {
    UsageSnapshot s;
    s.session.utilization = 33.0;
    s.session.windowType = UsageWindowType::Session;
    s.opus.windowType = UsageWindowType::Opus;

    auto j = json::parse(PairingMessage(MessageType::Snapshot, s.toJson()).toJson());
    EXPECT_EQ(j["type"], "snapshot");
    ASSERT_TRUE(j["payload"].is_object());
    EXPECT_DOUBLE_EQ(j["payload"]["session"]["utilization"].get<double>(), 33.0);
    EXPECT_TRUE(j["payload"].contains("fetchedAt"));
}

// ═══════════════════════════════════════════════════════════
// QR и устройства
// ═══════════════════════════════════════════════════════════

TEST(JsonContractsTest, QRPayloadFields) {
    PairingQRPayload qr;
    qr.host = "192.168.1.5";
    qr.port = 45123;
    qr.token = "tok";
    qr.expiresAt = Timestamp(std::chrono::seconds(1800000000LL));
    qr.machineName = "Studio";

    auto j = json::parse(qr.toJson());
    EXPECT_EQ(j["host"], "192.168.1.5");
    EXPECT_EQ(j["port"], 45123);
    EXPECT_EQ(j["token"], "tok");
    EXPECT_EQ(j["machineName"], "Studio");
    EXPECT_TRUE(j["expiresAt"].is_string());
    EXPECT_EQ(j.size(), 5u);
}

TEST(JsonContractsTest, QRPayloadWithoutMachineName) {
    auto qr = PairingQRPayload::fromJson(
        R"({"host":"10.0.0.9","port":4000,"token":"t","expiresAt":"2030-01-01T00:00:00Z"})");
    ASSERT_TRUE(qr.has_value());
    EXPECT_EQ(qr->machineName, "");
}

TEST(JsonContractsTest, ConnectedDeviceFields) {
    ConnectedDevice d;
    d.id = "id-1";
    d.name = "Pixel";
    d.address = "10.0.0.4:50000";

    auto j = json::parse(d.toJson());
    EXPECT_EQ(j["id"], "id-1");
    EXPECT_EQ(j["name"], "Pixel");
    EXPECT_EQ(j["address"], "10.0.0.4:50000");
    EXPECT_TRUE(j["connectedAt"].is_string());
}

TEST(JsonContractsTest, ConfigKeys) {
    auto j = json::parse(PairingServerConfig{}.toJson());
    for (const char* key : {"port", "bindAddress", "tokenLifetimeMs", "purgeGraceMs",
                            "authFailureGraceMs", "idleTimeoutMs", "sendTimeoutMs",
                            "listenBacklog", "hostDisplayName"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
}
