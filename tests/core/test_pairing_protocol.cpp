// test_pairing_protocol.cpp — Тесты кадрирования и envelope pairing протокола

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "meterlink/Network/PairingProtocol.h"
#include <cstring>
#include <string>

using namespace MeterLink;
using json = nlohmann::json;

namespace {

std::vector<uint8_t> rawFrame(uint32_t magic, uint32_t length, const std::string& body) {
    std::vector<uint8_t> data = {
        static_cast<uint8_t>(magic >> 24), static_cast<uint8_t>(magic >> 16),
        static_cast<uint8_t>(magic >> 8), static_cast<uint8_t>(magic),
        static_cast<uint8_t>(length >> 24), static_cast<uint8_t>(length >> 16),
        static_cast<uint8_t>(length >> 8), static_cast<uint8_t>(length)
    };
    data.insert(data.end(), body.begin(), body.end());
    return data;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// MessageType
// ═══════════════════════════════════════════════════════════

TEST(MessageTypeTest, WireNames) {
    EXPECT_STREQ(messageTypeName(MessageType::Auth), "auth");
    EXPECT_STREQ(messageTypeName(MessageType::AuthSuccess), "authSuccess");
    EXPECT_STREQ(messageTypeName(MessageType::AuthFailure), "authFailure");
    EXPECT_STREQ(messageTypeName(MessageType::Snapshot), "snapshot");
    EXPECT_STREQ(messageTypeName(MessageType::Ping), "ping");
    EXPECT_STREQ(messageTypeName(MessageType::Pong), "pong");
    EXPECT_STREQ(messageTypeName(MessageType::Disconnect), "disconnect");

    EXPECT_EQ(messageTypeFromName("authSuccess"), MessageType::AuthSuccess);
    EXPECT_FALSE(messageTypeFromName("AUTH").has_value());
    EXPECT_FALSE(messageTypeFromName("hello").has_value());
}

// ═══════════════════════════════════════════════════════════
// MessageSerializer
// ═══════════════════════════════════════════════════════════

TEST(MessageSerializerTest, FrameHeaderLayout) {
    auto data = MessageSerializer::serialize(PairingMessage(MessageType::Ping));
    ASSERT_GT(data.size(), FRAME_HEADER_SIZE);

    // "MLNK"
    EXPECT_EQ(data[0], 'M');
    EXPECT_EQ(data[1], 'L');
    EXPECT_EQ(data[2], 'N');
    EXPECT_EQ(data[3], 'K');

    uint32_t len = (uint32_t(data[4]) << 24) | (uint32_t(data[5]) << 16) |
                   (uint32_t(data[6]) << 8) | uint32_t(data[7]);
    EXPECT_EQ(len, data.size());
}

TEST(MessageSerializerTest, SerializeDeserializeAuth) {
    AuthPayload auth;
    auth.token = "3f2c7a4e-0000-4000-8000-000000000001";
    auth.deviceName = "iPhone";

    PairingMessage msg(MessageType::Auth, auth.toJson());
    auto data = MessageSerializer::serialize(msg);

    auto back = MessageSerializer::deserialize(data);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->type, MessageType::Auth);
    ASSERT_TRUE(back->payload.has_value());

    auto parsed = AuthPayload::fromJson(*back->payload);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->token, auth.token);
    EXPECT_EQ(parsed->deviceName, "iPhone");
}

TEST(MessageSerializerTest, FrameSizeNeedsFullHeader) {
    auto data = MessageSerializer::serialize(PairingMessage(MessageType::Pong));

    EXPECT_EQ(MessageSerializer::getFrameSize(data.data(), 4), 0u);
    EXPECT_EQ(MessageSerializer::getFrameSize(data.data(), 7), 0u);
    EXPECT_EQ(MessageSerializer::getFrameSize(data.data(), 8), data.size());
    EXPECT_EQ(MessageSerializer::getFrameSize(data.data(), data.size()), data.size());
}

TEST(MessageSerializerTest, PartialFrameNotDeserialized) {
    auto data = MessageSerializer::serialize(PairingMessage(MessageType::Ping));
    EXPECT_FALSE(MessageSerializer::deserialize(data.data(), data.size() - 1).has_value());
}

TEST(MessageSerializerTest, TwoFramesInOneBuffer) {
    auto a = MessageSerializer::serialize(PairingMessage(MessageType::Ping));
    auto b = MessageSerializer::serialize(PairingMessage(MessageType::Disconnect));
    std::vector<uint8_t> buffer(a);
    buffer.insert(buffer.end(), b.begin(), b.end());

    size_t first = MessageSerializer::getFrameSize(buffer.data(), buffer.size());
    ASSERT_EQ(first, a.size());
    auto m1 = MessageSerializer::deserialize(buffer.data(), first);
    ASSERT_TRUE(m1.has_value());
    EXPECT_EQ(m1->type, MessageType::Ping);

    size_t second = MessageSerializer::getFrameSize(buffer.data() + first, buffer.size() - first);
    ASSERT_EQ(second, b.size());
    auto m2 = MessageSerializer::deserialize(buffer.data() + first, second);
    ASSERT_TRUE(m2.has_value());
    EXPECT_EQ(m2->type, MessageType::Disconnect);
}

TEST(MessageSerializerTest, CorruptHeaders) {
    auto badMagic = rawFrame(0xDEADBEEF, 10, "{}");
    EXPECT_TRUE(MessageSerializer::isHeaderCorrupt(badMagic.data(), badMagic.size()));
    EXPECT_EQ(MessageSerializer::getFrameSize(badMagic.data(), badMagic.size()), 0u);

    // Magic виден уже по первым 4 байтам
    EXPECT_TRUE(MessageSerializer::isHeaderCorrupt(badMagic.data(), 4));

    auto tooBig = rawFrame(PROTOCOL_MAGIC, static_cast<uint32_t>(MAX_FRAME_SIZE + 1), "");
    EXPECT_TRUE(MessageSerializer::isHeaderCorrupt(tooBig.data(), tooBig.size()));

    auto tooSmall = rawFrame(PROTOCOL_MAGIC, 4, "");
    EXPECT_TRUE(MessageSerializer::isHeaderCorrupt(tooSmall.data(), tooSmall.size()));

    auto fine = MessageSerializer::serialize(PairingMessage(MessageType::Ping));
    EXPECT_FALSE(MessageSerializer::isHeaderCorrupt(fine.data(), fine.size()));
    EXPECT_FALSE(MessageSerializer::isHeaderCorrupt(fine.data(), 2));
}

TEST(MessageSerializerTest, WellFramedGarbageIsNotAMessage) {
    std::string body = "this is not json";
    auto data = rawFrame(PROTOCOL_MAGIC, static_cast<uint32_t>(FRAME_HEADER_SIZE + body.size()), body);

    EXPECT_FALSE(MessageSerializer::isHeaderCorrupt(data.data(), data.size()));
    EXPECT_EQ(MessageSerializer::getFrameSize(data.data(), data.size()), data.size());
    EXPECT_FALSE(MessageSerializer::deserialize(data).has_value());
}

TEST(MessageSerializerTest, OversizedPayloadNotFramed) {
    std::string big(MAX_FRAME_SIZE, 'x');
    EXPECT_TRUE(MessageSerializer::frame(big).empty());
}

// ═══════════════════════════════════════════════════════════
// PairingMessage envelope
// ═══════════════════════════════════════════════════════════

TEST(PairingMessageTest, UnknownTypeRejected) {
    EXPECT_FALSE(PairingMessage::fromJson(R"({"type":"hello","timestamp":"2024-01-01T00:00:00Z"})").has_value());
    EXPECT_FALSE(PairingMessage::fromJson(R"({"timestamp":"2024-01-01T00:00:00Z"})").has_value());
    EXPECT_FALSE(PairingMessage::fromJson("[]").has_value());
}

TEST(PairingMessageTest, MissingTimestampTolerated) {
    auto msg = PairingMessage::fromJson(R"({"type":"ping"})");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->type, MessageType::Ping);
}

TEST(PairingMessageTest, PayloadOnlyForAuthAndSnapshot) {
    PairingMessage pong(MessageType::Pong, R"({"ignored":true})");
    auto j = json::parse(pong.toJson());
    EXPECT_FALSE(j.contains("payload"));

    auto parsed = PairingMessage::fromJson(R"({"type":"ping","payload":{"x":1}})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->payload.has_value());
}

TEST(PairingMessageTest, InvalidPayloadNotSerialized) {
    PairingMessage msg(MessageType::Snapshot, "{not json");
    EXPECT_EQ(msg.toJson(), "");
    EXPECT_TRUE(MessageSerializer::serialize(msg).empty());
}

TEST(PairingMessageTest, TimestampSurvivesAtMillisecondPrecision) {
    PairingMessage msg(MessageType::Ping);
    msg.timestamp = Timestamp(std::chrono::milliseconds(1717171717171LL));

    auto back = PairingMessage::fromJson(msg.toJson());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->timestamp, msg.timestamp);
}

// ═══════════════════════════════════════════════════════════
// Payloads
// ═══════════════════════════════════════════════════════════

TEST(AuthPayloadTest, RequiresTokenAndDeviceName) {
    EXPECT_FALSE(AuthPayload::fromJson(R"({"deviceName":"x"})").has_value());
    EXPECT_FALSE(AuthPayload::fromJson(R"({"token":"abc"})").has_value());
    EXPECT_FALSE(AuthPayload::fromJson(R"({"token":"","deviceName":"x"})").has_value());
    EXPECT_FALSE(AuthPayload::fromJson(R"({"token":5,"deviceName":"x"})").has_value());
    EXPECT_TRUE(AuthPayload::fromJson(R"({"token":"abc","deviceName":""})").has_value());
}

TEST(QRPayloadTest, ExpiryHelpers) {
    auto now = SystemClock::now();
    PairingQRPayload qr;
    qr.expiresAt = now + std::chrono::seconds(30);

    EXPECT_FALSE(qr.isExpired(now));
    EXPECT_EQ(qr.secondsRemaining(now), 30);
    EXPECT_TRUE(qr.isExpired(now + std::chrono::seconds(30)));
    EXPECT_LT(qr.secondsRemaining(now + std::chrono::seconds(40)), 0);
}

TEST(QRPayloadTest, RejectsIncompletePayload) {
    EXPECT_FALSE(PairingQRPayload::fromJson("garbage").has_value());
    EXPECT_FALSE(PairingQRPayload::fromJson(R"({"host":"10.0.0.2","port":1234})").has_value());
    EXPECT_FALSE(PairingQRPayload::fromJson(
        R"({"host":"10.0.0.2","port":1234,"token":"t","expiresAt":"soon"})").has_value());
    EXPECT_FALSE(PairingQRPayload::fromJson(
        R"({"host":"10.0.0.2","port":70000,"token":"t","expiresAt":"2030-01-01T00:00:00Z"})").has_value());
}

TEST(QRPayloadTest, RejectsPortThatDoesNotFitUint16) {
    for (const char* port : {"70000", "65536", "-1", "-65535", "443.5", "\"443\""}) {
        std::string wire = std::string(R"({"host":"10.0.0.2","port":)") + port +
                           R"(,"token":"t","expiresAt":"2030-01-01T00:00:00Z"})";
        EXPECT_FALSE(PairingQRPayload::fromJson(wire).has_value()) << port;
    }

    auto edge = PairingQRPayload::fromJson(
        R"({"host":"10.0.0.2","port":65535,"token":"t","expiresAt":"2030-01-01T00:00:00Z"})");
    ASSERT_TRUE(edge.has_value());
    EXPECT_EQ(edge->port, 65535);
}
