// PairingProtocol.cpp — envelope, кадрирование и payloads

#include "meterlink/Network/PairingProtocol.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstring>

namespace MeterLink {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// MessageType names
// ═══════════════════════════════════════════════════════════

const char* messageTypeName(MessageType type) {
    switch (type) {
        case MessageType::Auth: return "auth";
        case MessageType::AuthSuccess: return "authSuccess";
        case MessageType::AuthFailure: return "authFailure";
        case MessageType::Snapshot: return "snapshot";
        case MessageType::Ping: return "ping";
        case MessageType::Pong: return "pong";
        case MessageType::Disconnect: return "disconnect";
        default: return "unknown";
    }
}

std::optional<MessageType> messageTypeFromName(const std::string& name) {
    if (name == "auth") return MessageType::Auth;
    if (name == "authSuccess") return MessageType::AuthSuccess;
    if (name == "authFailure") return MessageType::AuthFailure;
    if (name == "snapshot") return MessageType::Snapshot;
    if (name == "ping") return MessageType::Ping;
    if (name == "pong") return MessageType::Pong;
    if (name == "disconnect") return MessageType::Disconnect;
    return std::nullopt;
}

bool messageTypeHasPayload(MessageType type) {
    return type == MessageType::Auth || type == MessageType::Snapshot;
}

// ═══════════════════════════════════════════════════════════
// PairingMessage
// ═══════════════════════════════════════════════════════════

std::string PairingMessage::toJson() const {
    json j = {
        {"type", messageTypeName(type)},
        {"timestamp", formatTimestamp(timestamp)}
    };

    if (payload && messageTypeHasPayload(type)) {
        try {
            j["payload"] = json::parse(*payload);
        } catch (const json::exception& e) {
            spdlog::error("Protocol: Payload for {} is not JSON: {}", messageTypeName(type), e.what());
            return "";
        }
    }

    return j.dump();
}

std::optional<PairingMessage> PairingMessage::fromJson(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);
        if (!j.is_object()) {
            return std::nullopt;
        }

        auto type = messageTypeFromName(j.at("type").get<std::string>());
        if (!type) {
            spdlog::debug("Protocol: Unknown message type '{}'", j["type"].dump());
            return std::nullopt;
        }

        PairingMessage msg(*type);

        // Timestamp is informational: tolerate a missing or odd value
        if (j.contains("timestamp") && j["timestamp"].is_string()) {
            if (auto ts = parseTimestamp(j["timestamp"].get<std::string>())) {
                msg.timestamp = *ts;
            }
        }

        if (messageTypeHasPayload(*type) && j.contains("payload") && !j["payload"].is_null()) {
            msg.payload = j["payload"].dump();
        }

        return msg;
    } catch (const json::exception& e) {
        spdlog::debug("Protocol: Failed to parse envelope: {}", e.what());
        return std::nullopt;
    }
}

// ═══════════════════════════════════════════════════════════
// MessageSerializer
// ═══════════════════════════════════════════════════════════

namespace {

uint32_t readBigEndian32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

void writeBigEndian32(uint8_t* p, uint32_t value) {
    p[0] = (value >> 24) & 0xFF;
    p[1] = (value >> 16) & 0xFF;
    p[2] = (value >> 8) & 0xFF;
    p[3] = value & 0xFF;
}

} // namespace

std::vector<uint8_t> MessageSerializer::serialize(const PairingMessage& msg) {
    auto body = msg.toJson();
    if (body.empty()) {
        return {};
    }
    return frame(body);
}

std::vector<uint8_t> MessageSerializer::frame(const std::string& body) {
    size_t totalSize = FRAME_HEADER_SIZE + body.size();
    if (totalSize > MAX_FRAME_SIZE) {
        spdlog::error("Protocol: Frame of {} bytes exceeds limit", totalSize);
        return {};
    }

    std::vector<uint8_t> result(totalSize);
    writeBigEndian32(result.data(), PROTOCOL_MAGIC);
    writeBigEndian32(result.data() + 4, static_cast<uint32_t>(totalSize));
    if (!body.empty()) {
        memcpy(result.data() + FRAME_HEADER_SIZE, body.data(), body.size());
    }
    return result;
}

std::optional<PairingMessage> MessageSerializer::deserialize(const uint8_t* data, size_t size) {
    if (size < FRAME_HEADER_SIZE) {
        return std::nullopt;
    }

    uint32_t magic = readBigEndian32(data);
    if (magic != PROTOCOL_MAGIC) {
        spdlog::debug("Protocol: Invalid magic 0x{:08X}", magic);
        return std::nullopt;
    }

    uint32_t len = readBigEndian32(data + 4);
    if (len < FRAME_HEADER_SIZE || len > MAX_FRAME_SIZE || len > size) {
        spdlog::debug("Protocol: Invalid length {}", len);
        return std::nullopt;
    }

    std::string body(reinterpret_cast<const char*>(data + FRAME_HEADER_SIZE),
                     len - FRAME_HEADER_SIZE);
    return PairingMessage::fromJson(body);
}

std::optional<PairingMessage> MessageSerializer::deserialize(const std::vector<uint8_t>& data) {
    return deserialize(data.data(), data.size());
}

size_t MessageSerializer::getFrameSize(const uint8_t* data, size_t available) {
    if (available < FRAME_HEADER_SIZE || isHeaderCorrupt(data, available)) {
        return 0;
    }
    return readBigEndian32(data + 4);
}

bool MessageSerializer::isHeaderCorrupt(const uint8_t* data, size_t available) {
    if (available >= 4 && readBigEndian32(data) != PROTOCOL_MAGIC) {
        return true;
    }
    if (available >= FRAME_HEADER_SIZE) {
        uint32_t len = readBigEndian32(data + 4);
        return len < FRAME_HEADER_SIZE || len > MAX_FRAME_SIZE;
    }
    return false;
}

// ═══════════════════════════════════════════════════════════
// AuthPayload
// ═══════════════════════════════════════════════════════════

std::string AuthPayload::toJson() const {
    json j = {
        {"token", token},
        {"deviceName", deviceName}
    };
    return j.dump();
}

std::optional<AuthPayload> AuthPayload::fromJson(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);
        AuthPayload p;
        p.token = j.at("token").get<std::string>();
        p.deviceName = j.at("deviceName").get<std::string>();
        if (p.token.empty()) {
            return std::nullopt;
        }
        return p;
    } catch (const json::exception& e) {
        spdlog::debug("Protocol: Malformed auth payload: {}", e.what());
        return std::nullopt;
    }
}

// ═══════════════════════════════════════════════════════════
// PairingQRPayload
// ═══════════════════════════════════════════════════════════

int64_t PairingQRPayload::secondsRemaining(Timestamp now) const {
    return std::chrono::duration_cast<std::chrono::seconds>(expiresAt - now).count();
}

std::string PairingQRPayload::toJson() const {
    json j = {
        {"host", host},
        {"port", port},
        {"token", token},
        {"expiresAt", formatTimestamp(expiresAt)},
        {"machineName", machineName}
    };
    return j.dump();
}

std::optional<PairingQRPayload> PairingQRPayload::fromJson(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);

        PairingQRPayload p;
        p.host = j.at("host").get<std::string>();
        const auto& port = j.at("port");
        if (!port.is_number_unsigned() || port.get<uint64_t>() > 65535) {
            spdlog::warn("PairingQRPayload::fromJson: Port out of range: {}", port.dump());
            return std::nullopt;
        }
        p.port = static_cast<uint16_t>(port.get<uint64_t>());
        p.token = j.at("token").get<std::string>();
        p.machineName = j.value("machineName", "");

        auto expires = parseTimestamp(j.at("expiresAt").get<std::string>());
        if (!expires || p.host.empty() || p.token.empty() || p.port == 0) {
            spdlog::warn("PairingQRPayload::fromJson: Missing or invalid fields");
            return std::nullopt;
        }
        p.expiresAt = *expires;
        return p;
    } catch (const json::exception& e) {
        spdlog::warn("PairingQRPayload::fromJson failed: {}", e.what());
        return std::nullopt;
    }
}

} // namespace MeterLink
