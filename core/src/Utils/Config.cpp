#include "meterlink/Config.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace MeterLink {

using json = nlohmann::json;

namespace {

bool withinLimit(std::chrono::milliseconds d) {
    return d.count() <= MAX_DURATION_MS;
}

} // namespace

bool PairingServerConfig::isValid() const {
    if (tokenLifetime.count() <= 0) return false;
    if (purgeGrace.count() < 0) return false;
    if (authFailureGrace.count() < 0) return false;
    if (sendTimeout.count() <= 0) return false;
    if (idleTimeout.count() < 0) return false;
    if (!withinLimit(tokenLifetime) || !withinLimit(purgeGrace) || !withinLimit(authFailureGrace) ||
        !withinLimit(sendTimeout) || !withinLimit(idleTimeout)) {
        return false;
    }
    if (listenBacklog <= 0) return false;
    if (bindAddress.empty()) return false;
    return true;
}

std::string PairingServerConfig::toJson() const {
    json j = {
        {"port", port},
        {"bindAddress", bindAddress},
        {"tokenLifetimeMs", tokenLifetime.count()},
        {"purgeGraceMs", purgeGrace.count()},
        {"authFailureGraceMs", authFailureGrace.count()},
        {"sendTimeoutMs", sendTimeout.count()},
        {"idleTimeoutMs", idleTimeout.count()},
        {"listenBacklog", listenBacklog},
        {"hostDisplayName", hostDisplayName}
    };
    return j.dump();
}

std::optional<PairingServerConfig> PairingServerConfig::fromJson(const std::string& jsonStr) {
    PairingServerConfig c;
    try {
        auto j = json::parse(jsonStr);
        if (!j.is_object()) {
            return std::nullopt;
        }

        if (j.contains("port")) {
            // get<uint16_t>() молча обрезает 70000 и -1
            const auto& port = j.at("port");
            if (!port.is_number_unsigned() || port.get<uint64_t>() > 65535) {
                spdlog::warn("PairingServerConfig: Port out of range: {}", port.dump());
                return std::nullopt;
            }
            c.port = static_cast<uint16_t>(port.get<uint64_t>());
        }
        c.bindAddress = j.value("bindAddress", c.bindAddress);
        c.tokenLifetime = std::chrono::milliseconds(
            j.value("tokenLifetimeMs", static_cast<int64_t>(c.tokenLifetime.count())));
        c.purgeGrace = std::chrono::milliseconds(
            j.value("purgeGraceMs", static_cast<int64_t>(c.purgeGrace.count())));
        c.authFailureGrace = std::chrono::milliseconds(
            j.value("authFailureGraceMs", static_cast<int64_t>(c.authFailureGrace.count())));
        c.sendTimeout = std::chrono::milliseconds(
            j.value("sendTimeoutMs", static_cast<int64_t>(c.sendTimeout.count())));
        c.idleTimeout = std::chrono::milliseconds(
            j.value("idleTimeoutMs", static_cast<int64_t>(c.idleTimeout.count())));
        c.listenBacklog = j.value("listenBacklog", c.listenBacklog);
        c.hostDisplayName = j.value("hostDisplayName", c.hostDisplayName);
    } catch (const json::exception& e) {
        spdlog::warn("PairingServerConfig: Failed to parse config: {}", e.what());
        return std::nullopt;
    }

    if (!c.isValid()) {
        spdlog::warn("PairingServerConfig: Rejected invalid config");
        return std::nullopt;
    }
    return c;
}

} // namespace MeterLink
