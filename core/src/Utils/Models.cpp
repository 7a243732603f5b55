// Models.cpp — JSON для моделей и расчёт статуса использования

#include "meterlink/Models.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace MeterLink {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// ConnectedDevice
// ═══════════════════════════════════════════════════════════

std::string ConnectedDevice::toJson() const {
    json j = {
        {"id", id},
        {"name", name},
        {"address", address},
        {"connectedAt", formatTimestamp(connectedAt)}
    };
    return j.dump();
}

std::optional<ConnectedDevice> ConnectedDevice::fromJson(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);
        ConnectedDevice d;
        d.id = j.at("id").get<std::string>();
        d.name = j.value("name", "");
        d.address = j.value("address", "");
        auto ts = parseTimestamp(j.value("connectedAt", ""));
        if (!ts) return std::nullopt;
        d.connectedAt = *ts;
        return d;
    } catch (const json::exception& e) {
        spdlog::debug("ConnectedDevice::fromJson failed: {}", e.what());
        return std::nullopt;
    }
}

// ═══════════════════════════════════════════════════════════
// UsageWindowType / UsageStatus
// ═══════════════════════════════════════════════════════════

const char* usageWindowTypeToString(UsageWindowType type) {
    switch (type) {
        case UsageWindowType::Session: return "session";
        case UsageWindowType::Opus:    return "opus";
        case UsageWindowType::Sonnet:  return "sonnet";
        default:                       return "session";
    }
}

std::optional<UsageWindowType> usageWindowTypeFromString(const std::string& str) {
    if (str == "session") return UsageWindowType::Session;
    if (str == "opus")    return UsageWindowType::Opus;
    if (str == "sonnet")  return UsageWindowType::Sonnet;
    return std::nullopt;
}

std::chrono::seconds usageWindowDuration(UsageWindowType type) {
    switch (type) {
        case UsageWindowType::Session: return std::chrono::hours(5);
        case UsageWindowType::Opus:
        case UsageWindowType::Sonnet:
        default:                       return std::chrono::hours(7 * 24);
    }
}

const char* usageStatusToString(UsageStatus status) {
    switch (status) {
        case UsageStatus::OnTrack:  return "onTrack";
        case UsageStatus::Warning:  return "warning";
        case UsageStatus::Critical: return "critical";
        default:                    return "onTrack";
    }
}

// ═══════════════════════════════════════════════════════════
// UsageWindow
// ═══════════════════════════════════════════════════════════

double UsageWindow::normalized() const {
    return std::min(std::max(utilization / 100.0, 0.0), 1.0);
}

UsageStatus UsageWindow::status(Timestamp now) const {
    auto remaining = std::chrono::duration<double>(resetsAt - now).count();
    if (remaining <= 0) {
        return UsageStatus::OnTrack;
    }

    // Высокое абсолютное использование важнее темпа
    if (utilization >= 90.0) return UsageStatus::Critical;
    if (utilization >= 75.0) return UsageStatus::Warning;

    double total = std::chrono::duration<double>(usageWindowDuration(windowType)).count();
    double elapsedRatio = (total - remaining) / total;
    double expected = elapsedRatio * 100.0;
    double ahead = utilization - expected;

    if (ahead <= 10.0) return UsageStatus::OnTrack;
    if (ahead <= 25.0) return UsageStatus::Warning;
    return UsageStatus::Critical;
}

// ═══════════════════════════════════════════════════════════
// UsageSnapshot
// ═══════════════════════════════════════════════════════════

UsageStatus UsageSnapshot::overallStatus(Timestamp now) const {
    // Critical > Warning > OnTrack, порядок совпадает с int-значениями enum
    UsageStatus worst = std::max(session.status(now), opus.status(now));
    if (sonnet) {
        worst = std::max(worst, sonnet->status(now));
    }
    return worst;
}

static json windowToJson(const UsageWindow& w) {
    return {
        {"utilization", w.utilization},
        {"resetsAt", formatTimestamp(w.resetsAt)},
        {"windowType", usageWindowTypeToString(w.windowType)}
    };
}

static std::optional<UsageWindow> windowFromJson(const json& j) {
    if (!j.is_object()) return std::nullopt;

    auto resetsAt = parseTimestamp(j.value("resetsAt", ""));
    auto type = usageWindowTypeFromString(j.value("windowType", ""));
    if (!resetsAt || !type || !j.contains("utilization")) {
        return std::nullopt;
    }

    UsageWindow w;
    w.utilization = j.at("utilization").get<double>();
    w.resetsAt = *resetsAt;
    w.windowType = *type;
    return w;
}

std::string UsageSnapshot::toJson() const {
    json j = {
        {"session", windowToJson(session)},
        {"opus", windowToJson(opus)},
        {"fetchedAt", formatTimestamp(fetchedAt)}
    };
    if (sonnet) {
        j["sonnet"] = windowToJson(*sonnet);
    }
    return j.dump();
}

std::optional<UsageSnapshot> UsageSnapshot::fromJson(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);

        auto sessionWindow = windowFromJson(j.at("session"));
        auto opusWindow = windowFromJson(j.at("opus"));
        auto fetched = parseTimestamp(j.value("fetchedAt", ""));
        if (!sessionWindow || !opusWindow || !fetched) {
            return std::nullopt;
        }

        UsageSnapshot s;
        s.session = *sessionWindow;
        s.opus = *opusWindow;
        s.fetchedAt = *fetched;
        if (j.contains("sonnet") && !j["sonnet"].is_null()) {
            s.sonnet = windowFromJson(j["sonnet"]);
            if (!s.sonnet) return std::nullopt;
        }
        return s;
    } catch (const json::exception& e) {
        spdlog::debug("UsageSnapshot::fromJson failed: {}", e.what());
        return std::nullopt;
    }
}

} // namespace MeterLink
