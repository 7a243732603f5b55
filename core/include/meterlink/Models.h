#pragma once

#include "export.h"
#include "Types.h"
#include <string>
#include <optional>
#include <cstdint>

namespace MeterLink {

// ═══════════════════════════════════════════════════════════
// Подключённое устройство (для UI)
// ═══════════════════════════════════════════════════════════

struct ConnectedDevice {
    std::string id;              // = ID соединения
    std::string name;            // Имя, присланное клиентом в auth
    std::string address;         // ip:port пира
    Timestamp connectedAt{};     // Момент успешной аутентификации

    ML_API std::string toJson() const;
    ML_API static std::optional<ConnectedDevice> fromJson(const std::string& json);
};

// ═══════════════════════════════════════════════════════════
// Usage — окна лимитов
// ═══════════════════════════════════════════════════════════

enum class UsageWindowType : int32_t {
    Session = 0,  // 5 часов (five_hour)
    Opus = 1,     // 7 дней, общий недельный лимит (seven_day)
    Sonnet = 2    // 7 дней, отдельный лимит Sonnet (seven_day_sonnet)
};

ML_API const char* usageWindowTypeToString(UsageWindowType type);
ML_API std::optional<UsageWindowType> usageWindowTypeFromString(const std::string& str);

/// Полная длительность окна
ML_API std::chrono::seconds usageWindowDuration(UsageWindowType type);

enum class UsageStatus : int32_t {
    OnTrack = 0,
    Warning = 1,
    Critical = 2
};

ML_API const char* usageStatusToString(UsageStatus status);

struct UsageWindow {
    double utilization = 0.0;    // Проценты 0-100 (не доля!)
    Timestamp resetsAt{};
    UsageWindowType windowType = UsageWindowType::Session;

    int percentUsed() const { return static_cast<int>(utilization); }
    bool isAtLimit() const { return utilization >= 100.0; }

    /// 0..1, для прогресс-баров
    ML_API double normalized() const;

    /// Статус по абсолютному использованию и темпу расхода
    ML_API UsageStatus status(Timestamp now = SystemClock::now()) const;

    bool operator==(const UsageWindow& other) const {
        return utilization == other.utilization &&
               resetsAt == other.resetsAt &&
               windowType == other.windowType;
    }
};

// ═══════════════════════════════════════════════════════════
// UsageSnapshot — то, что рассылается пирам
// ═══════════════════════════════════════════════════════════

struct UsageSnapshot {
    UsageWindow session;
    UsageWindow opus;                    // Недельный лимит по умолчанию
    std::optional<UsageWindow> sonnet;   // Если API его возвращает
    Timestamp fetchedAt{};

    /// Худший статус среди session, opus и sonnet (если есть)
    ML_API UsageStatus overallStatus(Timestamp now = SystemClock::now()) const;

    ML_API std::string toJson() const;
    ML_API static std::optional<UsageSnapshot> fromJson(const std::string& json);

    bool operator==(const UsageSnapshot& other) const {
        return session == other.session && opus == other.opus &&
               sonnet == other.sonnet && fetchedAt == other.fetchedAt;
    }
};

} // namespace MeterLink
