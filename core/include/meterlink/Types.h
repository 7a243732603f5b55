#pragma once

#include "export.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace MeterLink {

using SystemClock = std::chrono::system_clock;
using Timestamp = SystemClock::time_point;

// ═══════════════════════════════════════════════════════════
// Состояние соединения с пиром (серверная сторона)
// ═══════════════════════════════════════════════════════════

enum class ConnectionState : int32_t {
    Connecting = 0,      // Принято, сообщений ещё не было
    Authenticating = 1,  // Получено первое сообщение, ждём auth
    Authenticated = 2,   // Токен принят, получает snapshot'ы
    Closed = 3           // Терминальное состояние
};

ML_API const char* connectionStateToString(ConnectionState state);

// ═══════════════════════════════════════════════════════════
// Ошибки уровня сервера (видны хост-приложению)
// ═══════════════════════════════════════════════════════════

enum class PairingError : int32_t {
    None = 0,
    ServerNotRunning = 1,
    BindFailed = 2,
    ListenFailed = 3,
    SocketFailed = 4,
    InvalidConfig = 5
};

ML_API const char* pairingErrorToString(PairingError error);

// ═══════════════════════════════════════════════════════════
// ISO-8601 timestamps (UTC)
// ═══════════════════════════════════════════════════════════

/// Формат: YYYY-MM-DDTHH:MM:SS.mmmZ
ML_API std::string formatTimestamp(Timestamp ts);

/// Принимает "YYYY-MM-DDTHH:MM:SS[.fff][Z|+00:00]"
/// @return nullopt если строка не распознана
ML_API std::optional<Timestamp> parseTimestamp(const std::string& str);

} // namespace MeterLink
