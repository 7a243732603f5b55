// Config.h — Настройки pairing сервера

#pragma once

#include "export.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace MeterLink {

// ═══════════════════════════════════════════════════════════
// Константы
// ═══════════════════════════════════════════════════════════

constexpr uint32_t PROTOCOL_MAGIC = 0x4D4C4E4B;           // "MLNK" in big-endian
constexpr size_t FRAME_HEADER_SIZE = 8;                    // Magic(4) + Length(4)
constexpr size_t MAX_FRAME_SIZE = 1024 * 1024;             // 1 MB max
constexpr int DEFAULT_TOKEN_LIFETIME_SEC = 60;             // Время жизни QR токена
constexpr int DEFAULT_PURGE_GRACE_MS = 1000;               // Удаление через expiresAt + 1s
constexpr int DEFAULT_AUTH_FAILURE_GRACE_MS = 100;         // Дать authFailure уйти до закрытия
constexpr int DEFAULT_SEND_TIMEOUT_MS = 2000;
constexpr int DEFAULT_LISTEN_BACKLOG = 8;
constexpr int64_t MAX_DURATION_MS = 24LL * 60 * 60 * 1000;       // Верхняя граница любого интервала

// ═══════════════════════════════════════════════════════════
// PairingServerConfig
// ═══════════════════════════════════════════════════════════

struct PairingServerConfig {
    uint16_t port = 0;                           // 0 = эфемерный порт
    std::string bindAddress = "0.0.0.0";
    std::chrono::milliseconds tokenLifetime{DEFAULT_TOKEN_LIFETIME_SEC * 1000};
    std::chrono::milliseconds purgeGrace{DEFAULT_PURGE_GRACE_MS};
    std::chrono::milliseconds authFailureGrace{DEFAULT_AUTH_FAILURE_GRACE_MS};
    std::chrono::milliseconds sendTimeout{DEFAULT_SEND_TIMEOUT_MS};

    /// Закрывать соединение без входящего трафика дольше idleTimeout.
    /// 0 = выключено (пир живёт, пока транспорт не сообщит об ошибке)
    std::chrono::milliseconds idleTimeout{0};

    int listenBacklog = DEFAULT_LISTEN_BACKLOG;

    /// Имя, показываемое на телефоне. Пусто = hostname
    std::string hostDisplayName;

    /// Проверить значения. Интервалы ограничены MAX_DURATION_MS
    ML_API bool isValid() const;

    ML_API std::string toJson() const;

    /// Неизвестные ключи игнорируются, отсутствующие берутся по умолчанию
    /// @return nullopt при ошибке парсинга или недопустимых значениях
    ML_API static std::optional<PairingServerConfig> fromJson(const std::string& json);
};

} // namespace MeterLink
