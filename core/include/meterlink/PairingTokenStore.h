// PairingTokenStore.h — одноразовые токены для QR pairing
// Хранилище не знает о транспорте: только выдача, проверка и отзыв

#pragma once

#include "export.h"
#include "Config.h"
#include "Types.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace MeterLink {

// ═══════════════════════════════════════════════════════════
// PairingToken
// ═══════════════════════════════════════════════════════════

struct PairingToken {
    std::string value;                                  // UUID v4, является секретом
    Timestamp expiresAt{};                              // Для QR и UI
    std::chrono::steady_clock::time_point deadline{};   // Для проверок (монотонные часы)
    bool consumed = false;

    bool isValid(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const {
        return !consumed && now < deadline;
    }
};

// ═══════════════════════════════════════════════════════════
// PairingTokenStore
// ═══════════════════════════════════════════════════════════

class ML_API PairingTokenStore {
public:
    explicit PairingTokenStore(
        std::chrono::milliseconds tokenLifetime = std::chrono::seconds(DEFAULT_TOKEN_LIFETIME_SEC),
        std::chrono::milliseconds purgeGrace = std::chrono::milliseconds(DEFAULT_PURGE_GRACE_MS));
    ~PairingTokenStore();

    // Запрет копирования
    PairingTokenStore(const PairingTokenStore&) = delete;
    PairingTokenStore& operator=(const PairingTokenStore&) = delete;

    /// Выдать новый токен. Попутно удаляет истёкшие и использованные.
    /// Токен удаляется автоматически через expiresAt + purgeGrace.
    /// @throws std::runtime_error если нет источника случайности
    PairingToken issue();

    /// Атомарно проверить и погасить токен.
    /// Единственный путь, которым токен становится consumed.
    /// @return true только для первого вызова с валидным токеном
    bool validateAndConsume(const std::string& value);

    /// Проверка без гашения. Только для UI, не для аутентификации!
    bool isValid(const std::string& value) const;

    /// Сколько осталось жить токену (nullopt если неизвестен)
    std::optional<std::chrono::milliseconds> timeRemaining(const std::string& value) const;

    /// Досрочно отозвать токен (отменяет отложенное удаление)
    void invalidate(const std::string& value);

    /// Отозвать все токены
    void invalidateAll();

    /// Количество записей (включая погашенные, но ещё не удалённые)
    size_t size() const;

    std::chrono::milliseconds tokenLifetime() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace MeterLink
