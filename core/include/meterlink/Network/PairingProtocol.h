// PairingProtocol.h — сообщения pairing протокола (JSON envelope)
// Кадр: [Magic:4][Length:4][UTF-8 JSON]

#pragma once

#include "../export.h"
#include "../Config.h"
#include "../Types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace MeterLink {

// ═══════════════════════════════════════════════════════════
// MessageType — типы сообщений
// ═══════════════════════════════════════════════════════════

enum class MessageType : uint8_t {
    Auth = 0,          // Клиент присылает токен из QR
    AuthSuccess = 1,   // Токен принят
    AuthFailure = 2,   // Неверный, истёкший или уже использованный токен
    Snapshot = 3,      // Сервер рассылает UsageSnapshot
    Ping = 4,          // Keepalive
    Pong = 5,
    Disconnect = 6     // Корректное закрытие
};

/// Имя типа на проводе ("auth", "authSuccess", ...)
ML_API const char* messageTypeName(MessageType type);
ML_API std::optional<MessageType> messageTypeFromName(const std::string& name);

/// Несут ли сообщения этого типа payload
ML_API bool messageTypeHasPayload(MessageType type);

// ═══════════════════════════════════════════════════════════
// PairingMessage — envelope
// ═══════════════════════════════════════════════════════════

struct ML_API PairingMessage {
    MessageType type;
    std::optional<std::string> payload;  // Вложенный JSON (только auth и snapshot)
    Timestamp timestamp;                 // Информационное поле, порядок не определяет

    PairingMessage() : type(MessageType::Ping), timestamp(SystemClock::now()) {}
    explicit PairingMessage(MessageType t) : type(t), timestamp(SystemClock::now()) {}
    PairingMessage(MessageType t, std::string jsonPayload)
        : type(t), payload(std::move(jsonPayload)), timestamp(SystemClock::now()) {}

    /// Сериализовать envelope. Payload у типов без payload отбрасывается.
    /// @return пустая строка, если payload не является JSON
    std::string toJson() const;

    /// Разобрать envelope. Неизвестный тип или битый JSON -> nullopt
    static std::optional<PairingMessage> fromJson(const std::string& json);
};

// ═══════════════════════════════════════════════════════════
// MessageSerializer — кадрирование поверх TCP
// ═══════════════════════════════════════════════════════════

class ML_API MessageSerializer {
public:
    /// Сериализовать сообщение в кадр
    /// @return пустой вектор, если сообщение не сериализуется
    static std::vector<uint8_t> serialize(const PairingMessage& msg);

    /// Обернуть готовый JSON в кадр (для broadcast: сериализация один раз)
    static std::vector<uint8_t> frame(const std::string& json);

    /// Разобрать полный кадр
    /// @return PairingMessage или nullopt если заголовок или JSON невалидны
    static std::optional<PairingMessage> deserialize(const uint8_t* data, size_t size);
    static std::optional<PairingMessage> deserialize(const std::vector<uint8_t>& data);

    /// Проверить, есть ли полный кадр в буфере
    /// @return размер кадра или 0 если данных недостаточно (или заголовок невалиден)
    static size_t getFrameSize(const uint8_t* data, size_t available);

    /// Заголовок повреждён: неверный magic или недопустимая длина.
    /// После этого поток байт не синхронизировать, соединение закрывается.
    static bool isHeaderCorrupt(const uint8_t* data, size_t available);
};

// ═══════════════════════════════════════════════════════════
// Payloads
// ═══════════════════════════════════════════════════════════

/// auth payload
struct ML_API AuthPayload {
    std::string token;
    std::string deviceName;

    std::string toJson() const;
    static std::optional<AuthPayload> fromJson(const std::string& json);
};

/// Данные QR-кода (сканируются, по сокету не передаются)
struct ML_API PairingQRPayload {
    std::string host;            // IPv4/IPv6 литерал
    uint16_t port = 0;
    std::string token;           // Одноразовый токен (UUID)
    Timestamp expiresAt{};
    std::string machineName;     // Имя компьютера для UI

    bool isExpired(Timestamp now = SystemClock::now()) const { return now >= expiresAt; }

    /// Секунд до истечения (может быть отрицательным)
    int64_t secondsRemaining(Timestamp now = SystemClock::now()) const;

    std::string toJson() const;
    static std::optional<PairingQRPayload> fromJson(const std::string& json);
};

} // namespace MeterLink
