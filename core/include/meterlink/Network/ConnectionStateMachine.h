// ConnectionStateMachine.h — переходы состояний соединения
// Чистая функция: без сокетов, без блокировок. Сервер исполняет эффекты по порядку.

#pragma once

#include "../export.h"
#include "../Types.h"
#include <cstdint>
#include <vector>

namespace MeterLink {

/// Что произошло с соединением
enum class ConnectionEvent : uint8_t {
    Accepted,            // Транспорт принят
    AuthRequested,       // Пришёл auth с разборчивым payload
    AuthMalformed,       // auth без token/deviceName
    TokenAccepted,       // validateAndConsume == true
    TokenRejected,       // validateAndConsume == false
    PingReceived,
    DisconnectReceived,  // Пир попросил закрыть
    UnexpectedMessage,   // Любой тип, не допустимый в текущем состоянии
    TransportClosed,     // EOF или ошибка сокета
    LocalDisconnect,     // Хост вызвал disconnect()
    IdleTimeout          // Нет входящего трафика дольше idleTimeout
};

/// Что серверу нужно сделать
enum class ConnectionEffect : uint8_t {
    Register,
    ValidateToken,
    Promote,
    SendAuthSuccess,
    InvalidateCredential,  // Сбросить QR, привязанный к погашенному токену
    SendAuthFailure,
    CloseAfterGrace,       // Дать authFailure уйти, затем закрыть
    SendPong,
    SendDisconnect,
    CloseTransport,
    Deregister
};

ML_API const char* connectionEventToString(ConnectionEvent event);
ML_API const char* connectionEffectToString(ConnectionEffect effect);

struct Transition {
    ConnectionState state;
    std::vector<ConnectionEffect> effects;

    bool has(ConnectionEffect effect) const {
        for (auto e : effects) {
            if (e == effect) return true;
        }
        return false;
    }
};

class ML_API ConnectionStateMachine {
public:
    /// Следующее состояние и эффекты.
    /// Из Authenticated нет пути назад в Authenticating; Closed поглощает всё.
    static Transition next(ConnectionState state, ConnectionEvent event);
};

} // namespace MeterLink
