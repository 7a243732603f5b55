// PairingClient.h — сторона телефона: подключение по QR и приём snapshot'ов

#pragma once

#include "../export.h"
#include "PairingProtocol.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace MeterLink {

class ML_API PairingClient {
public:
    enum class AuthResult {
        Success,       // authSuccess
        Rejected,      // authFailure: неверный, истёкший или использованный токен
        Timeout,       // Сервер не ответил
        NetworkError   // Соединение оборвалось
    };

    enum class JoinResult {
        Success,
        InvalidQRCode,     // QR не разобран
        Expired,           // Истёк до подключения (соединение не открывалось)
        ConnectionFailed,
        Rejected,
        Timeout
    };

    PairingClient();
    ~PairingClient();

    // Запрет копирования
    PairingClient(const PairingClient&) = delete;
    PairingClient& operator=(const PairingClient&) = delete;

    /// Открыть TCP соединение (IPv4/IPv6 литерал)
    bool connect(const std::string& host, uint16_t port, int timeoutMs = 5000);

    /// Отправить auth и дождаться ответа
    AuthResult authenticate(const std::string& token, const std::string& deviceName,
                            int timeoutMs = 5000);

    /// Разобрать QR, проверить срок, подключиться и аутентифицироваться
    JoinResult joinByQR(const std::string& qrJson, const std::string& deviceName,
                        int timeoutMs = 5000);

    /// Следующее сообщение от сервера. Битые envelope пропускаются.
    /// @return nullopt по таймауту или при закрытии соединения
    std::optional<PairingMessage> receive(int timeoutMs);

    /// Ждать, пока сервер закроет соединение (входящие сообщения отбрасываются)
    /// @return true если соединение закрыто до таймаута
    bool waitForClose(int timeoutMs);

    bool sendMessage(const PairingMessage& msg);
    bool sendPing();

    /// Отправить байты как есть (без кадрирования)
    bool sendRaw(const std::vector<uint8_t>& data);

    /// Корректное закрытие: disconnect, затем close
    void disconnect();

    /// Закрыть сокет без уведомления сервера
    void close();

    /// Сокет открыт и сервер его не закрыл
    bool isConnected() const;

    std::string getLastError() const;

    static const char* authResultToString(AuthResult result);
    static const char* joinResultToString(JoinResult result);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace MeterLink
