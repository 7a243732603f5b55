// PairingServer.h — TCP сервер: QR pairing и рассылка snapshot'ов
// Аутентификация одноразовым токеном из QR, без TLS (только локальная сеть)

#pragma once

#include "../export.h"
#include "../Config.h"
#include "../Models.h"
#include "../Types.h"
#include "LocalAddress.h"
#include "PairingProtocol.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace MeterLink {

// ═══════════════════════════════════════════════════════════
// PairingServer — сторона компьютера
// ═══════════════════════════════════════════════════════════

class ML_API PairingServer {
public:
    /// @param config настройки (порт, таймауты, имя хоста)
    /// @param resolver источник адреса для QR; nullptr = InterfaceAddressResolver
    explicit PairingServer(PairingServerConfig config = PairingServerConfig{},
                           std::shared_ptr<AddressResolver> resolver = nullptr);
    ~PairingServer();

    // Запрет копирования
    PairingServer(const PairingServer&) = delete;
    PairingServer& operator=(const PairingServer&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════

    /// Начать приём соединений. Повторный вызов на работающем сервере -> true.
    /// Каждый start() начинается с пустых реестра и хранилища токенов.
    /// @return false при ошибке socket/bind/listen (см. getLastError)
    bool start();

    /// Закрыть listener и все соединения, очистить состояние. Идемпотентно.
    void stop();

    bool isRunning() const;

    /// Фактический порт (0 если не запущен)
    uint16_t getPort() const;

    const PairingServerConfig& config() const;

    // ═══════════════════════════════════════════════════════════
    // Credentials
    // ═══════════════════════════════════════════════════════════

    /// Выдать новый QR payload. Предыдущий токен отзывается.
    /// @return nullopt если сервер не запущен (ServerNotRunning)
    /// @throws std::runtime_error если нет источника случайности
    std::optional<PairingQRPayload> issuePairingCredential();

    /// Отозвать текущий токен, не дожидаясь истечения
    void invalidateCurrentCredential();

    /// Текущий payload для показа (сбрасывается после успешного auth)
    std::optional<PairingQRPayload> currentCredential() const;

    // ═══════════════════════════════════════════════════════════
    // Broadcast
    // ═══════════════════════════════════════════════════════════

    /// Разослать snapshot всем аутентифицированным пирам.
    /// Сериализуется один раз; неудачные отправки не повторяются.
    /// @return сколько пиров приняли кадр
    size_t broadcast(const UsageSnapshot& snapshot);

    /// То же для произвольного JSON (хост сам формирует snapshot)
    size_t broadcastJson(const std::string& snapshotJson);

    // ═══════════════════════════════════════════════════════════
    // Devices
    // ═══════════════════════════════════════════════════════════

    /// Отправить disconnect и закрыть соединение
    /// @return false если соединение не найдено
    bool disconnect(const std::string& deviceId);

    /// То же для всех соединений
    void disconnectAll();

    /// Аутентифицированные устройства (для UI)
    std::vector<ConnectedDevice> connectedDevices() const;

    /// Все открытые соединения, включая неаутентифицированные
    size_t connectionCount() const;

    // ═══════════════════════════════════════════════════════════
    // Errors
    // ═══════════════════════════════════════════════════════════

    PairingError getLastError() const;
    std::string getLastErrorMessage() const;

    // ═══════════════════════════════════════════════════════════
    // Callbacks (вызываются без удержания блокировок сервера)
    // ═══════════════════════════════════════════════════════════

    using DeviceCallback = std::function<void(const ConnectedDevice&)>;
    using RunningCallback = std::function<void(bool running)>;
    using ErrorCallback = std::function<void(PairingError, const std::string&)>;

    void onDeviceConnected(DeviceCallback callback);
    void onDeviceDisconnected(DeviceCallback callback);
    void onRunningChanged(RunningCallback callback);
    void onError(ErrorCallback callback);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace MeterLink
