// ConnectionRegistry.h — учёт соединений pairing сервера
// Только bookkeeping: id, множество аутентифицированных, метаданные устройств

#pragma once

#include "../export.h"
#include "../Models.h"
#include <mutex>
#include <optional>
#include <set>
#include <map>
#include <string>
#include <vector>

namespace MeterLink {

class ML_API ConnectionRegistry {
public:
    ConnectionRegistry() = default;

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /// Зарегистрировать новое (неаутентифицированное) соединение
    /// @return false если id уже зарегистрирован
    bool add(const std::string& id);

    /// Пометить соединение аутентифицированным.
    /// @return true только при первом переводе; неизвестный id -> false
    bool promote(const std::string& id);
    bool promote(const std::string& id, const ConnectedDevice& device);

    /// Удалить соединение (идемпотентно)
    /// @return устройство, если соединение было аутентифицировано
    std::optional<ConnectedDevice> remove(const std::string& id);

    std::vector<std::string> authenticatedIds() const;
    bool isAuthenticated(const std::string& id) const;
    bool contains(const std::string& id) const;

    /// Аутентифицированные устройства, по возрастанию connectedAt
    std::vector<ConnectedDevice> connectedDevices() const;

    size_t connectionCount() const;
    size_t authenticatedCount() const;

    void clear();

private:
    mutable std::mutex m_mutex;
    std::set<std::string> m_connections;
    std::set<std::string> m_authenticated;              // ⊆ m_connections
    std::map<std::string, ConnectedDevice> m_devices;   // ключи ⊆ m_authenticated
};

} // namespace MeterLink
