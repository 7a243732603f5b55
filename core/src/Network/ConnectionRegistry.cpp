// ConnectionRegistry.cpp

#include "meterlink/Network/ConnectionRegistry.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace MeterLink {

bool ConnectionRegistry::add(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connections.insert(id).second;
}

bool ConnectionRegistry::promote(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_connections.count(id) == 0) {
        spdlog::debug("ConnectionRegistry: promote for unknown connection {}", id);
        return false;
    }
    return m_authenticated.insert(id).second;
}

bool ConnectionRegistry::promote(const std::string& id, const ConnectedDevice& device) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_connections.count(id) == 0) {
        spdlog::debug("ConnectionRegistry: promote for unknown connection {}", id);
        return false;
    }
    if (!m_authenticated.insert(id).second) {
        return false;
    }
    m_devices[id] = device;
    return true;
}

std::optional<ConnectedDevice> ConnectionRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_connections.erase(id);
    m_authenticated.erase(id);

    auto it = m_devices.find(id);
    if (it == m_devices.end()) {
        return std::nullopt;
    }
    ConnectedDevice device = std::move(it->second);
    m_devices.erase(it);
    return device;
}

std::vector<std::string> ConnectionRegistry::authenticatedIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_authenticated.begin(), m_authenticated.end()};
}

bool ConnectionRegistry::isAuthenticated(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_authenticated.count(id) > 0;
}

bool ConnectionRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connections.count(id) > 0;
}

std::vector<ConnectedDevice> ConnectionRegistry::connectedDevices() const {
    std::vector<ConnectedDevice> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        result.reserve(m_devices.size());
        for (const auto& [id, device] : m_devices) {
            result.push_back(device);
        }
    }

    std::stable_sort(result.begin(), result.end(),
        [](const ConnectedDevice& a, const ConnectedDevice& b) {
            return a.connectedAt < b.connectedAt;
        });
    return result;
}

size_t ConnectionRegistry::connectionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connections.size();
}

size_t ConnectionRegistry::authenticatedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_authenticated.size();
}

void ConnectionRegistry::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_connections.clear();
    m_authenticated.clear();
    m_devices.clear();
}

} // namespace MeterLink
