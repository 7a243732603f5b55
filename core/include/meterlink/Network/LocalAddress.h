// LocalAddress.h — адрес хоста для QR payload

#pragma once

#include "../export.h"
#include <string>
#include <vector>

namespace MeterLink {

/// Источник адреса, который телефон увидит в QR
class ML_API AddressResolver {
public:
    virtual ~AddressResolver() = default;

    /// IPv4/IPv6 литерал, по которому хост доступен в локальной сети
    virtual std::string resolve() = 0;
};

/// Перебирает интерфейсы (getifaddrs). Предпочитает приватные диапазоны,
/// иначе первый поднятый не-loopback адрес, иначе 127.0.0.1
class ML_API InterfaceAddressResolver : public AddressResolver {
public:
    std::string resolve() override;

    /// IPv4 адреса поднятых не-loopback интерфейсов
    static std::vector<std::string> getLocalIpAddresses();
};

/// Фиксированный адрес (тесты, явная настройка)
class ML_API StaticAddressResolver : public AddressResolver {
public:
    explicit StaticAddressResolver(std::string address) : m_address(std::move(address)) {}

    std::string resolve() override { return m_address; }

private:
    std::string m_address;
};

/// 192.168/16, 10/8, 172.16/12
ML_API bool isPrivateIPv4(const std::string& address);

/// Выбрать лучший адрес из списка (правило InterfaceAddressResolver)
ML_API std::string pickPreferredAddress(const std::vector<std::string>& addresses);

/// Имя компьютера для UI телефона
ML_API std::string getDefaultMachineName();

} // namespace MeterLink
