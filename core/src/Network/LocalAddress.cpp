// LocalAddress.cpp — перечисление интерфейсов и имя хоста

#include "meterlink/Network/LocalAddress.h"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdint>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #include <iphlpapi.h>
    #pragma comment(lib, "iphlpapi.lib")
#else
    #include <arpa/inet.h>
    #include <ifaddrs.h>
    #include <net/if.h>
    #include <netinet/in.h>
    #include <unistd.h>
#endif

namespace MeterLink {

namespace {
constexpr const char* LOOPBACK_ADDRESS = "127.0.0.1";
}

bool isPrivateIPv4(const std::string& address) {
    in_addr addr{};
    if (inet_pton(AF_INET, address.c_str(), &addr) != 1) {
        return false;
    }
    uint32_t ip = ntohl(addr.s_addr);
    return (ip & 0xFFFF0000u) == 0xC0A80000u ||   // 192.168.0.0/16
           (ip & 0xFF000000u) == 0x0A000000u ||   // 10.0.0.0/8
           (ip & 0xFFF00000u) == 0xAC100000u;     // 172.16.0.0/12
}

std::string pickPreferredAddress(const std::vector<std::string>& addresses) {
    for (const auto& ip : addresses) {
        if (isPrivateIPv4(ip)) {
            return ip;
        }
    }
    if (!addresses.empty()) {
        return addresses.front();
    }
    return LOOPBACK_ADDRESS;
}

std::vector<std::string> InterfaceAddressResolver::getLocalIpAddresses() {
    std::vector<std::string> addresses;

#ifdef _WIN32
    ULONG bufferSize = 15000;
    std::vector<uint8_t> buffer(bufferSize);
    auto* adapters = reinterpret_cast<IP_ADAPTER_ADDRESSES*>(buffer.data());

    ULONG result = GetAdaptersAddresses(AF_INET,
        GAA_FLAG_SKIP_DNS_SERVER | GAA_FLAG_SKIP_MULTICAST,
        nullptr, adapters, &bufferSize);
    if (result == ERROR_BUFFER_OVERFLOW) {
        buffer.resize(bufferSize);
        adapters = reinterpret_cast<IP_ADAPTER_ADDRESSES*>(buffer.data());
        result = GetAdaptersAddresses(AF_INET,
            GAA_FLAG_SKIP_DNS_SERVER | GAA_FLAG_SKIP_MULTICAST,
            nullptr, adapters, &bufferSize);
    }

    if (result == NO_ERROR) {
        for (auto* adapter = adapters; adapter; adapter = adapter->Next) {
            if (adapter->OperStatus != IfOperStatusUp) continue;
            if (adapter->IfType == IF_TYPE_SOFTWARE_LOOPBACK) continue;

            for (auto* addr = adapter->FirstUnicastAddress; addr; addr = addr->Next) {
                if (addr->Address.lpSockaddr->sa_family != AF_INET) continue;
                auto* sin = reinterpret_cast<sockaddr_in*>(addr->Address.lpSockaddr);
                char ip[INET_ADDRSTRLEN];
                inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip));
                addresses.push_back(ip);
            }
        }
    } else {
        spdlog::warn("LocalAddress: GetAdaptersAddresses failed: {}", result);
    }
#else
    struct ifaddrs* ifap = nullptr;
    if (getifaddrs(&ifap) != 0) {
        spdlog::warn("LocalAddress: getifaddrs failed: {}", errno);
        return addresses;
    }

    for (auto* ifa = ifap; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr) continue;
        if (ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;

        auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
        char ip[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip))) {
            addresses.push_back(ip);
        }
    }
    freeifaddrs(ifap);
#endif

    return addresses;
}

std::string InterfaceAddressResolver::resolve() {
    auto address = pickPreferredAddress(getLocalIpAddresses());
    if (address == LOOPBACK_ADDRESS) {
        spdlog::warn("LocalAddress: No LAN interface found, falling back to {}", address);
    }
    return address;
}

std::string getDefaultMachineName() {
#ifdef _WIN32
    char computerName[256];
    DWORD size = sizeof(computerName);
    if (GetComputerNameA(computerName, &size)) {
        return std::string(computerName);
    }
    return "Windows PC";
#else
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) == 0) {
        hostname[sizeof(hostname) - 1] = '\0';
        return std::string(hostname);
    }
    return "Desktop";
#endif
}

} // namespace MeterLink
