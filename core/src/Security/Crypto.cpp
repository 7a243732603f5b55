// Crypto.cpp — случайные байты и UUID через OpenSSL

#include "meterlink/Crypto.h"
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace MeterLink {
namespace Crypto {

std::vector<uint8_t> randomBytes(size_t count) {
    std::vector<uint8_t> result(count);
    if (count == 0) {
        return result;
    }
    if (RAND_bytes(result.data(), static_cast<int>(count)) != 1) {
        spdlog::error("Crypto::randomBytes: RAND_bytes failed");
        throw std::runtime_error("Failed to generate random bytes");
    }
    return result;
}

std::string generateUUID() {
    auto bytes = randomBytes(16);
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    static const char* HEX = "0123456789abcdef";
    std::string uuid;
    uuid.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            uuid.push_back('-');
        }
        uuid.push_back(HEX[bytes[i] >> 4]);
        uuid.push_back(HEX[bytes[i] & 0x0F]);
    }
    return uuid;
}

} // namespace Crypto
} // namespace MeterLink
