// Crypto.h — криптографически стойкая случайность (OpenSSL)

#pragma once

#include "export.h"
#include <cstdint>
#include <string>
#include <vector>

namespace MeterLink {
namespace Crypto {

/// Генерация криптографически стойких случайных байт
/// @throws std::runtime_error если RAND_bytes не сработал
ML_API std::vector<uint8_t> randomBytes(size_t count);

/// Генерация UUID v4 (122 случайных бита)
ML_API std::string generateUUID();

} // namespace Crypto
} // namespace MeterLink
