// meterlink_c.cpp — общая часть C API: версия, ошибки, строки, логирование

#include "ffi_internal.h"
#include "meterlink/meterlink_c.h"
#include "meterlink/core.h"

#include <spdlog/spdlog.h>
#include <cstdlib>

// ═══════════════════════════════════════════════════════════
// Thread-local error state
// ═══════════════════════════════════════════════════════════

// Shared across ffi_*.cpp files
thread_local MLError g_lastError = ML_OK;
thread_local std::string g_lastErrorMessage;

void setLastError(MLError error, const std::string& message) {
    g_lastError = error;
    g_lastErrorMessage = message;
    if (error != ML_OK) {
        spdlog::error("FFI error (code {}): {}", static_cast<int>(error), message);
    }
}

char* alloc_string(const std::string& str) {
    return ml_strdup(str.c_str());
}

// ═══════════════════════════════════════════════════════════
// Общие функции
// ═══════════════════════════════════════════════════════════

const char* ml_version(void) {
    return MeterLink::VERSION;
}

const char* ml_error_message(MLError error) {
    switch (error) {
        case ML_OK: return "Success";
        case ML_ERROR_INVALID_ARGUMENT: return "Invalid argument";
        case ML_ERROR_NOT_RUNNING: return "Server is not running";
        case ML_ERROR_NETWORK: return "Network error";
        case ML_ERROR_NOT_FOUND: return "Not found";
        case ML_ERROR_INTERNAL:
        default: return "Internal error";
    }
}

MLError ml_last_error(void) {
    return g_lastError;
}

const char* ml_last_error_message(void) {
    return g_lastErrorMessage.c_str();
}

void ml_clear_error(void) {
    g_lastError = ML_OK;
    g_lastErrorMessage.clear();
}

void ml_free_string(char* str) {
    std::free(str);
}

MLError ml_set_log_level(int32_t level) {
    if (level < static_cast<int32_t>(spdlog::level::trace) ||
        level > static_cast<int32_t>(spdlog::level::off)) {
        setLastError(ML_ERROR_INVALID_ARGUMENT, "Log level out of range: " + std::to_string(level));
        return ML_ERROR_INVALID_ARGUMENT;
    }
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
    clearLastError();
    return ML_OK;
}
