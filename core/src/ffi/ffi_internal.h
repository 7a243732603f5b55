// ffi_internal.h — Internal shared declarations for FFI implementation

#ifndef FFI_INTERNAL_H
#define FFI_INTERNAL_H

#include "meterlink/meterlink_c.h"
#include <string>
#include <cstring>

#ifdef _WIN32
    #define ml_strdup _strdup
#else
    #define ml_strdup strdup
#endif

// Thread-local error state
extern thread_local MLError g_lastError;
extern thread_local std::string g_lastErrorMessage;

// Error handling functions (defined in meterlink_c.cpp)
// Note: default argument only in declaration, not in definition
void setLastError(MLError error, const std::string& message = "");
inline void clearLastError() { setLastError(ML_OK); }

// String allocation (defined in meterlink_c.cpp)
char* alloc_string(const std::string& str);

#endif // FFI_INTERNAL_H
