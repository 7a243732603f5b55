#pragma once

#ifdef _WIN32
    #ifdef METERLINK_EXPORTS
        #define ML_API __declspec(dllexport)
    #else
        #define ML_API __declspec(dllimport)
    #endif
#else
    #define ML_API __attribute__((visibility("default")))
#endif
