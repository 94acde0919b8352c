#pragma once

#if defined(_WIN32)
    #if defined(SESSIONIZER_EXPORT)
        #define SESSIONIZER_API __declspec(dllexport)
    #else
        #define SESSIONIZER_API __declspec(dllimport)
    #endif
#else
    #define SESSIONIZER_API __attribute__((visibility("default")))
#endif
