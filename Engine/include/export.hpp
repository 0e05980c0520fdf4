#pragma once

// PRICESYNC_API marks the public surface of libpricesync.
// PRICESYNC_EXPORT is defined while building the library itself;
// PRICESYNC_STATIC is defined for static builds and their consumers.

#if defined(PRICESYNC_STATIC)
    #define PRICESYNC_API
#elif defined(_WIN32)
    #if defined(PRICESYNC_EXPORT)
        #define PRICESYNC_API __declspec(dllexport)
    #else
        #define PRICESYNC_API __declspec(dllimport)
    #endif
#else
    #define PRICESYNC_API __attribute__((visibility("default")))
#endif
