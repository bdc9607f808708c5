#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - QICONIC_BUILD_SHARED: when building QiConic as shared library
 *   - QICONIC_USE_SHARED: when using QiConic as shared library
 *   - QICONIC_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(QICONIC_BUILD_SHARED)
        #define QICONIC_API __declspec(dllexport)
    #elif defined(QICONIC_USE_SHARED)
        #define QICONIC_API __declspec(dllimport)
    #else
        #define QICONIC_API
    #endif
#else
    #if defined(QICONIC_BUILD_SHARED)
        #define QICONIC_API __attribute__((visibility("default")))
    #else
        #define QICONIC_API
    #endif
#endif
