#pragma once

// Platform Detection
#if defined(_WIN32) || defined(_WIN64)
    #define STRATA_PLATFORM_WINDOWS 1
#elif defined(__APPLE__) && defined(__MACH__)
    #define STRATA_PLATFORM_APPLE 1
#elif defined(__linux__)
    #define STRATA_PLATFORM_LINUX 1
#elif defined(__unix__)
    #define STRATA_PLATFORM_UNIX 1
#else
    #error "Unknown platform"
#endif

// Compiler Detection
#if defined(_MSC_VER)
    #define STRATA_COMPILER_MSVC 1
    #define STRATA_COMPILER_VERSION _MSC_VER
#elif defined(__clang__)
    #define STRATA_COMPILER_CLANG 1
    #define STRATA_COMPILER_VERSION (__clang_major__ * 10000 + __clang_minor__ * 100 + __clang_patchlevel__)
#elif defined(__GNUC__) || defined(__GNUG__)
    #define STRATA_COMPILER_GCC 1
    #define STRATA_COMPILER_VERSION (__GNUC__ * 10000 + __GNUC_MINOR__ * 100 + __GNUC_PATCHLEVEL__)
#else
    #error "Unknown compiler"
#endif

// Architecture Detection
#if defined(__x86_64__) || defined(_M_X64) || defined(__amd64__) || defined(__aarch64__) || defined(_M_ARM64)
    #define STRATA_POINTER_SIZE 8
#elif defined(__i386__) || defined(_M_IX86) || defined(__arm__) || defined(_M_ARM)
    #define STRATA_POINTER_SIZE 4
#else
    #error "Unknown architecture"
#endif

// Debug/Release Detection
#if defined(STRATA_BUILD_DEBUG) || defined(STRATA_BUILD_RELEASE)
    // Set explicitly by the build system
#elif defined(DEBUG) || defined(_DEBUG) || defined(STRATA_DEBUG)
    #define STRATA_BUILD_DEBUG 1
#elif defined(NDEBUG) || defined(STRATA_RELEASE)
    #define STRATA_BUILD_RELEASE 1
#endif

#if defined(STRATA_BUILD_DEBUG)
    #define STRATA_BUILD_TYPE "Debug"
#elif defined(STRATA_BUILD_RELEASE)
    #define STRATA_BUILD_TYPE "Release"
#else
    #define STRATA_BUILD_TYPE "Unknown"
#endif

// C++ Standard Detection
#if __cplusplus < 202002L && !(defined(_MSVC_LANG) && _MSVC_LANG >= 202002L)
    #error "Strata requires C++20 or later"
#endif
