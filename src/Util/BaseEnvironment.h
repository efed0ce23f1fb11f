#pragma once
// Copyright (c) 2025-2026, WH, All rights reserved.

// basic types, attribute macros and build configuration shared by everything

#include <cstdint>
#include <string_view>

using namespace std::string_view_literals;

using i8 = std::int8_t;
using u8 = std::uint8_t;
using i16 = std::int16_t;
using u16 = std::uint16_t;
using i32 = std::int32_t;
using u32 = std::uint32_t;
using i64 = std::int64_t;
using u64 = std::uint64_t;
using f32 = float;
using f64 = double;

#if defined(_MSC_VER) && !defined(__clang__)
#define forceinline __forceinline
#else
#define forceinline inline __attribute__((always_inline))
#endif

#define likely(x) __builtin_expect(!!(x), 1)
#define unlikely(x) __builtin_expect(!!(x), 0)

#define NOCOPY_NOMOVE(ClassName__)                          \
   public:                                                  \
    ClassName__(const ClassName__ &) = delete;              \
    ClassName__ &operator=(const ClassName__ &) = delete;   \
    ClassName__(ClassName__ &&) = delete;                   \
    ClassName__ &operator=(ClassName__ &&) = delete;        \
                                                            \
   private:

#ifndef PACKAGE_NAME
#define PACKAGE_NAME "spintrack"
#endif

#ifndef PACKAGE_VERSION
#define PACKAGE_VERSION "0.1.0"
#endif

#ifndef SPINTRACK_DATA_DIR
#define SPINTRACK_DATA_DIR "./"
#endif

#define SPINTRACK_CFG_PATH SPINTRACK_DATA_DIR "cfg"

#if defined(_WIN32)
#define SPINTRACK_PLATFORM_WINDOWS
#define OS_NAME "windows"
#elif defined(__linux__)
#define SPINTRACK_PLATFORM_LINUX
#define OS_NAME "linux"
#else
#define OS_NAME "unknown"
#endif

