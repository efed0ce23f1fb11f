#pragma once
// Copyright (c) 2025-2026, WH, All rights reserved.

#include "BaseEnvironment.h"

#include "fmt/format.h"

#include <string_view>
#include <source_location>

// helper macros to allow using a single string directly or a format string with args
#define _logFmtStart fmt::format(
#define _logFmtEnd(...) , __VA_ARGS__)

// main context-aware logging macro
#define debugLog(str__, ...)                                                                    \
    Logger::_detail::log_int(std::source_location::current(), Logger::_detail::log_level::info, \
                             __VA_OPT__(_logFmtStart)(str__) __VA_OPT__(_logFmtEnd(__VA_ARGS__)))

// same as debugLog, but at warning level
#define warnLog(str__, ...)                                                                     \
    Logger::_detail::log_int(std::source_location::current(), Logger::_detail::log_level::warn, \
                             __VA_OPT__(_logFmtStart)(str__) __VA_OPT__(_logFmtEnd(__VA_ARGS__)))

// log only if condition is true
#define logIf(cond__, ...) (static_cast<bool>(cond__) ? debugLog(__VA_ARGS__) : void(0))

// log only if cvar__.getBool() == true
#define logIfCV(cvar__, ...) logIf(cv::cvar__.getBool(), __VA_ARGS__)

// raw logging without any context
#define logRaw(str__, ...)                                        \
    Logger::_detail::logRaw_int(Logger::_detail::log_level::info, \
                                __VA_OPT__(_logFmtStart)(str__) __VA_OPT__(_logFmtEnd(__VA_ARGS__)))

// main Logger API
namespace Logger {
namespace _detail {

// copied from spdlog, don't want to include it here
// (only including spdlog things in 1 translation unit)
namespace log_level {
enum level_enum : int { trace = 0, debug = 1, info = 2, warn = 3, err = 4, critical = 5, off = 6, n_levels };
}

void log_int(std::source_location loc, log_level::level_enum lvl, std::string_view str) noexcept;
void logRaw_int(log_level::level_enum lvl, std::string_view str) noexcept;
}  // namespace _detail

// Logger::init() is called immediately after main()
// with_file: also write everything to logs/<package>-<os>-<build>-<version>.log
void init(bool with_file) noexcept;
void shutdown() noexcept;

void flush() noexcept;

};  // namespace Logger
