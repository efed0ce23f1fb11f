// Copyright (c) 2023-2024, kiwec & 2025, WH, All rights reserved.
#pragma once
#include "BaseEnvironment.h"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <type_traits>

// small std::string helpers

namespace SString {

template <typename R = std::string_view>
using split_ret_enabled_t =
    std::enable_if_t<std::is_same_v<std::decay_t<R>, std::string> || std::is_same_v<std::decay_t<R>, std::string_view>,
                     bool>;

// split on a single character, empty pieces are kept
template <typename R = std::string_view, split_ret_enabled_t<R> = true>
std::vector<R> split(std::string_view s, char d);

// in-place whitespace/newline trimming (both sides)
static forceinline void trim_inplace(std::string& str) {
    if(str.empty()) return;
    str.erase(0, str.find_first_not_of(" \t\r\n"));
    str.erase(str.find_last_not_of(" \t\r\n") + 1);
}

// adjusts the view to exclude leading/trailing whitespace
static forceinline void trim_inplace(std::string_view& str) {
    if(str.empty()) return;
    size_t start = str.find_first_not_of(" \t\r\n");
    if(start == std::string_view::npos) {
        str = std::string_view();
        return;
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    str = str.substr(start, end - start + 1);
}

// check if first non-whitespace sequence matches comment token
static forceinline bool is_comment(const std::string_view str, const std::string_view token = "//") {
    size_t start = str.find_first_not_of(" \t\r\n");
    if(start == std::string_view::npos) return false;
    return str.substr(start).starts_with(token);
}

// only really valid for ASCII
static forceinline std::string to_lower(const std::string_view str) {
    std::string lstr{str.data(), str.length()};
    std::ranges::transform(lstr, lstr.begin(), [](unsigned char c) { return std::tolower(c); });
    return lstr;
}

// whole-string numeric parsing (surrounding whitespace allowed), nullopt on garbage
std::optional<f64> to_double(std::string_view str);
std::optional<i64> to_int(std::string_view str);

// "1", "true", "on" -> true; "0", "false", "off" -> false (case-insensitive)
std::optional<bool> to_bool(std::string_view str);

}  // namespace SString
