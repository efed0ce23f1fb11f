// Copyright (c) 2023-2024, kiwec & 2025, WH, All rights reserved.

#include "SString.h"

#include <charconv>
#include <cmath>
#include <cstdlib>

namespace SString {

template <typename R, split_ret_enabled_t<R>>
std::vector<R> split(std::string_view s, char delim) {
    std::vector<R> r;

    // pre-count delimiter occurrences and reserve that amount (to avoid reallocations)
    r.reserve(std::ranges::count(s, delim) + 1);

    size_t i = 0, j = 0;
    if constexpr(std::is_same_v<std::decay_t<R>, std::string>) {
        while((j = s.find(delim, i)) != s.npos) r.emplace_back(s, i, j - i), i = j + 1;
        r.emplace_back(s, i, s.size() - i);
    } else {  // string_view
        while((j = s.find(delim, i)) != s.npos) r.emplace_back(s.substr(i, j - i)), i = j + 1;
        r.emplace_back(s.substr(i));
    }

    return r;
}

template std::vector<std::string_view> split<std::string_view>(std::string_view s, char d);
template std::vector<std::string> split<std::string>(std::string_view s, char d);

std::optional<f64> to_double(std::string_view str) {
    trim_inplace(str);
    if(str.empty()) return std::nullopt;

    // from_chars doesn't accept a leading '+'
    if(str.front() == '+') str.remove_prefix(1);

    f64 ret{0.0};
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), ret);
    if(ec != std::errc{} || ptr != str.data() + str.size()) return std::nullopt;
    return ret;
}

std::optional<i64> to_int(std::string_view str) {
    trim_inplace(str);
    if(str.empty()) return std::nullopt;
    if(str.front() == '+') str.remove_prefix(1);

    i64 ret{0};
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), ret);
    if(ec != std::errc{} || ptr != str.data() + str.size()) {
        // allow "3.0" style values for integer convars, as long as they fit
        const auto dbl = to_double(str);
        if(!dbl.has_value() || !std::isfinite(dbl.value())) return std::nullopt;
        if(dbl.value() < -0x1p63 || dbl.value() >= 0x1p63) return std::nullopt;
        return static_cast<i64>(dbl.value());
    }
    return ret;
}

std::optional<bool> to_bool(std::string_view str) {
    trim_inplace(str);
    const std::string lower = to_lower(str);
    if(lower == "true" || lower == "on") return true;
    if(lower == "false" || lower == "off") return false;

    if(auto num = to_double(lower); num.has_value()) return num.value() > 0.0;
    return std::nullopt;
}

}  // namespace SString
