/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <charconv>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

[[nodiscard]] constexpr std::string_view trim_sv(std::string_view str) noexcept {
    auto first = str.find_first_not_of(" \t\n\r\v\f");
    if (first == std::string_view::npos)
        return {};
    auto last = str.find_last_not_of(" \t\n\r\v\f");
    return str.substr(first, last - first + 1);
}

[[nodiscard]] inline std::string trim(std::string_view str) {
    return std::string(trim_sv(str));
}

// First whitespace-delimited token of `str`, empty if there is none.
[[nodiscard]] constexpr std::string_view first_token(std::string_view str) noexcept {
    str = trim_sv(str);
    auto end = str.find_first_of(" \t\n\r\v\f");
    return str.substr(0, end);
}

template <typename T>
std::expected<T, std::errc> parse_number(std::string_view sv) {
    T value;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec == std::errc()) {
        if (ptr == sv.data() + sv.size()) {
            return value;
        }
        return std::unexpected(std::errc::invalid_argument);
    }
    return std::unexpected(ec);
}

// Calls `fn(line)` for every line of `text` until it returns false.
template <typename Fn>
void for_each_line(std::string_view text, Fn&& fn) {
    while (!text.empty()) {
        auto newline = text.find('\n');
        std::string_view line = text.substr(0, newline);
        if (!fn(line))
            return;
        if (newline == std::string_view::npos)
            return;
        text.remove_prefix(newline + 1);
    }
}
