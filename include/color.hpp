/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <format>
#include <string>
#include <string_view>

enum class Style {
    Plain,
    Bold,
    Cyan,
    Magenta,
    Yellow,
    Green,
};

namespace Color {
constexpr std::string_view RESET = "\033[0m";
constexpr std::string_view RED = "\033[31m";
constexpr std::string_view GREEN = "\033[32m";
constexpr std::string_view YELLOW = "\033[33m";
constexpr std::string_view MAGENTA = "\033[35m";
constexpr std::string_view CYAN = "\033[36m";
constexpr std::string_view BOLD = "\033[1m";

constexpr std::string_view escape(Style style) noexcept {
    switch (style) {
        case Style::Bold:
            return BOLD;
        case Style::Cyan:
            return CYAN;
        case Style::Magenta:
            return MAGENTA;
        case Style::Yellow:
            return YELLOW;
        case Style::Green:
            return GREEN;
        case Style::Plain:
            break;
    }
    return {};
}

inline std::string colorize(std::string_view text, std::string_view color) {
    return std::format("{}{}{}", color, text, RESET);
}

inline std::string colorize(std::string_view text, Style style) {
    if (style == Style::Plain)
        return std::string(text);
    return colorize(text, escape(style));
}
}  // namespace Color
