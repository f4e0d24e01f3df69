/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/cli_renderer.hpp"

#include <algorithm>
#include <array>
#include <ctime>
#include <format>
#include <iostream>
#include <print>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "include/color.hpp"
#include "include/config.hpp"

namespace CliRenderer {

namespace {

StyledLine labeled(Style style, std::string_view label, std::string value) {
    return {{style, std::string(label)}, {Style::Plain, std::move(value)}};
}

}  // namespace

std::vector<StyledLine> graphic_lines() {
    return {
        {{Style::Cyan, "     ( (  "}},
        {{Style::Cyan, "      ) ) "}},
        {{Style::Yellow, "  ........ "}},
        {{Style::Yellow, "  |      |]"}},
        {{Style::Yellow, "  |      | "}},
        {{Style::Yellow, "   ======  "}},
    };
}

std::vector<StyledLine> info_lines(const SystemSnapshot& snapshot, std::string_view timestamp) {
    const auto& mem = snapshot.memory;
    const auto& disk = snapshot.disk;

    return {
        {{Style::Bold, std::format("{}@{}", snapshot.user, snapshot.host)}},
        {{Style::Cyan, std::string(Config::APP_NAME)},
         {Style::Plain, std::format(" v{} ({})", Config::APP_VERSION, Config::BUILD_COMPILER)}},
        {},
        labeled(Style::Yellow, "OS:     ", snapshot.os),
        labeled(Style::Yellow, "Kernel: ", snapshot.kernel),
        labeled(Style::Yellow, "Arch:   ", snapshot.arch),
        labeled(Style::Yellow, "Uptime: ", snapshot.uptime),
        {},
        labeled(Style::Green, "CPU:  ", snapshot.cpu),
        labeled(Style::Green,
                "Mem:  ",
                std::format("{}MB / {}MB ({:.1f}%)",
                            mem.used_mb,
                            mem.total_mb,
                            percent(mem.used_mb, mem.total_mb))),
        labeled(Style::Green,
                "Disk: ",
                std::format("{}GB / {}GB ({:.1f}%)",
                            disk.used_gb,
                            disk.total_gb,
                            percent(disk.used_gb, disk.total_gb))),
        {},
        labeled(Style::Magenta, "Shell: ", snapshot.shell),
        labeled(Style::Magenta, "Term:  ", snapshot.term),
        labeled(Style::Magenta, "Time:  ", std::string(timestamp)),
    };
}

double percent(std::uint64_t used, std::uint64_t total) {
    if (total == 0)
        return 0.0;
    return static_cast<double>(used) / static_cast<double>(total) * 100.0;
}

std::string to_ansi(const StyledLine& line) {
    std::string out;
    for (const auto& span : line) {
        out += Color::colorize(span.text, span.style);
    }
    return out;
}

std::string to_plain(const StyledLine& line) {
    std::string out;
    for (const auto& span : line) {
        out += span.text;
    }
    return out;
}

std::size_t visible_width(const StyledLine& line) {
    std::size_t width = 0;
    for (const auto& span : line) {
        width += span.text.size();
    }
    return width;
}

std::vector<std::string> compose(const std::vector<StyledLine>& graphic,
                                 const std::vector<StyledLine>& info) {
    std::size_t rows = std::max(graphic.size(), info.size());
    std::vector<std::string> out;
    out.reserve(rows);

    for (std::size_t i = 0; i < rows; ++i) {
        std::string left;
        std::size_t left_width = 0;
        if (i < graphic.size()) {
            left = to_ansi(graphic[i]);
            left_width = visible_width(graphic[i]);
        }
        if (left_width < Config::GRAPHIC_COLUMN_WIDTH)
            left.append(Config::GRAPHIC_COLUMN_WIDTH - left_width, ' ');

        std::string right = i < info.size() ? to_ansi(info[i]) : std::string();

        out.push_back(std::format("{0}{1}{0}{2}", Config::COLUMN_GAP, left, right));
    }
    return out;
}

void render_report(const SystemSnapshot& snapshot, std::string_view timestamp) {
    for (const auto& line : compose(graphic_lines(), info_lines(snapshot, timestamp))) {
        std::println("{}", line);
    }
    std::cout << std::flush;
}

std::string format_timestamp(std::int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm local{};
    if (::localtime_r(&t, &local) == nullptr)
        return std::string(Config::FALLBACK);

    std::array<char, 32> buffer{};
    std::size_t len = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%d %H:%M:%S", &local);
    if (len == 0)
        return std::string(Config::FALLBACK);
    return std::string(buffer.data(), len);
}

}  // namespace CliRenderer
