/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "color.hpp"
#include "results.hpp"

namespace CliRenderer {

struct Span {
    Style style = Style::Plain;
    std::string text;
};

using StyledLine = std::vector<Span>;

// The coffee cup. Same six lines on every run.
std::vector<StyledLine> graphic_lines();

// Labeled report lines. Blank lines separate the identity, hardware and
// session groups.
std::vector<StyledLine> info_lines(const SystemSnapshot& snapshot, std::string_view timestamp);

double percent(std::uint64_t used, std::uint64_t total);

std::string to_ansi(const StyledLine& line);
std::string to_plain(const StyledLine& line);
std::size_t visible_width(const StyledLine& line);

// Pairs graphic and info lines side by side; the shorter column is padded
// with empty lines. Returns max(graphic.size(), info.size()) lines.
std::vector<std::string> compose(const std::vector<StyledLine>& graphic,
                                 const std::vector<StyledLine>& info);

void render_report(const SystemSnapshot& snapshot, std::string_view timestamp);

std::string format_timestamp(std::int64_t epoch_seconds);
}  // namespace CliRenderer
