/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/system_info.hpp"

#include <string>
#include <string_view>

#include "include/config.hpp"
#include "include/utils.hpp"

std::optional<std::string> SystemInfo::parse_cpu_model(std::string_view text) {
    std::optional<std::string> model;

    for_each_line(text, [&](std::string_view line) {
        if (!line.starts_with("model name"))
            return true;

        auto colon = line.find(':');
        if (colon == std::string_view::npos)
            return true;

        auto value = trim_sv(line.substr(colon + 1));
        if (value.empty())
            return true;

        model = std::string(value);
        return false;
    });

    return model;
}

std::string SystemInfo::resolve_cpu_model(const Host& host) {
    auto content = host.read_file(std::string(Config::CPUINFO_PATH));
    if (!content)
        return std::string(Config::FALLBACK);

    return parse_cpu_model(*content).value_or(std::string(Config::FALLBACK));
}
