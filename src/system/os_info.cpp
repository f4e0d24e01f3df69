/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/system_info.hpp"

#include <cmath>
#include <format>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "include/config.hpp"
#include "include/utils.hpp"

namespace {

bool is_quote(char c) {
    return c == '"' || c == '\'';
}

}  // namespace

std::optional<std::string> SystemInfo::parse_os_release(std::string_view text) {
    constexpr std::string_view key = "PRETTY_NAME=";
    std::optional<std::string> pretty_name;

    for_each_line(text, [&](std::string_view line) {
        if (!line.starts_with(key))
            return true;

        auto value = trim_sv(line.substr(key.size()));
        if (!value.empty() && is_quote(value.front()))
            value.remove_prefix(1);
        if (!value.empty() && is_quote(value.back()))
            value.remove_suffix(1);

        pretty_name = std::string(value);
        return false;
    });

    if (pretty_name && pretty_name->empty())
        return std::nullopt;
    return pretty_name;
}

std::string SystemInfo::resolve_os(const Host& host) {
    auto content = host.read_file(std::string(Config::OS_RELEASE_PATH));
    if (content) {
        if (auto name = parse_os_release(*content))
            return *name;
    }
    return host.platform();
}

std::string SystemInfo::resolve_kernel(const Host& host) {
    auto result = host.run_command(
        {std::string(Config::KERNEL_COMMAND), std::string(Config::KERNEL_COMMAND_ARG)});
    if (!result || result->exit_status != 0)
        return std::string(Config::FALLBACK);

    auto release = trim(result->output);
    if (release.empty())
        return std::string(Config::FALLBACK);
    return release;
}

std::string SystemInfo::resolve_arch(const Host& host) {
    return host.arch();
}

std::string SystemInfo::env_or_fallback(const Host& host, std::string_view name) {
    auto value = host.get_env(std::string(name));
    if (value && !value->empty())
        return *value;
    return std::string(Config::FALLBACK);
}

std::string SystemInfo::resolve_hostname(const Host& host) {
    return env_or_fallback(host, Config::ENV_HOSTNAME);
}

std::string SystemInfo::resolve_user(const Host& host) {
    return env_or_fallback(host, Config::ENV_USER);
}

std::string SystemInfo::resolve_shell(const Host& host) {
    return env_or_fallback(host, Config::ENV_SHELL);
}

std::string SystemInfo::resolve_term(const Host& host) {
    return env_or_fallback(host, Config::ENV_TERM);
}

std::optional<long long> SystemInfo::parse_uptime_seconds(std::string_view text) {
    auto token = first_token(text);
    if (token.empty())
        return std::nullopt;

    auto seconds = parse_number<double>(token);
    if (!seconds || !std::isfinite(*seconds) || *seconds < 0.0 ||
        *seconds >= static_cast<double>(std::numeric_limits<long long>::max()))
        return std::nullopt;

    return static_cast<long long>(*seconds);
}

std::string SystemInfo::format_uptime(long long seconds) {
    long long days = seconds / Config::SECONDS_PER_DAY;
    long long hours = (seconds % Config::SECONDS_PER_DAY) / Config::SECONDS_PER_HOUR;
    long long mins = (seconds % Config::SECONDS_PER_HOUR) / Config::SECONDS_PER_MINUTE;

    if (days > 0)
        return std::format("{}d {}h {}m", days, hours, mins);
    return std::format("{}h {}m", hours, mins);
}

std::string SystemInfo::resolve_uptime(const Host& host) {
    auto content = host.read_file(std::string(Config::UPTIME_PATH));
    if (!content)
        return std::string(Config::FALLBACK);

    auto seconds = parse_uptime_seconds(*content);
    if (!seconds)
        return std::string(Config::FALLBACK);
    return format_uptime(*seconds);
}
