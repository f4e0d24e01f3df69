// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "host.hpp"
#include "results.hpp"

class SystemInfo {
public:
    static SystemSnapshot collect(const Host& host);

    static std::string resolve_os(const Host& host);
    static std::string resolve_kernel(const Host& host);
    static std::string resolve_arch(const Host& host);
    static std::string resolve_hostname(const Host& host);
    static std::string resolve_user(const Host& host);
    static std::string resolve_shell(const Host& host);
    static std::string resolve_term(const Host& host);
    static std::string resolve_cpu_model(const Host& host);
    static std::string resolve_uptime(const Host& host);
    static MemoryUsage resolve_memory(const Host& host);
    static DiskUsage resolve_disk(const Host& host);

    // Value of PRETTY_NAME with surrounding quotes removed.
    static std::optional<std::string> parse_os_release(std::string_view text);
    static std::optional<std::string> parse_cpu_model(std::string_view text);
    static std::optional<long long> parse_uptime_seconds(std::string_view text);
    static std::string format_uptime(long long seconds);
    static MemoryUsage parse_meminfo(std::string_view text);
    static DiskUsage disk_usage_from(const FsStats& stats);

    static std::string env_or_fallback(const Host& host, std::string_view name);
};
