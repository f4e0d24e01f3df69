/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/system_info.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "include/config.hpp"
#include "include/utils.hpp"

namespace {

// "MemTotal:       16318480 kB" -> 16318480
std::optional<std::uint64_t> meminfo_value(std::string_view line, std::string_view key) {
    if (!line.starts_with(key))
        return std::nullopt;

    auto value = parse_number<std::uint64_t>(first_token(line.substr(key.size())));
    if (!value)
        return std::nullopt;
    return *value;
}

}  // namespace

MemoryUsage SystemInfo::parse_meminfo(std::string_view text) {
    std::optional<std::uint64_t> total_kb;
    std::optional<std::uint64_t> available_kb;

    for_each_line(text, [&](std::string_view line) {
        if (!total_kb)
            total_kb = meminfo_value(line, "MemTotal:");
        if (!available_kb)
            available_kb = meminfo_value(line, "MemAvailable:");
        return !(total_kb && available_kb);
    });

    MemoryUsage usage{};
    if (!total_kb || !available_kb)
        return usage;

    usage.total_mb = *total_kb / Config::KIB_PER_MIB;
    std::uint64_t available_mb = *available_kb / Config::KIB_PER_MIB;
    usage.used_mb = usage.total_mb >= available_mb ? usage.total_mb - available_mb : 0;
    return usage;
}

MemoryUsage SystemInfo::resolve_memory(const Host& host) {
    auto content = host.read_file(std::string(Config::MEMINFO_PATH));
    if (!content)
        return {};
    return parse_meminfo(*content);
}

DiskUsage SystemInfo::disk_usage_from(const FsStats& stats) {
    std::uint64_t total_bytes = stats.block_count * stats.block_size;
    std::uint64_t free_bytes = stats.available_blocks * stats.block_size;
    std::uint64_t used_bytes = total_bytes >= free_bytes ? total_bytes - free_bytes : 0;

    DiskUsage usage{};
    usage.total_gb = total_bytes / Config::BYTES_PER_GIB;
    usage.used_gb = used_bytes / Config::BYTES_PER_GIB;
    return usage;
}

DiskUsage SystemInfo::resolve_disk(const Host& host) {
    auto stats = host.fs_stats(std::string(Config::ROOT_MOUNT));
    if (!stats)
        return {};
    return disk_usage_from(*stats);
}
