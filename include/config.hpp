/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Config {
    constexpr std::string_view APP_NAME = "cafetch";
    constexpr std::string_view APP_VERSION = "1.0.0";
#if defined(__clang__)
    constexpr std::string_view BUILD_COMPILER = "Clang " __clang_version__;
#elif defined(__GNUC__)
    constexpr std::string_view BUILD_COMPILER = "GCC " __VERSION__;
#else
    constexpr std::string_view BUILD_COMPILER = "C++";
#endif

    constexpr std::string_view FALLBACK = "N/A";

    constexpr std::string_view OS_RELEASE_PATH = "/etc/os-release";
    constexpr std::string_view CPUINFO_PATH = "/proc/cpuinfo";
    constexpr std::string_view UPTIME_PATH = "/proc/uptime";
    constexpr std::string_view MEMINFO_PATH = "/proc/meminfo";
    constexpr std::string_view ROOT_MOUNT = "/";

    constexpr std::string_view KERNEL_COMMAND = "uname";
    constexpr std::string_view KERNEL_COMMAND_ARG = "-r";

    constexpr std::string_view ENV_HOSTNAME = "HOSTNAME";
    constexpr std::string_view ENV_USER = "USER";
    constexpr std::string_view ENV_SHELL = "SHELL";
    constexpr std::string_view ENV_TERM = "TERM";

    constexpr std::size_t MAX_SOURCE_BYTES = 1024 * 1024;
    constexpr std::size_t MAX_COMMAND_OUTPUT = 64 * 1024;

    constexpr std::uint64_t KIB_PER_MIB = 1024;
    constexpr std::uint64_t BYTES_PER_GIB = 1024ULL * 1024 * 1024;

    constexpr long long SECONDS_PER_DAY = 86400;
    constexpr long long SECONDS_PER_HOUR = 3600;
    constexpr long long SECONDS_PER_MINUTE = 60;

    constexpr std::size_t GRAPHIC_COLUMN_WIDTH = 20;
    constexpr std::string_view COLUMN_GAP = "  ";
    constexpr int HELP_OPTION_WIDTH = 22;
}
