/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/host.hpp"

#include <cerrno>
#include <cstdlib>
#include <exception>
#include <format>
#include <string>
#include <system_error>

#include <sys/statvfs.h>

#include "include/config.hpp"
#include "include/file_descriptor.hpp"
#include "include/shell_pipe.hpp"

std::expected<std::string, std::string> LinuxHost::read_file(const std::string& path) const {
    auto fd = FileDescriptor::open_read_only(path);
    if (!fd) {
        return std::unexpected(fd.error());
    }

    auto content = fd->read_all(Config::MAX_SOURCE_BYTES);
    if (!content) {
        return std::unexpected(std::format("{}: {}", path, content.error()));
    }
    return content;
}

std::optional<std::string> LinuxHost::get_env(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::expected<CommandOutput, std::string> LinuxHost::run_command(
    const std::vector<std::string>& args) const {
    try {
        ShellPipe pipe(args);
        CommandOutput result;
        result.output = pipe.read_all(Config::MAX_COMMAND_OUTPUT);
        result.exit_status = pipe.wait();
        return result;
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}

std::expected<FsStats, std::string> LinuxHost::fs_stats(const std::string& path) const {
    struct statvfs disk;
    if (::statvfs(path.c_str(), &disk) != 0) {
        return std::unexpected(
            std::format("statvfs {}: {}", path, std::system_category().message(errno)));
    }

    FsStats stats;
    stats.block_count = static_cast<std::uint64_t>(disk.f_blocks);
    stats.block_size = static_cast<std::uint64_t>(disk.f_frsize);
    stats.available_blocks = static_cast<std::uint64_t>(disk.f_bavail);
    return stats;
}

std::string LinuxHost::platform() const {
#if defined(__linux__)
    return "linux";
#elif defined(__FreeBSD__)
    return "freebsd";
#elif defined(__APPLE__)
    return "darwin";
#else
    return "unknown";
#endif
}

std::string LinuxHost::arch() const {
#if defined(__x86_64__)
    return "x86_64";
#elif defined(__i386__)
    return "i386";
#elif defined(__aarch64__)
    return "aarch64";
#elif defined(__arm__)
    return "arm";
#elif defined(__riscv) && __riscv_xlen == 64
    return "riscv64";
#elif defined(__powerpc64__) && defined(__LITTLE_ENDIAN__)
    return "ppc64le";
#elif defined(__s390x__)
    return "s390x";
#else
    return "unknown";
#endif
}
