/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

struct FsStats {
    std::uint64_t block_count = 0;
    std::uint64_t block_size = 0;
    std::uint64_t available_blocks = 0;
};

struct CommandOutput {
    std::string output;
    int exit_status = 0;
};

// Everything the collector knows about the machine goes through this
// interface. Failures are returned, never thrown.
class Host {
   public:
    virtual ~Host() = default;

    virtual std::expected<std::string, std::string> read_file(const std::string& path) const = 0;
    virtual std::optional<std::string> get_env(const std::string& name) const = 0;
    virtual std::expected<CommandOutput, std::string> run_command(
        const std::vector<std::string>& args) const = 0;
    virtual std::expected<FsStats, std::string> fs_stats(const std::string& path) const = 0;

    // Generic platform identifier, e.g. "linux".
    virtual std::string platform() const = 0;
    // Target CPU architecture, e.g. "x86_64".
    virtual std::string arch() const = 0;
};

class LinuxHost final : public Host {
   public:
    std::expected<std::string, std::string> read_file(const std::string& path) const override;
    std::optional<std::string> get_env(const std::string& name) const override;
    std::expected<CommandOutput, std::string> run_command(
        const std::vector<std::string>& args) const override;
    std::expected<FsStats, std::string> fs_stats(const std::string& path) const override;
    std::string platform() const override;
    std::string arch() const override;
};
