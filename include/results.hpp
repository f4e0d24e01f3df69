// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <cstdint>
#include <string>

struct MemoryUsage {
    std::uint64_t total_mb = 0;
    std::uint64_t used_mb = 0;
};

struct DiskUsage {
    std::uint64_t total_gb = 0;
    std::uint64_t used_gb = 0;
};

// Built once by SystemInfo::collect. String fields hold either the resolved
// value or Config::FALLBACK; usage pairs are {0, 0} when unmeasured.
struct SystemSnapshot {
    std::string os;
    std::string kernel;
    std::string arch;

    std::string host;
    std::string user;
    std::string shell;
    std::string term;

    std::string cpu;
    std::string uptime;
    MemoryUsage memory;
    DiskUsage disk;
};
