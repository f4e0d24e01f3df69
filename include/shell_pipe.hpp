/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "file_descriptor.hpp"

// Runs `args[0]` from PATH with stdout captured and stderr discarded.
// A binary that cannot be executed exits with status 127.
class ShellPipe {
    FileDescriptor read_fd_;
    int pid_ = -1;

   public:
    explicit ShellPipe(const std::vector<std::string>& args);

    ~ShellPipe();

    ShellPipe(const ShellPipe&) = delete;
    ShellPipe& operator=(const ShellPipe&) = delete;

    std::string read_all(std::size_t max_bytes);

    // Reaps the child. Returns its exit status, or 128 + signal number when
    // it was killed.
    int wait();
};
