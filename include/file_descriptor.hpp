/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <expected>
#include <string>

class FileDescriptor {
    int fd_ = -1;

   public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd);

    ~FileDescriptor() noexcept;

    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    // Opens `path` with O_RDONLY | O_CLOEXEC.
    [[nodiscard]] static std::expected<FileDescriptor, std::string> open_read_only(
        const std::string& path);

    // Reads until EOF. Fails if more than `max_bytes` are available.
    [[nodiscard]] std::expected<std::string, std::string> read_all(std::size_t max_bytes) const;

    void reset(int new_fd = -1) noexcept;
    int release() noexcept;

    [[nodiscard]] int get() const;

    explicit operator bool() const noexcept {
        return fd_ >= 0;
    }
};
