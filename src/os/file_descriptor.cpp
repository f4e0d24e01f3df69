/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/file_descriptor.hpp"

#include <array>
#include <cerrno>
#include <format>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

FileDescriptor::FileDescriptor(int fd) : fd_(fd) {
    if (fd_ < -1) [[unlikely]] {
        throw std::invalid_argument(std::format("Invalid file descriptor: {}", fd));
    }
}

FileDescriptor::~FileDescriptor() noexcept {
    reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        reset(std::exchange(other.fd_, -1));
    }
    return *this;
}

std::expected<FileDescriptor, std::string> FileDescriptor::open_read_only(
    const std::string& path) {
    int fd;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return std::unexpected(
            std::format("open {}: {}", path, std::system_category().message(errno)));
    }
    return FileDescriptor(fd);
}

std::expected<std::string, std::string> FileDescriptor::read_all(std::size_t max_bytes) const {
    if (fd_ < 0) {
        return std::unexpected("Cannot read from invalid file descriptor");
    }

    std::string content;
    std::array<char, 4096> buffer;

    while (true) {
        ssize_t bytes_read = ::read(fd_, buffer.data(), buffer.size());
        if (bytes_read > 0) {
            if (content.size() + static_cast<std::size_t>(bytes_read) > max_bytes) {
                return std::unexpected(std::format("read: input exceeds {} bytes", max_bytes));
            }
            content.append(buffer.data(), static_cast<std::size_t>(bytes_read));
        } else if (bytes_read == 0) {
            break;
        } else {
            if (errno == EINTR)
                continue;
            return std::unexpected(
                std::format("read: {}", std::system_category().message(errno)));
        }
    }

    return content;
}

void FileDescriptor::reset(int new_fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = new_fd;
}

int FileDescriptor::release() noexcept {
    return std::exchange(fd_, -1);
}

int FileDescriptor::get() const {
    if (fd_ < 0) [[unlikely]] {
        throw std::logic_error("FATAL: Accessing invalid file descriptor (-1)");
    }
    return fd_;
}
