/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/shell_pipe.hpp"

#include <cerrno>
#include <chrono>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

ShellPipe::ShellPipe(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("ShellPipe: Empty argument list");
    }

    std::vector<std::string> args_copy = args;
    std::vector<char*> c_args;
    c_args.reserve(args_copy.size() + 1);

    for (auto& arg : args_copy) {
        c_args.push_back(arg.data());
    }
    c_args.push_back(nullptr);

    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to create pipe");
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        int err = errno;
        ::close(pipe_fds[0]);
        ::close(pipe_fds[1]);
        throw std::system_error(err, std::generic_category(), "Failed to fork process");
    }

    if (pid == 0) {
        if (::dup2(pipe_fds[1], STDOUT_FILENO) == -1) ::_exit(127);

        int null_fd = ::open("/dev/null", O_WRONLY);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDERR_FILENO);
            ::close(null_fd);
        }

        ::execvp(c_args[0], c_args.data());
        ::_exit(127);
    }

    ::close(pipe_fds[1]);
    read_fd_.reset(pipe_fds[0]);
    pid_ = pid;
}

ShellPipe::~ShellPipe() {
    read_fd_.reset();

    if (pid_ == -1) {
        return;
    }

    int status;
    if (::waitpid(pid_, &status, WNOHANG) == pid_) {
        return;
    }

    ::kill(pid_, SIGTERM);

    for (int i = 0; i < 5; ++i) {
        if (::waitpid(pid_, &status, WNOHANG) == pid_) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    ::kill(pid_, SIGKILL);
    ::waitpid(pid_, nullptr, 0);
}

std::string ShellPipe::read_all(std::size_t max_bytes) {
    auto output = read_fd_.read_all(max_bytes);
    if (!output) {
        throw std::runtime_error(std::string("Failed to read from pipe: ") + output.error());
    }
    read_fd_.reset();
    return std::move(*output);
}

int ShellPipe::wait() {
    if (pid_ == -1) {
        throw std::logic_error("ShellPipe: Child already reaped");
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result == -1 && errno == EINTR);

    if (result == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to wait for process");
    }
    pid_ = -1;

    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}
