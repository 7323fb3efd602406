/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/file_descriptor.hpp"

#include <cerrno>
#include <format>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

namespace speedwatch {

FileDescriptor::FileDescriptor(int fd) : fd_(fd) {
    if (fd_ < 0 && fd != -1) [[unlikely]] {
        throw std::system_error(
            errno, std::generic_category(), "Failed to wrap invalid file descriptor");
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

void FileDescriptor::reset(int new_fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = new_fd;
}

int FileDescriptor::release() noexcept {
    return std::exchange(fd_, -1);
}

void FileDescriptor::swap(FileDescriptor& other) noexcept {
    std::swap(fd_, other.fd_);
}

int FileDescriptor::get() const {
    if (fd_ < 0) [[unlikely]] {
        throw std::logic_error("FATAL: Accessing invalid file descriptor (-1)");
    }
    return fd_;
}

std::expected<void, std::string> FileDescriptor::write_all(std::string_view data) const {
    if (fd_ < 0) {
        return std::unexpected("Cannot write to invalid file descriptor");
    }

    struct stat st{};
    const bool is_socket = ::fstat(fd_, &st) == 0 && S_ISSOCK(st.st_mode);

    while (!data.empty()) {
        // MSG_NOSIGNAL keeps a closed peer from raising SIGPIPE.
        ssize_t n = is_socket ? ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL)
                              : ::write(fd_, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::format(
                "write failed: {} (Code: {})", std::system_category().message(errno), errno));
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
    return {};
}

std::expected<std::size_t, std::string> FileDescriptor::read_some(std::span<char> buffer) const {
    if (fd_ < 0) {
        return std::unexpected("Cannot read from invalid file descriptor");
    }

    while (true) {
        ssize_t n = ::read(fd_, buffer.data(), buffer.size());
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) continue;
        return std::unexpected(std::format(
            "read failed: {} (Code: {})", std::system_category().message(errno), errno));
    }
}

}  // namespace speedwatch
