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
#include <span>
#include <string>
#include <string_view>

namespace speedwatch {

// Owns a POSIX descriptor (file, pipe or socket) and closes it on destruction.
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

    void reset(int new_fd = -1) noexcept;
    int release() noexcept;
    void swap(FileDescriptor& other) noexcept;

    [[nodiscard]] int get() const;

    // Retries on EINTR and short writes.
    [[nodiscard]] std::expected<void, std::string> write_all(std::string_view data) const;
    // Returns 0 at end of stream.
    [[nodiscard]] std::expected<std::size_t, std::string> read_some(std::span<char> buffer) const;

    explicit operator bool() const noexcept { return fd_ >= 0; }
};

inline void swap(FileDescriptor& a, FileDescriptor& b) noexcept {
    a.swap(b);
}

}  // namespace speedwatch
