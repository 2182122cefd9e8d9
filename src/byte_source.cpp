// SPDX-License-Identifier: MIT

// src/byte_source.cpp
#include "src/byte_source.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fmt/format.h>

namespace multistream {

MemorySource::MemorySource(std::string_view data)
    : MemorySource(std::as_bytes(std::span{data.data(), data.size()})) {}

std::expected<size_t, Error> MemorySource::Read(std::span<std::byte> dest) {
    size_t n = std::min(dest.size(), data_.size() - offset_);
    if (n > 0) {
        std::memcpy(dest.data(), data_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

std::expected<void, Error> FileSource::Open() {
    if (fd_ >= 0) return {};

    int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        return std::unexpected(Error{
            ErrorCode::SourceOpenFailed,
            fmt::format("open({}) failed: {}", path_.string(), std::strerror(err)),
            err});
    }
    fd_ = fd;
    return {};
}

std::expected<size_t, Error> FileSource::Read(std::span<std::byte> dest) {
    if (fd_ < 0) {
        return std::unexpected(Error{ErrorCode::SourceReadFailed,
                                     fmt::format("{} is not open", path_.string())});
    }

    for (;;) {
        ssize_t n = ::read(fd_, dest.data(), dest.size());
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        int err = errno;
        return std::unexpected(Error{
            ErrorCode::SourceReadFailed,
            fmt::format("read({}) failed: {}", path_.string(), std::strerror(err)),
            err});
    }
}

void FileSource::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace multistream
