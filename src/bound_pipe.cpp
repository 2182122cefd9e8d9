// SPDX-License-Identifier: MIT

// src/bound_pipe.cpp
#include "src/bound_pipe.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstring>

#include <fmt/format.h>

namespace multistream {

std::expected<size_t, Error> PipeReader::Read(std::span<std::byte> dest) {
    if (fd_ < 0) {
        return std::unexpected(Error{ErrorCode::InvalidState, "pipe reader is closed"});
    }

    for (;;) {
        ssize_t n = ::read(fd_, dest.data(), dest.size());
        if (n >= 0) {
            if (n == 0 && !dest.empty()) {
                at_end_ = true;
            }
            return static_cast<size_t>(n);
        }

        int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (err == EAGAIN || err == EWOULDBLOCK) {
            return std::unexpected(Error{ErrorCode::WouldBlock, "no data ready", err});
        }
        return std::unexpected(Error{
            ErrorCode::SourceReadFailed,
            fmt::format("pipe read failed: {}", std::strerror(err)),
            err});
    }
}

void PipeReader::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::expected<BoundPipe, Error> BoundPipe::Create(size_t capacity) {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0, fds) < 0) {
        int err = errno;
        return std::unexpected(Error{
            ErrorCode::PipeCreateFailed,
            fmt::format("socketpair failed: {}", std::strerror(err)),
            err});
    }

    // Only the writer sends; its reverse direction is never used
    int sndbuf = capacity > static_cast<size_t>(INT_MAX)
        ? INT_MAX : static_cast<int>(capacity);
    if (::setsockopt(fds[1], SOL_SOCKET, SO_SNDBUF, &sndbuf, sizeof(sndbuf)) < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(Error{
            ErrorCode::PipeCreateFailed,
            fmt::format("SO_SNDBUF({}) failed: {}", sndbuf, std::strerror(err)),
            err});
    }

    auto state = std::make_shared<PipeState>();
    BoundPipe pipe;
    pipe.reader = PipeReader(fds[0], state);
    pipe.writer = FdSink::Create(fds[1], FdSink::Ownership::Owned);
    pipe.state = std::move(state);
    return pipe;
}

}  // namespace multistream
