// SPDX-License-Identifier: MIT

// src/byte_sink.cpp
#include "src/byte_sink.hpp"

#include <pthread.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <fmt/format.h>

namespace multistream {

namespace {

// Registration and fd of a closed FdSink. The handle may be the one
// dispatching the Close() call, so both are released from a deferred
// callback: handle first, then the fd.
struct RetiredFd {
    std::unique_ptr<IEventHandle> handle;
    int fd = -1;

    ~RetiredFd() {
        handle.reset();
        if (fd >= 0) {
            ::close(fd);
        }
    }
};

// write() to a pipe without readers raises SIGPIPE, which send() can
// suppress with MSG_NOSIGNAL but write() cannot. Keep it blocked for the
// call and consume the one this write raised, so the caller only sees
// EPIPE. A SIGPIPE already pending for this thread is left alone.
ssize_t WriteWithoutSigpipe(int fd, const void* data, size_t size) {
    sigset_t sigpipe;
    sigemptyset(&sigpipe);
    sigaddset(&sigpipe, SIGPIPE);

    sigset_t pending;
    sigemptyset(&pending);
    bool was_pending = ::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;

    sigset_t previous;
    ::pthread_sigmask(SIG_BLOCK, &sigpipe, &previous);

    ssize_t n = ::write(fd, data, size);
    int err = errno;

    if (n < 0 && err == EPIPE && !was_pending) {
        timespec no_wait{};
        while (::sigtimedwait(&sigpipe, nullptr, &no_wait) < 0 && errno == EINTR) {
        }
    }

    ::pthread_sigmask(SIG_SETMASK, &previous, nullptr);
    errno = err;
    return n;
}

}  // namespace

// MemorySink

void MemorySink::Open(IEventLoop& loop, EventCallback on_event) {
    loop_ = &loop;
    on_event_ = std::move(on_event);
    open_ = true;
    Post(SinkEvent::OpenCompleted);
    Post(SinkEvent::HasSpace);
}

std::expected<size_t, Error> MemorySink::Write(std::span<const std::byte> data) {
    if (!open_) {
        return std::unexpected(Error{ErrorCode::SinkClosed, "memory sink is closed"});
    }
    size_t n = std::min(data.size(), max_write_);
    data_.insert(data_.end(), data.begin(), data.begin() + n);
    ++write_count_;
    Post(SinkEvent::HasSpace);
    return n;
}

void MemorySink::Close() {
    open_ = false;
}

void MemorySink::Post(SinkEvent event) {
    std::weak_ptr<MemorySink> weak_self = weak_from_this();
    loop_->Defer([weak_self, event]() {
        auto self = weak_self.lock();
        if (self && self->open_ && self->on_event_) {
            self->on_event_(event);
        }
    });
}

// FdSink

FdSink::FdSink(int fd, Ownership ownership)
    : fd_(fd), ownership_(ownership) {
    struct stat st{};
    if (fd_ >= 0 && ::fstat(fd_, &st) == 0) {
        is_socket_ = S_ISSOCK(st.st_mode);
    }
}

FdSink::~FdSink() {
    handle_.reset();
    if (ownership_ == Ownership::Owned && fd_ >= 0) {
        ::close(fd_);
    }
}

void FdSink::Open(IEventLoop& loop, EventCallback on_event) {
    loop_ = &loop;
    on_event_ = std::move(on_event);
    open_ = true;

    // Register only after OpenCompleted so the first EPOLLOUT edge
    // cannot overtake it.
    std::weak_ptr<FdSink> weak_self = weak_from_this();
    loop.Defer([weak_self]() {
        auto self = weak_self.lock();
        if (!self || !self->open_) return;
        self->Emit(SinkEvent::OpenCompleted);
        self->Register();
    });
}

void FdSink::Register() {
    if (!open_ || handle_) return;

    std::weak_ptr<FdSink> weak_self = weak_from_this();
    try {
        handle_ = loop_->Register(
            fd_,
            /*want_read=*/false,
            /*want_write=*/true,
            nullptr,
            [weak_self]() {
                if (auto self = weak_self.lock()) self->HandleWritable();
            },
            [weak_self](int err) {
                if (auto self = weak_self.lock()) self->HandleError(err);
            });
    } catch (const std::system_error& e) {
        // Regular files and closed fds cannot be watched
        error_ = Error{ErrorCode::SinkClosed,
                       fmt::format("cannot watch fd {}: {}", fd_, e.what()),
                       e.code().value()};
        Emit(SinkEvent::ErrorOccurred);
    }
}

std::expected<size_t, Error> FdSink::Write(std::span<const std::byte> data) {
    if (!open_) {
        return std::unexpected(Error{ErrorCode::SinkClosed,
                                     fmt::format("fd {} sink is closed", fd_)});
    }

    for (;;) {
        ssize_t n = is_socket_
            ? ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL)
            : WriteWithoutSigpipe(fd_, data.data(), data.size());
        if (n >= 0) {
            if (static_cast<size_t>(n) == data.size()) {
                Post(SinkEvent::HasSpace);
            }
            return static_cast<size_t>(n);
        }

        int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (err == EAGAIN || err == EWOULDBLOCK) {
            return std::unexpected(Error{ErrorCode::WouldBlock,
                                         fmt::format("fd {} is full", fd_), err});
        }
        if (err == EPIPE || err == ECONNRESET) {
            return std::unexpected(Error{ErrorCode::SinkClosed,
                                         fmt::format("peer of fd {} closed", fd_), err});
        }
        return std::unexpected(Error{
            ErrorCode::SinkWriteFailed,
            fmt::format("write(fd {}) failed: {}", fd_, std::strerror(err)),
            err});
    }
}

void FdSink::Close() {
    if (!open_ && !handle_ && (ownership_ == Ownership::Borrowed || fd_ < 0)) {
        return;
    }
    open_ = false;

    auto retired = std::make_shared<RetiredFd>();
    retired->handle = std::move(handle_);
    if (ownership_ == Ownership::Owned) {
        retired->fd = fd_;
        fd_ = -1;
    }
    if (loop_ != nullptr) {
        loop_->Defer([retired]() {});
    }
}

void FdSink::Emit(SinkEvent event) {
    if (open_ && on_event_) {
        on_event_(event);
    }
}

void FdSink::Post(SinkEvent event) {
    std::weak_ptr<FdSink> weak_self = weak_from_this();
    loop_->Defer([weak_self, event]() {
        if (auto self = weak_self.lock()) self->Emit(event);
    });
}

void FdSink::HandleWritable() {
    Emit(SinkEvent::HasSpace);
}

void FdSink::HandleError(int error_code) {
    if (error_code == 0 || error_code == EPIPE || error_code == ECONNRESET) {
        Emit(SinkEvent::EndEncountered);
        return;
    }
    error_ = Error{ErrorCode::SinkWriteFailed,
                   fmt::format("fd {} failed: {}", fd_, std::strerror(error_code)),
                   error_code};
    Emit(SinkEvent::ErrorOccurred);
}

}  // namespace multistream
