// SPDX-License-Identifier: MIT

// lib/stream/event_loop.hpp
#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace multistream {

/// Registration of one fd with an IEventLoop.
///
/// Destroying the handle stops monitoring. The fd itself stays owned by
/// whoever registered it and must outlive the handle.
class IEventHandle {
public:
    virtual ~IEventHandle() = default;

    virtual int fd() const = 0;
};

/// Run loop that sinks, pipe readers and timers are driven from.
///
/// Readiness is edge-triggered: a callback fires when an fd becomes
/// readable or writable, not while it stays so. A writer that filled a
/// socket therefore waits for the next write callback, and one that did
/// not must Defer() its own follow-up.
///
/// All callbacks run on the loop thread. Adapt an existing loop (asio,
/// libuv) by implementing this interface; EventLoop wraps the built-in
/// epoll implementation.
class IEventLoop {
public:
    using ReadCallback = std::function<void()>;
    using WriteCallback = std::function<void()>;
    /// Receives the socket's SO_ERROR, or 0 for a plain hang-up.
    using ErrorCallback = std::function<void(int error_code)>;
    using TimerCallback = std::function<void()>;

    virtual ~IEventLoop() = default;

    /// Start monitoring @p fd.
    ///
    /// A hang-up or socket error is reported through @p on_error even when
    /// neither direction is wanted. Pending readable data is reported
    /// through @p on_read first.
    ///
    /// @throws std::system_error if the fd cannot be monitored
    virtual std::unique_ptr<IEventHandle> Register(
        int fd,
        bool want_read,
        bool want_write,
        ReadCallback on_read,
        WriteCallback on_write,
        ErrorCallback on_error) = 0;

    /// Run @p fn on the loop thread after the current callback returns.
    virtual void Defer(std::function<void()> fn) = 0;

    /// Run @p fn once, no earlier than @p delay from now.
    virtual void Schedule(std::chrono::milliseconds delay, TimerCallback fn) = 0;

    virtual bool IsInEventLoopThread() const = 0;
};

/// Owning wrapper around the epoll loop, for callers that only need
/// IEventLoop plus a way to turn it (see CollectAll()).
///
/// @code
/// EventLoop loop;
/// StreamAggregator aggregator(loop);
/// aggregator.AddFile("part1.bin");
/// auto bytes = CollectAll(loop, aggregator);
/// @endcode
class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;
    EventLoop(EventLoop&&) = delete;
    EventLoop& operator=(EventLoop&&) = delete;

    /// One round of deferred work and fd events; -1 waits indefinitely.
    void Poll(int timeout_ms = -1);

    operator IEventLoop&();
    operator const IEventLoop&() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace multistream
