// SPDX-License-Identifier: MIT

// lib/stream/epoll_event_loop.hpp
#pragma once

#include <sys/epoll.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "lib/stream/event_loop.hpp"

namespace multistream {

class EpollEventLoop;

/// Edge-triggered epoll registration of one fd.
class EpollEventHandle : public IEventHandle {
public:
    /// @throws std::system_error if epoll_ctl(ADD) fails, e.g. for a
    ///         regular file or a closed fd
    EpollEventHandle(EpollEventLoop& loop, int fd,
                     bool want_read, bool want_write,
                     IEventLoop::ReadCallback on_read,
                     IEventLoop::WriteCallback on_write,
                     IEventLoop::ErrorCallback on_error);

    ~EpollEventHandle() override;

    EpollEventHandle(const EpollEventHandle&) = delete;
    EpollEventHandle& operator=(const EpollEventHandle&) = delete;
    EpollEventHandle(EpollEventHandle&&) = delete;
    EpollEventHandle& operator=(EpollEventHandle&&) = delete;

    int fd() const override { return fd_; }

    /// Dispatch one epoll_event mask: read, then hang-up or error, then
    /// write. Write readiness is dropped once the peer has hung up.
    void Dispatch(uint32_t events);

private:
    static uint32_t InterestMask(bool want_read, bool want_write);

    EpollEventLoop& loop_;
    int fd_;
    IEventLoop::ReadCallback on_read_;
    IEventLoop::WriteCallback on_write_;
    IEventLoop::ErrorCallback on_error_;
};

/// Single-threaded epoll loop with timerfd-backed Schedule().
///
/// Each Poll() runs deferred callbacks, waits for fd events, dispatches
/// them, and runs whatever the dispatch deferred. It does not block while
/// deferred work is pending, so a sink that re-signals itself through
/// Defer() keeps making progress without any fd activity.
///
/// Defer() may be called from any thread; everything else belongs to the
/// loop thread.
class EpollEventLoop : public IEventLoop {
public:
    /// @throws std::system_error if epoll or the wake-up eventfd cannot be created
    EpollEventLoop();
    ~EpollEventLoop() override;

    EpollEventLoop(const EpollEventLoop&) = delete;
    EpollEventLoop& operator=(const EpollEventLoop&) = delete;
    EpollEventLoop(EpollEventLoop&&) = delete;
    EpollEventLoop& operator=(EpollEventLoop&&) = delete;

    std::unique_ptr<IEventHandle> Register(
        int fd,
        bool want_read,
        bool want_write,
        ReadCallback on_read,
        WriteCallback on_write,
        ErrorCallback on_error) override;

    void Defer(std::function<void()> fn) override;

    /// @throws std::system_error if the timerfd cannot be created or armed
    void Schedule(std::chrono::milliseconds delay, TimerCallback fn) override;

    bool IsInEventLoopThread() const override;

    /// @param timeout_ms  Longest wait for fd events; -1 blocks
    void Poll(int timeout_ms);

    /// Scheduled callbacks that have not fired yet.
    size_t PendingTimers() const;

    int epoll_fd() const { return epoll_fd_; }

private:
    // One Schedule() call: a one-shot timerfd and its callback
    struct ScheduledTimer {
        int fd = -1;
        TimerCallback callback;
        std::unique_ptr<IEventHandle> handle;

        ~ScheduledTimer();
    };

    void Wake();
    void RunDeferred();
    void OnTimerFired(int timer_fd);

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<std::thread::id> loop_thread_{};

    mutable std::mutex mutex_;
    std::vector<std::function<void()>> deferred_;
    std::unordered_map<int, std::unique_ptr<ScheduledTimer>> timers_;

    // Fired timers whose handle may still be referenced by the epoll_event
    // batch being dispatched; released at the end of Poll()
    std::vector<std::unique_ptr<ScheduledTimer>> fired_;

    static constexpr int kMaxEvents = 64;
};

}  // namespace multistream
