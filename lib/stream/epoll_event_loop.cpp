// SPDX-License-Identifier: MIT

// lib/stream/epoll_event_loop.cpp
#include "lib/stream/epoll_event_loop.hpp"

#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

namespace multistream {

namespace {

[[noreturn]] void ThrowErrno(const char* what) {
    throw std::system_error(errno, std::system_category(), what);
}

}  // namespace

// EpollEventHandle

EpollEventHandle::EpollEventHandle(EpollEventLoop& loop, int fd,
                                   bool want_read, bool want_write,
                                   IEventLoop::ReadCallback on_read,
                                   IEventLoop::WriteCallback on_write,
                                   IEventLoop::ErrorCallback on_error)
    : loop_(loop),
      fd_(fd),
      on_read_(std::move(on_read)),
      on_write_(std::move(on_write)),
      on_error_(std::move(on_error)) {
    epoll_event ev{};
    ev.events = InterestMask(want_read, want_write);
    ev.data.ptr = this;
    if (epoll_ctl(loop_.epoll_fd(), EPOLL_CTL_ADD, fd_, &ev) < 0) {
        ThrowErrno("epoll_ctl(ADD)");
    }
}

EpollEventHandle::~EpollEventHandle() {
    // The fd may already be closed, in which case epoll dropped it itself
    epoll_ctl(loop_.epoll_fd(), EPOLL_CTL_DEL, fd_, nullptr);
}

void EpollEventHandle::Dispatch(uint32_t events) {
    if ((events & EPOLLIN) != 0 && on_read_) {
        on_read_();
    }

    if ((events & (EPOLLERR | EPOLLHUP)) != 0) {
        int error_code = 0;
        socklen_t len = sizeof(error_code);
        if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &error_code, &len) < 0) {
            error_code = 0;  // pipe or tty: a hang-up carries no error
        }
        if (on_error_) {
            on_error_(error_code);
        }
        return;
    }

    if ((events & EPOLLOUT) != 0 && on_write_) {
        on_write_();
    }
}

uint32_t EpollEventHandle::InterestMask(bool want_read, bool want_write) {
    uint32_t mask = EPOLLET;
    if (want_read) mask |= EPOLLIN;
    if (want_write) mask |= EPOLLOUT;
    return mask;
}

// EpollEventLoop

EpollEventLoop::ScheduledTimer::~ScheduledTimer() {
    handle.reset();
    if (fd >= 0) {
        close(fd);
    }
}

EpollEventLoop::EpollEventLoop() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        ThrowErrno("epoll_create1");
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        int err = errno;
        close(epoll_fd_);
        throw std::system_error(err, std::system_category(), "eventfd");
    }

    // data.ptr == nullptr marks the wake-up fd in Poll()
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.ptr = nullptr;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        int err = errno;
        close(wake_fd_);
        close(epoll_fd_);
        throw std::system_error(err, std::system_category(), "epoll_ctl(ADD) wake fd");
    }
}

EpollEventLoop::~EpollEventLoop() {
    // Anything holding a handle unregisters from epoll_fd_, so it goes first
    deferred_.clear();
    timers_.clear();
    fired_.clear();

    close(wake_fd_);
    close(epoll_fd_);
}

std::unique_ptr<IEventHandle> EpollEventLoop::Register(
    int fd,
    bool want_read,
    bool want_write,
    ReadCallback on_read,
    WriteCallback on_write,
    ErrorCallback on_error) {
    return std::make_unique<EpollEventHandle>(
        *this, fd, want_read, want_write,
        std::move(on_read), std::move(on_write), std::move(on_error));
}

void EpollEventLoop::Defer(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deferred_.push_back(std::move(fn));
    }
    if (!IsInEventLoopThread()) {
        Wake();
    }
}

void EpollEventLoop::Schedule(std::chrono::milliseconds delay, TimerCallback fn) {
    auto timer = std::make_unique<ScheduledTimer>();
    timer->fd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer->fd < 0) {
        ThrowErrno("timerfd_create");
    }
    timer->callback = std::move(fn);

    // An all-zero it_value would disarm the timerfd instead
    itimerspec spec{};
    spec.it_value.tv_sec = delay.count() / 1000;
    spec.it_value.tv_nsec = (delay.count() % 1000) * 1000000;
    if (spec.it_value.tv_sec == 0 && spec.it_value.tv_nsec == 0) {
        spec.it_value.tv_nsec = 1;
    }
    if (timerfd_settime(timer->fd, 0, &spec, nullptr) < 0) {
        ThrowErrno("timerfd_settime");
    }

    int timer_fd = timer->fd;
    timer->handle = Register(
        timer_fd, true, false,
        [this, timer_fd]() { OnTimerFired(timer_fd); },
        nullptr,
        nullptr);

    std::lock_guard<std::mutex> lock(mutex_);
    timers_.emplace(timer_fd, std::move(timer));
}

void EpollEventLoop::OnTimerFired(int timer_fd) {
    uint64_t expirations = 0;
    [[maybe_unused]] ssize_t n = read(timer_fd, &expirations, sizeof(expirations));

    TimerCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = timers_.find(timer_fd);
        if (it == timers_.end()) {
            return;
        }
        callback = std::move(it->second->callback);
        fired_.push_back(std::move(it->second));
        timers_.erase(it);
    }

    if (callback) {
        callback();
    }
}

bool EpollEventLoop::IsInEventLoopThread() const {
    return std::this_thread::get_id() == loop_thread_.load();
}

size_t EpollEventLoop::PendingTimers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void EpollEventLoop::Poll(int timeout_ms) {
    loop_thread_.store(std::this_thread::get_id());

    RunDeferred();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!deferred_.empty()) {
            timeout_ms = 0;
        }
    }

    epoll_event events[kMaxEvents];
    int nfds = epoll_wait(epoll_fd_, events, kMaxEvents, timeout_ms);
    if (nfds < 0) {
        if (errno == EINTR) {
            return;
        }
        ThrowErrno("epoll_wait");
    }

    for (int i = 0; i < nfds; ++i) {
        auto* handle = static_cast<EpollEventHandle*>(events[i].data.ptr);
        if (handle == nullptr) {
            uint64_t value;
            [[maybe_unused]] ssize_t n = read(wake_fd_, &value, sizeof(value));
            continue;
        }
        handle->Dispatch(events[i].events);
    }

    std::vector<std::unique_ptr<ScheduledTimer>> fired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fired.swap(fired_);
    }
    fired.clear();

    RunDeferred();
}

void EpollEventLoop::Wake() {
    uint64_t value = 1;
    [[maybe_unused]] ssize_t n = write(wake_fd_, &value, sizeof(value));
}

void EpollEventLoop::RunDeferred() {
    std::vector<std::function<void()>> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(deferred_);
    }
    for (auto& fn : batch) {
        if (fn) {
            fn();
        }
    }
}

// EventLoop

struct EventLoop::Impl : EpollEventLoop {};

EventLoop::EventLoop() : impl_(std::make_unique<Impl>()) {}

EventLoop::~EventLoop() = default;

void EventLoop::Poll(int timeout_ms) { impl_->Poll(timeout_ms); }

EventLoop::operator IEventLoop&() { return *impl_; }

EventLoop::operator const IEventLoop&() const { return *impl_; }

}  // namespace multistream
