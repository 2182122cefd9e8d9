// SPDX-License-Identifier: MIT

// lib/stream/timer.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "lib/stream/event_loop.hpp"

namespace multistream {

/// Restartable one-shot timer on top of IEventLoop::Schedule().
///
/// Only the latest Start() ever fires: restarting or stopping leaves the
/// earlier Schedule() callbacks in the loop, but they find a newer
/// generation and do nothing. The Timer may be destroyed while armed, and
/// from inside its own callback.
///
/// @code
/// Timer retry(loop);
/// retry.OnTimer([this] { HandleSinkEvent(SinkEvent::HasSpace); });
/// retry.Start(100);
/// @endcode
class Timer {
public:
    using Callback = std::function<void()>;

    explicit Timer(IEventLoop& loop)
        : loop_(loop), alive_(std::make_shared<bool>(true)) {}

    ~Timer() { *alive_ = false; }

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;
    Timer(Timer&&) = delete;
    Timer& operator=(Timer&&) = delete;

    void OnTimer(Callback cb) { callback_ = std::move(cb); }

    /// Fire once after @p delay_ms, replacing any earlier Start().
    void Start(int delay_ms) {
        ++generation_;
        armed_ = true;
        Arm(delay_ms);
    }

    void Stop() {
        ++generation_;
        armed_ = false;
    }

    bool IsArmed() const { return armed_; }

private:
    void Arm(int delay_ms) {
        std::weak_ptr<bool> alive = alive_;
        uint64_t generation = generation_;
        loop_.Schedule(std::chrono::milliseconds(delay_ms), [this, alive, generation]() {
            auto token = alive.lock();
            if (token && *token && generation == generation_) {
                Fire();
            }
        });
    }

    void Fire() {
        if (!armed_) return;

        // Disarmed up front so the callback can Start() again. The copy
        // outlives a callback that destroys this Timer.
        armed_ = false;
        Callback callback = callback_;
        if (callback) {
            callback();
        }
    }

    IEventLoop& loop_;
    Callback callback_;
    bool armed_ = false;
    uint64_t generation_ = 0;
    std::shared_ptr<bool> alive_;
};

}  // namespace multistream
