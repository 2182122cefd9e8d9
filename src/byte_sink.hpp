// SPDX-License-Identifier: MIT

// src/byte_sink.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"

namespace multistream {

/// Readiness notifications a sink delivers to its writer.
enum class SinkEvent {
    OpenCompleted,    ///< Sink is ready; delivered once, before any HasSpace
    HasSpace,         ///< Sink can accept more bytes
    EndEncountered,   ///< The consuming end went away
    ErrorOccurred,    ///< The sink failed; see ByteSink::error()
};

constexpr std::string_view sink_event_name(SinkEvent event) {
    switch (event) {
        case SinkEvent::OpenCompleted:  return "open-completed";
        case SinkEvent::HasSpace:       return "has-space";
        case SinkEvent::EndEncountered: return "end-encountered";
        case SinkEvent::ErrorOccurred:  return "error-occurred";
    }
    return "unknown";
}

/// A byte-consuming destination that may accept only part of a write.
///
/// Events are delivered on the event loop thread, never from inside Open()
/// or Write(). After Close() no further events are delivered.
class ByteSink {
public:
    using EventCallback = std::function<void(SinkEvent)>;

    virtual ~ByteSink() = default;

    /// Start delivering events to @p on_event.
    virtual void Open(IEventLoop& loop, EventCallback on_event) = 0;

    /// Write up to data.size() bytes, returning how many were accepted.
    virtual std::expected<size_t, Error> Write(std::span<const std::byte> data) = 0;

    /// Stop delivering events and release the destination. Idempotent.
    virtual void Close() = 0;

    virtual bool IsOpen() const = 0;

    /// Error behind the last ErrorOccurred event, if any.
    virtual const std::optional<Error>& error() const = 0;
};

/// Sink accumulating everything written to it in memory.
///
/// Always has space. Each accepted write re-signals HasSpace through
/// IEventLoop::Defer(). @p max_write caps the bytes accepted per Write()
/// so a writer's partial-write handling can be exercised.
///
/// Must be owned by a std::shared_ptr (see Create()).
class MemorySink : public ByteSink,
                   public std::enable_shared_from_this<MemorySink> {
public:
    static constexpr size_t kUnlimited = std::numeric_limits<size_t>::max();

    explicit MemorySink(size_t max_write = kUnlimited) : max_write_(max_write) {}

    static std::shared_ptr<MemorySink> Create(size_t max_write = kUnlimited) {
        return std::make_shared<MemorySink>(max_write);
    }

    void Open(IEventLoop& loop, EventCallback on_event) override;
    std::expected<size_t, Error> Write(std::span<const std::byte> data) override;
    void Close() override;

    bool IsOpen() const override { return open_; }
    const std::optional<Error>& error() const override { return error_; }

    /// Bytes written so far; still readable after Close().
    const std::vector<std::byte>& data() const { return data_; }

    /// Move the collected bytes out.
    std::vector<std::byte> TakeData() { return std::move(data_); }

    /// Number of successful Write() calls.
    size_t write_count() const { return write_count_; }

private:
    void Post(SinkEvent event);

    size_t max_write_;
    IEventLoop* loop_ = nullptr;
    EventCallback on_event_;
    bool open_ = false;
    std::vector<std::byte> data_;
    size_t write_count_ = 0;
    std::optional<Error> error_;
};

/// Sink writing to a non-blocking, pollable fd (socket or pipe).
///
/// The fd is registered write-only and edge-triggered once OpenCompleted
/// has been delivered. A write that takes every byte re-signals HasSpace
/// through Defer(), since no new EPOLLOUT edge will follow; a short write
/// or EAGAIN waits for the next edge. Hang-up or peer reset surfaces as
/// EndEncountered, any other socket error as ErrorOccurred.
///
/// Must be owned by a std::shared_ptr (see Create()).
class FdSink : public ByteSink,
               public std::enable_shared_from_this<FdSink> {
public:
    enum class Ownership { Borrowed, Owned };

    FdSink(int fd, Ownership ownership);
    ~FdSink() override;

    FdSink(const FdSink&) = delete;
    FdSink& operator=(const FdSink&) = delete;
    FdSink(FdSink&&) = delete;
    FdSink& operator=(FdSink&&) = delete;

    /// @param fd         Non-blocking fd to write to
    /// @param ownership  Owned fds are closed by Close()
    static std::shared_ptr<FdSink> Create(int fd, Ownership ownership = Ownership::Borrowed) {
        return std::make_shared<FdSink>(fd, ownership);
    }

    void Open(IEventLoop& loop, EventCallback on_event) override;
    std::expected<size_t, Error> Write(std::span<const std::byte> data) override;
    void Close() override;

    bool IsOpen() const override { return open_; }
    const std::optional<Error>& error() const override { return error_; }

    int fd() const { return fd_; }

private:
    void Emit(SinkEvent event);
    void Post(SinkEvent event);
    void Register();
    void HandleWritable();
    void HandleError(int error_code);

    int fd_;
    Ownership ownership_;
    bool is_socket_ = false;
    IEventLoop* loop_ = nullptr;
    EventCallback on_event_;
    std::unique_ptr<IEventHandle> handle_;
    bool open_ = false;
    std::optional<Error> error_;
};

}  // namespace multistream
