// SPDX-License-Identifier: MIT

// src/stream_aggregator.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/timer.hpp"
#include "src/bound_pipe.hpp"
#include "src/byte_sink.hpp"
#include "src/byte_source.hpp"
#include "src/source_list.hpp"

namespace multistream {

/// Default staging buffer capacity.
inline constexpr size_t kDefaultBufferSize = 32768;

/// Configuration for a StreamAggregator.
struct AggregatorConfig {
    size_t buffer_size = kDefaultBufferSize;             ///< Staging buffer capacity in bytes
    std::chrono::milliseconds reader_retry_delay{100};   ///< Wait for an unopened PipeReader
};

/// Lifecycle of an aggregator. Closed is terminal.
enum class AggregatorState { Unopened, Open, Closed };

/// What the aggregator does in response to a sink event.
enum class AggregatorAction {
    Ignore,   ///< Event arrived outside the Open state
    Prime,    ///< Make the first source current and fill the buffer
    Drain,    ///< Write buffered bytes, refill, finish at end of data
    Close,    ///< Consumer went away; drop everything
    Fail,     ///< Record the sink's error, then close
};

constexpr std::string_view aggregator_state_name(AggregatorState state) {
    switch (state) {
        case AggregatorState::Unopened: return "unopened";
        case AggregatorState::Open:     return "open";
        case AggregatorState::Closed:   return "closed";
    }
    return "unknown";
}

constexpr std::string_view aggregator_action_name(AggregatorAction action) {
    switch (action) {
        case AggregatorAction::Ignore: return "ignore";
        case AggregatorAction::Prime:  return "prime";
        case AggregatorAction::Drain:  return "drain";
        case AggregatorAction::Close:  return "close";
        case AggregatorAction::Fail:   return "fail";
    }
    return "unknown";
}

/// Transition table of the sink event handler.
constexpr AggregatorAction NextAction(AggregatorState state, SinkEvent event) {
    if (state != AggregatorState::Open) {
        return AggregatorAction::Ignore;
    }
    switch (event) {
        case SinkEvent::OpenCompleted:  return AggregatorAction::Prime;
        case SinkEvent::HasSpace:       return AggregatorAction::Drain;
        case SinkEvent::EndEncountered: return AggregatorAction::Close;
        case SinkEvent::ErrorOccurred:  return AggregatorAction::Fail;
    }
    return AggregatorAction::Ignore;
}

/// Presents an ordered list of byte sources as one byte stream.
///
/// Sources are added first, then the aggregator is opened exactly once,
/// either as a readable stream (OpenForReading) or into a caller-supplied
/// sink (OpenForOutput). From then on it is driven by sink events on the
/// event loop: each time the sink has space, buffered bytes are written and
/// the buffer is refilled from the sources once it is at most half full.
/// When sources and buffer are both empty the aggregator closes itself.
///
/// Errors from sources and the sink are not thrown. The first one is kept
/// (see error()) and ends the stream; check it after the aggregator closed
/// to tell a clean end from a failed one.
///
/// Thread safety: Not thread-safe. All calls must be made on the event loop
/// thread that drives it.
///
/// @code
/// StreamAggregator aggregator(loop);
/// aggregator.AddBytes("--boundary\r\n");
/// aggregator.AddFile("attachment.bin");
/// auto reader = aggregator.OpenForReading();
/// @endcode
class StreamAggregator {
public:
    using CloseCallback = std::function<void()>;

    explicit StreamAggregator(IEventLoop& loop, AggregatorConfig config = {});
    ~StreamAggregator();

    StreamAggregator(const StreamAggregator&) = delete;
    StreamAggregator& operator=(const StreamAggregator&) = delete;
    StreamAggregator(StreamAggregator&&) = delete;
    StreamAggregator& operator=(StreamAggregator&&) = delete;

    // =========================================================================
    // Source registration
    // =========================================================================

    /// Append a copy of @p data. Empty input is ignored.
    void AddBytes(std::span<const std::byte> data);
    void AddBytes(std::string_view data);

    /// Append a file. Returns false if it cannot be stat'ed or opened.
    bool AddFile(const std::filesystem::path& path);

    /// Append a source that will produce exactly @p length bytes.
    void AddSource(std::unique_ptr<ByteSource> source, uint64_t length);

    /// Append a source of unknown length; Length() becomes unknown for good.
    void AddSource(std::unique_ptr<ByteSource> source);

    /// Sum of declared source lengths, nullopt if any is unknown.
    std::optional<uint64_t> Length() const { return sources_.Length(); }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Expose the concatenation as the read end of a bound pipe.
    ///
    /// The aggregator holds data back until the returned reader is Open()ed.
    /// Fails with InvalidState unless the aggregator is Unopened.
    std::expected<PipeReader, Error> OpenForReading();

    /// Push the concatenation into @p sink as it signals readiness.
    ///
    /// Fails with InvalidState unless the aggregator is Unopened.
    std::expected<void, Error> OpenForOutput(std::shared_ptr<ByteSink> sink);

    /// Stop immediately: close the sink, drop buffered bytes and sources.
    /// Safe to call in any state and more than once.
    void Close();

    /// Invoked once when the aggregator enters Closed.
    void OnClose(CloseCallback cb) { on_close_ = std::move(cb); }

    // =========================================================================
    // State
    // =========================================================================

    AggregatorState state() const { return state_; }
    bool IsOpen() const { return state_ == AggregatorState::Open; }

    /// First error from a source or the sink, if any.
    const std::optional<Error>& error() const { return error_; }

    uint64_t total_bytes_written() const { return total_bytes_written_; }

    /// Bytes currently staged in the buffer.
    size_t buffered() const { return valid_length_; }

    size_t capacity() const { return capacity_; }

    IEventLoop& loop() const { return loop_; }

private:
    void OpenSink(std::shared_ptr<ByteSink> sink);
    void HandleSinkEvent(SinkEvent event);

    void Prime();
    void Drain();
    void FinishStream();

    // Read across source boundaries into dest; records source errors
    std::expected<size_t, Error> ReadFromSources(std::span<std::byte> dest);

    // Top the buffer up; false when nothing could be read
    bool Refill();

    // Write buffered bytes once; false when the buffer ended up empty, the
    // sink failed or its consumer went away
    bool DrainOnce();

    void RecordError(Error error, std::string_view origin);
    std::expected<void, Error> CheckUnopened(std::string_view operation) const;

    IEventLoop& loop_;
    AggregatorConfig config_;
    SourceList sources_;

    std::unique_ptr<std::byte[]> buffer_;
    size_t capacity_;
    size_t valid_length_ = 0;

    std::shared_ptr<ByteSink> sink_;
    std::shared_ptr<const PipeState> pipe_state_;   // Set in OpenForReading mode
    Timer retry_timer_;

    uint64_t total_bytes_written_ = 0;
    bool consumer_gone_ = false;                    // Sink write hit SinkClosed
    std::optional<Error> error_;
    AggregatorState state_ = AggregatorState::Unopened;
    CloseCallback on_close_;
};

}  // namespace multistream
