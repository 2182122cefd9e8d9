// SPDX-License-Identifier: MIT

// src/bound_pipe.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <utility>

#include "lib/stream/error.hpp"
#include "src/byte_sink.hpp"

namespace multistream {

/// State shared by the two ends of a bound pipe.
struct PipeState {
    bool reader_open = false;   ///< PipeReader::Open() has been called
};

/// Read end of a bound pipe, handed to the consumer of an aggregator.
///
/// Move-only owner of a non-blocking fd. The consumer registers fd() with
/// its event loop, calls Open() once it is ready to receive, and reads until
/// Read() returns 0. Closing the reader early makes the writing side see
/// SinkEvent::EndEncountered.
class PipeReader {
public:
    PipeReader() = default;
    PipeReader(int fd, std::shared_ptr<PipeState> state)
        : fd_(fd), state_(std::move(state)) {}

    ~PipeReader() { Close(); }

    PipeReader(const PipeReader&) = delete;
    PipeReader& operator=(const PipeReader&) = delete;

    PipeReader(PipeReader&& other) noexcept
        : fd_(std::exchange(other.fd_, -1)),
          state_(std::move(other.state_)),
          at_end_(other.at_end_) {}

    PipeReader& operator=(PipeReader&& other) noexcept {
        if (this != &other) {
            Close();
            fd_ = std::exchange(other.fd_, -1);
            state_ = std::move(other.state_);
            at_end_ = other.at_end_;
        }
        return *this;
    }

    /// Mark the reader established; the writer holds data back until then.
    void Open() {
        if (state_) state_->reader_open = true;
    }

    bool IsOpen() const { return fd_ >= 0 && state_ && state_->reader_open; }

    /// Read up to dest.size() bytes.
    ///
    /// @return Bytes read, 0 at end of stream, ErrorCode::WouldBlock when
    ///         no data is ready yet.
    std::expected<size_t, Error> Read(std::span<std::byte> dest);

    /// Close the read end. Idempotent.
    void Close();

    /// True once Read() has returned 0.
    bool AtEnd() const { return at_end_; }

    int fd() const { return fd_; }

private:
    int fd_ = -1;
    std::shared_ptr<PipeState> state_;
    bool at_end_ = false;
};

/// Connected pair where bytes written to `writer` are read from `reader`.
///
/// Backed by a non-blocking AF_UNIX stream socketpair whose send buffer is
/// sized to the requested capacity (the kernel enforces a minimum), so the
/// writer sees backpressure once the consumer falls behind.
struct BoundPipe {
    PipeReader reader;
    std::shared_ptr<FdSink> writer;
    std::shared_ptr<const PipeState> state;

    /// @param capacity  Requested buffering between the two ends, in bytes
    static std::expected<BoundPipe, Error> Create(size_t capacity);
};

}  // namespace multistream
