// SPDX-License-Identifier: MIT

// src/stream_aggregator.cpp
#include "src/stream_aggregator.hpp"

#include <algorithm>
#include <cassert>
#include <cstring>
#include <utility>

#include "lib/stream/log.hpp"

namespace multistream {

namespace {
constexpr std::string_view kLogComponent = "aggregator";
}  // namespace

StreamAggregator::StreamAggregator(IEventLoop& loop, AggregatorConfig config)
    : loop_(loop),
      config_(config),
      buffer_(std::make_unique<std::byte[]>(std::max<size_t>(config.buffer_size, 1))),
      capacity_(std::max<size_t>(config.buffer_size, 1)),
      retry_timer_(loop) {
    retry_timer_.OnTimer([this]() { HandleSinkEvent(SinkEvent::HasSpace); });
}

StreamAggregator::~StreamAggregator() {
    on_close_ = nullptr;
    Close();
}

// ============================================================================
// Source registration
// ============================================================================

void StreamAggregator::AddBytes(std::span<const std::byte> data) {
    if (state_ == AggregatorState::Closed) {
        Log(LogLevel::Warn, kLogComponent, "ignoring {} bytes added after close", data.size());
        return;
    }
    sources_.AppendBytes(data);
}

void StreamAggregator::AddBytes(std::string_view data) {
    AddBytes(std::as_bytes(std::span{data.data(), data.size()}));
}

bool StreamAggregator::AddFile(const std::filesystem::path& path) {
    if (state_ == AggregatorState::Closed) {
        Log(LogLevel::Warn, kLogComponent, "ignoring {} added after close", path.string());
        return false;
    }
    return sources_.AppendFile(path);
}

void StreamAggregator::AddSource(std::unique_ptr<ByteSource> source, uint64_t length) {
    if (state_ == AggregatorState::Closed) {
        Log(LogLevel::Warn, kLogComponent, "ignoring source added after close");
        return;
    }
    sources_.Append(std::move(source), length);
}

void StreamAggregator::AddSource(std::unique_ptr<ByteSource> source) {
    if (state_ == AggregatorState::Closed) {
        Log(LogLevel::Warn, kLogComponent, "ignoring source added after close");
        return;
    }
    Log(LogLevel::Debug, kLogComponent, "adding source of unknown length");
    sources_.Append(std::move(source), std::nullopt);
}

// ============================================================================
// Lifecycle
// ============================================================================

std::expected<void, Error> StreamAggregator::CheckUnopened(std::string_view operation) const {
    if (state_ == AggregatorState::Unopened) {
        return {};
    }
    Log(LogLevel::Warn, kLogComponent, "{} called while {}",
        operation, aggregator_state_name(state_));
    return std::unexpected(Error{
        ErrorCode::InvalidState,
        std::string(operation) + " requires an unopened aggregator, state is " +
            std::string(aggregator_state_name(state_))});
}

std::expected<PipeReader, Error> StreamAggregator::OpenForReading() {
    if (auto ok = CheckUnopened("OpenForReading"); !ok) {
        return std::unexpected(std::move(ok.error()));
    }

    auto pipe = BoundPipe::Create(capacity_);
    if (!pipe) {
        Log(LogLevel::Warn, kLogComponent, "cannot create bound pipe: {}", pipe.error().message);
        return std::unexpected(std::move(pipe.error()));
    }

    Log(LogLevel::Debug, kLogComponent, "opened for reading: reader fd {}, writer fd {}",
        pipe->reader.fd(), pipe->writer->fd());
    pipe_state_ = std::move(pipe->state);
    OpenSink(std::move(pipe->writer));
    return std::move(pipe->reader);
}

std::expected<void, Error> StreamAggregator::OpenForOutput(std::shared_ptr<ByteSink> sink) {
    if (auto ok = CheckUnopened("OpenForOutput"); !ok) {
        return ok;
    }
    if (!sink) {
        return std::unexpected(Error{ErrorCode::InvalidState, "OpenForOutput requires a sink"});
    }

    Log(LogLevel::Debug, kLogComponent, "opened for output");
    OpenSink(std::move(sink));
    return {};
}

void StreamAggregator::OpenSink(std::shared_ptr<ByteSink> sink) {
    sink_ = std::move(sink);
    state_ = AggregatorState::Open;
    sink_->Open(loop_, [this](SinkEvent event) { HandleSinkEvent(event); });
}

void StreamAggregator::Close() {
    if (state_ == AggregatorState::Closed) {
        return;
    }
    Log(LogLevel::Debug, kLogComponent, "closing ({} bytes written, {} discarded)",
        total_bytes_written_, valid_length_);
    state_ = AggregatorState::Closed;

    retry_timer_.Stop();
    if (sink_) {
        sink_->Close();
        sink_.reset();
    }
    pipe_state_.reset();

    buffer_.reset();
    valid_length_ = 0;

    sources_.Clear();

    if (on_close_) {
        auto cb = std::move(on_close_);
        on_close_ = nullptr;
        cb();
    }
}

// ============================================================================
// Event handling
// ============================================================================

void StreamAggregator::HandleSinkEvent(SinkEvent event) {
    AggregatorAction action = NextAction(state_, event);
    Log(LogLevel::Debug, kLogComponent, "{} while {}: {}", sink_event_name(event),
        aggregator_state_name(state_), aggregator_action_name(action));

    switch (action) {
        case AggregatorAction::Ignore:
            break;
        case AggregatorAction::Prime:
            Prime();
            break;
        case AggregatorAction::Drain:
            Drain();
            break;
        case AggregatorAction::Close:
            // Consumer closed its end early; unread bytes are dropped
            Close();
            break;
        case AggregatorAction::Fail: {
            Error error = sink_->error().value_or(
                Error{ErrorCode::SinkClosed, "sink reported an error"});
            RecordError(std::move(error), "sink");
            Close();
            break;
        }
    }
}

void StreamAggregator::Prime() {
    auto advanced = sources_.Advance();
    if (!advanced) {
        RecordError(std::move(advanced.error()), "source");
        return;
    }
    Refill();
}

void StreamAggregator::Drain() {
    // A bound pipe can report space before its reader is set up; bytes
    // written then may be lost, so wait for the reader instead.
    if (pipe_state_ && !pipe_state_->reader_open) {
        Log(LogLevel::Debug, kLogComponent, "reader not open yet, retrying in {}ms",
            config_.reader_retry_delay.count());
        retry_timer_.Start(static_cast<int>(config_.reader_retry_delay.count()));
        return;
    }

    if (valid_length_ == 0 && !Refill()) {
        FinishStream();
        return;
    }
    if (!DrainOnce()) {
        FinishStream();
    }
}

void StreamAggregator::FinishStream() {
    Log(LogLevel::Debug, kLogComponent, "end of stream after {} bytes", total_bytes_written_);

    // A consumer that stopped reading early is not a length mismatch
    auto length = sources_.Length();
    if (!error_ && !consumer_gone_ && length && total_bytes_written_ != *length) {
        Log(LogLevel::Warn, kLogComponent, "wrote {} bytes, but expected length was {}",
            total_bytes_written_, *length);
    }
    Close();
}

// ============================================================================
// Buffer engine
// ============================================================================

std::expected<size_t, Error> StreamAggregator::ReadFromSources(std::span<std::byte> dest) {
    // Nothing is read past a failure
    if (error_) {
        return std::unexpected(*error_);
    }

    size_t total = 0;
    while (!dest.empty()) {
        ByteSource* source = sources_.Current();
        if (source == nullptr) {
            break;
        }

        auto n = source->Read(dest);
        if (!n) {
            RecordError(std::move(n.error()), "source");
            break;
        }
        Log(LogLevel::Debug, kLogComponent, "read {} bytes from source", *n);

        if (*n > 0) {
            total += *n;
            dest = dest.subspan(*n);
            continue;
        }

        // Source exhausted: move on to the next one
        auto advanced = sources_.Advance();
        if (!advanced) {
            RecordError(std::move(advanced.error()), "source");
            break;
        }
        if (!*advanced) {
            break;
        }
    }

    if (total == 0 && error_) {
        return std::unexpected(*error_);
    }
    return total;
}

bool StreamAggregator::Refill() {
    auto read = ReadFromSources(
        std::span<std::byte>(buffer_.get() + valid_length_, capacity_ - valid_length_));
    if (!read || *read == 0) {
        Log(LogLevel::Debug, kLogComponent, "no more input to refill from");
        return false;
    }
    valid_length_ += *read;
    Log(LogLevel::Debug, kLogComponent, "refilled buffer to {} bytes", valid_length_);
    return true;
}

bool StreamAggregator::DrainOnce() {
    assert(valid_length_ > 0 && "DrainOnce() requires buffered bytes");

    auto written = sink_->Write(std::span<const std::byte>(buffer_.get(), valid_length_));
    if (!written) {
        if (written.error().code == ErrorCode::WouldBlock) {
            // Nothing taken; the sink signals again once it drains
            return true;
        }
        if (written.error().code == ErrorCode::SinkClosed) {
            // Same as EndEncountered, seen from the write side
            Log(LogLevel::Debug, kLogComponent, "sink consumer went away: {}",
                written.error().message);
            consumer_gone_ = true;
            return false;
        }
        RecordError(std::move(written.error()), "sink");
        return false;
    }
    if (*written == 0) {
        RecordError(Error{ErrorCode::SinkWriteFailed, "sink accepted no bytes"}, "sink");
        return false;
    }

    size_t n = *written;
    assert(n <= valid_length_ && "sink reported more bytes than offered");
    total_bytes_written_ += n;
    valid_length_ -= n;
    std::memmove(buffer_.get(), buffer_.get() + n, valid_length_);
    Log(LogLevel::Debug, kLogComponent, "wrote {} bytes ({} total), {} left in buffer",
        n, total_bytes_written_, valid_length_);

    if (valid_length_ <= capacity_ / 2) {
        Refill();
    }
    return valid_length_ > 0;
}

void StreamAggregator::RecordError(Error error, std::string_view origin) {
    Log(LogLevel::Warn, kLogComponent, "{} error ({}): {}", origin,
        error_category(error.code), error.message);
    if (!error_) {
        error_ = std::move(error);
    }
}

}  // namespace multistream
