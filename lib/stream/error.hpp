// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace multistream {

/// Error codes for source, sink and aggregator operations.
enum class ErrorCode {
    // Sources
    SourceOpenFailed,      ///< File could not be stat'ed or opened
    SourceReadFailed,      ///< A source reported an error mid-read

    // Sinks
    SinkWriteFailed,       ///< The sink rejected a write
    SinkClosed,            ///< The sink reported an error or was already closed
    WouldBlock,            ///< Non-blocking fd cannot accept or supply bytes right now

    // Pipe
    PipeCreateFailed,      ///< socketpair() or socket option setup failed

    // State
    InvalidState,          ///< Method called in wrong aggregator state
};

/// Error payload returned through std::expected and kept as the sticky error.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
};

/// Return a short category string for an error code (e.g. "source", "sink").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::SourceOpenFailed:
        case ErrorCode::SourceReadFailed:
            return "source";
        case ErrorCode::SinkWriteFailed:
        case ErrorCode::SinkClosed:
        case ErrorCode::WouldBlock:
            return "sink";
        case ErrorCode::PipeCreateFailed:
            return "pipe";
        case ErrorCode::InvalidState:
            return "state";
    }
    return "unknown";
}

}  // namespace multistream
