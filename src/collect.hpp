// SPDX-License-Identifier: MIT

// src/collect.hpp
#pragma once

#include <concepts>
#include <cstddef>
#include <expected>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "src/byte_sink.hpp"
#include "src/stream_aggregator.hpp"

namespace multistream {

/// An event loop the caller can drive one iteration at a time.
template <typename L>
concept PollableEventLoop = requires(L& loop) {
    { loop.Poll(0) };
    { static_cast<IEventLoop&>(loop) };
};

/// Run @p aggregator into a MemorySink and return everything it produced.
///
/// Polls @p loop until the aggregator closes. The aggregator must be
/// Unopened and bound to @p loop. Returns the first source or sink error
/// instead of the partial output.
///
/// @param max_write  Cap on bytes the sink takes per write
template <PollableEventLoop L>
std::expected<std::vector<std::byte>, Error> CollectAll(
        L& loop, StreamAggregator& aggregator,
        size_t max_write = MemorySink::kUnlimited) {
    IEventLoop& iface = loop;
    if (&iface != &aggregator.loop()) {
        return std::unexpected(Error{ErrorCode::InvalidState,
                                     "aggregator is bound to a different event loop"});
    }

    auto sink = MemorySink::Create(max_write);
    if (auto opened = aggregator.OpenForOutput(sink); !opened) {
        return std::unexpected(std::move(opened.error()));
    }

    while (aggregator.state() != AggregatorState::Closed) {
        loop.Poll(100);
    }

    if (aggregator.error()) {
        return std::unexpected(*aggregator.error());
    }
    return sink->TakeData();
}

}  // namespace multistream
