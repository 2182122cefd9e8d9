// SPDX-License-Identifier: MIT

// tests/collect_test.cpp
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "lib/stream/epoll_event_loop.hpp"
#include "src/collect.hpp"
#include "tests/test_helpers.hpp"

using namespace multistream;
using multistream::testing::TempFile;
using multistream::testing::ToString;

static_assert(PollableEventLoop<EventLoop>);
static_assert(PollableEventLoop<EpollEventLoop>);

TEST(CollectAllTest, ReturnsConcatenation) {
    EventLoop loop;
    TempFile file("middle");
    StreamAggregator aggregator(loop, AggregatorConfig{.buffer_size = 4});
    aggregator.AddBytes("start-");
    ASSERT_TRUE(aggregator.AddFile(file.path()));
    aggregator.AddBytes("-end");

    auto bytes = CollectAll(loop, aggregator);

    ASSERT_TRUE(bytes);
    EXPECT_EQ(ToString(*bytes), "start-middle-end");
    EXPECT_EQ(aggregator.state(), AggregatorState::Closed);
}

TEST(CollectAllTest, SmallBufferOverTwoSources) {
    const std::string first(70, 'a');
    const std::string second(100, 'b');
    EventLoop loop;
    StreamAggregator aggregator(loop, AggregatorConfig{.buffer_size = 16});
    aggregator.AddBytes(first);
    aggregator.AddBytes(second);

    auto bytes = CollectAll(loop, aggregator);

    ASSERT_TRUE(bytes);
    EXPECT_EQ(ToString(*bytes), first + second);
    EXPECT_EQ(aggregator.total_bytes_written(), 170u);
}

TEST(CollectAllTest, HonoursMaxWrite) {
    EpollEventLoop loop;
    StreamAggregator aggregator(loop, AggregatorConfig{.buffer_size = 8});
    aggregator.AddBytes("split into many tiny writes");

    auto bytes = CollectAll(loop, aggregator, 2);

    ASSERT_TRUE(bytes);
    EXPECT_EQ(ToString(*bytes), "split into many tiny writes");
}

TEST(CollectAllTest, ReturnsSourceError) {
    EpollEventLoop loop;
    auto file = std::make_unique<TempFile>("vanishing");
    StreamAggregator aggregator(loop);
    ASSERT_TRUE(aggregator.AddFile(file->path()));
    file.reset();

    auto bytes = CollectAll(loop, aggregator);

    ASSERT_FALSE(bytes);
    EXPECT_EQ(bytes.error().code, ErrorCode::SourceOpenFailed);
}

TEST(CollectAllTest, RejectsAggregatorOnAnotherLoop) {
    EpollEventLoop loop;
    EpollEventLoop other;
    StreamAggregator aggregator(other);

    auto bytes = CollectAll(loop, aggregator);

    ASSERT_FALSE(bytes);
    EXPECT_EQ(bytes.error().code, ErrorCode::InvalidState);
    EXPECT_EQ(aggregator.state(), AggregatorState::Unopened);
}

TEST(CollectAllTest, RejectsOpenedAggregator) {
    EpollEventLoop loop;
    StreamAggregator aggregator(loop);
    ASSERT_TRUE(aggregator.OpenForOutput(MemorySink::Create()));

    auto bytes = CollectAll(loop, aggregator);

    ASSERT_FALSE(bytes);
    EXPECT_EQ(bytes.error().code, ErrorCode::InvalidState);
}
