// SPDX-License-Identifier: MIT

// tests/source_list_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <memory>
#include <string>

#include "src/source_list.hpp"
#include "tests/test_helpers.hpp"

using namespace multistream;
using multistream::testing::MockByteSource;
using multistream::testing::TempFile;
using multistream::testing::ToString;
using ::testing::Return;

namespace {

std::string ReadCurrent(SourceList& list) {
    std::string out;
    std::array<std::byte, 8> buf{};
    for (;;) {
        auto n = list.Current()->Read(buf);
        if (!n || *n == 0) break;
        out += ToString(std::span(buf.data(), *n));
    }
    return out;
}

}  // namespace

TEST(SourceListTest, EmptyListHasZeroLength) {
    SourceList list;
    EXPECT_TRUE(list.Empty());
    EXPECT_EQ(list.size(), 0u);
    EXPECT_EQ(list.Length(), 0u);
    EXPECT_EQ(list.Current(), nullptr);

    auto advanced = list.Advance();
    ASSERT_TRUE(advanced);
    EXPECT_FALSE(*advanced);
}

TEST(SourceListTest, LengthSumsKnownLengths) {
    SourceList list;
    list.AppendBytes("abc");
    list.AppendBytes("defgh");
    list.Append(std::make_unique<MemorySource>("ij"), 2);

    EXPECT_EQ(list.size(), 3u);
    EXPECT_EQ(list.Length(), 10u);
}

TEST(SourceListTest, UnknownLengthIsPermanent) {
    SourceList list;
    list.AppendBytes("abc");
    list.Append(std::make_unique<MemorySource>("?"), std::nullopt);
    EXPECT_EQ(list.Length(), std::nullopt);

    list.AppendBytes("more");
    EXPECT_EQ(list.Length(), std::nullopt);
}

TEST(SourceListTest, EmptyBytesAreIgnored) {
    SourceList list;
    list.AppendBytes("");
    list.AppendBytes(std::span<const std::byte>{});

    EXPECT_TRUE(list.Empty());
}

TEST(SourceListTest, AdvanceVisitsSourcesInOrder) {
    SourceList list;
    list.AppendBytes("first");
    list.AppendBytes("second");

    ASSERT_EQ(list.Advance(), true);
    EXPECT_EQ(ReadCurrent(list), "first");

    ASSERT_EQ(list.Advance(), true);
    EXPECT_EQ(ReadCurrent(list), "second");
    EXPECT_EQ(list.size(), 1u);

    ASSERT_EQ(list.Advance(), false);
    EXPECT_EQ(list.Current(), nullptr);
    EXPECT_TRUE(list.Empty());
}

TEST(SourceListTest, AdvanceClosesExhaustedSource) {
    SourceList list;
    auto mock = std::make_unique<MockByteSource>();
    EXPECT_CALL(*mock, Open()).WillOnce(Return(std::expected<void, Error>{}));
    EXPECT_CALL(*mock, Close()).Times(1);
    list.Append(std::move(mock), 0);

    ASSERT_EQ(list.Advance(), true);
    ASSERT_EQ(list.Advance(), false);
}

TEST(SourceListTest, OpenFailureDropsSourceAndReturnsError) {
    SourceList list;
    auto mock = std::make_unique<MockByteSource>();
    EXPECT_CALL(*mock, Open()).WillOnce(Return(std::unexpected(
        Error{ErrorCode::SourceOpenFailed, "gone"})));
    EXPECT_CALL(*mock, Close()).Times(1);
    list.Append(std::move(mock), 4);
    list.AppendBytes("next");

    auto advanced = list.Advance();
    ASSERT_FALSE(advanced);
    EXPECT_EQ(advanced.error().code, ErrorCode::SourceOpenFailed);
    EXPECT_EQ(list.Current(), nullptr);
    EXPECT_EQ(list.size(), 1u);
}

TEST(SourceListTest, ClearClosesCurrentAndDropsRest) {
    SourceList list;
    auto current = std::make_unique<MockByteSource>();
    auto queued = std::make_unique<MockByteSource>();
    EXPECT_CALL(*current, Open()).WillOnce(Return(std::expected<void, Error>{}));
    EXPECT_CALL(*current, Close()).Times(1);
    EXPECT_CALL(*queued, Open()).Times(0);
    EXPECT_CALL(*queued, Close()).Times(0);
    list.Append(std::move(current), 1);
    list.Append(std::move(queued), 1);

    ASSERT_EQ(list.Advance(), true);
    list.Clear();

    EXPECT_TRUE(list.Empty());
    EXPECT_EQ(list.Current(), nullptr);
}

TEST(SourceListTest, AppendFileUsesFileSize) {
    TempFile file("0123456789");
    SourceList list;

    EXPECT_TRUE(list.AppendFile(file.path()));
    EXPECT_EQ(list.Length(), 10u);

    ASSERT_EQ(list.Advance(), true);
    EXPECT_EQ(ReadCurrent(list), "0123456789");
}

TEST(SourceListTest, AppendFileRejectsMissingPath) {
    SourceList list;
    EXPECT_FALSE(list.AppendFile("/nonexistent/multistream/file"));
    EXPECT_TRUE(list.Empty());
    EXPECT_EQ(list.Length(), 0u);
}

TEST(SourceListTest, AppendFileRejectsDirectory) {
    SourceList list;
    EXPECT_FALSE(list.AppendFile(std::filesystem::temp_directory_path()));
    EXPECT_TRUE(list.Empty());
}
