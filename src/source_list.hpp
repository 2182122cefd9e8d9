// SPDX-License-Identifier: MIT

// src/source_list.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

#include "lib/stream/error.hpp"
#include "src/byte_source.hpp"

namespace multistream {

/// Ordered queue of byte sources, consumed from the front.
///
/// Insertion order is read order. The front source becomes current on
/// Advance(); once exhausted it is closed and dropped, never revisited.
/// Length() is the sum of declared lengths, or nullopt once any source was
/// appended with an unknown length (it never becomes known again).
///
/// Thread safety: Not thread-safe. Owned and driven by one aggregator.
class SourceList {
public:
    SourceList() = default;
    ~SourceList() { Clear(); }

    SourceList(const SourceList&) = delete;
    SourceList& operator=(const SourceList&) = delete;
    SourceList(SourceList&&) = delete;
    SourceList& operator=(SourceList&&) = delete;

    /// Push to the back. An unknown length makes Length() unknown for good.
    void Append(std::unique_ptr<ByteSource> source, std::optional<uint64_t> length);

    /// Copy bytes into a MemorySource. Empty input is ignored.
    void AppendBytes(std::span<const std::byte> data);
    void AppendBytes(std::string_view data);

    /// Append a regular file, opened when it becomes current.
    /// Returns false if it cannot be stat'ed or is not readable.
    bool AppendFile(const std::filesystem::path& path);

    /// Close and drop the current source (if any), then open the next one.
    /// Returns true if a new current source is available, false when the
    /// list is exhausted. A source that fails to open is dropped and its
    /// error returned.
    std::expected<bool, Error> Advance();

    /// Close the current source and drop everything still queued.
    void Clear();

    /// Source being drained, or nullptr before the first Advance() and
    /// after exhaustion.
    ByteSource* Current() const { return current_ ? entries_.front().source.get() : nullptr; }

    bool Empty() const noexcept { return entries_.empty(); }
    size_t size() const noexcept { return entries_.size(); }

    std::optional<uint64_t> Length() const {
        if (!length_known_) return std::nullopt;
        return length_;
    }

private:
    struct Entry {
        std::unique_ptr<ByteSource> source;
        std::optional<uint64_t> length;
    };

    std::deque<Entry> entries_;
    bool current_ = false;    // entries_.front() is open
    uint64_t length_ = 0;
    bool length_known_ = true;
};

}  // namespace multistream
