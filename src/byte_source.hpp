// SPDX-License-Identifier: MIT

// src/byte_source.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "lib/stream/error.hpp"

namespace multistream {

/// A byte-producing object that can be opened, read in chunks, and closed.
///
/// Sources are handed to a SourceList by unique_ptr and are drained only by
/// it. Read() is expected to return promptly: a positive count, 0 once the
/// source is exhausted, or an Error.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Prepare the source for reading. Called once, when it becomes current.
    virtual std::expected<void, Error> Open() = 0;

    /// Read up to dest.size() bytes. Returns 0 at end of source.
    virtual std::expected<size_t, Error> Read(std::span<std::byte> dest) = 0;

    /// Release any OS resources. Safe to call more than once.
    virtual void Close() = 0;

    /// Total bytes this source will produce, if known up front.
    virtual std::optional<uint64_t> Length() const = 0;
};

/// Source over an owned copy of a byte buffer.
class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::span<const std::byte> data)
        : data_(data.begin(), data.end()) {}

    explicit MemorySource(std::string_view data);

    explicit MemorySource(std::vector<std::byte>&& data)
        : data_(std::move(data)) {}

    std::expected<void, Error> Open() override {
        offset_ = 0;
        return {};
    }

    std::expected<size_t, Error> Read(std::span<std::byte> dest) override;

    void Close() override {}

    std::optional<uint64_t> Length() const override { return data_.size(); }

private:
    std::vector<std::byte> data_;
    size_t offset_ = 0;
};

/// Source reading a regular file, opened lazily on Open().
///
/// Reads are blocking POSIX reads; a regular file never reports
/// "would block", so the aggregator can treat them as prompt.
class FileSource : public ByteSource {
public:
    /// @param path    File to read
    /// @param length  Size from the stat done at registration
    FileSource(std::filesystem::path path, std::optional<uint64_t> length)
        : path_(std::move(path)), length_(length) {}

    ~FileSource() override { Close(); }

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;
    FileSource(FileSource&&) = delete;
    FileSource& operator=(FileSource&&) = delete;

    std::expected<void, Error> Open() override;
    std::expected<size_t, Error> Read(std::span<std::byte> dest) override;
    void Close() override;

    std::optional<uint64_t> Length() const override { return length_; }

    const std::filesystem::path& path() const { return path_; }
    bool IsOpen() const { return fd_ >= 0; }

private:
    std::filesystem::path path_;
    std::optional<uint64_t> length_;
    int fd_ = -1;
};

}  // namespace multistream
