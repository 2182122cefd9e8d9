// SPDX-License-Identifier: MIT

// src/source_list.cpp
#include "src/source_list.hpp"

#include <unistd.h>

#include <system_error>

#include "lib/stream/log.hpp"

namespace multistream {

void SourceList::Append(std::unique_ptr<ByteSource> source,
                        std::optional<uint64_t> length) {
    if (!source) return;

    if (length) {
        length_ += *length;
    } else {
        if (length_known_) {
            Log(LogLevel::Debug, "source_list",
                "source #{} has unknown length; total length is now unknown",
                entries_.size());
        }
        length_known_ = false;
    }
    entries_.push_back(Entry{std::move(source), length});
}

void SourceList::AppendBytes(std::span<const std::byte> data) {
    if (data.empty()) return;
    Append(std::make_unique<MemorySource>(data), data.size());
}

void SourceList::AppendBytes(std::string_view data) {
    AppendBytes(std::as_bytes(std::span{data.data(), data.size()}));
}

bool SourceList::AppendFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        Log(LogLevel::Warn, "source_list", "cannot add {}: not a regular file{}{}",
            path.string(), ec ? ": " : "", ec ? ec.message() : "");
        return false;
    }

    uint64_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        Log(LogLevel::Warn, "source_list", "cannot stat {}: {}",
            path.string(), ec.message());
        return false;
    }

    if (::access(path.c_str(), R_OK) != 0) {
        Log(LogLevel::Warn, "source_list", "cannot add {}: not readable", path.string());
        return false;
    }

    Append(std::make_unique<FileSource>(path, size), size);
    return true;
}

std::expected<bool, Error> SourceList::Advance() {
    if (current_) {
        entries_.front().source->Close();
        entries_.pop_front();
        current_ = false;
    }

    if (entries_.empty()) {
        return false;
    }

    auto opened = entries_.front().source->Open();
    if (!opened) {
        entries_.front().source->Close();
        entries_.pop_front();
        return std::unexpected(std::move(opened.error()));
    }
    current_ = true;
    return true;
}

void SourceList::Clear() {
    if (current_) {
        entries_.front().source->Close();
        current_ = false;
    }
    entries_.clear();
}

}  // namespace multistream
