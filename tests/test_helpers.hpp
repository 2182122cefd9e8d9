// SPDX-License-Identifier: MIT

// tests/test_helpers.hpp
#pragma once

#include <gmock/gmock.h>

#include <unistd.h>

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "src/byte_source.hpp"

namespace multistream::testing {

class MockByteSource : public ByteSource {
public:
    MOCK_METHOD((std::expected<void, Error>), Open, (), (override));
    MOCK_METHOD((std::expected<size_t, Error>), Read, (std::span<std::byte>), (override));
    MOCK_METHOD(void, Close, (), (override));
    MOCK_METHOD(std::optional<uint64_t>, Length, (), (const, override));
};

// Regular file holding the given contents, removed on destruction
class TempFile {
public:
    explicit TempFile(std::string_view contents) {
        std::string tmpl = (std::filesystem::temp_directory_path() / "multistream-XXXXXX").string();
        int fd = ::mkstemp(tmpl.data());
        if (fd >= 0) {
            ::close(fd);
        }
        path_ = tmpl;
        std::ofstream out(path_, std::ios::binary);
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::vector<std::byte> Bytes(std::string_view s) {
    auto span = std::as_bytes(std::span{s.data(), s.size()});
    return {span.begin(), span.end()};
}

inline std::string ToString(std::span<const std::byte> bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}  // namespace multistream::testing
