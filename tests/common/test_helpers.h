#pragma once

#include <rangedb/core/types.h>

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

namespace rangedb::tests {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "rangedb_test_") {
    static std::atomic<int> counter{0};
    auto base = std::filesystem::temp_directory_path();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" +
                         std::to_string(counter.fetch_add(1)));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

inline ByteVector make_bytes(std::size_t size, std::uint8_t seed = 0) {
    ByteVector out(size);
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = static_cast<std::byte>((i + seed) & 0xff);
    }
    return out;
}

} // namespace rangedb::tests
