#pragma once

#include <rangedb/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rangedb::metadata {

inline constexpr std::uint32_t SUFFIX_FORMAT_VERSION = 1;

/**
 * Immutable description of one remote database file and how it is partitioned.
 */
struct DatabaseIdentity {
    std::string url; // data file the chunk ranges are read from
    std::uint64_t totalSize{0};
    std::uint32_t pageSize{0};
    std::uint32_t chunkSize{0};
    std::uint32_t chunkCount{0};
    std::uint32_t formatVersion{0};

    std::uint64_t chunkOffset(std::uint32_t index) const {
        return static_cast<std::uint64_t>(index) * chunkSize;
    }
    // Length of chunk `index`; only the last one may be short.
    std::uint32_t chunkLength(std::uint32_t index) const;

    bool operator==(const DatabaseIdentity&) const = default;
};

/**
 * Optional per-chunk entry of a suffix descriptor.
 */
struct ChunkEntry {
    std::uint32_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::uint64_t size{0};
};

struct SuffixDescriptor {
    DatabaseIdentity identity;
    std::vector<ChunkEntry> chunks;
    nlohmann::json metadata; // free-form, null when absent
};

std::uint32_t expectedChunkCount(std::uint64_t totalSize, std::uint32_t chunkSize);

/**
 * Parse the JSON suffix descriptor. `descriptorUrl` resolves a relative `url` field; when the
 * field is missing `fallbackDataUrl` is used. Parse errors yield InvalidData, structural
 * problems (non-positive sizes, inconsistent chunk count, unknown version) CorruptedData.
 */
Result<SuffixDescriptor> parseSuffixDescriptor(std::string_view text,
                                               std::string_view descriptorUrl,
                                               std::string_view fallbackDataUrl = {});

Result<void> validateIdentity(const DatabaseIdentity& identity);

nlohmann::json identityToJson(const DatabaseIdentity& identity);

/**
 * Resolve `ref` against the directory of `base`. Absolute URLs and paths are returned as is.
 */
std::string resolveRelativeUrl(std::string_view base, std::string_view ref);

} // namespace rangedb::metadata
