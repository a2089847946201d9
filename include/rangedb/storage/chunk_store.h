#pragma once

#include <rangedb/core/types.h>
#include <rangedb/metadata/descriptor.h>
#include <rangedb/progress/progress_tracker.h>
#include <rangedb/transport/range_adapter.h>
#include <rangedb/transport/retrier.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace rangedb::storage {

/**
 * One immutable chunk of the remote file.
 */
struct Chunk {
    std::uint32_t index = 0;
    std::shared_ptr<const ByteVector> bytes;
    TimePoint fetchedAt{};

    std::size_t size() const { return bytes ? bytes->size() : 0; }
};

struct ChunkStoreConfig {
    std::size_t maxBytes = DEFAULT_CHUNK_CACHE_BYTES;
    transport::FetchOptions fetch{};
};

struct ChunkStoreStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t fetches = 0;
    std::uint64_t failures = 0;
    std::uint64_t evictions = 0;
    std::uint64_t coalesced = 0; // callers that waited on another caller's fetch
    std::uint64_t bytesFetched = 0;
    std::size_t bytesCached = 0;
    std::size_t entries = 0;
};

/**
 * Byte-budgeted LRU cache of chunks for one database identity.
 *
 * A miss fetches exactly the chunk's range through the retrier at the bulk-fetch tier. At most
 * one fetch per index is in flight; concurrent callers for the same index wait for it. A failed
 * fetch inserts nothing. Running out of attempts is RetryExhausted, a terminal failure is
 * ChunkFetchFailed; both name the chunk and carry the retry context.
 */
class ChunkStore {
public:
    ChunkStore(metadata::DatabaseIdentity identity,
               std::shared_ptr<transport::IRangeAdapter> adapter,
               std::shared_ptr<transport::TransportRetrier> retrier,
               std::shared_ptr<progress::ProgressTracker> progress = nullptr,
               ChunkStoreConfig config = {});

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    Result<Chunk> get(const metadata::DatabaseIdentity& identity, std::uint32_t index);
    Result<Chunk> get(std::uint32_t index);

    /**
     * Cached chunk without I/O; does not touch LRU order or statistics.
     */
    std::optional<Chunk> peek(std::uint32_t index) const;
    bool contains(std::uint32_t index) const;

    /**
     * Insert bytes obtained elsewhere (full download). Length must match the chunk layout.
     */
    Result<void> preload(std::uint32_t index, ByteVector bytes);

    void clear();

    ChunkStoreStats stats() const;
    const metadata::DatabaseIdentity& identity() const { return identity_; }
    std::size_t maxBytes() const { return config_.maxBytes; }

private:
    using Shared = std::shared_future<Result<Chunk>>;

    Result<void> checkIndex(std::uint32_t index) const;
    Result<Chunk> fetch(std::uint32_t index);
    void insertLocked(const Chunk& chunk);
    void evictLocked(std::size_t incoming);

    const metadata::DatabaseIdentity identity_;
    std::shared_ptr<transport::IRangeAdapter> adapter_;
    std::shared_ptr<transport::TransportRetrier> retrier_;
    std::shared_ptr<progress::ProgressTracker> progress_;
    ChunkStoreConfig config_;

    mutable std::mutex mutex_;
    std::list<std::uint32_t> lruList_; // front = most recent
    struct Slot {
        Chunk chunk;
        std::list<std::uint32_t>::iterator lru;
    };
    std::unordered_map<std::uint32_t, Slot> chunks_;
    std::unordered_map<std::uint32_t, Shared> inflight_;
    std::size_t bytesCached_ = 0;
    ChunkStoreStats stats_;
};

} // namespace rangedb::storage
