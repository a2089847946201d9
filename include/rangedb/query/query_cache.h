#pragma once

#include <rangedb/core/types.h>
#include <rangedb/core/value.h>
#include <rangedb/query/cache_key.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <list>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace rangedb::query {

/**
 * @brief Configuration for the query result cache
 */
struct QueryCacheConfig {
    size_t maxEntries = 1000;                ///< Maximum number of cache entries
    size_t maxMemoryMB = 64;                 ///< Maximum memory usage in MB
    std::chrono::seconds selectTtl{300};     ///< TTL for read statements
    std::chrono::seconds otherTtl{60};       ///< TTL for everything else (PRAGMA, ...)
};

/**
 * @brief Generic cache entry with expiry
 */
template <typename T> struct CacheEntry {
    CacheKey key;
    T value;
    SteadyTimePoint createdAt{};
    std::chrono::milliseconds ttl{0};
    size_t memorySize = 0;

    bool isExpired(SteadyTimePoint now) const { return now - createdAt >= ttl; }
};

/**
 * @brief Snapshot of cache counters
 */
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t invalidations = 0;
    uint64_t insertions = 0;
    uint64_t ttlExpirations = 0;
    size_t currentSize = 0;
    size_t memoryUsage = 0;

    double hitRate() const {
        uint64_t total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

/**
 * @brief Thread-safe LRU cache of query results with per-entry TTL
 */
class QueryCache {
public:
    using Clock = std::function<SteadyTimePoint()>;

    explicit QueryCache(const QueryCacheConfig& config = {}, Clock clock = {});

    /**
     * @return nullopt if absent or expired
     */
    std::optional<QueryResult> get(const CacheKey& key);

    /**
     * @brief Store a result; a zero ttl or a retired scope stores nothing
     */
    void put(const CacheKey& key, const QueryResult& result, std::chrono::milliseconds ttl);

    bool contains(const CacheKey& key) const;
    void invalidate(const CacheKey& key);

    /**
     * @brief Drop every entry belonging to one connection scope
     */
    size_t invalidateScope(std::uint64_t scope);

    /**
     * @brief Drop a scope's entries and refuse any later put for it
     *
     * Used when a connection closes; a put racing the close either lands before and is dropped
     * here, or arrives after and is refused.
     */
    size_t retireScope(std::uint64_t scope);
    bool isRetired(std::uint64_t scope) const;

    void clear();
    size_t removeExpired();

    size_t size() const;
    size_t memoryUsage() const;
    CacheStats getStats() const;
    const QueryCacheConfig& getConfig() const { return config_; }

private:
    using Entry = CacheEntry<QueryResult>;

    size_t invalidateScopeLocked(std::uint64_t scope);
    void eraseLocked(std::unordered_map<CacheKey, Entry, CacheKeyHash>::iterator it);
    void evictLocked(size_t incoming);

    mutable std::shared_mutex mutex_;
    QueryCacheConfig config_;
    Clock clock_;

    std::list<CacheKey> lruList_; ///< front = most recently used
    std::unordered_map<CacheKey, std::list<CacheKey>::iterator, CacheKeyHash> keyToListIter_;
    std::unordered_map<CacheKey, Entry, CacheKeyHash> cache_;
    size_t memoryUsage_ = 0;
    std::unordered_set<std::uint64_t> retiredScopes_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> invalidations_{0};
    std::atomic<uint64_t> insertions_{0};
    std::atomic<uint64_t> ttlExpirations_{0};
};

} // namespace rangedb::query
