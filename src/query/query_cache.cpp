#include <rangedb/query/query_cache.h>

#include <spdlog/spdlog.h>

#include <iterator>
#include <mutex>

namespace rangedb::query {

QueryCache::QueryCache(const QueryCacheConfig& config, Clock clock)
    : config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

std::optional<QueryResult> QueryCache::get(const CacheKey& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        misses_.fetch_add(1);
        return std::nullopt;
    }

    if (it->second.isExpired(clock_())) {
        eraseLocked(it);
        ttlExpirations_.fetch_add(1);
        misses_.fetch_add(1);
        return std::nullopt;
    }

    // Move to front for LRU
    if (auto li = keyToListIter_.find(key); li != keyToListIter_.end()) {
        lruList_.splice(lruList_.begin(), lruList_, li->second);
    }
    hits_.fetch_add(1);
    return it->second.value;
}

void QueryCache::put(const CacheKey& key, const QueryResult& result,
                     std::chrono::milliseconds ttl) {
    if (ttl.count() <= 0 || config_.maxEntries == 0) {
        return;
    }
    const size_t size = result.memorySize() + key.toString().size();
    const size_t maxMemory = config_.maxMemoryMB * 1024 * 1024;
    if (size > maxMemory) {
        spdlog::debug("query result of {} bytes exceeds cache budget; not cached", size);
        return;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (retiredScopes_.count(key.scope()) > 0) {
        spdlog::debug("query cache: scope {} is retired; result not cached", key.scope());
        return;
    }

    if (auto it = cache_.find(key); it != cache_.end()) {
        eraseLocked(it);
    }
    evictLocked(size);

    Entry entry;
    entry.key = key;
    entry.value = result;
    entry.createdAt = clock_();
    entry.ttl = ttl;
    entry.memorySize = size;

    lruList_.push_front(key);
    keyToListIter_[key] = lruList_.begin();
    cache_.emplace(key, std::move(entry));
    memoryUsage_ += size;
    insertions_.fetch_add(1);
}

bool QueryCache::contains(const CacheKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    return it != cache_.end() && !it->second.isExpired(clock_());
}

void QueryCache::invalidate(const CacheKey& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (auto it = cache_.find(key); it != cache_.end()) {
        eraseLocked(it);
        invalidations_.fetch_add(1);
    }
}

size_t QueryCache::invalidateScope(std::uint64_t scope) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return invalidateScopeLocked(scope);
}

size_t QueryCache::retireScope(std::uint64_t scope) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    retiredScopes_.insert(scope);
    return invalidateScopeLocked(scope);
}

bool QueryCache::isRetired(std::uint64_t scope) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return retiredScopes_.count(scope) > 0;
}

size_t QueryCache::invalidateScopeLocked(std::uint64_t scope) {
    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (it->first.scope() == scope) {
            auto next = std::next(it);
            eraseLocked(it);
            it = next;
            ++removed;
        } else {
            ++it;
        }
    }
    invalidations_.fetch_add(removed);
    return removed;
}

void QueryCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    invalidations_.fetch_add(cache_.size());
    cache_.clear();
    keyToListIter_.clear();
    lruList_.clear();
    memoryUsage_ = 0;
}

size_t QueryCache::removeExpired() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto now = clock_();
    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (it->second.isExpired(now)) {
            auto next = std::next(it);
            eraseLocked(it);
            it = next;
            ++removed;
        } else {
            ++it;
        }
    }
    ttlExpirations_.fetch_add(removed);
    return removed;
}

size_t QueryCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

size_t QueryCache::memoryUsage() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return memoryUsage_;
}

CacheStats QueryCache::getStats() const {
    CacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.evictions = evictions_.load();
    stats.invalidations = invalidations_.load();
    stats.insertions = insertions_.load();
    stats.ttlExpirations = ttlExpirations_.load();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    stats.currentSize = cache_.size();
    stats.memoryUsage = memoryUsage_;
    return stats;
}

void QueryCache::eraseLocked(std::unordered_map<CacheKey, Entry, CacheKeyHash>::iterator it) {
    memoryUsage_ -= it->second.memorySize;
    if (auto li = keyToListIter_.find(it->first); li != keyToListIter_.end()) {
        lruList_.erase(li->second);
        keyToListIter_.erase(li);
    }
    cache_.erase(it);
}

void QueryCache::evictLocked(size_t incoming) {
    const size_t maxMemory = config_.maxMemoryMB * 1024 * 1024;
    while (!lruList_.empty() &&
           (cache_.size() >= config_.maxEntries || memoryUsage_ + incoming > maxMemory)) {
        auto it = cache_.find(lruList_.back());
        if (it == cache_.end()) {
            lruList_.pop_back();
            continue;
        }
        eraseLocked(it);
        evictions_.fetch_add(1);
    }
}

} // namespace rangedb::query
