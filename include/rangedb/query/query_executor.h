#pragma once

#include <rangedb/connection/connection_manager.h>
#include <rangedb/core/types.h>
#include <rangedb/core/value.h>
#include <rangedb/query/query_cache.h>
#include <rangedb/query/query_types.h>

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rangedb::query {

/**
 * One statement that reached the engine. `sequence` counts executions from 1 in the order the
 * worker ran them.
 */
struct ExecutionRecord {
    std::uint64_t sequence = 0;
    std::uint64_t connectionId = 0;
    std::string sql;
    std::vector<Value> params;
    SteadyTimePoint started{};
    SteadyTimePoint finished{};
    bool failed = false;
};

using ExecutionObserver = std::function<void(const ExecutionRecord&)>;

struct QueryExecutorConfig {
    QueryCacheConfig cache{};
    std::chrono::milliseconds slowQueryThreshold{100};
    // Called on the worker thread after every execution; cache hits are not reported.
    ExecutionObserver onExecution;
};

struct ExecutorStats {
    std::uint64_t executions = 0; // statements that reached the engine
    std::uint64_t cacheHits = 0;
    std::uint64_t cacheMisses = 0;
    std::uint64_t slowQueries = 0;
    std::uint64_t failures = 0;
    std::chrono::microseconds totalExecutionTime{0};
};

/**
 * Runs queries against one connection manager's engine.
 *
 * Results are cached per connection; a hit never touches the engine. Misses run one at a time on
 * a single worker thread, in submission order, through the retrier at the query-execution tier.
 * Closing the connection purges its entries.
 */
class QueryExecutor {
public:
    explicit QueryExecutor(std::shared_ptr<connection::ConnectionManager> manager,
                           QueryExecutorConfig config = {}, QueryCache::Clock clock = {});
    ~QueryExecutor();

    QueryExecutor(const QueryExecutor&) = delete;
    QueryExecutor& operator=(const QueryExecutor&) = delete;

    Result<QueryResult> run(const QueryRequest& request);

    // Same as run() but returns immediately; results arrive in submission order.
    std::future<Result<QueryResult>> submit(QueryRequest request);

    // First row, or nullopt when the statement produced none.
    Result<std::optional<Row>> runSingle(const QueryRequest& request);

    // First column of the first row as an integer (SELECT count(*) ...).
    Result<std::int64_t> runCount(const QueryRequest& request);

    // Drop the cached result of one request on the current connection.
    Result<void> invalidate(const QueryRequest& request);
    void clearCache();

    ExecutorStats stats() const;
    CacheStats cacheStats() const { return cache_.getStats(); }
    const QueryExecutorConfig& config() const { return config_; }

private:
    Result<QueryResult> execute(const std::shared_ptr<connection::Connection>& connection,
                                const CacheKey& key, const NormalizedQuery& query);
    void recordExecution(std::uint64_t connectionId, const NormalizedQuery& query,
                         SteadyTimePoint started, SteadyTimePoint finished, bool failed);

    std::shared_ptr<connection::ConnectionManager> manager_;
    QueryExecutorConfig config_;
    QueryCache cache_;
    std::uint64_t closeListener_ = 0;

    mutable std::mutex statsMutex_;
    ExecutorStats stats_;

    // Declared last so both pools drain before the members above go away.
    boost::asio::thread_pool worker_{1};
    boost::asio::thread_pool submitter_{1};
};

} // namespace rangedb::query
