#include <rangedb/query/query_executor.h>

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>

#include <exception>
#include <utility>

namespace rangedb::query {

namespace {

constexpr std::size_t kLoggedQueryLength = 200;

std::string truncateForLog(const std::string& sql) {
    if (sql.size() <= kLoggedQueryLength) {
        return sql;
    }
    return sql.substr(0, kLoggedQueryLength) + "...";
}

// Query-tier exhaustion is reported as a query failure; chunk and cancellation errors keep
// their own code.
Error queryError(const Error& error) {
    if (error.code == ErrorCode::RetryExhausted && error.retry &&
        error.retry->tier == Tier::QueryExecution) {
        return Error{ErrorCode::QueryExecutionFailed, error.message, error.retry};
    }
    return error;
}

} // namespace

QueryExecutor::QueryExecutor(std::shared_ptr<connection::ConnectionManager> manager,
                             QueryExecutorConfig config, QueryCache::Clock clock)
    : manager_(std::move(manager)), config_(config), cache_(config_.cache, std::move(clock)) {
    closeListener_ = manager_->addCloseListener([this](std::uint64_t connectionId) {
        const auto dropped = cache_.retireScope(connectionId);
        spdlog::debug("query cache: dropped {} entries of connection {}", dropped, connectionId);
    });
}

QueryExecutor::~QueryExecutor() {
    submitter_.join();
    worker_.join();
    manager_->removeCloseListener(closeListener_);
}

Result<QueryResult> QueryExecutor::run(const QueryRequest& request) {
    auto normalized = normalize(request);
    if (!normalized) {
        return normalized.error();
    }

    auto connection = manager_->acquire();
    if (!connection) {
        return connection.error();
    }
    const auto key = CacheKey::fromQuery(connection.value()->id(), normalized.value());

    if (auto cached = cache_.get(key)) {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.cacheHits;
        return std::move(*cached);
    }
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.cacheMisses;
    }

    auto promise = std::make_shared<std::promise<Result<QueryResult>>>();
    auto future = promise->get_future();
    boost::asio::post(worker_, [this, promise, conn = connection.value(), key,
                                query = std::move(normalized).value()]() {
        try {
            promise->set_value(execute(conn, key, query));
        } catch (const std::exception& e) {
            promise->set_value(Error{ErrorCode::InternalError,
                                     std::string("query worker exception: ") + e.what()});
        } catch (...) {
            promise->set_value(
                Error{ErrorCode::InternalError, "query worker threw unknown exception"});
        }
    });
    return future.get();
}

std::future<Result<QueryResult>> QueryExecutor::submit(QueryRequest request) {
    auto promise = std::make_shared<std::promise<Result<QueryResult>>>();
    auto future = promise->get_future();
    boost::asio::post(submitter_, [this, promise, request = std::move(request)]() {
        try {
            promise->set_value(run(request));
        } catch (const std::exception& e) {
            promise->set_value(Error{ErrorCode::InternalError,
                                     std::string("query submit exception: ") + e.what()});
        } catch (...) {
            promise->set_value(
                Error{ErrorCode::InternalError, "query submit threw unknown exception"});
        }
    });
    return future;
}

Result<std::optional<Row>> QueryExecutor::runSingle(const QueryRequest& request) {
    auto result = run(request);
    if (!result) {
        return result.error();
    }
    if (result.value().rows.empty()) {
        return std::optional<Row>{};
    }
    return std::optional<Row>{std::move(result.value().rows.front())};
}

Result<std::int64_t> QueryExecutor::runCount(const QueryRequest& request) {
    auto row = runSingle(request);
    if (!row) {
        return row.error();
    }
    if (!row.value() || row.value()->empty()) {
        return Error{ErrorCode::InvalidData, "count query returned no value"};
    }
    const Value& first = row.value()->front();
    if (const auto* integer = std::get_if<std::int64_t>(&first)) {
        return *integer;
    }
    if (const auto* real = std::get_if<double>(&first)) {
        return static_cast<std::int64_t>(*real);
    }
    return Error{ErrorCode::InvalidData,
                 "count query returned a non-numeric value: " + describeValue(first)};
}

Result<void> QueryExecutor::invalidate(const QueryRequest& request) {
    auto normalized = normalize(request);
    if (!normalized) {
        return normalized.error();
    }
    const auto state = manager_->state();
    if (state.status != connection::ConnectionStatus::Ready) {
        // Nothing can be cached for a connection that is not ready.
        return {};
    }
    cache_.invalidate(CacheKey::fromQuery(state.connectionId, normalized.value()));
    return {};
}

void QueryExecutor::clearCache() {
    cache_.clear();
}

ExecutorStats QueryExecutor::stats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

Result<QueryResult> QueryExecutor::execute(const std::shared_ptr<connection::Connection>& conn,
                                           const CacheKey& key, const NormalizedQuery& query) {
    // An identical request queued ahead of this one may have filled the entry.
    if (auto cached = cache_.get(key)) {
        return std::move(*cached);
    }

    const auto started = std::chrono::steady_clock::now();
    auto result = manager_->retrier()->execute(
        Tier::QueryExecution, "query",
        [&](const transport::AttemptContext& ctx) {
            return conn->engine().execute(query.text, query.params, ctx.shouldCancel);
        });
    recordExecution(conn->id(), query, started, std::chrono::steady_clock::now(), !result);

    if (!result) {
        const auto error = queryError(result.error());
        spdlog::debug("query failed: {} sql='{}'", error.describe(), truncateForLog(query.text));
        return error;
    }

    const auto state = manager_->state();
    if (state.status == connection::ConnectionStatus::Ready && state.connectionId == key.scope()) {
        const auto ttl = classifyStatement(query.text) == StatementKind::Read
                             ? config_.cache.selectTtl
                             : config_.cache.otherTtl;
        cache_.put(key, result.value(), std::chrono::duration_cast<std::chrono::milliseconds>(ttl));
    }
    return result;
}

void QueryExecutor::recordExecution(std::uint64_t connectionId, const NormalizedQuery& query,
                                    SteadyTimePoint started, SteadyTimePoint finished,
                                    bool failed) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(finished - started);
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
    const bool slow = elapsedMs > config_.slowQueryThreshold;
    std::uint64_t sequence = 0;
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        sequence = ++stats_.executions;
        stats_.totalExecutionTime += elapsed;
        if (slow) {
            ++stats_.slowQueries;
        }
        if (failed) {
            ++stats_.failures;
        }
    }
    if (slow) {
        spdlog::warn("slow query: duration_ms={} threshold_ms={} sql='{}' params={}",
                     elapsedMs.count(), config_.slowQueryThreshold.count(),
                     truncateForLog(query.text), serializeParams(query.params));
    }

    if (config_.onExecution) {
        ExecutionRecord record;
        record.sequence = sequence;
        record.connectionId = connectionId;
        record.sql = query.text;
        record.params = query.params;
        record.started = started;
        record.finished = finished;
        record.failed = failed;
        try {
            config_.onExecution(record);
        } catch (const std::exception& e) {
            spdlog::warn("query execution observer threw: {}", e.what());
        }
    }
}

} // namespace rangedb::query
