#pragma once

#include <rangedb/config/database_config.h>
#include <rangedb/connection/connection_manager.h>
#include <rangedb/core/types.h>
#include <rangedb/core/value.h>
#include <rangedb/progress/progress_tracker.h>
#include <rangedb/query/query_executor.h>
#include <rangedb/query/query_types.h>

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rangedb::client {

/**
 * Application-facing handle on one remote database.
 *
 * acquireConnection() configures and starts the connection; runQuery() goes through the query
 * cache and the serialized executor; closeConnection() tears the connection down and purges its
 * cached results. A query after close fails with InvalidState until acquireConnection() is
 * called again, which builds a fresh connection. Progress subscriptions survive reconnects.
 */
class RemoteDatabase {
public:
    using ManagerFactory = std::function<std::shared_ptr<connection::ConnectionManager>(
        const config::DatabaseConfig&, std::shared_ptr<progress::ProgressTracker>)>;

    explicit RemoteDatabase(ManagerFactory factory = {});
    ~RemoteDatabase();

    RemoteDatabase(const RemoteDatabase&) = delete;
    RemoteDatabase& operator=(const RemoteDatabase&) = delete;

    Result<void> acquireConnection(const config::DatabaseConfig& config);

    Result<QueryResult> runQuery(const std::string& text, std::vector<Value> params = {});
    Result<QueryResult> runQuery(const query::QueryRequest& request);
    std::future<Result<QueryResult>> submitQuery(query::QueryRequest request);

    Result<std::optional<Row>> runQuerySingle(const query::QueryRequest& request);
    Result<std::int64_t> runCount(const query::QueryRequest& request);

    // True when SELECT 1 succeeds.
    bool isAvailable();

    void closeConnection();

    progress::SubscriptionId subscribeProgress(progress::ProgressCallback callback);
    bool unsubscribeProgress(progress::SubscriptionId id);
    progress::ProgressEvent progress() const { return progress_->snapshot(); }

    connection::ConnectionState connectionState() const;
    std::optional<query::ExecutorStats> executorStats() const;
    std::optional<config::DatabaseConfig> config() const;

private:
    struct Session {
        config::DatabaseConfig config;
        std::shared_ptr<connection::ConnectionManager> manager;
        std::shared_ptr<query::QueryExecutor> executor;
    };

    Result<std::shared_ptr<query::QueryExecutor>> currentExecutor() const;

    ManagerFactory factory_;
    std::shared_ptr<progress::ProgressTracker> progress_;

    mutable std::mutex mutex_;
    std::optional<Session> session_;
};

} // namespace rangedb::client
