#include <rangedb/client/remote_database.h>

#include <spdlog/spdlog.h>

namespace rangedb::client {

RemoteDatabase::RemoteDatabase(ManagerFactory factory)
    : factory_(std::move(factory)), progress_(std::make_shared<progress::ProgressTracker>()) {
    if (!factory_) {
        factory_ = [](const config::DatabaseConfig& config,
                      std::shared_ptr<progress::ProgressTracker> progress) {
            return connection::ConnectionManager::create(config, std::move(progress));
        };
    }
}

RemoteDatabase::~RemoteDatabase() {
    closeConnection();
}

Result<void> RemoteDatabase::acquireConnection(const config::DatabaseConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }

    std::shared_ptr<connection::ConnectionManager> manager;
    std::optional<Session> replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool reusable =
            session_ && session_->config.url == config.url &&
            session_->config.effectiveSuffixUrl() == config.effectiveSuffixUrl() &&
            session_->config.serverMode == config.serverMode &&
            session_->config.source == config.source &&
            session_->manager->state().status != connection::ConnectionStatus::Closed;
        if (!reusable) {
            if (session_) {
                replaced = std::move(session_);
                session_.reset();
            }
            Session session;
            session.config = config;
            session.manager = factory_(config, progress_);
            if (!session.manager) {
                return Error{ErrorCode::InternalError, "connection factory returned null"};
            }
            query::QueryExecutorConfig executorConfig;
            executorConfig.cache = config.queryCache;
            executorConfig.slowQueryThreshold = config.slowQueryThreshold;
            session.executor =
                std::make_shared<query::QueryExecutor>(session.manager, executorConfig);
            session_ = std::move(session);
        }
        manager = session_->manager;
    }

    if (replaced) {
        spdlog::info("remote database: switching from {} to {}", replaced->config.url,
                     config.url);
        replaced->manager->close();
    }

    auto connection = manager->acquire();
    if (!connection) {
        return connection.error();
    }
    return {};
}

Result<QueryResult> RemoteDatabase::runQuery(const std::string& text, std::vector<Value> params) {
    return runQuery(query::QueryRequest{text, std::move(params)});
}

Result<QueryResult> RemoteDatabase::runQuery(const query::QueryRequest& request) {
    auto executor = currentExecutor();
    if (!executor) {
        return executor.error();
    }
    return executor.value()->run(request);
}

std::future<Result<QueryResult>> RemoteDatabase::submitQuery(query::QueryRequest request) {
    auto executor = currentExecutor();
    if (!executor) {
        std::promise<Result<QueryResult>> failed;
        failed.set_value(executor.error());
        return failed.get_future();
    }
    return executor.value()->submit(std::move(request));
}

Result<std::optional<Row>> RemoteDatabase::runQuerySingle(const query::QueryRequest& request) {
    auto executor = currentExecutor();
    if (!executor) {
        return executor.error();
    }
    return executor.value()->runSingle(request);
}

Result<std::int64_t> RemoteDatabase::runCount(const query::QueryRequest& request) {
    auto executor = currentExecutor();
    if (!executor) {
        return executor.error();
    }
    return executor.value()->runCount(request);
}

bool RemoteDatabase::isAvailable() {
    auto result = runQuery(query::QueryRequest{"SELECT 1"});
    if (!result) {
        spdlog::debug("remote database: availability check failed: {}",
                      result.error().describe());
        return false;
    }
    return true;
}

void RemoteDatabase::closeConnection() {
    std::shared_ptr<connection::ConnectionManager> manager;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_) {
            return;
        }
        manager = session_->manager;
    }
    // The session stays so later queries report the closed state instead of "not configured".
    manager->close();
}

progress::SubscriptionId RemoteDatabase::subscribeProgress(progress::ProgressCallback callback) {
    return progress_->subscribe(std::move(callback));
}

bool RemoteDatabase::unsubscribeProgress(progress::SubscriptionId id) {
    return progress_->unsubscribe(id);
}

connection::ConnectionState RemoteDatabase::connectionState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return {};
    }
    return session_->manager->state();
}

std::optional<query::ExecutorStats> RemoteDatabase::executorStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return std::nullopt;
    }
    return session_->executor->stats();
}

std::optional<config::DatabaseConfig> RemoteDatabase::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return std::nullopt;
    }
    return session_->config;
}

Result<std::shared_ptr<query::QueryExecutor>> RemoteDatabase::currentExecutor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return Error{ErrorCode::InvalidState, "no connection; call acquireConnection() first"};
    }
    return session_->executor;
}

} // namespace rangedb::client
