#pragma once

#include <rangedb/config/database_config.h>
#include <rangedb/core/types.h>
#include <rangedb/engine/engine.h>
#include <rangedb/metadata/metadata_resolver.h>
#include <rangedb/progress/progress_tracker.h>
#include <rangedb/storage/chunk_store.h>
#include <rangedb/transport/range_adapter.h>
#include <rangedb/transport/retrier.h>

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace rangedb::connection {

enum class ConnectionStatus { Uninitialized, Initializing, Ready, Failed, Closed };

const char* statusToString(ConnectionStatus status);

struct ConnectionState {
    ConnectionStatus status = ConnectionStatus::Uninitialized;
    std::optional<Error> failure; // set while Failed
    std::uint64_t connectionId = 0; // set while Ready
};

/**
 * A ready engine plus the chunk store feeding it. Identified by a process-unique id that scopes
 * every cache entry derived from it.
 */
class Connection {
public:
    Connection(std::uint64_t id, std::shared_ptr<storage::ChunkStore> store,
               std::unique_ptr<engine::Engine> engine, config::ServerMode mode,
               bool viaFallback);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    std::uint64_t id() const { return id_; }
    const metadata::DatabaseIdentity& identity() const { return store_->identity(); }
    engine::Engine& engine() { return *engine_; }
    storage::ChunkStore& chunks() { return *store_; }
    config::ServerMode mode() const { return mode_; }
    bool viaFallback() const { return viaFallback_; }

private:
    std::uint64_t id_;
    std::shared_ptr<storage::ChunkStore> store_;
    std::unique_ptr<engine::Engine> engine_;
    config::ServerMode mode_;
    bool viaFallback_;
};

/**
 * Owns the single engine instance for one database.
 *
 * Uninitialized -> Initializing -> Ready | Failed, Failed -> Initializing on the next acquire(),
 * any state -> Closed on close(). Startup runs once no matter how many callers arrive while it is
 * in flight; they all receive its outcome. Closed is terminal: acquire() then fails with
 * InvalidState and a new manager must be built.
 */
class ConnectionManager {
public:
    using CloseListener = std::function<void(std::uint64_t connectionId)>;

    ConnectionManager(config::DatabaseConfig config,
                      std::shared_ptr<transport::IRangeAdapter> adapter,
                      std::shared_ptr<transport::TransportRetrier> retrier,
                      std::shared_ptr<metadata::MetadataResolver> resolver,
                      std::shared_ptr<progress::ProgressTracker> progress);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * Build a manager with the adapter matching config.source and a retrier using the
     * configured tiers and policy.
     */
    static std::shared_ptr<ConnectionManager>
    create(const config::DatabaseConfig& config,
           std::shared_ptr<progress::ProgressTracker> progress = nullptr);

    Result<std::shared_ptr<Connection>> acquire();

    /**
     * Release the engine, purge the chunk store and notify close listeners. Waits for an
     * in-flight startup, which is asked to stop at its next retry boundary.
     */
    void close();

    ConnectionState state() const;
    std::uint64_t initializationCount() const { return initializations_.load(); }

    std::uint64_t addCloseListener(CloseListener listener);
    void removeCloseListener(std::uint64_t id);

    const config::DatabaseConfig& config() const { return config_; }
    std::shared_ptr<transport::TransportRetrier> retrier() const { return retrier_; }
    std::shared_ptr<progress::ProgressTracker> progress() const { return progress_; }

private:
    using Shared = std::shared_future<Result<std::shared_ptr<Connection>>>;

    Result<std::shared_ptr<Connection>> initialize();
    Result<std::shared_ptr<Connection>> initializePartial(std::uint64_t id);
    Result<std::shared_ptr<Connection>> initializeFull(std::uint64_t id, Tier tier,
                                                       bool viaFallback);

    config::DatabaseConfig config_;
    std::shared_ptr<transport::IRangeAdapter> adapter_;
    std::shared_ptr<transport::TransportRetrier> retrier_;
    std::shared_ptr<metadata::MetadataResolver> resolver_;
    std::shared_ptr<progress::ProgressTracker> progress_;

    mutable std::mutex mutex_;
    ConnectionStatus status_ = ConnectionStatus::Uninitialized;
    std::optional<Error> failure_;
    std::shared_ptr<Connection> connection_;
    Shared initFuture_;
    std::atomic<bool> closing_{false};
    std::atomic<std::uint64_t> initializations_{0};

    std::map<std::uint64_t, CloseListener> closeListeners_;
    std::uint64_t nextListenerId_ = 1;
};

/**
 * Page size stored in a SQLite header (offset 16, big-endian, 1 means 65536); 0 if the buffer
 * is not a SQLite database.
 */
std::uint32_t sqliteHeaderPageSize(ByteSpan header);

} // namespace rangedb::connection
