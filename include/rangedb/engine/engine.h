#pragma once

#include <rangedb/core/types.h>
#include <rangedb/core/value.h>
#include <rangedb/engine/chunked_vfs.h>
#include <rangedb/engine/database.h>
#include <rangedb/storage/chunk_store.h>
#include <rangedb/transport/range_adapter.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rangedb::engine {

/**
 * The single query engine instance of a connection: a read-only SQLite handle opened through a
 * ChunkedVfs. Not reentrant; callers serialize, the internal mutex only guards against misuse.
 */
class Engine {
public:
    static Result<std::unique_ptr<Engine>> open(std::shared_ptr<storage::ChunkStore> store);

    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * Run one statement to completion. shouldCancel is polled while the statement runs and
     * interrupts it (OperationCancelled). A chunk failure during the statement is returned as
     * the chunk's own error; any other engine error becomes QueryExecutionFailed.
     */
    Result<QueryResult> execute(const std::string& sql, const std::vector<Value>& params,
                                const transport::ShouldCancel& shouldCancel = {});

    /**
     * SELECT sqlite_version() plus a schema read, forcing page 1 through the chunk path.
     */
    Result<void> sanityCheck(const transport::ShouldCancel& shouldCancel = {});

    const std::string& sqliteVersion() const { return sqliteVersion_; }
    const metadata::DatabaseIdentity& identity() const { return store_->identity(); }
    storage::ChunkStore& chunks() { return *store_; }
    // Statements run through execute(); the startup check is not counted.
    std::uint64_t executions() const { return executions_.load(); }

private:
    explicit Engine(std::shared_ptr<storage::ChunkStore> store);

    Result<QueryResult> run(const std::string& sql, const std::vector<Value>& params,
                            const transport::ShouldCancel& shouldCancel);

    std::shared_ptr<storage::ChunkStore> store_;
    std::unique_ptr<ChunkedVfs> vfs_;
    Database db_; // closed before vfs_ is unregistered
    std::mutex mutex_;
    std::string sqliteVersion_;
    std::atomic<std::uint64_t> executions_{0};
};

} // namespace rangedb::engine
