#include <rangedb/engine/engine.h>

#include <spdlog/spdlog.h>

namespace rangedb::engine {

Engine::Engine(std::shared_ptr<storage::ChunkStore> store)
    : store_(std::move(store)), vfs_(std::make_unique<ChunkedVfs>(store_)) {}

Engine::~Engine() {
    db_.close();
    vfs_.reset();
}

Result<std::unique_ptr<Engine>> Engine::open(std::shared_ptr<storage::ChunkStore> store) {
    if (!store) {
        return Error{ErrorCode::InvalidArgument, "Engine::open requires a chunk store"};
    }
    std::unique_ptr<Engine> engine(new Engine(std::move(store)));
    if (auto r = engine->vfs_->registerVfs(); !r) {
        return r.error();
    }
    if (auto r = engine->db_.open(engine->vfs_->fileName(), engine->vfs_->name()); !r) {
        if (auto chunkErr = engine->vfs_->takeLastError()) {
            return *chunkErr;
        }
        return r.error();
    }
    spdlog::debug("engine opened {} via {}", engine->identity().url, engine->vfs_->name());
    return std::move(engine);
}

Result<QueryResult> Engine::execute(const std::string& sql, const std::vector<Value>& params,
                                    const transport::ShouldCancel& shouldCancel) {
    executions_.fetch_add(1);
    return run(sql, params, shouldCancel);
}

Result<QueryResult> Engine::run(const std::string& sql, const std::vector<Value>& params,
                                const transport::ShouldCancel& shouldCancel) {
    std::lock_guard<std::mutex> lock(mutex_);
    vfs_->clearLastError();
    db_.setInterruptCheck(shouldCancel);

    auto result = db_.query(sql, params);
    db_.setInterruptCheck({});
    if (result) {
        return result;
    }

    if (auto chunkErr = vfs_->takeLastError()) {
        return *chunkErr;
    }
    const auto& err = result.error();
    if (db_.interrupted() || err.code == ErrorCode::OperationCancelled) {
        return Error{ErrorCode::OperationCancelled, "statement interrupted: " + err.message};
    }
    if (err.code == ErrorCode::InvalidArgument) {
        return err;
    }
    return Error{ErrorCode::QueryExecutionFailed, err.message};
}

Result<void> Engine::sanityCheck(const transport::ShouldCancel& shouldCancel) {
    auto version = run("SELECT sqlite_version()", {}, shouldCancel);
    if (!version) {
        return version.error();
    }
    if (!version.value().rows.empty() && !version.value().rows.front().empty()) {
        if (auto s = std::get_if<std::string>(&version.value().rows.front().front())) {
            sqliteVersion_ = *s;
        }
    }
    auto schema = run("SELECT count(*) FROM sqlite_master", {}, shouldCancel);
    if (!schema) {
        return schema.error();
    }
    spdlog::info("engine ready: sqlite {} serving {} ({} bytes)", sqliteVersion_,
                 identity().url, identity().totalSize);
    return {};
}

} // namespace rangedb::engine
