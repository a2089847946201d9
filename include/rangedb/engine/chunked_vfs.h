#pragma once

#include <rangedb/core/types.h>
#include <rangedb/storage/chunk_store.h>

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rangedb::engine {

/**
 * Read-only SQLite VFS whose single file is backed by a ChunkStore.
 *
 * Each instance registers under a unique name and is unregistered on destruction, so every
 * connection gets its own VFS bound to its own chunk store. Reads are split at chunk boundaries;
 * writes and truncation fail with SQLITE_READONLY and journal probes report "absent". The first
 * chunk error seen by xRead is kept so the caller can report it instead of SQLITE_IOERR.
 */
class ChunkedVfs {
public:
    explicit ChunkedVfs(std::shared_ptr<storage::ChunkStore> store);
    ~ChunkedVfs();

    ChunkedVfs(const ChunkedVfs&) = delete;
    ChunkedVfs& operator=(const ChunkedVfs&) = delete;

    Result<void> registerVfs();
    void unregisterVfs();

    const std::string& name() const { return name_; }
    // Path handed to sqlite3_open_v2; any name works, the VFS serves one file.
    std::string fileName() const { return "/" + name_ + ".db"; }

    std::optional<Error> takeLastError();
    void clearLastError();

    storage::ChunkStore& store() { return *store_; }

    // Reads [offset, offset + amount) into out. Returns false and records the error on failure.
    bool readAt(void* out, int amount, sqlite3_int64 offset, bool& shortRead);

private:
    void recordError(Error error);

    std::shared_ptr<storage::ChunkStore> store_;
    std::string name_;
    sqlite3_vfs vfs_{};
    sqlite3_vfs* base_ = nullptr;
    bool registered_ = false;

    std::mutex errorMutex_;
    std::optional<Error> lastError_;
};

} // namespace rangedb::engine
