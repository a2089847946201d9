#include <rangedb/engine/chunked_vfs.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cstring>

namespace rangedb::engine {

namespace {

std::atomic<std::uint64_t> g_vfsCounter{0};

struct ChunkedFile {
    sqlite3_file base;
    ChunkedVfs* owner;
};

ChunkedVfs* ownerOf(sqlite3_vfs* vfs) {
    return static_cast<ChunkedVfs*>(vfs->pAppData);
}

int xClose(sqlite3_file*) {
    return SQLITE_OK;
}

int xRead(sqlite3_file* file, void* out, int amount, sqlite3_int64 offset) {
    auto* f = reinterpret_cast<ChunkedFile*>(file);
    bool shortRead = false;
    if (!f->owner->readAt(out, amount, offset, shortRead)) {
        return SQLITE_IOERR_READ;
    }
    return shortRead ? SQLITE_IOERR_SHORT_READ : SQLITE_OK;
}

int xWrite(sqlite3_file*, const void*, int, sqlite3_int64) {
    return SQLITE_READONLY;
}

int xTruncate(sqlite3_file*, sqlite3_int64) {
    return SQLITE_READONLY;
}

int xSync(sqlite3_file*, int) {
    return SQLITE_OK;
}

int xFileSize(sqlite3_file* file, sqlite3_int64* size) {
    auto* f = reinterpret_cast<ChunkedFile*>(file);
    *size = static_cast<sqlite3_int64>(f->owner->store().identity().totalSize);
    return SQLITE_OK;
}

int xLock(sqlite3_file*, int) {
    return SQLITE_OK;
}

int xUnlock(sqlite3_file*, int) {
    return SQLITE_OK;
}

int xCheckReservedLock(sqlite3_file*, int* out) {
    *out = 0;
    return SQLITE_OK;
}

int xFileControl(sqlite3_file*, int, void*) {
    return SQLITE_NOTFOUND;
}

int xSectorSize(sqlite3_file*) {
    return 512;
}

int xDeviceCharacteristics(sqlite3_file*) {
    return SQLITE_IOCAP_IMMUTABLE;
}

const sqlite3_io_methods kIoMethods = {
    1, // iVersion
    xClose,
    xRead,
    xWrite,
    xTruncate,
    xSync,
    xFileSize,
    xLock,
    xUnlock,
    xCheckReservedLock,
    xFileControl,
    xSectorSize,
    xDeviceCharacteristics,
    nullptr,
    nullptr,
    nullptr,
    nullptr,
    nullptr,
    nullptr,
};

int xOpen(sqlite3_vfs* vfs, const char*, sqlite3_file* file, int flags, int* outFlags) {
    file->pMethods = nullptr;
    if ((flags & SQLITE_OPEN_MAIN_DB) == 0) {
        return SQLITE_CANTOPEN;
    }
    auto* f = reinterpret_cast<ChunkedFile*>(file);
    f->owner = ownerOf(vfs);
    f->base.pMethods = &kIoMethods;
    if (outFlags) {
        *outFlags = SQLITE_OPEN_READONLY;
    }
    return SQLITE_OK;
}

int xDelete(sqlite3_vfs*, const char*, int) {
    return SQLITE_IOERR_DELETE;
}

int xAccess(sqlite3_vfs*, const char*, int, int* out) {
    *out = 0;
    return SQLITE_OK;
}

int xFullPathname(sqlite3_vfs*, const char* name, int size, char* out) {
    sqlite3_snprintf(size, out, "%s", name);
    return SQLITE_OK;
}

// Everything below delegates to the platform VFS.
sqlite3_vfs* baseOf(sqlite3_vfs* vfs) {
    return sqlite3_vfs_find(nullptr) == vfs ? nullptr : sqlite3_vfs_find(nullptr);
}

void* xDlOpen(sqlite3_vfs* vfs, const char* path) {
    auto* b = baseOf(vfs);
    return b ? b->xDlOpen(b, path) : nullptr;
}

void xDlError(sqlite3_vfs* vfs, int n, char* msg) {
    auto* b = baseOf(vfs);
    if (b) {
        b->xDlError(b, n, msg);
    } else if (n > 0) {
        msg[0] = '\0';
    }
}

void (*xDlSym(sqlite3_vfs* vfs, void* handle, const char* sym))(void) {
    auto* b = baseOf(vfs);
    return b ? b->xDlSym(b, handle, sym) : nullptr;
}

void xDlClose(sqlite3_vfs* vfs, void* handle) {
    auto* b = baseOf(vfs);
    if (b) {
        b->xDlClose(b, handle);
    }
}

int xRandomness(sqlite3_vfs* vfs, int n, char* out) {
    auto* b = baseOf(vfs);
    if (b) {
        return b->xRandomness(b, n, out);
    }
    std::memset(out, 0, static_cast<std::size_t>(n));
    return n;
}

int xSleep(sqlite3_vfs* vfs, int micros) {
    auto* b = baseOf(vfs);
    return b ? b->xSleep(b, micros) : 0;
}

int xCurrentTime(sqlite3_vfs* vfs, double* out) {
    auto* b = baseOf(vfs);
    return b ? b->xCurrentTime(b, out) : SQLITE_ERROR;
}

int xGetLastError(sqlite3_vfs*, int, char*) {
    return 0;
}

} // namespace

ChunkedVfs::ChunkedVfs(std::shared_ptr<storage::ChunkStore> store)
    : store_(std::move(store)), name_("rangedb-" + std::to_string(++g_vfsCounter)) {
    base_ = sqlite3_vfs_find(nullptr);

    vfs_.iVersion = 1;
    vfs_.szOsFile = static_cast<int>(sizeof(ChunkedFile));
    vfs_.mxPathname = base_ ? base_->mxPathname : 512;
    vfs_.pNext = nullptr;
    vfs_.zName = name_.c_str();
    vfs_.pAppData = this;
    vfs_.xOpen = xOpen;
    vfs_.xDelete = xDelete;
    vfs_.xAccess = xAccess;
    vfs_.xFullPathname = xFullPathname;
    vfs_.xDlOpen = xDlOpen;
    vfs_.xDlError = xDlError;
    vfs_.xDlSym = xDlSym;
    vfs_.xDlClose = xDlClose;
    vfs_.xRandomness = xRandomness;
    vfs_.xSleep = xSleep;
    vfs_.xCurrentTime = xCurrentTime;
    vfs_.xGetLastError = xGetLastError;
}

ChunkedVfs::~ChunkedVfs() {
    unregisterVfs();
}

Result<void> ChunkedVfs::registerVfs() {
    if (registered_) {
        return {};
    }
    int rc = sqlite3_vfs_register(&vfs_, 0);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     "Failed to register VFS " + name_ + ": " + sqlite3_errstr(rc)};
    }
    registered_ = true;
    spdlog::debug("registered VFS {} for {}", name_, store_->identity().url);
    return {};
}

void ChunkedVfs::unregisterVfs() {
    if (registered_) {
        sqlite3_vfs_unregister(&vfs_);
        registered_ = false;
        spdlog::debug("unregistered VFS {}", name_);
    }
}

bool ChunkedVfs::readAt(void* out, int amount, sqlite3_int64 offset, bool& shortRead) {
    shortRead = false;
    if (amount <= 0 || offset < 0) {
        return true;
    }
    const auto& id = store_->identity();
    auto* dst = static_cast<std::byte*>(out);
    std::uint64_t pos = static_cast<std::uint64_t>(offset);
    std::uint64_t left = static_cast<std::uint64_t>(amount);

    while (left > 0) {
        if (pos >= id.totalSize) {
            // SQLite requires the unread tail to be zero-filled on a short read.
            std::memset(dst, 0, static_cast<std::size_t>(left));
            shortRead = true;
            return true;
        }
        const auto index = static_cast<std::uint32_t>(pos / id.chunkSize);
        const auto within = static_cast<std::size_t>(pos % id.chunkSize);
        auto chunk = store_->get(index);
        if (!chunk) {
            recordError(chunk.error());
            return false;
        }
        const auto& bytes = *chunk.value().bytes;
        if (within >= bytes.size()) {
            recordError(Error{ErrorCode::CorruptedData,
                              "chunk " + std::to_string(index) + " shorter than expected"});
            return false;
        }
        const auto n = std::min<std::uint64_t>(left, bytes.size() - within);
        std::memcpy(dst, bytes.data() + within, static_cast<std::size_t>(n));
        dst += n;
        pos += n;
        left -= n;
    }
    return true;
}

void ChunkedVfs::recordError(Error error) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    if (!lastError_) {
        lastError_ = std::move(error);
    }
}

std::optional<Error> ChunkedVfs::takeLastError() {
    std::lock_guard<std::mutex> lock(errorMutex_);
    auto out = std::move(lastError_);
    lastError_.reset();
    return out;
}

void ChunkedVfs::clearLastError() {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_.reset();
}

} // namespace rangedb::engine
