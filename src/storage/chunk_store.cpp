#include <rangedb/storage/chunk_store.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace rangedb::storage {

ChunkStore::ChunkStore(metadata::DatabaseIdentity identity,
                       std::shared_ptr<transport::IRangeAdapter> adapter,
                       std::shared_ptr<transport::TransportRetrier> retrier,
                       std::shared_ptr<progress::ProgressTracker> progress,
                       ChunkStoreConfig config)
    : identity_(std::move(identity)), adapter_(std::move(adapter)), retrier_(std::move(retrier)),
      progress_(std::move(progress)), config_(std::move(config)) {}

Result<void> ChunkStore::checkIndex(std::uint32_t index) const {
    if (index >= identity_.chunkCount) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("chunk index {} out of range (chunkCount {})", index,
                                 identity_.chunkCount)};
    }
    return {};
}

Result<Chunk> ChunkStore::get(const metadata::DatabaseIdentity& identity, std::uint32_t index) {
    if (identity.url != identity_.url || identity.chunkSize != identity_.chunkSize ||
        identity.totalSize != identity_.totalSize) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("chunk store for {} asked for a chunk of {}", identity_.url,
                                 identity.url)};
    }
    return get(index);
}

Result<Chunk> ChunkStore::get(std::uint32_t index) {
    if (auto ok = checkIndex(index); !ok) {
        return ok.error();
    }

    std::promise<Result<Chunk>> promise;
    Shared shared;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = chunks_.find(index); it != chunks_.end()) {
            lruList_.splice(lruList_.begin(), lruList_, it->second.lru);
            ++stats_.hits;
            return it->second.chunk;
        }
        ++stats_.misses;
        if (auto it = inflight_.find(index); it != inflight_.end()) {
            shared = it->second;
            ++stats_.coalesced;
        } else {
            shared = promise.get_future().share();
            inflight_.emplace(index, shared);
            owner = true;
        }
    }

    if (!owner) {
        return shared.get();
    }

    Result<Chunk> result = Error{ErrorCode::ChunkFetchFailed, "chunk fetch did not run"};
    try {
        result = fetch(index);
    } catch (const std::exception& e) {
        result = Error{ErrorCode::ChunkFetchFailed, fmt::format("chunk {}: {}", index, e.what())};
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        inflight_.erase(index);
        if (result) {
            ++stats_.fetches;
            stats_.bytesFetched += result.value().size();
            insertLocked(result.value());
        } else {
            ++stats_.failures;
        }
    }
    promise.set_value(result);

    if (result && progress_) {
        progress_->onBytes(result.value().size());
    }
    return result;
}

Result<Chunk> ChunkStore::fetch(std::uint32_t index) {
    const auto offset = identity_.chunkOffset(index);
    const auto length = identity_.chunkLength(index);
    const auto label = fmt::format("chunk {} of {}", index, identity_.url);

    spdlog::debug("fetching {} [{}, {})", label, offset, offset + length);

    auto fetched = retrier_->execute(
        Tier::BulkFetch, label, [&](const transport::AttemptContext& ctx) -> Result<ByteVector> {
            transport::FetchOptions opts = config_.fetch;
            opts.timeout = ctx.remaining();
            ByteVector buffer;
            buffer.reserve(length);
            auto r = adapter_->fetchRange(
                identity_.url, offset, length, opts,
                [&buffer, length](ByteSpan piece) -> Result<void> {
                    if (buffer.size() + piece.size() > length) {
                        return Error{ErrorCode::ChunkFetchFailed,
                                     "server returned more bytes than requested"};
                    }
                    buffer.insert(buffer.end(), piece.begin(), piece.end());
                    return {};
                },
                ctx.shouldCancel);
            if (!r) {
                return r.error();
            }
            if (buffer.size() != length) {
                return Error{ErrorCode::ChunkFetchFailed,
                             fmt::format("short chunk: got {} of {} bytes", buffer.size(),
                                         length)};
            }
            return buffer;
        });

    if (!fetched) {
        const auto& err = fetched.error();
        // Exhaustion stays RetryExhausted; anything else is a failure of this chunk.
        const auto code = err.code == ErrorCode::RetryExhausted ? ErrorCode::RetryExhausted
                                                                : ErrorCode::ChunkFetchFailed;
        return Error{code, label + ": " + err.message, err.retry};
    }

    Chunk chunk;
    chunk.index = index;
    chunk.bytes = std::make_shared<const ByteVector>(std::move(fetched).value());
    chunk.fetchedAt = std::chrono::system_clock::now();
    return chunk;
}

Result<void> ChunkStore::preload(std::uint32_t index, ByteVector bytes) {
    if (auto ok = checkIndex(index); !ok) {
        return ok.error();
    }
    if (bytes.size() != identity_.chunkLength(index)) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("preload of chunk {}: {} bytes, layout expects {}", index,
                                 bytes.size(), identity_.chunkLength(index))};
    }
    Chunk chunk;
    chunk.index = index;
    chunk.bytes = std::make_shared<const ByteVector>(std::move(bytes));
    chunk.fetchedAt = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    insertLocked(chunk);
    return {};
}

void ChunkStore::insertLocked(const Chunk& chunk) {
    if (auto it = chunks_.find(chunk.index); it != chunks_.end()) {
        bytesCached_ -= it->second.chunk.size();
        lruList_.erase(it->second.lru);
        chunks_.erase(it);
    }
    if (chunk.size() > config_.maxBytes) {
        spdlog::debug("chunk {} ({} bytes) exceeds cache budget {}; not cached", chunk.index,
                      chunk.size(), config_.maxBytes);
        return;
    }
    evictLocked(chunk.size());
    lruList_.push_front(chunk.index);
    chunks_.emplace(chunk.index, Slot{chunk, lruList_.begin()});
    bytesCached_ += chunk.size();
}

void ChunkStore::evictLocked(std::size_t incoming) {
    while (!lruList_.empty() && bytesCached_ + incoming > config_.maxBytes) {
        const auto victim = lruList_.back();
        lruList_.pop_back();
        auto it = chunks_.find(victim);
        if (it != chunks_.end()) {
            bytesCached_ -= it->second.chunk.size();
            chunks_.erase(it);
        }
        ++stats_.evictions;
        spdlog::debug("evicted chunk {} of {}", victim, identity_.url);
    }
}

std::optional<Chunk> ChunkStore::peek(std::uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = chunks_.find(index); it != chunks_.end()) {
        return it->second.chunk;
    }
    return std::nullopt;
}

bool ChunkStore::contains(std::uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.count(index) > 0;
}

void ChunkStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.clear();
    lruList_.clear();
    bytesCached_ = 0;
}

ChunkStoreStats ChunkStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto s = stats_;
    s.bytesCached = bytesCached_;
    s.entries = chunks_.size();
    return s;
}

} // namespace rangedb::storage
