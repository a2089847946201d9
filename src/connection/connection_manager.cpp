#include <rangedb/connection/connection_manager.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <exception>
#include <vector>

namespace rangedb::connection {

namespace {

std::atomic<std::uint64_t> g_nextConnectionId{1};

constexpr char kSqliteMagic[] = "SQLite format 3";
constexpr std::size_t kSqliteHeaderSize = 100;

bool fallbackEligible(const Error& cause) {
    switch (cause.code) {
        case ErrorCode::RetryExhausted:
        case ErrorCode::ChunkFetchFailed:
        case ErrorCode::MetadataUnavailable:
            return true;
        default:
            return false;
    }
}

Error startupError(const Error& cause) {
    return Error{ErrorCode::EngineInitFailed, "engine startup failed: " + cause.describe(),
                 cause.retry};
}

} // namespace

const char* statusToString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Uninitialized: return "uninitialized";
        case ConnectionStatus::Initializing: return "initializing";
        case ConnectionStatus::Ready: return "ready";
        case ConnectionStatus::Failed: return "failed";
        case ConnectionStatus::Closed: return "closed";
    }
    return "unknown";
}

std::uint32_t sqliteHeaderPageSize(ByteSpan header) {
    if (header.size() < kSqliteHeaderSize ||
        std::memcmp(header.data(), kSqliteMagic, sizeof(kSqliteMagic)) != 0) {
        return 0;
    }
    const auto hi = std::to_integer<std::uint32_t>(header[16]);
    const auto lo = std::to_integer<std::uint32_t>(header[17]);
    const std::uint32_t raw = (hi << 8) | lo;
    return raw == 1 ? 65536u : raw;
}

Connection::Connection(std::uint64_t id, std::shared_ptr<storage::ChunkStore> store,
                       std::unique_ptr<engine::Engine> engine, config::ServerMode mode,
                       bool viaFallback)
    : id_(id),
      store_(std::move(store)),
      engine_(std::move(engine)),
      mode_(mode),
      viaFallback_(viaFallback) {}

Connection::~Connection() {
    // Engine first: its VFS reads from store_.
    engine_.reset();
}

ConnectionManager::ConnectionManager(config::DatabaseConfig config,
                                     std::shared_ptr<transport::IRangeAdapter> adapter,
                                     std::shared_ptr<transport::TransportRetrier> retrier,
                                     std::shared_ptr<metadata::MetadataResolver> resolver,
                                     std::shared_ptr<progress::ProgressTracker> progress)
    : config_(std::move(config)),
      adapter_(std::move(adapter)),
      retrier_(std::move(retrier)),
      resolver_(std::move(resolver)),
      progress_(std::move(progress)) {
    if (!retrier_) {
        retrier_ =
            std::make_shared<transport::TransportRetrier>(config_.timeouts, config_.retry);
    }
    if (!resolver_) {
        resolver_ = std::make_shared<metadata::MetadataResolver>(adapter_, retrier_,
                                                                 config_.fetchOptions());
    }
    if (!progress_) {
        progress_ = std::make_shared<progress::ProgressTracker>(config_.progressWindow);
    }
}

ConnectionManager::~ConnectionManager() {
    close();
}

std::shared_ptr<ConnectionManager>
ConnectionManager::create(const config::DatabaseConfig& config,
                          std::shared_ptr<progress::ProgressTracker> progress) {
    std::shared_ptr<transport::IRangeAdapter> adapter = transport::makeRangeAdapter(config.source);
    auto retrier = std::make_shared<transport::TransportRetrier>(config.timeouts, config.retry);
    auto resolver =
        std::make_shared<metadata::MetadataResolver>(adapter, retrier, config.fetchOptions());
    return std::make_shared<ConnectionManager>(config, std::move(adapter), std::move(retrier),
                                               std::move(resolver), std::move(progress));
}

Result<std::shared_ptr<Connection>> ConnectionManager::acquire() {
    std::promise<Result<std::shared_ptr<Connection>>> promise;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        switch (status_) {
            case ConnectionStatus::Closed:
                return Error{ErrorCode::InvalidState,
                             "connection closed; create a new connection"};
            case ConnectionStatus::Ready:
                return connection_;
            case ConnectionStatus::Initializing: {
                auto pending = initFuture_;
                lock.unlock();
                return pending.get();
            }
            case ConnectionStatus::Uninitialized:
            case ConnectionStatus::Failed:
                break;
        }
        status_ = ConnectionStatus::Initializing;
        failure_.reset();
        initFuture_ = promise.get_future().share();
    }
    initializations_.fetch_add(1);
    spdlog::info("connection: initializing {} (mode={}, source={})", config_.url,
                 config::serverModeToString(config_.serverMode),
                 transport::sourceToString(config_.source));

    Result<std::shared_ptr<Connection>> outcome = Error{ErrorCode::InternalError, "not run"};
    try {
        outcome = initialize();
    } catch (const std::exception& e) {
        outcome = Error{ErrorCode::EngineInitFailed,
                        std::string("engine startup threw: ") + e.what()};
    }

    std::shared_ptr<Connection> orphan;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_.load()) {
            // close() ran while we were starting; it owns the final state.
            if (outcome) {
                orphan = std::move(outcome).value();
            }
            outcome = Error{ErrorCode::InvalidState, "connection closed during initialization"};
        } else if (outcome) {
            status_ = ConnectionStatus::Ready;
            connection_ = outcome.value();
        } else {
            status_ = ConnectionStatus::Failed;
            failure_ = outcome.error();
        }
    }
    if (outcome) {
        spdlog::info("connection: ready id={} url={} size={} chunks={}{}", outcome.value()->id(),
                     outcome.value()->identity().url, outcome.value()->identity().totalSize,
                     outcome.value()->identity().chunkCount,
                     outcome.value()->viaFallback() ? " (emergency fallback)" : "");
    } else if (!orphan) {
        spdlog::error("connection: {}", outcome.error().describe());
    }
    promise.set_value(outcome);
    return outcome;
}

void ConnectionManager::close() {
    Shared pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == ConnectionStatus::Closed) {
            return;
        }
        closing_.store(true);
        if (status_ == ConnectionStatus::Initializing) {
            pending = initFuture_;
        }
    }
    if (pending.valid()) {
        pending.wait();
    }

    std::shared_ptr<Connection> released;
    std::vector<CloseListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = ConnectionStatus::Closed;
        failure_.reset();
        released = std::move(connection_);
        for (const auto& [id, listener] : closeListeners_) {
            listeners.push_back(listener);
        }
    }
    resolver_->forget(config_.effectiveSuffixUrl());

    if (!released) {
        spdlog::info("connection: closed {} (no engine)", config_.url);
        return;
    }
    const auto id = released->id();
    released->chunks().clear();
    released.reset();
    spdlog::info("connection: closed id={} url={}", id, config_.url);

    for (const auto& listener : listeners) {
        try {
            listener(id);
        } catch (const std::exception& e) {
            spdlog::warn("connection: close listener failed: {}", e.what());
        }
    }
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ConnectionState state;
    state.status = status_;
    state.failure = failure_;
    if (status_ == ConnectionStatus::Ready && connection_) {
        state.connectionId = connection_->id();
    }
    return state;
}

std::uint64_t ConnectionManager::addCloseListener(CloseListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = nextListenerId_++;
    closeListeners_.emplace(id, std::move(listener));
    return id;
}

void ConnectionManager::removeCloseListener(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    closeListeners_.erase(id);
}

Result<std::shared_ptr<Connection>> ConnectionManager::initialize() {
    if (auto valid = config_.validate(); !valid) {
        return startupError(valid.error());
    }
    const auto id = g_nextConnectionId.fetch_add(1);

    if (config_.serverMode == config::ServerMode::Full) {
        auto full = initializeFull(id, Tier::BulkFetch, false);
        if (!full) {
            return startupError(full.error());
        }
        return full;
    }

    auto partial = initializePartial(id);
    if (partial) {
        return partial;
    }
    const Error cause = partial.error();
    if (!config_.emergencyFallback || !fallbackEligible(cause) || closing_.load()) {
        return startupError(cause);
    }

    spdlog::warn("connection: chunked startup failed ({}); trying full download",
                 cause.describe());
    auto full = initializeFull(id, Tier::EmergencyFallback, true);
    if (!full) {
        return startupError(Error{full.error().code,
                                  full.error().message + " (after chunked startup failed: " +
                                      cause.describe() + ")",
                                  full.error().retry});
    }
    return full;
}

Result<std::shared_ptr<Connection>> ConnectionManager::initializePartial(std::uint64_t id) {
    auto identity = resolver_->resolve(config_.effectiveSuffixUrl(), config_.url);
    if (!identity) {
        return identity.error();
    }
    progress_->begin(identity.value().totalSize, "chunked-load");

    storage::ChunkStoreConfig storeConfig;
    storeConfig.maxBytes = config_.chunkCacheBytes;
    storeConfig.fetch = config_.fetchOptions();
    auto store = std::make_shared<storage::ChunkStore>(identity.value(), adapter_, retrier_,
                                                       progress_, storeConfig);

    const transport::ShouldCancel aborted = [this] { return closing_.load(); };
    auto engine = retrier_->execute(
        Tier::EngineInit, "engine startup",
        [&](const transport::AttemptContext& ctx) -> Result<std::unique_ptr<engine::Engine>> {
            auto opened = engine::Engine::open(store);
            if (!opened) {
                return opened.error();
            }
            if (auto checked = opened.value()->sanityCheck(ctx.shouldCancel); !checked) {
                return checked.error();
            }
            return std::move(opened).value();
        },
        aborted);
    if (!engine) {
        return engine.error();
    }
    return std::make_shared<Connection>(id, std::move(store), std::move(engine).value(),
                                        config::ServerMode::Partial, false);
}

Result<std::shared_ptr<Connection>>
ConnectionManager::initializeFull(std::uint64_t id, Tier tier, bool viaFallback) {
    const transport::ShouldCancel aborted = [this] { return closing_.load(); };
    const auto baseOptions = config_.fetchOptions();

    auto body = retrier_->execute(
        tier, "full download of " + config_.url,
        [&](const transport::AttemptContext& ctx) -> Result<ByteVector> {
            progress_->begin(0, "full-download");
            auto options = baseOptions;
            options.timeout = ctx.remaining();
            options.onContentLength = [this](std::uint64_t total) {
                progress_->setTotalBytes(total);
            };
            ByteVector buffer;
            auto fetched = adapter_->fetchRange(
                config_.url, 0, 0, options,
                [&](ByteSpan piece) -> Result<void> {
                    buffer.insert(buffer.end(), piece.begin(), piece.end());
                    progress_->onBytes(piece.size());
                    return {};
                },
                ctx.shouldCancel);
            if (!fetched) {
                return fetched.error();
            }
            return buffer;
        },
        aborted);
    if (!body) {
        return body.error();
    }
    ByteVector& bytes = body.value();

    const auto pageSize = sqliteHeaderPageSize(ByteSpan{bytes.data(), bytes.size()});
    if (pageSize == 0) {
        return Error{ErrorCode::CorruptedData, config_.url + " is not a SQLite database"};
    }

    metadata::DatabaseIdentity identity;
    identity.url = config_.url;
    identity.totalSize = bytes.size();
    identity.pageSize = pageSize;
    identity.chunkSize = config_.requestChunkSize;
    identity.chunkCount = metadata::expectedChunkCount(identity.totalSize, identity.chunkSize);
    identity.formatVersion = metadata::SUFFIX_FORMAT_VERSION;
    if (auto valid = metadata::validateIdentity(identity); !valid) {
        return valid.error();
    }
    progress_->setTotalBytes(identity.totalSize);

    storage::ChunkStoreConfig storeConfig;
    storeConfig.maxBytes = std::max<std::size_t>(config_.chunkCacheBytes, bytes.size());
    storeConfig.fetch = config_.fetchOptions();
    auto store = std::make_shared<storage::ChunkStore>(identity, adapter_, retrier_, progress_,
                                                       storeConfig);
    for (std::uint32_t index = 0; index < identity.chunkCount; ++index) {
        const auto offset = identity.chunkOffset(index);
        const auto length = identity.chunkLength(index);
        ByteVector slice(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                         bytes.begin() + static_cast<std::ptrdiff_t>(offset + length));
        if (auto loaded = store->preload(index, std::move(slice)); !loaded) {
            return loaded.error();
        }
    }
    bytes.clear();
    bytes.shrink_to_fit();

    auto engine = retrier_->execute(
        tier, "engine startup (full)",
        [&](const transport::AttemptContext& ctx) -> Result<std::unique_ptr<engine::Engine>> {
            auto opened = engine::Engine::open(store);
            if (!opened) {
                return opened.error();
            }
            if (auto checked = opened.value()->sanityCheck(ctx.shouldCancel); !checked) {
                return checked.error();
            }
            return std::move(opened).value();
        },
        aborted);
    if (!engine) {
        return engine.error();
    }
    return std::make_shared<Connection>(id, std::move(store), std::move(engine).value(),
                                        config::ServerMode::Full, viaFallback);
}

} // namespace rangedb::connection
