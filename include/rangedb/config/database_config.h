#pragma once

#include <rangedb/core/types.h>
#include <rangedb/query/query_cache.h>
#include <rangedb/transport/range_adapter.h>
#include <rangedb/transport/retrier.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rangedb::config {

// partial = chunked range access; full = download the whole file once
enum class ServerMode { Full, Partial };

Result<ServerMode> parseServerMode(std::string_view text);
const char* serverModeToString(ServerMode mode);

/**
 * Everything a connection needs: where the database lives, how it is served, and the budgets
 * applied to fetching and caching it.
 */
struct DatabaseConfig {
    transport::Source source = transport::Source::Remote;
    ServerMode serverMode = ServerMode::Partial;
    std::uint32_t requestChunkSize = static_cast<std::uint32_t>(DEFAULT_CHUNK_SIZE);
    std::string url;
    std::string suffixUrl; // empty = url + ".suffix"

    transport::TimeoutTiers timeouts{};
    transport::RetryPolicy retry{};

    std::size_t chunkCacheBytes = DEFAULT_CHUNK_CACHE_BYTES;
    query::QueryCacheConfig queryCache{};
    std::chrono::milliseconds slowQueryThreshold{100};
    std::chrono::milliseconds progressWindow{3000};
    bool emergencyFallback = true;

    std::vector<transport::Header> headers;
    transport::TlsConfig tls{};
    std::optional<std::string> proxy;

    std::string effectiveSuffixUrl() const;
    transport::FetchOptions fetchOptions() const;
    Result<void> validate() const;
};

/**
 * Apply "section.key" values (see parse_config_file) on top of `config`.
 * Unknown keys are ignored; malformed values are InvalidArgument.
 */
Result<void> applyConfigValues(DatabaseConfig& config,
                               const std::map<std::string, std::string>& values);

// RANGEDB_URL, RANGEDB_SUFFIX_URL, RANGEDB_SOURCE, RANGEDB_SERVER_MODE
Result<void> applyEnvironmentOverrides(DatabaseConfig& config);

/**
 * Defaults, then the file at `path` (NotFound if it does not exist).
 */
Result<DatabaseConfig> loadDatabaseConfig(const std::filesystem::path& path);

/**
 * Defaults, then the config file from get_config_path(overridePath) if present, then the
 * environment. An explicit overridePath that does not exist is an error.
 */
Result<DatabaseConfig> resolveDatabaseConfig(const std::string& overridePath = "");

} // namespace rangedb::config
