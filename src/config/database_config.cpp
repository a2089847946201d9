#include <rangedb/config/config_helpers.h>
#include <rangedb/config/database_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace rangedb::config {

namespace {

Error badValue(const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument,
                 "invalid value for " + key + ": '" + value + "'"};
}

std::optional<double> parse_double(const std::string& s) {
    std::string v = s;
    trim(v);
    if (v.empty())
        return std::nullopt;
    char* end = nullptr;
    const double d = std::strtod(v.c_str(), &end);
    if (end != v.c_str() + v.size())
        return std::nullopt;
    return d;
}

} // namespace

Result<ServerMode> parseServerMode(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "full")
        return ServerMode::Full;
    if (lower == "partial")
        return ServerMode::Partial;
    return Error{ErrorCode::InvalidArgument,
                 "Unknown server mode '" + std::string(text) + "' (expected full or partial)"};
}

const char* serverModeToString(ServerMode mode) {
    return mode == ServerMode::Full ? "full" : "partial";
}

std::string DatabaseConfig::effectiveSuffixUrl() const {
    return suffixUrl.empty() ? url + ".suffix" : suffixUrl;
}

transport::FetchOptions DatabaseConfig::fetchOptions() const {
    transport::FetchOptions opts;
    opts.headers = headers;
    opts.tls = tls;
    opts.proxy = proxy;
    return opts;
}

Result<void> DatabaseConfig::validate() const {
    if (url.empty()) {
        return Error{ErrorCode::InvalidArgument, "database url is required"};
    }
    if (requestChunkSize == 0) {
        return Error{ErrorCode::InvalidArgument, "requestChunkSize must be positive"};
    }
    for (auto t : {timeouts.engineInit, timeouts.bulkFetch, timeouts.queryExecution,
                   timeouts.emergencyFallback}) {
        if (t.count() <= 0) {
            return Error{ErrorCode::InvalidArgument, "timeouts must be positive"};
        }
    }
    if (retry.maxAttempts < 1) {
        return Error{ErrorCode::InvalidArgument, "retry.maxAttempts must be at least 1"};
    }
    if (retry.multiplier < 1.0 || retry.initialBackoff.count() < 0) {
        return Error{ErrorCode::InvalidArgument, "retry backoff must not shrink"};
    }
    if (chunkCacheBytes < requestChunkSize) {
        return Error{ErrorCode::InvalidArgument,
                     "chunk cache budget is smaller than one chunk"};
    }
    return {};
}

Result<void> applyConfigValues(DatabaseConfig& config,
                               const std::map<std::string, std::string>& values) {
    for (const auto& [key, value] : values) {
        if (key == "database.url") {
            config.url = value;
        } else if (key == "database.suffix_url") {
            config.suffixUrl = value;
        } else if (key == "database.source") {
            auto s = transport::parseSource(value);
            if (!s)
                return s.error();
            config.source = s.value();
        } else if (key == "database.server_mode") {
            auto m = parseServerMode(value);
            if (!m)
                return m.error();
            config.serverMode = m.value();
        } else if (key == "database.request_chunk_size") {
            auto n = parse_integer(value);
            if (!n || *n <= 0 || *n > 0x7fffffff)
                return badValue(key, value);
            config.requestChunkSize = static_cast<std::uint32_t>(*n);
        } else if (key == "database.emergency_fallback") {
            auto b = parse_bool(value);
            if (!b)
                return badValue(key, value);
            config.emergencyFallback = *b;
        } else if (key == "database.slow_query_threshold") {
            auto d = parse_duration_ms(value);
            if (!d)
                return badValue(key, value);
            config.slowQueryThreshold = *d;
        } else if (key == "database.progress_window") {
            auto d = parse_duration_ms(value);
            if (!d || d->count() <= 0)
                return badValue(key, value);
            config.progressWindow = *d;
        } else if (key == "database.proxy") {
            if (!value.empty())
                config.proxy = value;
        } else if (key == "database.tls_insecure") {
            auto b = parse_bool(value);
            if (!b)
                return badValue(key, value);
            config.tls.insecure = *b;
        } else if (key == "database.ca_path") {
            config.tls.caPath = expand_tilde(value).string();
        } else if (key.rfind("database.header.", 0) == 0) {
            config.headers.push_back({key.substr(16), value});
        } else if (key.rfind("timeouts.", 0) == 0) {
            auto d = parse_duration_ms(value);
            if (!d || d->count() <= 0)
                return badValue(key, value);
            if (key == "timeouts.engine_init")
                config.timeouts.engineInit = *d;
            else if (key == "timeouts.bulk_fetch")
                config.timeouts.bulkFetch = *d;
            else if (key == "timeouts.query_execution")
                config.timeouts.queryExecution = *d;
            else if (key == "timeouts.emergency_fallback")
                config.timeouts.emergencyFallback = *d;
        } else if (key == "retry.max_attempts") {
            auto n = parse_integer(value);
            if (!n || *n < 1 || *n > 100)
                return badValue(key, value);
            config.retry.maxAttempts = static_cast<int>(*n);
        } else if (key == "retry.initial_backoff") {
            auto d = parse_duration_ms(value);
            if (!d)
                return badValue(key, value);
            config.retry.initialBackoff = *d;
        } else if (key == "retry.max_backoff") {
            auto d = parse_duration_ms(value);
            if (!d)
                return badValue(key, value);
            config.retry.maxBackoff = *d;
        } else if (key == "retry.multiplier") {
            auto m = parse_double(value);
            if (!m || *m < 1.0)
                return badValue(key, value);
            config.retry.multiplier = *m;
        } else if (key == "cache.chunk_cache_mb") {
            auto n = parse_integer(value);
            if (!n || *n <= 0)
                return badValue(key, value);
            config.chunkCacheBytes = static_cast<std::size_t>(*n) * 1024 * 1024;
        } else if (key == "cache.query_max_entries") {
            auto n = parse_integer(value);
            if (!n || *n < 0)
                return badValue(key, value);
            config.queryCache.maxEntries = static_cast<std::size_t>(*n);
        } else if (key == "cache.query_max_memory_mb") {
            auto n = parse_integer(value);
            if (!n || *n <= 0)
                return badValue(key, value);
            config.queryCache.maxMemoryMB = static_cast<std::size_t>(*n);
        } else if (key == "cache.select_ttl" || key == "cache.other_ttl") {
            auto d = parse_duration_ms(value);
            if (!d || d->count() < 0)
                return badValue(key, value);
            auto secs = std::chrono::duration_cast<std::chrono::seconds>(*d);
            if (key == "cache.select_ttl")
                config.queryCache.selectTtl = secs;
            else
                config.queryCache.otherTtl = secs;
        } else {
            spdlog::debug("ignoring unknown config key {}", key);
        }
    }
    return {};
}

Result<void> applyEnvironmentOverrides(DatabaseConfig& config) {
    if (const char* env = std::getenv("RANGEDB_URL"); env && *env) {
        config.url = env;
    }
    if (const char* env = std::getenv("RANGEDB_SUFFIX_URL"); env && *env) {
        config.suffixUrl = env;
    }
    if (const char* env = std::getenv("RANGEDB_SOURCE"); env && *env) {
        auto s = transport::parseSource(env);
        if (!s)
            return s.error();
        config.source = s.value();
    }
    if (const char* env = std::getenv("RANGEDB_SERVER_MODE"); env && *env) {
        auto m = parseServerMode(env);
        if (!m)
            return m.error();
        config.serverMode = m.value();
    }
    return {};
}

Result<DatabaseConfig> loadDatabaseConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::NotFound, "config file not found: " + path.string()};
    }
    DatabaseConfig config;
    if (auto r = applyConfigValues(config, parse_config_file(path)); !r) {
        return Error{ErrorCode::InvalidArgument, path.string() + ": " + r.error().message};
    }
    return config;
}

Result<DatabaseConfig> resolveDatabaseConfig(const std::string& overridePath) {
    DatabaseConfig config;
    const auto path = get_config_path(overridePath);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        auto loaded = loadDatabaseConfig(path);
        if (!loaded) {
            return loaded.error();
        }
        config = std::move(loaded).value();
        spdlog::debug("loaded config from {}", path.string());
    } else if (!overridePath.empty()) {
        return Error{ErrorCode::NotFound, "config file not found: " + path.string()};
    }
    if (auto r = applyEnvironmentOverrides(config); !r) {
        return r.error();
    }
    return config;
}

} // namespace rangedb::config
