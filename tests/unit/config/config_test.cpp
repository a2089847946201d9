#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include <rangedb/config/config_helpers.h>
#include <rangedb/config/database_config.h>

#include "common/test_helpers.h"

using namespace rangedb;
using namespace rangedb::config;
using namespace std::chrono_literals;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = old;
        }
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() {
        if (old_) {
            ::setenv(name_, old_->c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::optional<std::string> old_;
};

} // namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = tests::make_temp_dir("rangedb_config_"); }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path writeConfig(const std::string& text) {
        return tests::write_file(dir_ / "config.toml", text);
    }

    std::filesystem::path dir_;
};

TEST(ConfigHelpersTest, ParsesScalars) {
    EXPECT_EQ(parse_integer(" 42 "), 42);
    EXPECT_EQ(parse_integer("1_000_000"), 1000000);
    EXPECT_FALSE(parse_integer("12abc").has_value());
    EXPECT_FALSE(parse_integer("").has_value());

    EXPECT_EQ(parse_bool("Yes"), true);
    EXPECT_EQ(parse_bool("off"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());

    EXPECT_EQ(parse_duration_ms("250"), 250ms);
    EXPECT_EQ(parse_duration_ms("1500ms"), 1500ms);
    EXPECT_EQ(parse_duration_ms("45s"), 45000ms);
    EXPECT_FALSE(parse_duration_ms("soon").has_value());
}

TEST(ConfigHelpersTest, TrimAndUnquote) {
    std::string s = "  padded \t";
    trim(s);
    EXPECT_EQ(s, "padded");
    EXPECT_EQ(unquote("\"quoted\""), "quoted");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("bare"), "bare");
}

TEST_F(ConfigTest, ParseConfigFileFlattensSections) {
    auto path = writeConfig(R"(# top comment
loose = 1

[database]
url = "https://cdn.example.com/data.sqlite"   # inline comment stays out
server_mode = partial # trailing

[retry]
max_attempts = 4
)");
    auto values = parse_config_file(path);
    EXPECT_EQ(values["loose"], "1");
    EXPECT_EQ(values["database.url"], "https://cdn.example.com/data.sqlite");
    EXPECT_EQ(values["database.server_mode"], "partial");
    EXPECT_EQ(values["retry.max_attempts"], "4");
    EXPECT_EQ(parse_config_value(path, "retry", "max_attempts"), "4");
    EXPECT_EQ(parse_config_value(path, "retry", "missing"), "");
}

TEST_F(ConfigTest, LoadDatabaseConfig) {
    auto path = writeConfig(R"([database]
url = "https://cdn.example.com/data.sqlite"
source = cdn
server_mode = full
request_chunk_size = 8192
emergency_fallback = false
slow_query_threshold = 250ms
header.Authorization = "Bearer abc"

[timeouts]
engine_init = 10s
bulk_fetch = 20s
query_execution = 30s
emergency_fallback = 40s

[retry]
max_attempts = 6
initial_backoff = 500
max_backoff = 8s
multiplier = 3

[cache]
chunk_cache_mb = 8
query_max_entries = 50
select_ttl = 120s
other_ttl = 0
)");
    auto loaded = loadDatabaseConfig(path);
    ASSERT_TRUE(loaded) << loaded.error().describe();
    const auto& c = loaded.value();

    EXPECT_EQ(c.url, "https://cdn.example.com/data.sqlite");
    EXPECT_EQ(c.effectiveSuffixUrl(), "https://cdn.example.com/data.sqlite.suffix");
    EXPECT_EQ(c.source, transport::Source::Cdn);
    EXPECT_EQ(c.serverMode, ServerMode::Full);
    EXPECT_EQ(c.requestChunkSize, 8192u);
    EXPECT_FALSE(c.emergencyFallback);
    EXPECT_EQ(c.slowQueryThreshold, 250ms);
    ASSERT_EQ(c.headers.size(), 1u);
    EXPECT_EQ(c.headers[0].name, "Authorization");
    EXPECT_EQ(c.headers[0].value, "Bearer abc");
    EXPECT_EQ(c.fetchOptions().headers.size(), 1u);

    EXPECT_EQ(c.timeouts.engineInit, 10000ms);
    EXPECT_EQ(c.timeouts.bulkFetch, 20000ms);
    EXPECT_EQ(c.timeouts.queryExecution, 30000ms);
    EXPECT_EQ(c.timeouts.emergencyFallback, 40000ms);

    EXPECT_EQ(c.retry.maxAttempts, 6);
    EXPECT_EQ(c.retry.initialBackoff, 500ms);
    EXPECT_EQ(c.retry.maxBackoff, 8000ms);
    EXPECT_DOUBLE_EQ(c.retry.multiplier, 3.0);

    EXPECT_EQ(c.chunkCacheBytes, 8u * 1024 * 1024);
    EXPECT_EQ(c.queryCache.maxEntries, 50u);
    EXPECT_EQ(c.queryCache.selectTtl, std::chrono::seconds(120));
    EXPECT_EQ(c.queryCache.otherTtl, std::chrono::seconds(0));
    EXPECT_TRUE(c.validate());
}

TEST_F(ConfigTest, MalformedValueIsRejected) {
    auto path = writeConfig("[retry]\nmax_attempts = lots\n");
    auto loaded = loadDatabaseConfig(path);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(loaded.error().message.find("retry.max_attempts"), std::string::npos);

    path = writeConfig("[database]\nserver_mode = sideways\n");
    EXPECT_FALSE(loadDatabaseConfig(path));
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
    auto path = writeConfig("[database]\nurl = https://x/db.sqlite\ncolour = blue\n");
    auto loaded = loadDatabaseConfig(path);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value().url, "https://x/db.sqlite");
}

TEST_F(ConfigTest, MissingFile) {
    auto loaded = loadDatabaseConfig(dir_ / "absent.toml");
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::NotFound);

    auto resolved = resolveDatabaseConfig((dir_ / "absent.toml").string());
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().code, ErrorCode::NotFound);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    auto path = writeConfig("[database]\nurl = https://file/db.sqlite\nserver_mode = partial\n");
    ScopedEnv url("RANGEDB_URL", "https://env/db.sqlite");
    ScopedEnv mode("RANGEDB_SERVER_MODE", "FULL");
    ScopedEnv source("RANGEDB_SOURCE", "local");

    auto resolved = resolveDatabaseConfig(path.string());
    ASSERT_TRUE(resolved) << resolved.error().describe();
    EXPECT_EQ(resolved.value().url, "https://env/db.sqlite");
    EXPECT_EQ(resolved.value().serverMode, ServerMode::Full);
    EXPECT_EQ(resolved.value().source, transport::Source::Local);
}

TEST_F(ConfigTest, BadEnvironmentValueIsAnError) {
    ScopedEnv source("RANGEDB_SOURCE", "carrier-pigeon");
    DatabaseConfig config;
    auto r = applyEnvironmentOverrides(config);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigTest, ConfigPathPrecedence) {
    ScopedEnv env("RANGEDB_CONFIG", (dir_ / "env.toml").string().c_str());
    EXPECT_EQ(get_config_path((dir_ / "explicit.toml").string()), dir_ / "explicit.toml");
    EXPECT_EQ(get_config_path(), dir_ / "env.toml");
}

TEST(DatabaseConfigTest, Validate) {
    DatabaseConfig config;
    EXPECT_FALSE(config.validate());

    config.url = "https://cdn.example.com/db.sqlite";
    EXPECT_TRUE(config.validate());

    auto zeroChunk = config;
    zeroChunk.requestChunkSize = 0;
    EXPECT_FALSE(zeroChunk.validate());

    auto noAttempts = config;
    noAttempts.retry.maxAttempts = 0;
    EXPECT_FALSE(noAttempts.validate());

    auto tinyCache = config;
    tinyCache.chunkCacheBytes = 1024;
    EXPECT_FALSE(tinyCache.validate());

    auto zeroTimeout = config;
    zeroTimeout.timeouts.queryExecution = 0ms;
    EXPECT_FALSE(zeroTimeout.validate());
}

TEST(DatabaseConfigTest, Defaults) {
    DatabaseConfig config;
    EXPECT_EQ(config.serverMode, ServerMode::Partial);
    EXPECT_EQ(config.requestChunkSize, 64u * 1024);
    EXPECT_EQ(config.timeouts.engineInit, 45000ms);
    EXPECT_EQ(config.timeouts.bulkFetch, 120000ms);
    EXPECT_EQ(config.timeouts.queryExecution, 90000ms);
    EXPECT_EQ(config.timeouts.emergencyFallback, 180000ms);
    EXPECT_EQ(config.retry.maxAttempts, 4);
    EXPECT_TRUE(config.emergencyFallback);

    config.url = "https://cdn.example.com/db.sqlite";
    config.suffixUrl = "https://meta.example.com/db.json";
    EXPECT_EQ(config.effectiveSuffixUrl(), "https://meta.example.com/db.json");
}

TEST(ServerModeTest, Parse) {
    EXPECT_EQ(parseServerMode("Partial").value(), ServerMode::Partial);
    EXPECT_EQ(parseServerMode("full").value(), ServerMode::Full);
    EXPECT_FALSE(parseServerMode("half"));
    EXPECT_STREQ(serverModeToString(ServerMode::Full), "full");
}
