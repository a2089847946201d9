#include "common/test_database.h"
#include "common/test_helpers.h"

#include <rangedb/metadata/descriptor.h>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace rangedb::tests {

namespace {

void exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("test database: " + message + " in: " + sql);
    }
}

} // namespace

TestDatabase::TestDatabase(TestDatabaseOptions options) : options_(options) {
    dir_ = make_temp_dir("rangedb_db_");
    path_ = dir_ / "test.sqlite";
    build();
    size_ = std::filesystem::file_size(path_);
    if (options_.writeSuffix) {
        writeSuffix();
    }
}

TestDatabase::~TestDatabase() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
}

std::uint32_t TestDatabase::chunkCount() const {
    return metadata::expectedChunkCount(size_, options_.chunkSize);
}

ByteVector TestDatabase::bytes() const {
    std::ifstream in(path_, std::ios::binary);
    std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ByteVector out(raw.size());
    std::transform(raw.begin(), raw.end(), out.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return out;
}

void TestDatabase::writeSuffixText(const std::string& text) const {
    write_file(suffixUrl(), text);
}

config::DatabaseConfig TestDatabase::config() const {
    config::DatabaseConfig cfg;
    cfg.source = transport::Source::Local;
    cfg.serverMode = config::ServerMode::Partial;
    cfg.url = url();
    cfg.requestChunkSize = options_.chunkSize;
    cfg.retry.initialBackoff = std::chrono::milliseconds(1);
    cfg.retry.maxBackoff = std::chrono::milliseconds(4);
    cfg.slowQueryThreshold = std::chrono::milliseconds(10000);
    return cfg;
}

void TestDatabase::build() {
    sqlite3* db = nullptr;
    if (sqlite3_open(path_.string().c_str(), &db) != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw std::runtime_error("test database: cannot create " + path_.string() + ": " +
                                 message);
    }
    try {
        exec(db, "PRAGMA page_size=" + std::to_string(options_.pageSize));
        exec(db, "PRAGMA journal_mode=DELETE");
        exec(db, "CREATE TABLE buildings(id INTEGER PRIMARY KEY, name TEXT NOT NULL, city TEXT, "
                 "height REAL, levels INTEGER, photo BLOB)");
        exec(db, "CREATE INDEX idx_buildings_city ON buildings(city)");
        exec(db, "BEGIN");
        for (int i = 0; i < options_.rows; ++i) {
            exec(db, "INSERT INTO buildings(id, name, city, height, levels, photo) VALUES(" +
                         std::to_string(i) + ", 'Building " + std::to_string(i) + "', '" +
                         kCities[i % 5] + "', " + std::to_string(i) + " * 1.5, " +
                         std::to_string(i % 40) + ", zeroblob(32))");
        }
        exec(db, "COMMIT");
    } catch (...) {
        sqlite3_close(db);
        throw;
    }
    sqlite3_close(db);
}

void TestDatabase::writeSuffix() const {
    const auto count = chunkCount();
    nlohmann::json chunks = nlohmann::json::array();
    for (std::uint32_t i = 0; i < count; ++i) {
        const std::uint64_t start = static_cast<std::uint64_t>(i) * options_.chunkSize;
        const std::uint64_t length =
            std::min<std::uint64_t>(options_.chunkSize, size_ - start);
        chunks.push_back({{"index", i},
                          {"size", length},
                          {"start", start},
                          {"end", start + length - 1},
                          {"url", path_.filename().string() + ".chunk" + std::to_string(i)}});
    }
    nlohmann::json j = {{"size", size_},
                        {"pageSize", options_.pageSize},
                        {"chunkSize", options_.chunkSize},
                        {"url", path_.filename().string()},
                        {"chunkCount", count},
                        {"version", 1},
                        {"chunks", chunks},
                        {"metadata", {{"rows", options_.rows}, {"source", "test"}}}};
    write_file(suffixUrl(), j.dump(2));
}

} // namespace rangedb::tests
