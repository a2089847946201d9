#pragma once

#include <rangedb/core/types.h>
#include <rangedb/core/value.h>

#include <sqlite3.h>

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rangedb::engine {

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, std::int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, bool value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, const Value& value);

    /**
     * @brief Bind positional parameters 1..N
     */
    Result<void> bindAll(const std::vector<Value>& values);

    /**
     * @return true if a row is available, false when done
     */
    Result<bool> step();

    Value getValue(int column) const;
    std::int64_t getInt64(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

    int columnCount() const;
    std::string columnName(int column) const;
    int parameterCount() const;

    Result<void> reset();

    sqlite3_stmt* handle() const { return stmt_; }
    // SQL text left after the first statement.
    const std::string& tail() const { return tail_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
    std::string tail_;
};

/**
 * @brief Read-only database connection wrapper
 *
 * Opens through a named VFS. An optional interrupt check is polled by SQLite's progress handler
 * while statements run; returning true aborts the statement with SQLITE_INTERRUPT.
 */
class Database {
public:
    using InterruptCheck = std::function<bool()>;

    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, const std::string& vfsName);
    void close();
    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Prepare, bind and drain a statement into rows
     */
    Result<QueryResult> query(const std::string& sql, const std::vector<Value>& params);

    void setInterruptCheck(InterruptCheck check);
    [[nodiscard]] bool interrupted() const { return interrupted_; }

    std::string lastErrorMessage() const;
    sqlite3* handle() const { return db_; }

private:
    static int progressHandler(void* self);

    sqlite3* db_ = nullptr;
    std::string path_;
    InterruptCheck interruptCheck_;
    bool interrupted_ = false;
};

} // namespace rangedb::engine
