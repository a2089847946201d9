#include <rangedb/engine/database.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstring>
#include <stdexcept>

namespace rangedb::engine {

namespace {

// VM instructions between interrupt polls.
constexpr int kProgressOps = 1000;

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// True when text holds another statement; whitespace, comments and stray semicolons do not count.
bool hasTrailingStatement(sqlite3* db, const std::string& text) {
    const char* cursor = text.c_str();
    while (*cursor != '\0') {
        while (*cursor == ';' || std::isspace(static_cast<unsigned char>(*cursor))) {
            ++cursor;
        }
        if (*cursor == '\0') {
            return false;
        }
        sqlite3_stmt* extra = nullptr;
        const char* next = nullptr;
        if (sqlite3_prepare_v2(db, cursor, -1, &extra, &next) != SQLITE_OK) {
            return true;
        }
        if (extra != nullptr) {
            sqlite3_finalize(extra);
            return true;
        }
        if (next == nullptr || next == cursor) {
            return false;
        }
        cursor = next;
    }
    return false;
}

} // namespace

// Statement implementation
Statement::Statement(sqlite3* db, const std::string& sql) {
    const char* tail;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, &tail);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
    if (stmt_ == nullptr) {
        throw std::runtime_error("Failed to prepare statement: empty SQL");
    }
    if (tail != nullptr) {
        tail_ = tail;
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : stmt_(other.stmt_), tail_(std::move(other.tail_)) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        tail_ = std::move(other.tail_);
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind null"};
    }
    return {};
}

Result<void> Statement::bind(int index, std::int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, value);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind int64"};
    }
    return {};
}

Result<void> Statement::bind(int index, double value) {
    int rc = sqlite3_bind_double(stmt_, index, value);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind double"};
    }
    return {};
}

Result<void> Statement::bind(int index, bool value) {
    return bind(index, static_cast<std::int64_t>(value ? 1 : 0));
}

Result<void> Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind text"};
    }
    return {};
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    int rc = sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind blob"};
    }
    return {};
}

Result<void> Statement::bind(int index, const Value& value) {
    return std::visit(overloaded{
                          [&](std::nullptr_t) { return bind(index, nullptr); },
                          [&](std::int64_t v) { return bind(index, v); },
                          [&](double v) { return bind(index, v); },
                          [&](bool v) { return bind(index, v); },
                          [&](const std::string& v) { return bind(index, std::string_view(v)); },
                          [&](const ByteVector& v) {
                              return bind(index, std::span<const std::byte>(v));
                          },
                      },
                      value);
}

Result<void> Statement::bindAll(const std::vector<Value>& values) {
    const int expected = parameterCount();
    if (static_cast<int>(values.size()) != expected) {
        return Error{ErrorCode::InvalidArgument,
                     "Statement expects " + std::to_string(expected) + " parameter(s), got " +
                         std::to_string(values.size())};
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
        auto r = bind(static_cast<int>(i + 1), values[i]);
        if (!r) {
            return r;
        }
    }
    return {};
}

Result<bool> Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    } else if (rc == SQLITE_DONE) {
        return false;
    }
    if (rc == SQLITE_INTERRUPT) {
        return Error{ErrorCode::OperationCancelled, "Statement interrupted"};
    }
    sqlite3* db = sqlite3_db_handle(stmt_);
    const char* msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    const int primary = rc & 0xff;
    if (primary == SQLITE_IOERR || primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB) {
        return Error{ErrorCode::DatabaseError, "Failed to read database: " + std::string(msg)};
    }
    return Error{ErrorCode::QueryExecutionFailed,
                 "Failed to step statement: " + std::string(msg)};
}

Value Statement::getValue(int column) const {
    switch (sqlite3_column_type(stmt_, column)) {
        case SQLITE_INTEGER:
            return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt_, column);
        case SQLITE_TEXT:
            return getString(column);
        case SQLITE_BLOB: {
            const void* blob = sqlite3_column_blob(stmt_, column);
            int size = sqlite3_column_bytes(stmt_, column);
            ByteVector out(static_cast<std::size_t>(size > 0 ? size : 0));
            if (blob && size > 0) {
                std::memcpy(out.data(), blob, static_cast<std::size_t>(size));
            }
            return out;
        }
        default:
            return nullptr;
    }
}

std::int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::string Statement::getString(int column) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return "";
    return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int Statement::columnCount() const {
    return sqlite3_column_count(stmt_);
}

std::string Statement::columnName(int column) const {
    const char* name = sqlite3_column_name(stmt_, column);
    return name ? name : "";
}

int Statement::parameterCount() const {
    return sqlite3_bind_parameter_count(stmt_);
}

Result<void> Statement::reset() {
    if (!stmt_) {
        return Error{ErrorCode::DatabaseError, "Statement is null"};
    }
    int rc = sqlite3_reset(stmt_);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to reset statement"};
    }
    return {};
}

// Database implementation
Database::~Database() {
    close();
}

Result<void> Database::open(const std::string& path, const std::string& vfsName) {
    if (db_) {
        return Error{ErrorCode::InvalidState, "Database already open"};
    }
    const int flags = SQLITE_OPEN_READONLY;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, vfsName.empty() ? nullptr : vfsName.c_str());
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return Error{ErrorCode::DatabaseError, "Failed to open database: " + error};
    }

    sqlite3_progress_handler(db_, kProgressOps, &Database::progressHandler, this);
    path_ = path;
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_progress_handler(db_, 0, nullptr, nullptr);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK) {
            spdlog::warn("sqlite3_close({}) returned {}: {}", path_, rc, sqlite3_errstr(rc));
            sqlite3_close_v2(db_);
        }
        db_ = nullptr;
    }
    path_.clear();
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    try {
        Statement stmt(db_, sql);
        if (hasTrailingStatement(db_, stmt.tail())) {
            return Error{ErrorCode::InvalidArgument,
                         "Only one statement per query is allowed; trailing text: " + stmt.tail()};
        }
        return stmt;
    } catch (const std::exception& e) {
        return Error{ErrorCode::QueryExecutionFailed, e.what()};
    }
}

Result<QueryResult> Database::query(const std::string& sql, const std::vector<Value>& params) {
    interrupted_ = false;
    auto stmtResult = prepare(sql);
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto& stmt = stmtResult.value();
    if (auto b = stmt.bindAll(params); !b) {
        return b.error();
    }

    QueryResult result;
    const int columns = stmt.columnCount();
    result.columns.reserve(static_cast<std::size_t>(columns));
    for (int c = 0; c < columns; ++c) {
        result.columns.push_back(stmt.columnName(c));
    }

    while (true) {
        auto stepped = stmt.step();
        if (!stepped) {
            return stepped.error();
        }
        if (!stepped.value()) {
            break;
        }
        Row row;
        row.reserve(static_cast<std::size_t>(columns));
        for (int c = 0; c < columns; ++c) {
            row.push_back(stmt.getValue(c));
        }
        result.rows.push_back(std::move(row));
    }
    return result;
}

void Database::setInterruptCheck(InterruptCheck check) {
    interruptCheck_ = std::move(check);
}

std::string Database::lastErrorMessage() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

int Database::progressHandler(void* self) {
    auto* db = static_cast<Database*>(self);
    if (db->interruptCheck_ && db->interruptCheck_()) {
        db->interrupted_ = true;
        return 1;
    }
    return 0;
}

} // namespace rangedb::engine
