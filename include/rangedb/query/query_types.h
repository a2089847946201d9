#pragma once

#include <rangedb/core/types.h>
#include <rangedb/core/value.h>

#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rangedb::query {

struct Positional {
    std::vector<Value> values;
};

// Keys may be written with or without their sigil (":year" and "year" are the same name).
struct Named {
    std::map<std::string, Value> values;
};

using QueryParams = std::variant<Positional, Named>;

struct QueryRequest {
    std::string text;
    QueryParams params{Positional{}};

    QueryRequest() = default;
    QueryRequest(std::string sql) : text(std::move(sql)) {}
    QueryRequest(std::string sql, std::vector<Value> positional)
        : text(std::move(sql)), params(Positional{std::move(positional)}) {}
    QueryRequest(std::string sql, std::map<std::string, Value> named)
        : text(std::move(sql)), params(Named{std::move(named)}) {}
};

/**
 * Request after normalization: canonical text and positional parameters in binding order.
 */
struct NormalizedQuery {
    std::string text;
    std::vector<Value> params;
};

enum class StatementKind { Read, Other };

/**
 * Trim, strip comments, drop trailing semicolons, and collapse whitespace runs outside string
 * literals and quoted identifiers into a single space. The result is what gets executed.
 */
std::string normalizeText(std::string_view sql);

/**
 * Named parameters (:name, @name, $name) in order of first appearance, sigil included.
 * Positional markers (?, ?NNN) are reported through `positionalCount`.
 */
std::vector<std::string> namedParameterOrder(std::string_view sql, int* positionalCount = nullptr);

/**
 * Convert a request to positional form. Named parameters follow their first appearance in the
 * text, which is SQLite's own numbering. A missing name, or a statement mixing ? with named
 * parameters, is InvalidArgument.
 */
Result<NormalizedQuery> normalize(const QueryRequest& request);

StatementKind classifyStatement(std::string_view normalizedSql);

} // namespace rangedb::query
