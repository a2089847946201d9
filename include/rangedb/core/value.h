#pragma once

#include <rangedb/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace rangedb {

/**
 * A single SQL value, as bound to a parameter or read from a result column.
 */
using Value = std::variant<std::nullptr_t, std::int64_t, double, bool, std::string, ByteVector>;

using Row = std::vector<Value>;

/**
 * Ordered rows plus their column names.
 */
struct QueryResult {
    std::vector<std::string> columns;
    std::vector<Row> rows;

    bool empty() const { return rows.empty(); }
    std::size_t size() const { return rows.size(); }

    // Approximate heap footprint, used for cache accounting.
    std::size_t memorySize() const;

    // Array of objects keyed by column name.
    nlohmann::json toJson() const;

    bool operator==(const QueryResult&) const = default;
};

// Type-tagged rendering used in cache keys and logs: n, i:42, r:1.5, b:1, s:5:hello, x:<hex>
std::string describeValue(const Value& value);

nlohmann::json valueToJson(const Value& value);

/**
 * Parse a literal from the command line: null, true/false, integer, real, else text.
 */
Value parseLiteral(const std::string& text);

} // namespace rangedb
