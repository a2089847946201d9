#pragma once

#include <rangedb/core/value.h>
#include <rangedb/query/query_types.h>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace rangedb::query {

/**
 * @brief Identifies one cached query result
 *
 * Built from the connection scope, the normalized text, and the positional parameters in order.
 * Parameter values carry a type tag, so 1, 1.0, '1' and true produce different keys.
 */
class CacheKey {
public:
    static CacheKey fromQuery(std::uint64_t scope, const NormalizedQuery& query);

    CacheKey() = default;

    size_t hash() const { return hashValue_; }
    const std::string& toString() const { return keyString_; }
    std::uint64_t scope() const { return scope_; }

    bool operator==(const CacheKey& other) const {
        return hashValue_ == other.hashValue_ && keyString_ == other.keyString_;
    }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

private:
    std::string keyString_;
    size_t hashValue_ = 0;
    std::uint64_t scope_ = 0;
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const { return key.hash(); }
};

std::string serializeParams(const std::vector<Value>& params);

} // namespace rangedb::query
