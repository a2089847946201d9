#include <rangedb/query/cache_key.h>

namespace rangedb::query {

std::string serializeParams(const std::vector<Value>& params) {
    std::string out = "[";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += describeValue(params[i]);
    }
    out += ']';
    return out;
}

CacheKey CacheKey::fromQuery(std::uint64_t scope, const NormalizedQuery& query) {
    CacheKey key;
    key.scope_ = scope;
    key.keyString_ = "c:" + std::to_string(scope) + "|sql:" + query.text +
                     "|params:" + serializeParams(query.params);
    key.hashValue_ = std::hash<std::string>{}(key.keyString_);
    return key;
}

} // namespace rangedb::query
