#include <rangedb/transport/range_adapter.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace rangedb::transport {

Result<ByteVector> IRangeAdapter::fetchToBuffer(std::string_view url, std::uint64_t offset,
                                                std::uint64_t size, const FetchOptions& options,
                                                const ShouldCancel& shouldCancel) {
    ByteVector buffer;
    if (size != 0) {
        buffer.reserve(static_cast<std::size_t>(size));
    }
    auto r = fetchRange(
        url, offset, size, options,
        [&buffer](ByteSpan piece) -> Result<void> {
            buffer.insert(buffer.end(), piece.begin(), piece.end());
            return {};
        },
        shouldCancel);
    if (!r) {
        return r.error();
    }
    return buffer;
}

Result<Source> parseSource(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "cdn")
        return Source::Cdn;
    if (lower == "local")
        return Source::Local;
    if (lower == "remote")
        return Source::Remote;
    return Error{ErrorCode::InvalidArgument, "Unknown source '" + std::string(text) +
                                                 "' (expected cdn, local or remote)"};
}

const char* sourceToString(Source source) {
    switch (source) {
        case Source::Cdn:
            return "cdn";
        case Source::Local:
            return "local";
        case Source::Remote:
            return "remote";
    }
    return "unknown";
}

std::unique_ptr<IRangeAdapter> makeRangeAdapter(Source source) {
    if (source == Source::Local) {
        return makeFileRangeAdapter();
    }
    return makeCurlRangeAdapter();
}

} // namespace rangedb::transport
