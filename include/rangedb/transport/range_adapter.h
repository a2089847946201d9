#pragma once

/*
 * rangedb transport - range fetch abstraction
 *
 * Every byte rangedb reads from a remote database goes through an IRangeAdapter. The adapter
 * performs exactly one transfer per call and never retries; retry/backoff/timeout discipline
 * lives in TransportRetrier.
 */

#include <rangedb/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rangedb::transport {

/**
 * Where the database file is served from.
 */
enum class Source { Cdn, Local, Remote };

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

using ContentLengthCallback = std::function<void(std::uint64_t)>;

/**
 * Per-transfer options.
 */
struct FetchOptions {
    std::chrono::milliseconds timeout{60000};
    std::vector<Header> headers;
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
    // Called at most once, before the first byte reaches the sink, with the number of bytes
    // the transfer will deliver. Not called when the source does not announce a length.
    ContentLengthCallback onContentLength;
};

using ShouldCancel = std::function<bool()>; // return true to abandon ASAP
using ByteSink = std::function<Result<void>(ByteSpan)>;

/**
 * Range transport. fetchRange streams [offset, offset+size) to the sink, possibly in several
 * pieces, on the calling thread. size == 0 means "until end of file".
 */
class IRangeAdapter {
public:
    virtual ~IRangeAdapter() = default;

    virtual Result<void> fetchRange(std::string_view url, std::uint64_t offset,
                                    std::uint64_t size, const FetchOptions& options,
                                    const ByteSink& sink, const ShouldCancel& shouldCancel) = 0;

    /**
     * Convenience wrapper collecting a range into memory.
     */
    Result<ByteVector> fetchToBuffer(std::string_view url, std::uint64_t offset,
                                     std::uint64_t size, const FetchOptions& options,
                                     const ShouldCancel& shouldCancel = {});
};

Result<Source> parseSource(std::string_view text);
const char* sourceToString(Source source);

std::unique_ptr<IRangeAdapter> makeCurlRangeAdapter();
std::unique_ptr<IRangeAdapter> makeFileRangeAdapter();

/**
 * Adapter for a configured source: cdn and remote use libcurl, local reads files.
 */
std::unique_ptr<IRangeAdapter> makeRangeAdapter(Source source);

} // namespace rangedb::transport
