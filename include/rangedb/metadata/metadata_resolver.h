#pragma once

#include <rangedb/core/types.h>
#include <rangedb/metadata/descriptor.h>
#include <rangedb/transport/range_adapter.h>
#include <rangedb/transport/retrier.h>

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rangedb::metadata {

/**
 * Fetches and validates suffix descriptors, once per descriptor URL.
 *
 * Concurrent resolve() calls for the same URL share one in-flight fetch. Successful results are
 * memoized until forget()/clear(); failures are not, so a later call fetches again.
 */
class MetadataResolver {
public:
    // Upper bound on a descriptor body; real descriptors are a few KB.
    static constexpr std::size_t MAX_DESCRIPTOR_BYTES = 16 * 1024 * 1024;

    MetadataResolver(std::shared_ptr<transport::IRangeAdapter> adapter,
                     std::shared_ptr<transport::TransportRetrier> retrier,
                     transport::FetchOptions options = {});

    /**
     * Resolve the descriptor at `descriptorUrl`. A relative `url` inside the descriptor is
     * resolved against it; `fallbackDataUrl` is used when the descriptor names no data url.
     * Any failure is reported as MetadataUnavailable.
     */
    Result<DatabaseIdentity> resolve(std::string_view descriptorUrl,
                                     std::string_view fallbackDataUrl = {});

    /**
     * Same as resolve() but keeps the optional chunk table and metadata block.
     */
    Result<SuffixDescriptor> resolveDescriptor(std::string_view descriptorUrl,
                                               std::string_view fallbackDataUrl = {});

    void forget(std::string_view descriptorUrl);
    void clear();

    // Number of descriptor fetch operations started (not attempts).
    std::uint64_t fetchCount() const { return fetches_.load(); }

private:
    using Shared = std::shared_future<Result<SuffixDescriptor>>;

    Result<SuffixDescriptor> fetchAndParse(const std::string& descriptorUrl,
                                           const std::string& fallbackDataUrl);

    std::shared_ptr<transport::IRangeAdapter> adapter_;
    std::shared_ptr<transport::TransportRetrier> retrier_;
    transport::FetchOptions options_;

    std::mutex mutex_;
    std::unordered_map<std::string, Shared> inflight_;
    std::unordered_map<std::string, SuffixDescriptor> resolved_;
    std::atomic<std::uint64_t> fetches_{0};
};

} // namespace rangedb::metadata
