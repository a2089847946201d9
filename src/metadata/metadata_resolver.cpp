#include <rangedb/metadata/metadata_resolver.h>

#include <spdlog/spdlog.h>

namespace rangedb::metadata {

MetadataResolver::MetadataResolver(std::shared_ptr<transport::IRangeAdapter> adapter,
                                   std::shared_ptr<transport::TransportRetrier> retrier,
                                   transport::FetchOptions options)
    : adapter_(std::move(adapter)), retrier_(std::move(retrier)), options_(std::move(options)) {}

Result<DatabaseIdentity> MetadataResolver::resolve(std::string_view descriptorUrl,
                                                   std::string_view fallbackDataUrl) {
    auto r = resolveDescriptor(descriptorUrl, fallbackDataUrl);
    if (!r) {
        return r.error();
    }
    return r.value().identity;
}

Result<SuffixDescriptor> MetadataResolver::resolveDescriptor(std::string_view descriptorUrl,
                                                             std::string_view fallbackDataUrl) {
    const std::string key(descriptorUrl);
    std::promise<Result<SuffixDescriptor>> promise;
    Shared shared;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = resolved_.find(key); it != resolved_.end()) {
            return it->second;
        }
        if (auto it = inflight_.find(key); it != inflight_.end()) {
            shared = it->second;
        } else {
            shared = promise.get_future().share();
            inflight_.emplace(key, shared);
            owner = true;
        }
    }

    if (!owner) {
        spdlog::debug("descriptor {} already in flight; waiting", key);
        return shared.get();
    }

    Result<SuffixDescriptor> result = Error{ErrorCode::InternalError, "descriptor fetch failed"};
    try {
        result = fetchAndParse(key, std::string(fallbackDataUrl));
    } catch (const std::exception& e) {
        result = Error{ErrorCode::MetadataUnavailable, "descriptor " + key + ": " + e.what()};
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inflight_.erase(key);
        if (result) {
            resolved_[key] = result.value();
        }
    }
    promise.set_value(result);
    return result;
}

Result<SuffixDescriptor> MetadataResolver::fetchAndParse(const std::string& descriptorUrl,
                                                         const std::string& fallbackDataUrl) {
    fetches_.fetch_add(1);
    spdlog::debug("resolving descriptor {}", descriptorUrl);

    auto fetched = retrier_->execute(
        Tier::EngineInit, "fetch descriptor",
        [&](const transport::AttemptContext& ctx) -> Result<SuffixDescriptor> {
            transport::FetchOptions opts = options_;
            opts.timeout = ctx.remaining();
            std::string body;
            auto r = adapter_->fetchRange(
                descriptorUrl, 0, 0, opts,
                [&body](ByteSpan piece) -> Result<void> {
                    if (body.size() + piece.size() > MAX_DESCRIPTOR_BYTES) {
                        return Error{ErrorCode::InvalidData, "descriptor too large"};
                    }
                    body.append(reinterpret_cast<const char*>(piece.data()), piece.size());
                    return {};
                },
                ctx.shouldCancel);
            if (!r) {
                return r.error();
            }
            // Parse inside the attempt: malformed content is terminal and stops the loop.
            return parseSuffixDescriptor(body, descriptorUrl, fallbackDataUrl);
        });

    if (!fetched) {
        const auto& err = fetched.error();
        spdlog::error("descriptor {} unavailable: {}", descriptorUrl, err.describe());
        return Error{ErrorCode::MetadataUnavailable,
                     "descriptor " + descriptorUrl + ": " + err.describe(), err.retry};
    }

    const auto& id = fetched.value().identity;
    spdlog::info("resolved {} -> {} ({} bytes, {} chunks of {}, page {})", descriptorUrl, id.url,
                 id.totalSize, id.chunkCount, id.chunkSize, id.pageSize);
    return fetched;
}

void MetadataResolver::forget(std::string_view descriptorUrl) {
    std::lock_guard<std::mutex> lock(mutex_);
    resolved_.erase(std::string(descriptorUrl));
}

void MetadataResolver::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    resolved_.clear();
}

} // namespace rangedb::metadata
