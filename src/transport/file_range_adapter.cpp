#include <rangedb/transport/range_adapter.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace rangedb::transport {

namespace {

constexpr std::size_t kReadBlock = 64 * 1024;

std::filesystem::path toPath(std::string_view url) {
    constexpr std::string_view kScheme = "file://";
    if (url.substr(0, kScheme.size()) == kScheme) {
        url.remove_prefix(kScheme.size());
    }
    return std::filesystem::path(std::string(url));
}

} // namespace

/**
 * Serves ranges from the local filesystem. Accepts plain paths and file:// URLs.
 * Mirrors HTTP semantics: a range that starts past the end is rejected, a range that
 * runs past the end is truncated at EOF.
 */
class FileRangeAdapter final : public IRangeAdapter {
public:
    Result<void> fetchRange(std::string_view url, std::uint64_t offset, std::uint64_t size,
                            const FetchOptions& options, const ByteSink& sink,
                            const ShouldCancel& shouldCancel) override {
        if (!sink) {
            return Error{ErrorCode::InvalidArgument, "fetchRange: no sink provided"};
        }

        const auto path = toPath(url);
        std::error_code ec;
        const auto fileSize = std::filesystem::file_size(path, ec);
        if (ec) {
            return Error{ErrorCode::NotFound, "Cannot stat " + path.string() + ": " + ec.message()};
        }
        if (offset > 0 && offset >= fileSize) {
            return Error{ErrorCode::InvalidArgument,
                         "Range start " + std::to_string(offset) + " beyond end of " +
                             path.string()};
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return Error{ErrorCode::PermissionDenied, "Cannot open " + path.string()};
        }
        in.seekg(static_cast<std::streamoff>(offset));

        std::uint64_t remaining = size == 0 ? fileSize - offset
                                            : std::min<std::uint64_t>(size, fileSize - offset);
        spdlog::debug("file read {} range=[{}, {})", path.string(), offset, offset + remaining);
        if (options.onContentLength) {
            options.onContentLength(remaining);
        }

        std::uint64_t position = offset;
        std::array<std::byte, kReadBlock> block{};
        while (remaining > 0) {
            if (shouldCancel && shouldCancel()) {
                return Error{ErrorCode::OperationCancelled, "transfer abandoned"};
            }
            const auto want = static_cast<std::streamsize>(
                std::min<std::uint64_t>(remaining, block.size()));
            in.read(reinterpret_cast<char*>(block.data()), want);
            const auto got = in.gcount();
            if (got <= 0) {
                return Error{ErrorCode::NetworkError,
                             "Short read from " + path.string() + " at offset " +
                                 std::to_string(position)};
            }
            if (auto r = sink(ByteSpan{block.data(), static_cast<std::size_t>(got)}); !r) {
                return r.error();
            }
            remaining -= static_cast<std::uint64_t>(got);
            position += static_cast<std::uint64_t>(got);
        }
        return {};
    }
};

std::unique_ptr<IRangeAdapter> makeFileRangeAdapter() {
    return std::make_unique<FileRangeAdapter>();
}

} // namespace rangedb::transport
