#include <rangedb/metadata/descriptor.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <limits>

namespace rangedb::metadata {

namespace {

using json = nlohmann::json;

// Missing -> nullopt; present but not a non-negative integer -> error.
Result<std::optional<std::uint64_t>> readUnsigned(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::optional<std::uint64_t>{};
    }
    if (it->is_number_unsigned()) {
        return std::optional<std::uint64_t>{it->get<std::uint64_t>()};
    }
    if (it->is_number_integer()) {
        return Error{ErrorCode::CorruptedData,
                     fmt::format("descriptor field '{}' is negative ({})", key,
                                 it->get<std::int64_t>())};
    }
    return Error{ErrorCode::InvalidData,
                 fmt::format("descriptor field '{}' must be an integer, got {}", key,
                             it->type_name())};
}

Result<std::uint32_t> narrow32(std::uint64_t v, const char* key) {
    if (v > std::numeric_limits<std::uint32_t>::max()) {
        return Error{ErrorCode::CorruptedData,
                     fmt::format("descriptor field '{}' out of range ({})", key, v)};
    }
    return static_cast<std::uint32_t>(v);
}

bool hasScheme(std::string_view ref) {
    auto pos = ref.find("://");
    if (pos == std::string_view::npos || pos == 0)
        return false;
    for (std::size_t i = 0; i < pos; ++i) {
        const char c = ref[i];
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.'))
            return false;
    }
    return true;
}

} // namespace

std::uint32_t DatabaseIdentity::chunkLength(std::uint32_t index) const {
    if (chunkSize == 0 || index >= chunkCount)
        return 0;
    const auto offset = chunkOffset(index);
    const auto left = totalSize - offset;
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(left, chunkSize));
}

std::uint32_t expectedChunkCount(std::uint64_t totalSize, std::uint32_t chunkSize) {
    if (chunkSize == 0)
        return 0;
    return static_cast<std::uint32_t>((totalSize + chunkSize - 1) / chunkSize);
}

Result<void> validateIdentity(const DatabaseIdentity& id) {
    if (id.totalSize == 0) {
        return Error{ErrorCode::CorruptedData, "descriptor size must be positive"};
    }
    if (id.chunkSize == 0) {
        return Error{ErrorCode::CorruptedData, "descriptor chunkSize must be positive"};
    }
    if (id.pageSize == 0) {
        return Error{ErrorCode::CorruptedData, "descriptor pageSize must be positive"};
    }
    if ((id.pageSize & (id.pageSize - 1)) != 0 || id.pageSize < 512 || id.pageSize > 65536) {
        return Error{ErrorCode::CorruptedData,
                     fmt::format("descriptor pageSize {} is not a power of two in [512, 65536]",
                                 id.pageSize)};
    }
    const auto expected = expectedChunkCount(id.totalSize, id.chunkSize);
    if (id.chunkCount != expected) {
        return Error{ErrorCode::CorruptedData,
                     fmt::format("descriptor chunkCount {} inconsistent with size {} / chunkSize "
                                 "{} (expected {})",
                                 id.chunkCount, id.totalSize, id.chunkSize, expected)};
    }
    if (id.formatVersion != SUFFIX_FORMAT_VERSION) {
        return Error{ErrorCode::CorruptedData,
                     fmt::format("unsupported descriptor version {}", id.formatVersion)};
    }
    if (id.url.empty()) {
        return Error{ErrorCode::CorruptedData, "descriptor does not name a data url"};
    }
    return {};
}

Result<SuffixDescriptor> parseSuffixDescriptor(std::string_view text,
                                               std::string_view descriptorUrl,
                                               std::string_view fallbackDataUrl) {
    json j = json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorCode::InvalidData, "descriptor is not valid JSON"};
    }
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "descriptor must be a JSON object"};
    }

    SuffixDescriptor out;
    auto& id = out.identity;

    auto size = readUnsigned(j, "size");
    if (!size)
        return size.error();
    auto chunkSize = readUnsigned(j, "chunkSize");
    if (!chunkSize)
        return chunkSize.error();
    auto pageSize = readUnsigned(j, "pageSize");
    if (!pageSize)
        return pageSize.error();
    auto chunkCount = readUnsigned(j, "chunkCount");
    if (!chunkCount)
        return chunkCount.error();
    auto version = readUnsigned(j, "version");
    if (!version)
        return version.error();

    if (!size.value()) {
        return Error{ErrorCode::CorruptedData, "descriptor is missing 'size'"};
    }
    if (!chunkSize.value()) {
        return Error{ErrorCode::CorruptedData, "descriptor is missing 'chunkSize'"};
    }
    id.totalSize = *size.value();

    auto cs = narrow32(*chunkSize.value(), "chunkSize");
    if (!cs)
        return cs.error();
    id.chunkSize = cs.value();

    auto ps = narrow32(pageSize.value().value_or(DEFAULT_PAGE_SIZE), "pageSize");
    if (!ps)
        return ps.error();
    id.pageSize = ps.value();

    if (chunkCount.value()) {
        auto cc = narrow32(*chunkCount.value(), "chunkCount");
        if (!cc)
            return cc.error();
        id.chunkCount = cc.value();
    } else {
        id.chunkCount = expectedChunkCount(id.totalSize, id.chunkSize);
    }

    auto ver = narrow32(version.value().value_or(SUFFIX_FORMAT_VERSION), "version");
    if (!ver)
        return ver.error();
    id.formatVersion = ver.value();

    if (auto it = j.find("url"); it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
        id.url = resolveRelativeUrl(descriptorUrl, it->get<std::string>());
    } else {
        id.url = std::string(fallbackDataUrl);
    }

    if (auto v = validateIdentity(id); !v) {
        return v.error();
    }

    if (auto it = j.find("chunks"); it != j.end() && it->is_array()) {
        out.chunks.reserve(it->size());
        for (const auto& c : *it) {
            if (!c.is_object()) {
                return Error{ErrorCode::InvalidData, "descriptor chunk entry must be an object"};
            }
            ChunkEntry e;
            e.index = c.value("index", 0u);
            e.start = c.value("start", std::uint64_t{0});
            e.end = c.value("end", std::uint64_t{0});
            e.size = c.value("size", std::uint64_t{0});
            if (e.index >= id.chunkCount || e.start != id.chunkOffset(e.index) ||
                e.size != id.chunkLength(e.index)) {
                return Error{ErrorCode::CorruptedData,
                             fmt::format("descriptor chunk entry {} disagrees with chunk layout",
                                         e.index)};
            }
            out.chunks.push_back(e);
        }
    }

    if (auto it = j.find("metadata"); it != j.end()) {
        out.metadata = *it;
    }
    return out;
}

nlohmann::json identityToJson(const DatabaseIdentity& id) {
    return json{{"url", id.url},
                {"size", id.totalSize},
                {"pageSize", id.pageSize},
                {"chunkSize", id.chunkSize},
                {"chunkCount", id.chunkCount},
                {"version", id.formatVersion}};
}

std::string resolveRelativeUrl(std::string_view base, std::string_view ref) {
    if (ref.empty() || hasScheme(ref) || ref.front() == '/') {
        if (!ref.empty() && ref.front() == '/' && hasScheme(base)) {
            // Host-relative reference
            auto schemeEnd = base.find("://") + 3;
            auto hostEnd = base.find('/', schemeEnd);
            return std::string(base.substr(0, hostEnd)) + std::string(ref);
        }
        return std::string(ref);
    }
    auto slash = base.rfind('/');
    if (slash == std::string_view::npos) {
        return std::string(ref);
    }
    if (hasScheme(base) && slash < base.find("://") + 3) {
        return std::string(base) + "/" + std::string(ref);
    }
    return std::string(base.substr(0, slash + 1)) + std::string(ref);
}

} // namespace rangedb::metadata
