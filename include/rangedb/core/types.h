#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace rangedb {

// Type aliases
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;
using TimePoint = std::chrono::system_clock::time_point;
using SteadyTimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    NotFound,
    PermissionDenied,
    InvalidState,
    InvalidData,
    CorruptedData,
    DatabaseError,
    OperationCancelled,
    ResourceExhausted,
    NotSupported,
    InternalError,
    MetadataUnavailable,
    ChunkFetchFailed,
    EngineInitFailed,
    QueryExecutionFailed,
    RetryExhausted,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::CorruptedData: return "Corrupted data";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::MetadataUnavailable: return "Metadata unavailable";
        case ErrorCode::ChunkFetchFailed: return "Chunk fetch failed";
        case ErrorCode::EngineInitFailed: return "Engine initialization failed";
        case ErrorCode::QueryExecutionFailed: return "Query execution failed";
        case ErrorCode::RetryExhausted: return "Retries exhausted";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * Timeout/retry budget classes. Each tier is an independent budget applied to its own
 * operation only.
 */
enum class Tier { EngineInit, BulkFetch, QueryExecution, EmergencyFallback };

constexpr const char* tierToString(Tier tier) {
    switch (tier) {
        case Tier::EngineInit: return "engine-init";
        case Tier::BulkFetch: return "bulk-fetch";
        case Tier::QueryExecution: return "query-exec";
        case Tier::EmergencyFallback: return "emergency-fallback";
    }
    return "unknown";
}

/**
 * Context attached to a failure that went through the retry loop.
 */
struct RetryInfo {
    Tier tier{Tier::BulkFetch};
    int attempts{0};
    ErrorCode lastCode{ErrorCode::Unknown};
    std::string lastMessage;
    std::chrono::milliseconds elapsed{0};
};

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<RetryInfo> retry;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg, std::optional<RetryInfo> info)
        : code(c), message(std::move(msg)), retry(std::move(info)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }

    /**
     * Human readable one-liner including tier and attempt count when present.
     */
    std::string describe() const {
        std::string out = errorToString(code);
        if (!message.empty()) {
            out += ": ";
            out += message;
        }
        if (retry) {
            out += " [tier=";
            out += tierToString(retry->tier);
            out += ", attempts=" + std::to_string(retry->attempts);
            if (!retry->lastMessage.empty()) {
                out += ", last=" + retry->lastMessage;
            }
            out += "]";
        }
        return out;
    }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace rangedb

// fmt library support for ErrorCode and Tier (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<rangedb::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(rangedb::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", rangedb::errorToString(error));
    }
};

template <> struct fmt::formatter<rangedb::Tier> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext> auto format(rangedb::Tier tier, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", rangedb::tierToString(tier));
    }
};
#endif

namespace rangedb {

// Common constants
inline constexpr std::size_t DEFAULT_CHUNK_SIZE = 64 * 1024;          // 64KB
inline constexpr std::size_t DEFAULT_CHUNK_CACHE_BYTES = 20 * 1024 * 1024; // 20MB
inline constexpr std::uint32_t DEFAULT_PAGE_SIZE = 4096;

} // namespace rangedb
