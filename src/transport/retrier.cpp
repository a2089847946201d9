#include <rangedb/transport/retrier.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <thread>

namespace rangedb::transport {

std::chrono::milliseconds TimeoutTiers::forTier(Tier tier) const {
    switch (tier) {
        case Tier::EngineInit:
            return engineInit;
        case Tier::BulkFetch:
            return bulkFetch;
        case Tier::QueryExecution:
            return queryExecution;
        case Tier::EmergencyFallback:
            return emergencyFallback;
    }
    return bulkFetch;
}

std::chrono::milliseconds RetryPolicy::delayBeforeAttempt(int attempt) const {
    if (attempt <= 0) {
        return std::chrono::milliseconds{0};
    }
    const double scaled =
        static_cast<double>(initialBackoff.count()) * std::pow(multiplier, attempt - 1);
    const double capped = std::min(scaled, static_cast<double>(maxBackoff.count()));
    return std::chrono::milliseconds{static_cast<std::int64_t>(capped)};
}

std::chrono::milliseconds AttemptContext::remaining() const {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

bool isRetriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::ResourceExhausted:
            return true;
        default:
            return false;
    }
}

TransportRetrier::TransportRetrier(TimeoutTiers tiers, RetryPolicy policy, Sleeper sleeper)
    : tiers_(tiers), policy_(policy), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

AttemptOutcome TransportRetrier::classify(const Error& error) {
    if (error.code == ErrorCode::Success) {
        return AttemptOutcome::Success;
    }
    return isRetriable(error.code) ? AttemptOutcome::RetriableFailure
                                   : AttemptOutcome::TerminalFailure;
}

RetrierStats TransportRetrier::stats() const {
    RetrierStats s;
    s.operations = stats_.operations.load(std::memory_order_relaxed);
    s.attempts = stats_.attempts.load(std::memory_order_relaxed);
    s.retries = stats_.retries.load(std::memory_order_relaxed);
    s.exhausted = stats_.exhausted.load(std::memory_order_relaxed);
    s.terminalFailures = stats_.terminalFailures.load(std::memory_order_relaxed);
    return s;
}

void TransportRetrier::sleep(std::chrono::milliseconds delay) const {
    sleeper_(delay);
}

void TransportRetrier::logFailedAttempt(Tier tier, std::string_view label, int attempt,
                                        int maxAttempts, std::chrono::milliseconds elapsed,
                                        const Error& error, AttemptOutcome outcome) const {
    spdlog::warn("retry tier={} op='{}' attempt={}/{} elapsed_ms={} outcome={} error={}",
                 tierToString(tier), label, attempt + 1, maxAttempts, elapsed.count(),
                 outcome == AttemptOutcome::TerminalFailure ? "terminal" : "retriable",
                 error.describe());
}

Error TransportRetrier::finishTerminal(Tier tier, std::string_view label, int attempts,
                                       std::chrono::steady_clock::time_point started,
                                       Error last) {
    stats_.terminalFailures.fetch_add(1, std::memory_order_relaxed);
    if (!last.retry) {
        RetryInfo info;
        info.tier = tier;
        info.attempts = attempts;
        info.lastCode = last.code;
        info.lastMessage = last.message;
        info.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        last.retry = std::move(info);
    }
    spdlog::debug("'{}' failed terminally at tier {} after {} attempt(s)", label,
                  tierToString(tier), attempts);
    return last;
}

Error TransportRetrier::finishExhausted(Tier tier, std::string_view label, int attempts,
                                        std::chrono::steady_clock::time_point started,
                                        Error last) {
    stats_.exhausted.fetch_add(1, std::memory_order_relaxed);
    RetryInfo info;
    info.tier = tier;
    info.attempts = attempts;
    info.lastCode = last.code;
    info.lastMessage = last.message;
    info.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::error("'{}' exhausted {} attempts at tier {} after {} ms: {}", label, attempts,
                  tierToString(tier), info.elapsed.count(), last.describe());
    std::string message = std::string(label) + ": " + std::to_string(attempts) +
                          " attempts failed; last error: " + errorToString(last.code);
    if (!last.message.empty()) {
        message += " (" + last.message + ")";
    }
    return Error{ErrorCode::RetryExhausted, std::move(message), std::move(info)};
}

Error TransportRetrier::finishAborted(Tier tier, std::string_view label, int attempts,
                                      std::chrono::steady_clock::time_point started) {
    RetryInfo info;
    info.tier = tier;
    info.attempts = attempts;
    info.lastCode = ErrorCode::OperationCancelled;
    info.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("'{}' abandoned at tier {} before attempt {}", label, tierToString(tier),
                 attempts + 1);
    return Error{ErrorCode::OperationCancelled, std::string(label) + ": abandoned",
                 std::move(info)};
}

} // namespace rangedb::transport
