#pragma once

#include <rangedb/core/types.h>
#include <rangedb/transport/range_adapter.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace rangedb::transport {

/**
 * Per-tier timeout table. Each tier bounds a single attempt of its own operation; tiers are
 * independent and never nest.
 */
struct TimeoutTiers {
    std::chrono::milliseconds engineInit{45000};
    std::chrono::milliseconds bulkFetch{120000};
    std::chrono::milliseconds queryExecution{90000};
    std::chrono::milliseconds emergencyFallback{180000};

    std::chrono::milliseconds forTier(Tier tier) const;
};

/**
 * Exponential backoff schedule. The first attempt runs immediately, attempt k > 0 waits
 * initialBackoff * multiplier^(k-1), capped at maxBackoff.
 */
struct RetryPolicy {
    int maxAttempts{4};
    std::chrono::milliseconds initialBackoff{1000};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};

    std::chrono::milliseconds delayBeforeAttempt(int attempt) const;
};

enum class AttemptOutcome { Success, RetriableFailure, TerminalFailure };

/**
 * Handed to every attempt. Long running work must poll shouldCancel (or compare against
 * deadline) and return early once it reports true.
 */
struct AttemptContext {
    Tier tier{Tier::BulkFetch};
    int attempt{0}; // 0-based
    std::chrono::milliseconds timeout{0};
    std::chrono::steady_clock::time_point deadline{};
    ShouldCancel shouldCancel;

    bool expired() const { return std::chrono::steady_clock::now() >= deadline; }
    std::chrono::milliseconds remaining() const;
};

bool isRetriable(ErrorCode code);

struct RetrierStats {
    std::uint64_t operations{0};
    std::uint64_t attempts{0};
    std::uint64_t retries{0};
    std::uint64_t exhausted{0};
    std::uint64_t terminalFailures{0};
};

/**
 * Bounded retry loop around a single operation.
 *
 * Attempts run inline on the caller's thread. An attempt that outlives its tier timeout counts as
 * a Timeout failure even if it eventually produced a value. Every failed attempt is logged. After
 * the last attempt the caller gets RetryExhausted carrying the final underlying error; terminal
 * failures are returned unchanged (with RetryInfo attached) without further attempts.
 */
class TransportRetrier {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit TransportRetrier(TimeoutTiers tiers = {}, RetryPolicy policy = {},
                              Sleeper sleeper = {});

    template <typename Op>
    std::invoke_result_t<Op&, const AttemptContext&>
    execute(Tier tier, std::string_view label, Op&& op, const ShouldCancel& abort = {}) {
        using R = std::invoke_result_t<Op&, const AttemptContext&>;

        const auto timeout = tiers_.forTier(tier);
        const int maxAttempts = policy_.maxAttempts < 1 ? 1 : policy_.maxAttempts;
        const auto started = std::chrono::steady_clock::now();
        stats_.operations.fetch_add(1, std::memory_order_relaxed);

        Error last{ErrorCode::Unknown, "no attempt made"};
        for (int attempt = 0; attempt < maxAttempts; ++attempt) {
            if (attempt > 0) {
                stats_.retries.fetch_add(1, std::memory_order_relaxed);
                sleep(policy_.delayBeforeAttempt(attempt));
            }
            if (abort && abort()) {
                return finishAborted(tier, label, attempt, started);
            }

            AttemptContext ctx;
            ctx.tier = tier;
            ctx.attempt = attempt;
            ctx.timeout = timeout;
            const auto attemptStart = std::chrono::steady_clock::now();
            ctx.deadline = attemptStart + timeout;
            ctx.shouldCancel = [deadline = ctx.deadline, &abort] {
                return std::chrono::steady_clock::now() >= deadline || (abort && abort());
            };

            stats_.attempts.fetch_add(1, std::memory_order_relaxed);
            R result = op(ctx);
            const auto attemptElapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - attemptStart);
            const bool overran = attemptElapsed >= timeout;

            if (result && !overran) {
                return result;
            }

            if (result) {
                last = Error{ErrorCode::Timeout,
                             "attempt exceeded " + std::to_string(timeout.count()) + " ms"};
            } else {
                last = result.error();
                if (last.code == ErrorCode::OperationCancelled && overran) {
                    last = Error{ErrorCode::Timeout, "attempt abandoned after " +
                                                         std::to_string(timeout.count()) + " ms"};
                }
            }

            const auto outcome = classify(last);
            logFailedAttempt(tier, label, attempt, maxAttempts, attemptElapsed, last, outcome);
            if (outcome == AttemptOutcome::TerminalFailure) {
                return finishTerminal(tier, label, attempt + 1, started, std::move(last));
            }
        }
        return finishExhausted(tier, label, maxAttempts, started, std::move(last));
    }

    static AttemptOutcome classify(const Error& error);

    const TimeoutTiers& tiers() const { return tiers_; }
    const RetryPolicy& policy() const { return policy_; }
    RetrierStats stats() const;

private:
    void sleep(std::chrono::milliseconds delay) const;
    void logFailedAttempt(Tier tier, std::string_view label, int attempt, int maxAttempts,
                          std::chrono::milliseconds elapsed, const Error& error,
                          AttemptOutcome outcome) const;
    Error finishTerminal(Tier tier, std::string_view label, int attempts,
                         std::chrono::steady_clock::time_point started, Error last);
    Error finishExhausted(Tier tier, std::string_view label, int attempts,
                          std::chrono::steady_clock::time_point started, Error last);
    Error finishAborted(Tier tier, std::string_view label, int attempts,
                        std::chrono::steady_clock::time_point started);

    struct Counters {
        std::atomic<std::uint64_t> operations{0};
        std::atomic<std::uint64_t> attempts{0};
        std::atomic<std::uint64_t> retries{0};
        std::atomic<std::uint64_t> exhausted{0};
        std::atomic<std::uint64_t> terminalFailures{0};
    };

    TimeoutTiers tiers_;
    RetryPolicy policy_;
    Sleeper sleeper_;
    Counters stats_;
};

} // namespace rangedb::transport
