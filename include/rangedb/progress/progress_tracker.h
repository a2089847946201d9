#pragma once

#include <rangedb/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace rangedb::progress {

/**
 * Progress event delivered to subscribers.
 */
struct ProgressEvent {
    double percent = 0.0; // 0-100, 0 while the total is unknown
    std::uint64_t bytesLoaded = 0;
    std::uint64_t bytesTotal = 0;
    double speedBytesPerSec = 0.0;
    std::optional<double> etaSeconds; // nullopt when speed is 0 or the total is unknown
    std::string operation;
    SteadyTimePoint startedAt{};
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using SubscriptionId = std::uint64_t;
using Clock = std::function<SteadyTimePoint()>;

/**
 * Byte counter with a moving-average speed estimate.
 *
 * Speed is the byte delta across the samples inside a trailing window divided by the time
 * since the oldest of them, so one burst does not register as a spike. Subscribers are notified
 * on every update, outside the tracker lock; they observe and can never influence transfers.
 */
class ProgressTracker {
public:
    explicit ProgressTracker(std::chrono::milliseconds window = std::chrono::seconds(3),
                             Clock clock = {});
    ~ProgressTracker();

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;
    ProgressTracker(ProgressTracker&&) noexcept;
    ProgressTracker& operator=(ProgressTracker&&) noexcept;

    // Start a new transfer; clears counters and samples.
    void begin(std::uint64_t totalBytes, std::string operation = {});
    // Total learned after the transfer started; publishes like any other update.
    void setTotalBytes(std::uint64_t total);
    void onBytes(std::uint64_t delta);
    void reset();

    [[nodiscard]] ProgressEvent snapshot() const;

    SubscriptionId subscribe(ProgressCallback callback);
    bool unsubscribe(SubscriptionId id);
    [[nodiscard]] std::size_t subscriberCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace rangedb::progress
