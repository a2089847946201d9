#include <rangedb/progress/progress_tracker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <map>
#include <mutex>
#include <vector>

namespace rangedb::progress {

struct ProgressTracker::Impl {
    struct Sample {
        SteadyTimePoint at;
        std::uint64_t loaded;
    };

    std::chrono::milliseconds window;
    Clock clock;

    mutable std::mutex mutex;
    std::uint64_t bytesLoaded = 0;
    std::uint64_t bytesTotal = 0;
    std::string operation;
    SteadyTimePoint startedAt;
    std::deque<Sample> samples;

    std::map<SubscriptionId, ProgressCallback> subscribers;
    SubscriptionId nextId = 1;

    Impl(std::chrono::milliseconds w, Clock c) : window(w), clock(std::move(c)) {
        if (!clock) {
            clock = [] { return std::chrono::steady_clock::now(); };
        }
        startedAt = clock();
    }

    // Requires mutex.
    void prune(SteadyTimePoint now) {
        const auto horizon = now - window;
        while (samples.size() > 1 && samples.front().at < horizon) {
            samples.pop_front();
        }
    }

    // Requires mutex.
    ProgressEvent makeEvent(SteadyTimePoint now) const {
        ProgressEvent ev;
        ev.bytesLoaded = bytesLoaded;
        ev.bytesTotal = bytesTotal;
        ev.operation = operation;
        ev.startedAt = startedAt;
        if (bytesTotal > 0) {
            ev.percent = std::min(100.0, static_cast<double>(bytesLoaded) * 100.0 /
                                             static_cast<double>(bytesTotal));
        }

        // Oldest sample still inside the window anchors the average.
        const auto horizon = now - window;
        const Sample* first = nullptr;
        for (const auto& s : samples) {
            if (s.at >= horizon) {
                first = &s;
                break;
            }
        }
        if (first != nullptr && !samples.empty() && first != &samples.back()) {
            const auto span = std::chrono::duration<double>(now - first->at).count();
            const auto delta = samples.back().loaded - first->loaded;
            if (span > 0.0 && delta > 0) {
                ev.speedBytesPerSec = static_cast<double>(delta) / span;
            }
        }

        if (ev.speedBytesPerSec > 0.0 && bytesTotal > 0) {
            const auto left = bytesTotal > bytesLoaded ? bytesTotal - bytesLoaded : 0;
            ev.etaSeconds = static_cast<double>(left) / ev.speedBytesPerSec;
        }
        return ev;
    }

    void publish(const ProgressEvent& ev) {
        std::vector<ProgressCallback> targets;
        {
            std::lock_guard<std::mutex> lock(mutex);
            targets.reserve(subscribers.size());
            for (const auto& [id, cb] : subscribers) {
                targets.push_back(cb);
            }
        }
        for (const auto& cb : targets) {
            try {
                cb(ev);
            } catch (const std::exception& e) {
                spdlog::warn("progress subscriber threw: {}", e.what());
            }
        }
    }
};

ProgressTracker::ProgressTracker(std::chrono::milliseconds window, Clock clock)
    : pImpl(std::make_unique<Impl>(window, std::move(clock))) {}

ProgressTracker::~ProgressTracker() = default;

ProgressTracker::ProgressTracker(ProgressTracker&&) noexcept = default;
ProgressTracker& ProgressTracker::operator=(ProgressTracker&&) noexcept = default;

void ProgressTracker::begin(std::uint64_t totalBytes, std::string operation) {
    ProgressEvent ev;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        const auto now = pImpl->clock();
        pImpl->bytesLoaded = 0;
        pImpl->bytesTotal = totalBytes;
        pImpl->operation = std::move(operation);
        pImpl->startedAt = now;
        pImpl->samples.clear();
        pImpl->samples.push_back({now, 0});
        ev = pImpl->makeEvent(now);
    }
    pImpl->publish(ev);
}

void ProgressTracker::setTotalBytes(std::uint64_t total) {
    ProgressEvent ev;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->bytesTotal = total;
        ev = pImpl->makeEvent(pImpl->clock());
    }
    pImpl->publish(ev);
}

void ProgressTracker::onBytes(std::uint64_t delta) {
    if (delta == 0)
        return;
    ProgressEvent ev;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        const auto now = pImpl->clock();
        pImpl->bytesLoaded += delta;
        pImpl->samples.push_back({now, pImpl->bytesLoaded});
        pImpl->prune(now);
        ev = pImpl->makeEvent(now);
    }
    pImpl->publish(ev);
}

void ProgressTracker::reset() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->bytesLoaded = 0;
    pImpl->bytesTotal = 0;
    pImpl->operation.clear();
    pImpl->samples.clear();
    pImpl->startedAt = pImpl->clock();
}

ProgressEvent ProgressTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->makeEvent(pImpl->clock());
}

SubscriptionId ProgressTracker::subscribe(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    const auto id = pImpl->nextId++;
    pImpl->subscribers.emplace(id, std::move(callback));
    return id;
}

bool ProgressTracker::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->subscribers.erase(id) > 0;
}

std::size_t ProgressTracker::subscriberCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->subscribers.size();
}

} // namespace rangedb::progress
