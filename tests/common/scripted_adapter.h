#pragma once

#include <rangedb/transport/range_adapter.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rangedb::tests {

/**
 * In-memory IRangeAdapter. Serves registered bodies, fails calls according to a script and
 * records every call.
 */
class ScriptedAdapter : public transport::IRangeAdapter {
public:
    struct Call {
        std::string url;
        std::uint64_t offset = 0;
        std::uint64_t size = 0;
    };

    void serve(const std::string& url, ByteVector body) {
        std::lock_guard<std::mutex> lock(mutex_);
        bodies_[url] = std::move(body);
    }

    void serveText(const std::string& url, const std::string& text) {
        ByteVector body(text.size());
        std::memcpy(body.data(), text.data(), text.size());
        serve(url, std::move(body));
    }

    // The next N calls (any url) fail with these errors, in order.
    void failNext(Error error, int times = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int i = 0; i < times; ++i) {
            script_.push_back(error);
        }
    }

    // Every call for this url fails until cleared.
    void failAlways(const std::string& url, Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        alwaysFail_[url] = std::move(error);
    }

    void clearFailures() {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.clear();
        alwaysFail_.clear();
    }

    void setLatency(std::chrono::milliseconds latency) {
        std::lock_guard<std::mutex> lock(mutex_);
        latency_ = latency;
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::size_t callCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    std::size_t callCount(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& c : calls_) {
            if (c.url == url)
                ++n;
        }
        return n;
    }

    void resetCalls() {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.clear();
    }

    Result<void> fetchRange(std::string_view url, std::uint64_t offset, std::uint64_t size,
                            const transport::FetchOptions&, const transport::ByteSink& sink,
                            const transport::ShouldCancel& shouldCancel) override {
        std::optional<Error> failure;
        std::chrono::milliseconds latency{0};
        ByteVector slice;
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const std::string key(url);
            calls_.push_back(Call{key, offset, size});
            latency = latency_;
            if (auto it = alwaysFail_.find(key); it != alwaysFail_.end()) {
                failure = it->second;
            } else if (!script_.empty()) {
                failure = script_.front();
                script_.pop_front();
            }
            if (auto it = bodies_.find(key); it != bodies_.end()) {
                found = true;
                const auto& body = it->second;
                if (offset < body.size()) {
                    const auto end = size == 0 ? body.size()
                                               : std::min<std::uint64_t>(body.size(), offset + size);
                    slice.assign(body.begin() + static_cast<std::ptrdiff_t>(offset),
                                 body.begin() + static_cast<std::ptrdiff_t>(end));
                } else if (offset > 0) {
                    failure = Error{ErrorCode::InvalidArgument, "range not satisfiable"};
                }
            }
        }

        if (latency.count() > 0) {
            const auto until = std::chrono::steady_clock::now() + latency;
            while (std::chrono::steady_clock::now() < until) {
                if (shouldCancel && shouldCancel()) {
                    return Error{ErrorCode::OperationCancelled, "transfer abandoned"};
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
        if (failure) {
            return *failure;
        }
        if (!found) {
            return Error{ErrorCode::NotFound, "HTTP error 404"};
        }
        return sink(ByteSpan{slice.data(), slice.size()});
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, ByteVector> bodies_;
    std::map<std::string, Error> alwaysFail_;
    std::deque<Error> script_;
    std::vector<Call> calls_;
    std::chrono::milliseconds latency_{0};
};

} // namespace rangedb::tests
