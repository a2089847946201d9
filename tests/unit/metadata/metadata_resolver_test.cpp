#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "common/scripted_adapter.h"
#include <rangedb/metadata/metadata_resolver.h>

using namespace rangedb;
using namespace rangedb::metadata;
using namespace std::chrono_literals;

class MetadataResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        adapter_ = std::make_shared<tests::ScriptedAdapter>();
        retrier_ = std::make_shared<transport::TransportRetrier>(
            transport::TimeoutTiers{}, transport::RetryPolicy{},
            [this](std::chrono::milliseconds d) { sleeps_.push_back(d); });
        resolver_ = std::make_unique<MetadataResolver>(adapter_, retrier_);
        adapter_->serveText(kUrl, R"({"size": 300000, "pageSize": 4096, "chunkSize": 65536,
                                      "url": "db.sqlite", "chunkCount": 5, "version": 1})");
    }

    static constexpr const char* kUrl = "https://cdn.example.org/db.sqlite.suffix";

    std::shared_ptr<tests::ScriptedAdapter> adapter_;
    std::shared_ptr<transport::TransportRetrier> retrier_;
    std::unique_ptr<MetadataResolver> resolver_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(MetadataResolverTest, ResolvesIdentity) {
    auto r = resolver_->resolve(kUrl);
    ASSERT_TRUE(r) << r.error().describe();
    EXPECT_EQ(r.value().url, "https://cdn.example.org/db.sqlite");
    EXPECT_EQ(r.value().chunkCount, 5u);
    EXPECT_EQ(adapter_->callCount(kUrl), 1u);
}

TEST_F(MetadataResolverTest, SuccessIsMemoized) {
    ASSERT_TRUE(resolver_->resolve(kUrl));
    ASSERT_TRUE(resolver_->resolve(kUrl));
    EXPECT_EQ(adapter_->callCount(kUrl), 1u);
    EXPECT_EQ(resolver_->fetchCount(), 1u);

    resolver_->forget(kUrl);
    ASSERT_TRUE(resolver_->resolve(kUrl));
    EXPECT_EQ(adapter_->callCount(kUrl), 2u);
}

TEST_F(MetadataResolverTest, ConcurrentCallersShareOneFetch) {
    adapter_->setLatency(100ms);
    std::vector<std::thread> threads;
    std::atomic<int> successes{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (resolver_->resolve(kUrl)) {
                successes.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(successes.load(), 8);
    EXPECT_EQ(adapter_->callCount(kUrl), 1u);
}

TEST_F(MetadataResolverTest, TransientFailuresAreRetried) {
    adapter_->failNext(Error{ErrorCode::NetworkError, "reset"}, 2);
    auto r = resolver_->resolve(kUrl);
    ASSERT_TRUE(r) << r.error().describe();
    EXPECT_EQ(adapter_->callCount(kUrl), 3u);
    ASSERT_EQ(sleeps_.size(), 2u);
}

TEST_F(MetadataResolverTest, ExhaustionIsMetadataUnavailable) {
    adapter_->failAlways(kUrl, Error{ErrorCode::Timeout, "slow"});
    auto r = resolver_->resolve(kUrl);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::MetadataUnavailable);
    ASSERT_TRUE(r.error().retry.has_value());
    EXPECT_EQ(r.error().retry->tier, Tier::EngineInit);
    EXPECT_EQ(r.error().retry->attempts, 4);
    EXPECT_EQ(adapter_->callCount(kUrl), 4u);
}

TEST_F(MetadataResolverTest, MalformedDescriptorFailsWithoutRetry) {
    adapter_->serveText(kUrl, "{not json");
    auto r = resolver_->resolve(kUrl);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::MetadataUnavailable);
    ASSERT_TRUE(r.error().retry.has_value());
    EXPECT_EQ(r.error().retry->lastCode, ErrorCode::InvalidData);
    EXPECT_EQ(r.error().retry->attempts, 1);
    EXPECT_EQ(adapter_->callCount(kUrl), 1u);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(MetadataResolverTest, FailuresAreNotMemoized) {
    adapter_->failAlways(kUrl, Error{ErrorCode::NotFound, "HTTP error 404"});
    ASSERT_FALSE(resolver_->resolve(kUrl));
    adapter_->clearFailures();
    auto r = resolver_->resolve(kUrl);
    ASSERT_TRUE(r) << r.error().describe();
    EXPECT_EQ(adapter_->callCount(kUrl), 2u);
}

TEST_F(MetadataResolverTest, DescriptorKeepsMetadataBlock) {
    adapter_->serveText(kUrl, R"({"size": 10, "chunkSize": 10, "url": "x.sqlite",
                                  "metadata": {"generated": "2024-01-01"}})");
    auto r = resolver_->resolveDescriptor(kUrl);
    ASSERT_TRUE(r) << r.error().describe();
    EXPECT_EQ(r.value().metadata["generated"], "2024-01-01");
}
