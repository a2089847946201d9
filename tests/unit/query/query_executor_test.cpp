#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <rangedb/connection/connection_manager.h>
#include <rangedb/query/query_executor.h>

#include "common/counting_adapter.h"
#include "common/test_database.h"

using namespace rangedb;
using namespace rangedb::query;
using namespace std::chrono_literals;

class QueryExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = std::make_unique<tests::TestDatabase>();
        adapter_ = std::make_shared<tests::CountingAdapter>();
        manager_ = std::make_shared<connection::ConnectionManager>(db_->config(), adapter_,
                                                                   nullptr, nullptr, nullptr);
    }

    void TearDown() override {
        executor_.reset();
        manager_.reset();
        db_.reset();
    }

    QueryExecutor& executor(QueryExecutorConfig config = {}) {
        executor_ = std::make_unique<QueryExecutor>(manager_, config);
        return *executor_;
    }

    std::uint64_t engineExecutions() {
        auto conn = manager_->acquire();
        EXPECT_TRUE(conn);
        return conn.value()->engine().executions();
    }

    std::unique_ptr<tests::TestDatabase> db_;
    std::shared_ptr<tests::CountingAdapter> adapter_;
    std::shared_ptr<connection::ConnectionManager> manager_;
    std::unique_ptr<QueryExecutor> executor_;
};

TEST_F(QueryExecutorTest, RepeatedQueryIsServedFromCache) {
    auto& exec = executor();
    const QueryRequest request{"SELECT id, name FROM buildings WHERE city = ? ORDER BY id LIMIT 5",
                               std::vector<Value>{std::string("Rome")}};

    auto first = exec.run(request);
    ASSERT_TRUE(first) << first.error().describe();
    ASSERT_EQ(first.value().size(), 5u);
    EXPECT_EQ(std::get<std::int64_t>(first.value().rows[0][0]), 2);
    EXPECT_EQ(std::get<std::string>(first.value().rows[4][1]), "Building 22");
    const auto callsAfterFirst = adapter_->calls();
    EXPECT_EQ(engineExecutions(), 1u);

    auto second = exec.run(request);
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value(), first.value());
    EXPECT_EQ(adapter_->calls(), callsAfterFirst);
    EXPECT_EQ(engineExecutions(), 1u);

    auto stats = exec.stats();
    EXPECT_EQ(stats.executions, 1u);
    EXPECT_EQ(stats.cacheHits, 1u);
    EXPECT_EQ(stats.cacheMisses, 1u);
}

TEST_F(QueryExecutorTest, EquivalentSpellingsShareAnEntry) {
    auto& exec = executor();
    ASSERT_TRUE(exec.run(QueryRequest{"SELECT count(*) FROM buildings"}));
    auto again = exec.run(QueryRequest{"SELECT count(*)\n   FROM buildings ;"});
    ASSERT_TRUE(again);
    EXPECT_EQ(exec.stats().executions, 1u);
    EXPECT_EQ(exec.stats().cacheHits, 1u);
}

TEST_F(QueryExecutorTest, DifferentParametersMiss) {
    auto& exec = executor();
    const std::string sql = "SELECT count(*) FROM buildings WHERE levels = ?";
    ASSERT_TRUE(exec.run(QueryRequest{sql, std::vector<Value>{std::int64_t{1}}}));
    ASSERT_TRUE(exec.run(QueryRequest{sql, std::vector<Value>{std::int64_t{2}}}));
    EXPECT_EQ(exec.stats().executions, 2u);
    EXPECT_EQ(exec.stats().cacheHits, 0u);
}

TEST_F(QueryExecutorTest, NamedParametersAndCount) {
    auto& exec = executor();
    auto count = exec.runCount(
        QueryRequest{"SELECT count(*) FROM buildings WHERE city = :city",
                     std::map<std::string, Value>{{"city", std::string("Paris")}}});
    ASSERT_TRUE(count) << count.error().describe();
    EXPECT_EQ(count.value(), db_->rows() / 5);
}

TEST_F(QueryExecutorTest, RunSingle) {
    auto& exec = executor();
    auto row = exec.runSingle(
        QueryRequest{"SELECT name, height FROM buildings WHERE id = ?",
                     std::vector<Value>{std::int64_t{10}}});
    ASSERT_TRUE(row);
    ASSERT_TRUE(row.value().has_value());
    EXPECT_EQ(std::get<std::string>((*row.value())[0]), "Building 10");
    EXPECT_DOUBLE_EQ(std::get<double>((*row.value())[1]), 15.0);

    auto none = exec.runSingle(
        QueryRequest{"SELECT name FROM buildings WHERE id = ?", std::vector<Value>{std::int64_t{-1}}});
    ASSERT_TRUE(none);
    EXPECT_FALSE(none.value().has_value());

    auto notCount = exec.runCount(QueryRequest{"SELECT name FROM buildings WHERE id = 1"});
    ASSERT_FALSE(notCount);
    EXPECT_EQ(notCount.error().code, ErrorCode::InvalidData);
}

TEST_F(QueryExecutorTest, FailedQueryIsReportedAndNotCached) {
    auto& exec = executor();
    const QueryRequest bad{"SELECT nope FROM buildings"};

    auto first = exec.run(bad);
    ASSERT_FALSE(first);
    EXPECT_EQ(first.error().code, ErrorCode::QueryExecutionFailed);
    ASSERT_TRUE(first.error().retry.has_value());
    EXPECT_EQ(first.error().retry->tier, Tier::QueryExecution);

    auto second = exec.run(bad);
    ASSERT_FALSE(second);
    EXPECT_EQ(exec.stats().executions, 2u);
    EXPECT_EQ(exec.stats().failures, 2u);
    EXPECT_EQ(exec.cacheStats().currentSize, 0u);
}

TEST_F(QueryExecutorTest, InvalidRequestNeverReachesTheEngine) {
    auto& exec = executor();
    auto r = exec.run(QueryRequest{"SELECT * FROM buildings WHERE id = :id",
                                   std::map<std::string, Value>{}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(exec.stats().executions, 0u);
}

TEST_F(QueryExecutorTest, MultiStatementTextIsRejectedAndNotCached) {
    auto& exec = executor();
    const QueryRequest request{"SELECT count(*) FROM buildings; SELECT 2"};

    auto r = exec.run(request);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(exec.cacheStats().currentSize, 0u);
    EXPECT_EQ(exec.stats().failures, 1u);

    auto again = exec.run(request);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::InvalidArgument);
}

TEST_F(QueryExecutorTest, SlowQueriesAreCounted) {
    QueryExecutorConfig config;
    config.slowQueryThreshold = std::chrono::milliseconds(-1);
    auto& exec = executor(config);

    ASSERT_TRUE(exec.run(QueryRequest{"SELECT count(*) FROM buildings"}));
    EXPECT_EQ(exec.stats().slowQueries, 1u);
}

TEST_F(QueryExecutorTest, FastQueriesAreNotSlow) {
    QueryExecutorConfig config;
    config.slowQueryThreshold = std::chrono::milliseconds(60000);
    auto& exec = executor(config);

    ASSERT_TRUE(exec.run(QueryRequest{"SELECT 1"}));
    EXPECT_EQ(exec.stats().slowQueries, 0u);
}

TEST_F(QueryExecutorTest, SubmittedQueriesAllComplete) {
    auto& exec = executor();
    std::vector<std::future<Result<QueryResult>>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(exec.submit(QueryRequest{"SELECT name FROM buildings WHERE id = ?",
                                                   std::vector<Value>{std::int64_t{i}}}));
    }
    for (int i = 0; i < 8; ++i) {
        auto r = futures[i].get();
        ASSERT_TRUE(r) << r.error().describe();
        ASSERT_EQ(r.value().size(), 1u);
        EXPECT_EQ(std::get<std::string>(r.value().rows[0][0]), "Building " + std::to_string(i));
    }
    EXPECT_EQ(exec.stats().executions, 8u);
}

namespace {

// Enough engine work per statement that overlapping executions would show.
const std::string kBusySql = "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c "
                             "WHERE x < 20000) SELECT count(*), ? FROM c";

} // namespace

TEST_F(QueryExecutorTest, ConcurrentRunsExecuteOneAtATime) {
    std::mutex recordsMutex;
    std::vector<ExecutionRecord> records;
    QueryExecutorConfig config;
    config.onExecution = [&](const ExecutionRecord& record) {
        std::lock_guard<std::mutex> lock(recordsMutex);
        records.push_back(record);
    };
    auto& exec = executor(config);
    ASSERT_TRUE(manager_->acquire());

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&exec, t] {
            for (int i = 0; i < 5; ++i) {
                const std::int64_t tag = t * 100 + i;
                auto r = exec.run(QueryRequest{kBusySql, std::vector<Value>{tag}});
                EXPECT_TRUE(r) << r.error().describe();
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::lock_guard<std::mutex> lock(recordsMutex);
    ASSERT_EQ(records.size(), 20u);
    for (std::size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].sequence, i + 1);
        EXPECT_FALSE(records[i].failed);
        EXPECT_LE(records[i].started, records[i].finished);
        if (i > 0) {
            EXPECT_GE(records[i].started, records[i - 1].finished) << "execution " << i;
        }
    }
}

TEST_F(QueryExecutorTest, SubmittedQueriesExecuteInSubmissionOrder) {
    std::mutex recordsMutex;
    std::vector<ExecutionRecord> records;
    QueryExecutorConfig config;
    config.onExecution = [&](const ExecutionRecord& record) {
        std::lock_guard<std::mutex> lock(recordsMutex);
        records.push_back(record);
    };
    auto& exec = executor(config);
    ASSERT_TRUE(manager_->acquire());

    std::mutex submitMutex;
    std::vector<std::int64_t> submitted;
    std::vector<std::future<Result<QueryResult>>> futures;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 6; ++i) {
                const std::int64_t tag = t * 100 + i;
                std::lock_guard<std::mutex> lock(submitMutex);
                submitted.push_back(tag);
                futures.push_back(exec.submit(QueryRequest{kBusySql, std::vector<Value>{tag}}));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    for (std::size_t i = 0; i < futures.size(); ++i) {
        auto r = futures[i].get();
        ASSERT_TRUE(r) << r.error().describe();
        ASSERT_EQ(r.value().size(), 1u);
        EXPECT_EQ(std::get<std::int64_t>(r.value().rows[0][1]), submitted[i]);
    }

    std::lock_guard<std::mutex> lock(recordsMutex);
    ASSERT_EQ(records.size(), submitted.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        ASSERT_EQ(records[i].params.size(), 1u);
        EXPECT_EQ(std::get<std::int64_t>(records[i].params[0]), submitted[i]);
        if (i > 0) {
            EXPECT_GE(records[i].started, records[i - 1].finished);
        }
    }
}

TEST_F(QueryExecutorTest, InvalidateForcesReexecution) {
    auto& exec = executor();
    const QueryRequest request{"SELECT count(*) FROM buildings"};
    ASSERT_TRUE(exec.run(request));
    ASSERT_TRUE(exec.invalidate(request));
    ASSERT_TRUE(exec.run(request));
    EXPECT_EQ(exec.stats().executions, 2u);

    exec.clearCache();
    EXPECT_EQ(exec.cacheStats().currentSize, 0u);
}

TEST_F(QueryExecutorTest, CloseDropsCachedResults) {
    auto& exec = executor();
    ASSERT_TRUE(exec.run(QueryRequest{"SELECT count(*) FROM buildings"}));
    EXPECT_EQ(exec.cacheStats().currentSize, 1u);

    manager_->close();
    EXPECT_EQ(exec.cacheStats().currentSize, 0u);

    auto after = exec.run(QueryRequest{"SELECT count(*) FROM buildings"});
    ASSERT_FALSE(after);
    EXPECT_EQ(after.error().code, ErrorCode::InvalidState);
}
