#include <string>
#include <gtest/gtest.h>
#include <rangedb/core/types.h>
#include <rangedb/core/value.h>

using namespace rangedb;

TEST(ValueTest, DescribeIsTypeTagged) {
    EXPECT_EQ(describeValue(nullptr), "n");
    EXPECT_EQ(describeValue(std::int64_t{42}), "i:42");
    EXPECT_EQ(describeValue(1.5), "r:1.5");
    EXPECT_EQ(describeValue(true), "b:1");
    EXPECT_EQ(describeValue(std::string("hello")), "s:5:hello");
    EXPECT_EQ(describeValue(ByteVector{std::byte{0x0a}, std::byte{0xff}}), "x:0aff");
}

TEST(ValueTest, ParseLiteral) {
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(parseLiteral("null")));
    EXPECT_EQ(std::get<bool>(parseLiteral("true")), true);
    EXPECT_EQ(std::get<std::int64_t>(parseLiteral("-17")), -17);
    EXPECT_DOUBLE_EQ(std::get<double>(parseLiteral("2.25")), 2.25);
    EXPECT_EQ(std::get<std::string>(parseLiteral("Berlin")), "Berlin");
    EXPECT_EQ(std::get<std::string>(parseLiteral("")), "");
    EXPECT_EQ(std::get<std::string>(parseLiteral("12 apples")), "12 apples");
}

TEST(ValueTest, ResultToJson) {
    QueryResult result;
    result.columns = {"id", "name", "photo", "missing"};
    result.rows.push_back(Row{std::int64_t{1}, std::string("Tower"),
                              ByteVector{std::byte{0x01}}, nullptr});

    const auto j = result.toJson();
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["id"], 1);
    EXPECT_EQ(j[0]["name"], "Tower");
    EXPECT_EQ(j[0]["photo"], "01");
    EXPECT_TRUE(j[0]["missing"].is_null());
}

TEST(ValueTest, MemorySizeGrowsWithPayload) {
    QueryResult small;
    small.columns = {"v"};
    small.rows.push_back(Row{std::string("a")});
    QueryResult large = small;
    large.rows[0][0] = std::string(4096, 'a');
    EXPECT_GT(large.memorySize(), small.memorySize() + 4000);
}

TEST(ErrorTest, DescribeIncludesRetryContext) {
    Error plain{ErrorCode::NotFound, "HTTP error 404"};
    EXPECT_EQ(plain.describe(), "Not found: HTTP error 404");

    RetryInfo info;
    info.tier = Tier::BulkFetch;
    info.attempts = 4;
    info.lastMessage = "connection reset";
    Error retried{ErrorCode::ChunkFetchFailed, "chunk 3", info};
    EXPECT_EQ(retried.describe(),
              "Chunk fetch failed: chunk 3 [tier=bulk-fetch, attempts=4, last=connection reset]");
    EXPECT_TRUE(retried == ErrorCode::ChunkFetchFailed);
}

TEST(ResultTest, ValueAndError) {
    Result<int> ok = 5;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 5);
    EXPECT_THROW((void)ok.error(), std::runtime_error);

    Result<int> failed = Error{ErrorCode::Timeout, "slow"};
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::Timeout);
    EXPECT_THROW((void)failed.value(), std::runtime_error);

    Result<void> done;
    EXPECT_TRUE(done);
    Result<void> notDone = ErrorCode::InvalidState;
    EXPECT_FALSE(notDone);
    EXPECT_EQ(notDone.error().message, "Invalid state");
}
