#include <map>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <rangedb/query/cache_key.h>
#include <rangedb/query/query_types.h>

using namespace rangedb;
using namespace rangedb::query;

TEST(NormalizeTextTest, CollapsesWhitespaceOutsideLiterals) {
    EXPECT_EQ(normalizeText("  SELECT   *\n\tFROM  t  WHERE name = 'a   b' ;  "),
              "SELECT * FROM t WHERE name = 'a   b'");
    EXPECT_EQ(normalizeText("SELECT \"odd  column\" FROM t"), "SELECT \"odd  column\" FROM t");
}

TEST(NormalizeTextTest, StripsComments) {
    EXPECT_EQ(normalizeText("SELECT 1 -- trailing\nFROM t"), "SELECT 1 FROM t");
    EXPECT_EQ(normalizeText("SELECT /* hint */ 1"), "SELECT 1");
    EXPECT_EQ(normalizeText("SELECT '--not a comment'"), "SELECT '--not a comment'");
}

TEST(NormalizeTextTest, EquivalentSpellingsMatch) {
    EXPECT_EQ(normalizeText("SELECT * FROM t"), normalizeText("SELECT *\n   FROM t;"));
}

TEST(NamedParameterOrderTest, FirstAppearanceOrder) {
    int positional = -1;
    auto order = namedParameterOrder(
        "SELECT * FROM t WHERE a = :b AND c = @a AND d = :b AND e = $c AND f = ':x'", &positional);
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], ":b");
    EXPECT_EQ(order[1], "@a");
    EXPECT_EQ(order[2], "$c");
    EXPECT_EQ(positional, 0);

    namedParameterOrder("SELECT ?, ?2, ?", &positional);
    EXPECT_EQ(positional, 3);
}

TEST(NormalizeTest, PositionalParametersKeepOrder) {
    auto r = normalize(QueryRequest{"SELECT ?, ?", std::vector<Value>{std::int64_t{1},
                                                                         std::string("x")}});
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().params.size(), 2u);
    EXPECT_EQ(std::get<std::int64_t>(r.value().params[0]), 1);
    EXPECT_EQ(std::get<std::string>(r.value().params[1]), "x");
}

TEST(NormalizeTest, NamedParametersBecomePositional) {
    std::map<std::string, Value> named{{"city", std::string("Rome")}, {":min", std::int64_t{3}}};
    auto r = normalize(QueryRequest{"SELECT * FROM b WHERE levels > :min AND city = :city", named});
    ASSERT_TRUE(r) << r.error().describe();
    ASSERT_EQ(r.value().params.size(), 2u);
    EXPECT_EQ(std::get<std::int64_t>(r.value().params[0]), 3);
    EXPECT_EQ(std::get<std::string>(r.value().params[1]), "Rome");
}

TEST(NormalizeTest, MissingNamedParameterIsRejected) {
    std::map<std::string, Value> named{{"city", std::string("Rome")}};
    auto r = normalize(QueryRequest{"SELECT * FROM b WHERE city = :city AND id = :id", named});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(NormalizeTest, MixingStylesIsRejected) {
    std::map<std::string, Value> named{{"a", std::int64_t{1}}};
    auto r = normalize(QueryRequest{"SELECT ? , :a", named});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(NormalizeTest, EmptyQueryIsRejected) {
    auto r = normalize(QueryRequest{std::string(" ;  -- nothing")});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(ClassifyStatementTest, ReadsAndOthers) {
    EXPECT_EQ(classifyStatement("SELECT 1"), StatementKind::Read);
    EXPECT_EQ(classifyStatement("with x as (select 1) select * from x"), StatementKind::Read);
    EXPECT_EQ(classifyStatement("(SELECT 1)"), StatementKind::Read);
    EXPECT_EQ(classifyStatement("VALUES (1)"), StatementKind::Read);
    EXPECT_EQ(classifyStatement("PRAGMA page_size"), StatementKind::Other);
}

TEST(CacheKeyTest, ParameterOrderMatters) {
    NormalizedQuery a{"SELECT ?, ?", {std::int64_t{1}, std::int64_t{2}}};
    NormalizedQuery b{"SELECT ?, ?", {std::int64_t{2}, std::int64_t{1}}};
    EXPECT_NE(CacheKey::fromQuery(1, a), CacheKey::fromQuery(1, b));
    EXPECT_EQ(CacheKey::fromQuery(1, a), CacheKey::fromQuery(1, a));
}

TEST(CacheKeyTest, ValueTypesAreDistinguished) {
    NormalizedQuery asInt{"SELECT ?", {std::int64_t{1}}};
    NormalizedQuery asReal{"SELECT ?", {1.0}};
    NormalizedQuery asText{"SELECT ?", {std::string("1")}};
    NormalizedQuery asBool{"SELECT ?", {true}};
    const auto k1 = CacheKey::fromQuery(1, asInt);
    EXPECT_NE(k1, CacheKey::fromQuery(1, asReal));
    EXPECT_NE(k1, CacheKey::fromQuery(1, asText));
    EXPECT_NE(k1, CacheKey::fromQuery(1, asBool));
}

TEST(CacheKeyTest, ScopeSeparatesConnections) {
    NormalizedQuery q{"SELECT 1", {}};
    auto k1 = CacheKey::fromQuery(1, q);
    auto k2 = CacheKey::fromQuery(2, q);
    EXPECT_NE(k1, k2);
    EXPECT_EQ(k1.scope(), 1u);
    EXPECT_EQ(k2.scope(), 2u);
}

TEST(CacheKeyTest, NamedAndPositionalFormsShareAKey) {
    auto named = normalize(QueryRequest{"SELECT * FROM b WHERE id = :id",
                                        std::map<std::string, Value>{{"id", std::int64_t{7}}}});
    auto positional =
        normalize(QueryRequest{"SELECT * FROM b WHERE id = :id", std::vector<Value>{std::int64_t{7}}});
    ASSERT_TRUE(named);
    ASSERT_TRUE(positional);
    EXPECT_EQ(CacheKey::fromQuery(3, named.value()), CacheKey::fromQuery(3, positional.value()));
}
