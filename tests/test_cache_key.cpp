#include <gtest/gtest.h>
#include "CacheKey.hpp"

using namespace sqlcursor;

class CacheKeyTest : public ::testing::Test {
protected:
    void SetUp() override {
        users_ = Table::create("users", {{"id", integerType()}, {"name", varchar(16)}});
    }

    static TypePtr varchar(size_t length) { return std::make_shared<String>(length); }

    std::shared_ptr<Select> byId(int64_t id) const {
        auto stmt = select({users_->c("id"), users_->c("name")});
        stmt->where(eq(users_->c("id"), literal(id)));
        return stmt;
    }

    static CacheKey keyOf(const ClauseElement& element) {
        auto key = CacheKeyGenerator::generate(element);
        EXPECT_TRUE(key.has_value());
        return key ? *key : CacheKey(json(), {});
    }

    std::shared_ptr<Table> users_;
};

TEST_F(CacheKeyTest, EqualTreesGiveEqualKeys) {
    auto a = keyOf(*byId(1));
    auto b = keyOf(*byId(1));

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_EQ(CacheKeyHash{}(a), a.hash());
}

TEST_F(CacheKeyTest, LiteralValuesAreExtracted) {
    auto a = keyOf(*byId(1));
    auto b = keyOf(*byId(2));

    EXPECT_EQ(a, b);
    ASSERT_EQ(a.parameters().size(), 1u);
    ASSERT_EQ(b.parameters().size(), 1u);
    EXPECT_EQ(a.parameters()[0].value, Value(int64_t{1}));
    EXPECT_EQ(b.parameters()[0].value, Value(int64_t{2}));
    EXPECT_EQ(a.parameters()[0].key, b.parameters()[0].key);
    EXPECT_EQ(a.parameters()[0].type->affinity(), "integer");
}

TEST_F(CacheKeyTest, NamedBindKeepsItsName) {
    auto stmt = select({users_->c("name")});
    stmt->where(eq(users_->c("id"), bindparam("user_id", int64_t{5})));

    auto key = keyOf(*stmt);
    ASSERT_EQ(key.parameters().size(), 1u);
    EXPECT_EQ(key.parameters()[0].key, "user_id");
}

TEST_F(CacheKeyTest, StructureChangesKey) {
    auto base = keyOf(*byId(1));

    auto otherColumn = select({users_->c("id")});
    otherColumn->where(eq(users_->c("id"), literal(int64_t{1})));
    EXPECT_NE(base, keyOf(*otherColumn));

    auto otherOperator = select({users_->c("id"), users_->c("name")});
    otherOperator->where(binary(users_->c("id"), Operator::Gt, literal(int64_t{1})));
    EXPECT_NE(base, keyOf(*otherOperator));

    auto limited = byId(1);
    limited->limit(10);
    EXPECT_NE(base, keyOf(*limited));

    auto distinct = byId(1);
    distinct->distinct();
    EXPECT_NE(base, keyOf(*distinct));
}

TEST_F(CacheKeyTest, LimitValueIsAParameter) {
    auto a = byId(1);
    a->limit(10);
    auto b = byId(1);
    b->limit(20);

    auto ka = keyOf(*a);
    auto kb = keyOf(*b);
    EXPECT_EQ(ka, kb);
    EXPECT_EQ(ka.parameters().size(), 2u);
}

TEST_F(CacheKeyTest, TypeParametersAreStructural) {
    auto shortName = Table::create("users", {{"id", integerType()}, {"name", varchar(16)}});
    auto longName = Table::create("users", {{"id", integerType()}, {"name", varchar(64)}});

    EXPECT_EQ(keyOf(*select({users_->c("name")})), keyOf(*select({shortName->c("name")})));
    EXPECT_NE(keyOf(*select({users_->c("name")})), keyOf(*select({longName->c("name")})));
}

TEST_F(CacheKeyTest, OpaqueElementMakesStatementUncacheable) {
    auto stmt = select({users_->c("id"), opaque("window function")});
    EXPECT_FALSE(CacheKeyGenerator::generate(*stmt).has_value());

    auto nested = select({users_->c("id")});
    nested->where(and_({eq(users_->c("id"), literal(int64_t{1})), opaque("custom")}));
    EXPECT_FALSE(CacheKeyGenerator::generate(*nested).has_value());
}

TEST_F(CacheKeyTest, AnonymousNamesNumberedByPosition) {
    // Two anonymous labels in separately built statements get the same
    // numbering, so the keys match
    auto a = select({anonLabel(users_->c("id")), anonLabel(users_->c("name"))});
    auto b = select({anonLabel(users_->c("id")), anonLabel(users_->c("name"))});
    EXPECT_EQ(keyOf(*a), keyOf(*b));

    auto named = select({label("x", users_->c("id")), anonLabel(users_->c("name"))});
    EXPECT_NE(keyOf(*a), keyOf(*named));
}

TEST_F(CacheKeyTest, AnonymousAliasesMatch) {
    auto a1 = users_->alias();
    auto a2 = users_->alias();
    auto fixed = users_->alias("u");

    EXPECT_EQ(keyOf(*select({a1->c("id")})), keyOf(*select({a2->c("id")})));
    EXPECT_NE(keyOf(*select({a1->c("id")})), keyOf(*select({fixed->c("id")})));
}

TEST_F(CacheKeyTest, RepeatedElementIsBackReference) {
    auto id = users_->c("id");
    auto twice = select({id, id});
    auto key = keyOf(*twice).key();

    // [id, "select", "raw_columns", [first, second], ...]
    ASSERT_TRUE(key.is_array());
    ASSERT_GE(key.size(), 4u);
    EXPECT_EQ(key[1], "select");
    EXPECT_EQ(key[2], "raw_columns");
    const auto& columns = key[3];
    ASSERT_EQ(columns.size(), 2u);
    EXPECT_GT(columns[0].size(), 2u);
    EXPECT_EQ(columns[1].size(), 2u);
    EXPECT_EQ(columns[0][0], columns[1][0]);
}

TEST_F(CacheKeyTest, CorrelateOrderDoesNotMatter) {
    auto orders = Table::create("orders", {{"id", integerType()}});
    auto items = Table::create("items", {{"id", integerType()}});

    auto a = select({users_->c("id")});
    a->correlate(orders).correlate(items);
    auto b = select({users_->c("id")});
    b->correlate(items).correlate(orders);

    EXPECT_EQ(keyOf(*a), keyOf(*b));
}

TEST_F(CacheKeyTest, FalsyValuesLeftOut) {
    auto stmt = select({users_->c("id")});
    auto key = keyOf(*stmt).key();
    for (const auto& part : key) {
        EXPECT_NE(part, "distinct");
        EXPECT_NE(part, "where_criteria");
    }
}

TEST_F(CacheKeyTest, CaseAndFunctionKeys) {
    auto makeCase = [this](int64_t threshold) {
        auto big = binary(users_->c("id"), Operator::Gt, literal(threshold));
        auto expr = std::make_shared<Case>(
            std::vector<Case::When>{{big, literal(std::string("big"))}},
            literal(std::string("small")));
        return select({label("size", expr), func("lower", {users_->c("name")}, varchar(16))});
    };

    auto a = keyOf(*makeCase(10));
    auto b = keyOf(*makeCase(99));
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.parameters().size(), 3u);
}

TEST_F(CacheKeyTest, AnonMapAssignsStableIds) {
    AnonMap map;
    int a = 0;
    int b = 0;

    EXPECT_EQ(map.get(&a), "0");
    EXPECT_EQ(map.get(&b), "1");
    EXPECT_EQ(map.get(&a), "0");
    EXPECT_TRUE(map.contains(&b));
    EXPECT_EQ(map.size(), 2u);
    EXPECT_FALSE(map.uncacheable());

    auto owner = null();
    AnonName fixed{nullptr, "fixed"};
    AnonName anon{owner.get(), "anon"};
    EXPECT_EQ(renderAnonName(fixed, map), "fixed");
    EXPECT_EQ(renderAnonName(anon, map), "anon_2");
    EXPECT_EQ(renderAnonName(anon, map), "anon_2");
}
