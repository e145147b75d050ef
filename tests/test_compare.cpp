#include <gtest/gtest.h>
#include "CacheKey.hpp"
#include "Compare.hpp"

using namespace sqlcursor;

class CompareTest : public ::testing::Test {
protected:
    void SetUp() override {
        users_ = Table::create("users", {{"id", integerType()}, {"name", stringType()}});
        id_ = users_->c("id");
        name_ = users_->c("name");
    }

    std::shared_ptr<Table> users_;
    std::shared_ptr<const Column> id_;
    std::shared_ptr<const Column> name_;
};

TEST_F(CompareTest, SeparatelyBuiltTreesAreEqual) {
    auto a = select({id_, name_});
    a->where(eq(id_, literal(int64_t{1}))).orderBy(desc(name_));
    auto b = select({id_, name_});
    b->where(eq(id_, literal(int64_t{1}))).orderBy(desc(name_));

    EXPECT_TRUE(compare(*a, *b));
    EXPECT_TRUE(compare(*a, *a));
}

TEST_F(CompareTest, DifferentColumnsDiffer) {
    EXPECT_FALSE(compare(*select({id_}), *select({name_})));
    EXPECT_FALSE(compare(*select({id_}), *select({id_, name_})));
}

TEST_F(CompareTest, CommutativeOperatorIgnoresOrder) {
    auto left = eq(id_, literal(int64_t{5}));
    auto right = eq(literal(int64_t{5}), id_);
    EXPECT_TRUE(compare(*left, *right));

    auto sumA = binary(id_, Operator::Add, literal(int64_t{1}));
    auto sumB = binary(literal(int64_t{1}), Operator::Add, id_);
    EXPECT_TRUE(compare(*sumA, *sumB));
}

TEST_F(CompareTest, NonCommutativeOperatorKeepsOrder) {
    auto left = binary(id_, Operator::Gt, literal(int64_t{5}));
    auto right = binary(literal(int64_t{5}), Operator::Gt, id_);
    EXPECT_FALSE(compare(*left, *right));

    auto diffA = binary(id_, Operator::Sub, literal(int64_t{1}));
    auto diffB = binary(literal(int64_t{1}), Operator::Sub, id_);
    EXPECT_FALSE(compare(*diffA, *diffB));
}

TEST_F(CompareTest, DifferentOperatorsDiffer) {
    EXPECT_FALSE(compare(*eq(id_, literal(int64_t{1})),
                         *binary(id_, Operator::Ne, literal(int64_t{1}))));
    EXPECT_FALSE(compare(*and_({eq(id_, literal(int64_t{1}))}),
                         *or_({eq(id_, literal(int64_t{1}))})));
}

TEST_F(CompareTest, AssociativeListIgnoresOrder) {
    auto a = and_({eq(id_, literal(int64_t{1})), eq(name_, literal(std::string("x")))});
    auto b = and_({eq(name_, literal(std::string("x"))), eq(id_, literal(int64_t{1}))});
    EXPECT_TRUE(compare(*a, *b));

    auto shorter = and_({eq(id_, literal(int64_t{1}))});
    EXPECT_FALSE(compare(*a, *shorter));
}

TEST_F(CompareTest, NonAssociativeListKeepsOrder) {
    auto a = std::make_shared<ClauseList>(Operator::Comma, std::vector<ElementPtr>{id_, name_});
    auto b = std::make_shared<ClauseList>(Operator::Comma, std::vector<ElementPtr>{name_, id_});
    auto c = std::make_shared<ClauseList>(Operator::Comma, std::vector<ElementPtr>{id_, name_});
    EXPECT_FALSE(compare(*a, *b));
    EXPECT_TRUE(compare(*a, *c));
}

TEST_F(CompareTest, LiteralValuesCompareByDefault) {
    auto one = eq(id_, literal(int64_t{1}));
    auto two = eq(id_, literal(int64_t{2}));
    EXPECT_FALSE(compare(*one, *two));

    CompareOptions options;
    options.compareValues = false;
    EXPECT_TRUE(compare(*one, *two, options));
}

TEST_F(CompareTest, TypesCompareByAffinity) {
    auto shortName = Table::create("users", {{"id", integerType()},
                                             {"name", std::make_shared<String>(16)}});
    auto longName = Table::create("users", {{"id", integerType()},
                                            {"name", std::make_shared<String>(64)}});

    auto a = select({shortName->c("name")});
    auto b = select({longName->c("name")});
    EXPECT_TRUE(compare(*a, *b));
    // Cache keys still tell them apart
    EXPECT_NE(*CacheKeyGenerator::generate(*a), *CacheKeyGenerator::generate(*b));

    auto asFloat = Table::create("users", {{"id", integerType()}, {"name", floatType()}});
    EXPECT_FALSE(compare(*a, *select({asFloat->c("name")})));
}

TEST_F(CompareTest, AnonymousNamesCompareByPosition) {
    auto a = select({anonLabel(id_), anonLabel(name_)});
    auto b = select({anonLabel(id_), anonLabel(name_)});
    EXPECT_TRUE(compare(*a, *b));

    auto named = select({label("x", id_), anonLabel(name_)});
    EXPECT_FALSE(compare(*a, *named));
}

TEST_F(CompareTest, OpaqueElementsNeverEqual) {
    auto a = opaque("custom");
    auto b = opaque("custom");
    EXPECT_FALSE(compare(*a, *b));
    EXPECT_TRUE(compare(*a, *a));
}

TEST_F(CompareTest, CaseExpressions) {
    auto makeCase = [this](const std::string& result) {
        return std::make_shared<Case>(
            std::vector<Case::When>{{eq(id_, literal(int64_t{1})), literal(result)}},
            null());
    };
    EXPECT_TRUE(compare(*makeCase("one"), *makeCase("one")));
    EXPECT_FALSE(compare(*makeCase("one"), *makeCase("two")));
}

// ============================================================================
// Lineage-aware comparison
// ============================================================================

TEST_F(CompareTest, ProxiesMatchAliasColumns) {
    auto alias = users_->alias("u");
    auto direct = select({id_});
    auto aliased = select({alias->c("id")});

    EXPECT_FALSE(compare(*direct, *aliased));

    CompareOptions options;
    options.useProxies = true;
    EXPECT_TRUE(compare(*direct, *aliased, options));
}

TEST_F(CompareTest, ProxiesRequireSharedIdentity) {
    auto twin = Table::create("users", {{"id", integerType()}, {"name", stringType()}});
    auto a = select({id_});
    auto b = select({twin->c("id")});

    // Structurally equal, but built from unrelated tables
    EXPECT_TRUE(compare(*a, *b));

    CompareOptions options;
    options.useProxies = true;
    EXPECT_FALSE(compare(*a, *b, options));
}

TEST_F(CompareTest, ProxiesCompareTablesByIdentity) {
    auto twin = Table::create("users", {{"id", integerType()}, {"name", stringType()}});
    CompareOptions options;
    options.useProxies = true;

    auto a = select({id_});
    a->from(users_);
    auto b = select({id_});
    b->from(twin);
    EXPECT_FALSE(compare(*a, *b, options));

    auto c = select({id_});
    c->from(users_);
    EXPECT_TRUE(compare(*a, *c, options));
}

TEST_F(CompareTest, ProxiesStillCompareExpressions) {
    CompareOptions options;
    options.useProxies = true;

    auto a = and_({eq(id_, literal(int64_t{1})), eq(name_, literal(std::string("x")))});
    auto b = and_({eq(name_, literal(std::string("x"))), eq(literal(int64_t{1}), id_)});
    EXPECT_TRUE(compare(*a, *b, options));

    auto c = and_({eq(name_, literal(std::string("y"))), eq(id_, literal(int64_t{1}))});
    EXPECT_FALSE(compare(*a, *c, options));
}

TEST_F(CompareTest, ComparatorIsReusable) {
    TraversalComparator comparator;
    auto a = eq(id_, literal(int64_t{1}));
    auto b = eq(id_, literal(int64_t{1}));
    auto c = eq(id_, literal(int64_t{2}));

    EXPECT_TRUE(comparator.compare(*a, *b));
    EXPECT_FALSE(comparator.compare(*a, *c));
    EXPECT_TRUE(comparator.compare(*b, *a));
}
