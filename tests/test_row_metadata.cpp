#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"
#include "FakeCursor.hpp"
#include "RowMetadata.hpp"
#include "SQLiteDialect.hpp"

using namespace sqlcursor;
using namespace sqlcursor::testing;
using ::testing::ElementsAre;

namespace {

LookupKey key(const ElementPtr& element) {
    return LookupKey(element.get());
}

// Dialect whose driver already delivers integers for type code 1
class IntegerAwareDialect : public Dialect {
public:
    std::string rawAffinity(int rawType) const override {
        return rawType == 1 ? "integer" : "";
    }
};

}  // namespace

class RowMetadataTest : public ::testing::Test {
protected:
    void SetUp() override {
        users_ = Table::create("users", {{"id", integerType()}, {"name", stringType()}});
        orders_ = Table::create("orders", {{"id", integerType()}, {"total", floatType()}});
    }

    Dialect dialect_;
    std::shared_ptr<Table> users_;
    std::shared_ptr<Table> orders_;
};

// ============================================================================
// Matching strategies
// ============================================================================

TEST_F(RowMetadataTest, NoDeclaredColumns) {
    auto md = RowMetadata::resolve(dialect_, describe({"id", "name"}), nullptr);

    EXPECT_EQ(md->strategy(), MatchStrategy::None);
    EXPECT_THAT(md->keys(), ElementsAre("id", "name"));
    EXPECT_EQ(md->indexFor(std::string("name")), 1u);
    EXPECT_EQ(md->indexFor(int64_t{0}), 0u);
    EXPECT_EQ(md->indexFor(int64_t{-1}), 1u);
    EXPECT_THROW(md->indexFor(std::string("missing")), NoSuchColumnError);
    EXPECT_THROW(md->indexFor(int64_t{2}), NoSuchColumnError);
    EXPECT_FALSE(md->findIndex(std::string("missing")).has_value());
}

TEST_F(RowMetadataTest, PositionalMatchUsesDeclaredNames) {
    auto stmt = select({users_->c("id"), users_->c("name")});
    const auto declared = stmt->resultColumns();

    // Driver reports names in a different case; positions decide
    auto md = RowMetadata::resolve(dialect_, describe({"ID", "NAME"}), &declared);

    EXPECT_EQ(md->strategy(), MatchStrategy::Positional);
    EXPECT_THAT(md->keys(), ElementsAre("id", "name"));
    EXPECT_EQ(md->indexFor(key(users_->c("name"))), 1u);
    EXPECT_EQ(md->indexFor(std::string("id")), 0u);
    EXPECT_FALSE(md->contains(std::string("ID")));
}

TEST_F(RowMetadataTest, CountMismatchFallsBackToNames) {
    auto stmt = select({users_->c("id"), users_->c("name")});
    const auto declared = stmt->resultColumns();

    auto md = RowMetadata::resolve(dialect_, describe({"name", "extra", "id"}), &declared);

    EXPECT_EQ(md->strategy(), MatchStrategy::ByName);
    EXPECT_THAT(md->keys(), ElementsAre("name", "extra", "id"));
    EXPECT_EQ(md->indexFor(key(users_->c("id"))), 2u);
    EXPECT_EQ(md->indexFor(key(users_->c("name"))), 0u);
    EXPECT_EQ(md->indexFor(std::string("extra")), 1u);
}

TEST_F(RowMetadataTest, ByNameAttachesDecoders) {
    ResultColumnStruct declared;
    declared.colsAreOrdered = false;
    declared.columns.push_back({"flag", "flag", {std::string("flag")}, booleanType()});

    auto md = RowMetadata::resolve(dialect_, describe({"other", "flag"}), &declared);

    ASSERT_EQ(md->processors().size(), 2u);
    EXPECT_FALSE(md->processors()[0]);
    ASSERT_TRUE(md->processors()[1]);
    EXPECT_EQ(md->processors()[1](Value(int64_t{1})), Value(true));
}

TEST_F(RowMetadataTest, TextualPositional) {
    auto stmt = textualSelect(text("SELECT a, b FROM users"),
                              {users_->c("name"), users_->c("id")}, true);
    const auto declared = stmt->resultColumns();

    auto md = RowMetadata::resolve(dialect_, describe({"a", "b"}), &declared);

    EXPECT_EQ(md->strategy(), MatchStrategy::TextualPositional);
    // Keys come from the driver, objects from the declared columns
    EXPECT_THAT(md->keys(), ElementsAre("a", "b"));
    EXPECT_EQ(md->indexFor(key(users_->c("name"))), 0u);
    EXPECT_EQ(md->indexFor(key(users_->c("id"))), 1u);
    EXPECT_EQ(md->indexFor(std::string("b")), 1u);
}

TEST_F(RowMetadataTest, TextualPositionalWithFewerRawColumns) {
    auto stmt = textualSelect(text("SELECT a FROM users"),
                              {users_->c("name"), users_->c("id")}, true);
    const auto declared = stmt->resultColumns();

    auto md = RowMetadata::resolve(dialect_, describe({"a"}), &declared);

    EXPECT_EQ(md->size(), 1u);
    EXPECT_EQ(md->indexFor(key(users_->c("name"))), 0u);
    EXPECT_FALSE(md->contains(key(users_->c("id"))));
}

TEST_F(RowMetadataTest, TextualPositionalWithMoreRawColumns) {
    auto stmt = textualSelect(text("SELECT a, b FROM users"), {users_->c("id")}, true);
    const auto declared = stmt->resultColumns();

    auto md = RowMetadata::resolve(dialect_, describe({"a", "b"}), &declared);

    EXPECT_EQ(md->strategy(), MatchStrategy::TextualPositional);
    EXPECT_THAT(md->keys(), ElementsAre("a", "b"));
    EXPECT_EQ(md->indexFor(key(users_->c("id"))), 0u);
    EXPECT_EQ(md->indexFor(std::string("b")), 1u);

    // Columns past the declared ones pass values through and carry no objects
    ASSERT_EQ(md->processors().size(), 2u);
    EXPECT_FALSE(md->processors()[1]);
    EXPECT_TRUE(md->records()[1]->objects.empty());
    EXPECT_FALSE(md->records()[1]->resultIndex.has_value());
    EXPECT_EQ(md->records()[0]->resultIndex, std::optional<size_t>(0));
}

TEST_F(RowMetadataTest, TextualPositionalRejectsDuplicateColumn) {
    auto name = users_->c("name");
    auto stmt = textualSelect(text("SELECT a, b FROM users"), {name, name}, true);
    const auto declared = stmt->resultColumns();

    EXPECT_THROW(RowMetadata::resolve(dialect_, describe({"a", "b"}), &declared),
                 InvalidRequestError);
}

// ============================================================================
// Ambiguity
// ============================================================================

TEST_F(RowMetadataTest, DuplicateNamesAreAmbiguous) {
    auto md = RowMetadata::resolve(dialect_, describe({"id", "id", "name"}), nullptr);

    EXPECT_TRUE(md->contains(std::string("id")));
    EXPECT_THROW(md->indexFor(std::string("id")), AmbiguousColumnError);
    EXPECT_THROW(md->findIndex(std::string("id")), AmbiguousColumnError);
    EXPECT_EQ(md->indexFor(int64_t{1}), 1u);
    EXPECT_EQ(md->indexFor(std::string("name")), 2u);
}

TEST_F(RowMetadataTest, SameNameFromTwoTablesAmbiguousByNameOnly) {
    auto stmt = select({users_->c("id"), orders_->c("id")});
    const auto declared = stmt->resultColumns();

    auto md = RowMetadata::resolve(dialect_, describe({"id", "id"}), &declared);

    EXPECT_THROW(md->indexFor(std::string("id")), AmbiguousColumnError);
    EXPECT_EQ(md->indexFor(key(users_->c("id"))), 0u);
    EXPECT_EQ(md->indexFor(key(orders_->c("id"))), 1u);
}

TEST_F(RowMetadataTest, AmbiguousErrorNamesKey) {
    auto md = RowMetadata::resolve(dialect_, describe({"x", "x"}), nullptr);
    try {
        md->indexFor(std::string("x"));
        FAIL() << "Expected AmbiguousColumnError";
    } catch (const AmbiguousColumnError& e) {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("'x'"));
    }
}

// ============================================================================
// Name handling
// ============================================================================

TEST_F(RowMetadataTest, CaseInsensitiveLookup) {
    Dialect insensitive(DialectOptions{false, false});
    auto md = RowMetadata::resolve(insensitive, describe({"UserId", "Name"}), nullptr);

    EXPECT_FALSE(md->caseSensitive());
    EXPECT_THAT(md->keys(), ElementsAre("UserId", "Name"));
    EXPECT_EQ(md->indexFor(std::string("userid")), 0u);
    EXPECT_EQ(md->indexFor(std::string("NAME")), 1u);
}

TEST_F(RowMetadataTest, CaseSensitiveLookup) {
    auto md = RowMetadata::resolve(dialect_, describe({"Name"}), nullptr);
    EXPECT_THROW(md->indexFor(std::string("name")), NoSuchColumnError);
}

TEST_F(RowMetadataTest, CaseInsensitiveDuplicatesAreAmbiguous) {
    Dialect insensitive(DialectOptions{false, false});
    auto md = RowMetadata::resolve(insensitive, describe({"id", "ID"}), nullptr);
    EXPECT_THROW(md->indexFor(std::string("Id")), AmbiguousColumnError);
}

TEST_F(RowMetadataTest, NormalizesUpperCaseNames) {
    Dialect normalizing(DialectOptions{true, true});
    auto md = RowMetadata::resolve(normalizing, describe({"USER_ID", "MixedCase"}), nullptr);

    EXPECT_THAT(md->keys(), ElementsAre("user_id", "MixedCase"));
    EXPECT_EQ(md->indexFor(std::string("user_id")), 0u);
}

TEST_F(RowMetadataTest, TranslatedNamesKeepUntranslatedKey) {
    SQLiteDialect sqlite;
    auto md = RowMetadata::resolve(sqlite, describe({"users.id", "orders.total"}), nullptr);

    EXPECT_THAT(md->keys(), ElementsAre("id", "total"));
    EXPECT_EQ(md->indexFor(std::string("id")), 0u);
    EXPECT_EQ(md->indexFor(std::string("orders.total")), 1u);
    EXPECT_EQ(md->records()[0]->untranslated, std::optional<std::string>("users.id"));
}

TEST_F(RowMetadataTest, UntranslatedKeyOnlyWithoutDeclaredColumns) {
    SQLiteDialect sqlite;
    ResultColumnStruct declared;
    declared.colsAreOrdered = false;
    declared.columns.push_back({"id", "id", {std::string("id")}, integerType()});

    auto md = RowMetadata::resolve(sqlite, describe({"users.id"}), &declared);
    EXPECT_EQ(md->indexFor(std::string("id")), 0u);
    EXPECT_FALSE(md->contains(std::string("users.id")));
}

// ============================================================================
// Decoders
// ============================================================================

TEST_F(RowMetadataTest, DecoderSkippedWhenDriverMatchesAffinity) {
    IntegerAwareDialect aware;
    auto stmt = select({users_->c("id"), users_->c("name")});
    const auto declared = stmt->resultColumns();

    auto md = RowMetadata::resolve(aware, describe({"id", "name"}, 1), &declared);

    ASSERT_EQ(md->processors().size(), 2u);
    EXPECT_FALSE(md->processors()[0]);
    EXPECT_TRUE(md->processors()[1]);
}

TEST_F(RowMetadataTest, DecoratedTypeRunsAfterBase) {
    auto cents = std::make_shared<DecoratedType>(
        integerType(), "Cents",
        [](const Value& value) -> Value {
            if (const auto* amount = std::get_if<int64_t>(&value)) {
                return static_cast<double>(*amount) / 100.0;
            }
            return value;
        });
    auto price = std::make_shared<Column>("price", cents);
    auto stmt = select({price});
    const auto declared = stmt->resultColumns();

    auto md = RowMetadata::resolve(dialect_, describe({"price"}), &declared);
    ASSERT_TRUE(md->processors()[0]);
    EXPECT_EQ(md->processors()[0](Value(std::string("250"))), Value(2.5));
}

// ============================================================================
// Reduction, adaptation and serialization
// ============================================================================

TEST_F(RowMetadataTest, ReduceSelectsAndReorders) {
    auto md = RowMetadata::resolve(dialect_, describe({"a", "b", "c"}), nullptr);
    auto reduced = md->reduce({std::string("c"), int64_t{0}});

    EXPECT_THAT(reduced->keys(), ElementsAre("c", "a"));
    ASSERT_TRUE(reduced->tupleFilter().has_value());
    EXPECT_THAT(*reduced->tupleFilter(), ElementsAre(2u, 0u));
    EXPECT_EQ(reduced->indexFor(std::string("a")), 1u);
    EXPECT_EQ(reduced->indexFor(int64_t{-1}), 1u);
    EXPECT_FALSE(reduced->contains(std::string("b")));
}

TEST_F(RowMetadataTest, ReduceRejectsAmbiguousKey) {
    auto md = RowMetadata::resolve(dialect_, describe({"a", "a"}), nullptr);
    EXPECT_THROW(md->reduce({std::string("a")}), AmbiguousColumnError);
    EXPECT_THROW(md->reduce({std::string("zz")}), NoSuchColumnError);
}

TEST_F(RowMetadataTest, AdaptToSameColumnsReturnsSelf) {
    auto stmt = select({users_->c("id"), users_->c("name")});
    const auto declared = stmt->resultColumns();
    auto md = RowMetadata::resolve(dialect_, describe({"id", "name"}), &declared);

    auto adapted = md->adaptTo(declared.columns, stmt->exportedColumns());
    EXPECT_EQ(adapted, md);
}

TEST_F(RowMetadataTest, AdaptToAddsInvokedColumns) {
    auto stmt = select({users_->c("id"), users_->c("name")});
    const auto declared = stmt->resultColumns();
    auto md = RowMetadata::resolve(dialect_, describe({"id", "name"}), &declared);

    auto alias = users_->alias();
    auto invoked = select({alias->c("id"), alias->c("name")});
    auto adapted = md->adaptTo(declared.columns, invoked->exportedColumns());

    EXPECT_NE(adapted, md);
    EXPECT_EQ(adapted->indexFor(key(alias->c("name"))), 1u);
    EXPECT_EQ(adapted->indexFor(key(users_->c("id"))), 0u);
    EXPECT_FALSE(md->contains(key(alias->c("name"))));
}

TEST_F(RowMetadataTest, AdaptToKeepsSameNamedColumnsApart) {
    auto stmt = select({users_->c("id"), orders_->c("id")});
    const auto declared = stmt->resultColumns();
    auto md = RowMetadata::resolve(dialect_, describe({"id", "id"}), &declared);
    ASSERT_EQ(md->indexFor(key(users_->c("id"))), 0u);
    ASSERT_EQ(md->indexFor(key(orders_->c("id"))), 1u);

    auto users2 = Table::create("users", {{"id", integerType()}, {"name", stringType()}});
    auto orders2 = Table::create("orders", {{"id", integerType()}, {"total", floatType()}});
    auto invoked = select({users2->c("id"), orders2->c("id")});
    auto adapted = md->adaptTo(declared.columns, invoked->exportedColumns());

    EXPECT_EQ(adapted->indexFor(key(users2->c("id"))), 0u);
    EXPECT_EQ(adapted->indexFor(key(orders2->c("id"))), 1u);
    EXPECT_EQ(adapted->indexFor(key(orders_->c("id"))), 1u);
    EXPECT_THROW(adapted->indexFor(std::string("id")), AmbiguousColumnError);
}

TEST_F(RowMetadataTest, AdaptToByNameFollowsDeclaredPositions) {
    auto stmt = select({users_->c("id"), orders_->c("id")});
    const auto declared = stmt->resultColumns();
    // Extra raw column forces matching by name
    auto md = RowMetadata::resolve(dialect_, describe({"id", "extra", "id"}), &declared);
    ASSERT_EQ(md->strategy(), MatchStrategy::ByName);

    auto users2 = Table::create("users", {{"id", integerType()}, {"name", stringType()}});
    auto orders2 = Table::create("orders", {{"id", integerType()}, {"total", floatType()}});
    auto invoked = select({users2->c("id"), orders2->c("id")});
    auto adapted = md->adaptTo(declared.columns, invoked->exportedColumns());

    EXPECT_EQ(adapted->indexFor(key(users2->c("id"))), 0u);
    EXPECT_EQ(adapted->indexFor(key(orders2->c("id"))), 2u);
}

TEST_F(RowMetadataTest, AdaptToRepeatedInvokedColumnIsAmbiguous) {
    auto stmt = select({users_->c("id"), orders_->c("id")});
    const auto declared = stmt->resultColumns();
    auto md = RowMetadata::resolve(dialect_, describe({"id", "id"}), &declared);

    auto users2 = Table::create("users", {{"id", integerType()}, {"name", stringType()}});
    auto invoked = select({users2->c("id"), users2->c("id")});
    auto adapted = md->adaptTo(declared.columns, invoked->exportedColumns());

    EXPECT_TRUE(adapted->contains(key(users2->c("id"))));
    EXPECT_THROW(adapted->indexFor(key(users2->c("id"))), AmbiguousColumnError);
}

TEST_F(RowMetadataTest, JsonRoundTripKeepsStringAndIntegerKeys) {
    auto stmt = select({users_->c("id"), users_->c("name")});
    const auto declared = stmt->resultColumns();
    auto md = RowMetadata::resolve(dialect_, describe({"id", "name"}), &declared);

    auto restored = RowMetadata::fromJson(md->toJson());

    EXPECT_EQ(restored->strategy(), MatchStrategy::Restored);
    EXPECT_EQ(restored->keys(), md->keys());
    EXPECT_EQ(restored->indexFor(std::string("name")), 1u);
    EXPECT_EQ(restored->indexFor(int64_t{-2}), 0u);
    // Construct identities do not survive serialization
    EXPECT_FALSE(restored->contains(key(users_->c("id"))));
    EXPECT_TRUE(restored->processors()[0] == nullptr);
}

TEST_F(RowMetadataTest, JsonRoundTripKeepsAmbiguityAndFilter) {
    auto md = RowMetadata::resolve(dialect_, describe({"x", "x", "y"}), nullptr);
    auto reduced = md->reduce({std::string("y"), int64_t{1}});

    auto restored = RowMetadata::fromJson(RowMetadata::fromJson(md->toJson())->toJson());
    EXPECT_THROW(restored->indexFor(std::string("x")), AmbiguousColumnError);

    auto restoredReduced = RowMetadata::fromJson(reduced->toJson());
    ASSERT_TRUE(restoredReduced->tupleFilter().has_value());
    EXPECT_THAT(*restoredReduced->tupleFilter(), ElementsAre(2u, 1u));
}

TEST_F(RowMetadataTest, JsonWithOutOfRangeIndexRejected) {
    json state;
    state["keys"] = {"a"};
    state["case_sensitive"] = true;
    state["keymap"] = json::array({{{"key", "a"}, {"index", 3}}});
    state["tuplefilter"] = nullptr;

    EXPECT_THROW(RowMetadata::fromJson(state), InvalidRequestError);
}

TEST_F(RowMetadataTest, DescribeKeyForms) {
    EXPECT_EQ(describeKey(int64_t{3}), "3");
    EXPECT_EQ(describeKey(std::string("name")), "name");
    EXPECT_EQ(describeKey(key(users_->c("id"))), "users.id");
    EXPECT_EQ(describeKey(key(label("total", users_->c("id")))), "total");
    EXPECT_STREQ(matchStrategyName(MatchStrategy::ByName), "by name");
}
