#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"
#include "Result.hpp"
#include "SQLiteConnection.hpp"
#include "SQLiteDialect.hpp"

using namespace sqlcursor;
using ::testing::ElementsAre;

class SQLiteCursorTest : public ::testing::Test {
protected:
    void SetUp() override {
        conn_.executeScript(R"(
            CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT, score REAL, data BLOB);
            INSERT INTO users (name, score, data) VALUES ('ann', 1.5, x'0102');
            INSERT INTO users (name, score, data) VALUES ('bob', 2.5, NULL);
            INSERT INTO users (name, score, data) VALUES ('cid', NULL, NULL);
        )");
    }

    static LookupKey key(const ElementPtr& element) {
        return LookupKey{static_cast<const ClauseElement*>(element.get())};
    }

    SQLiteConnection conn_{":memory:"};
    SQLiteDialect dialect_;
};

// ============================================================================
// Driver cursor
// ============================================================================

TEST_F(SQLiteCursorTest, DescriptionCarriesAffinity) {
    auto cursor = conn_.execute("SELECT id, name, score, data FROM users");

    auto description = cursor->description();
    ASSERT_TRUE(description.has_value());
    ASSERT_EQ(description->size(), 4u);
    EXPECT_EQ((*description)[0].name, "id");
    EXPECT_EQ((*description)[0].typeCode, SQLITE_INTEGER);
    EXPECT_EQ((*description)[1].typeCode, SQLITE_TEXT);
    EXPECT_EQ((*description)[2].typeCode, SQLITE_FLOAT);
    EXPECT_EQ((*description)[3].typeCode, SQLITE_BLOB);
}

TEST_F(SQLiteCursorTest, ExpressionColumnsHaveNoAffinity) {
    auto cursor = conn_.execute("SELECT count(*) AS n FROM users");

    auto description = cursor->description();
    ASSERT_TRUE(description.has_value());
    EXPECT_EQ((*description)[0].name, "n");
    EXPECT_EQ((*description)[0].typeCode, 0);
}

TEST_F(SQLiteCursorTest, AffinityCodeFromDeclaredType) {
    EXPECT_EQ(SQLiteCursor::affinityCode("BIGINT"), SQLITE_INTEGER);
    EXPECT_EQ(SQLiteCursor::affinityCode("varchar(20)"), SQLITE_TEXT);
    EXPECT_EQ(SQLiteCursor::affinityCode("CLOB"), SQLITE_TEXT);
    EXPECT_EQ(SQLiteCursor::affinityCode("DOUBLE PRECISION"), SQLITE_FLOAT);
    EXPECT_EQ(SQLiteCursor::affinityCode("blob"), SQLITE_BLOB);
    EXPECT_EQ(SQLiteCursor::affinityCode(""), SQLITE_BLOB);
    EXPECT_EQ(SQLiteCursor::affinityCode("NUMERIC"), 0);
    EXPECT_EQ(SQLiteCursor::affinityCode(nullptr), 0);
}

TEST_F(SQLiteCursorTest, FetchRows) {
    auto cursor = conn_.execute("SELECT id, name, score, data FROM users ORDER BY id");

    auto first = cursor->fetchOne();
    ASSERT_TRUE(first.has_value());
    EXPECT_THAT(*first, ElementsAre(Value(int64_t{1}), Value(std::string("ann")), Value(1.5),
                                    Value(Blob{0x01, 0x02})));

    auto batch = cursor->fetchMany(5);
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0][1], Value(std::string("bob")));
    EXPECT_TRUE(isNull(batch[1][2]));

    EXPECT_TRUE(cursor->fetchAll().empty());
    EXPECT_FALSE(cursor->fetchOne().has_value());
}

TEST_F(SQLiteCursorTest, CloseFinalizesStatement) {
    auto cursor = conn_.execute("SELECT id FROM users");
    EXPECT_FALSE(cursor->closed());

    cursor->close();
    EXPECT_TRUE(cursor->closed());
    EXPECT_FALSE(cursor->fetchOne().has_value());

    // Idempotent
    cursor->close();
}

TEST_F(SQLiteCursorTest, InsertReportsSideChannel) {
    auto cursor = conn_.execute("INSERT INTO users (name) VALUES ('dee')");

    EXPECT_FALSE(cursor->description().has_value());
    EXPECT_EQ(cursor->rowCount(), 1);
    ASSERT_TRUE(cursor->lastRowId().has_value());
    EXPECT_EQ(*cursor->lastRowId(), 4);
    EXPECT_TRUE(cursor->closed());
    EXPECT_EQ(conn_.lastInsertRowId(), 4);
}

TEST_F(SQLiteCursorTest, UpdateReportsAffectedRows) {
    auto cursor = conn_.execute("UPDATE users SET score = 0 WHERE id > 1");

    EXPECT_EQ(cursor->rowCount(), 2);
    EXPECT_EQ(conn_.changes(), 2);
}

TEST_F(SQLiteCursorTest, RowQueryHasNoRowCount) {
    auto cursor = conn_.execute("SELECT id FROM users");
    EXPECT_EQ(cursor->rowCount(), -1);
}

TEST_F(SQLiteCursorTest, BadSqlRaisesDriverError) {
    try {
        conn_.execute("SELECT nope FROM users");
        FAIL() << "Expected DriverError";
    } catch (const DriverError& e) {
        EXPECT_EQ(e.backend(), Backend::SQLite);
        EXPECT_EQ(e.errorCode(), SQLITE_ERROR);
        EXPECT_THAT(e.what(), ::testing::HasSubstr("nope"));
    }
}

TEST_F(SQLiteCursorTest, ConstraintViolationRaisesDriverError) {
    conn_.executeScript("CREATE TABLE tags (name TEXT UNIQUE); INSERT INTO tags VALUES ('x');");

    try {
        conn_.execute("INSERT INTO tags VALUES ('x')");
        FAIL() << "Expected DriverError";
    } catch (const DriverError& e) {
        EXPECT_EQ(e.backend(), Backend::SQLite);
        EXPECT_EQ(e.errorCode() & 0xff, SQLITE_CONSTRAINT);
        EXPECT_FALSE(ErrorHandler::isRetryable(e));
    }
}

TEST_F(SQLiteCursorTest, EmptyStatementRejected) {
    EXPECT_THROW(conn_.execute("   "), DriverError);
}

TEST_F(SQLiteCursorTest, CannotOpenIsConnectionError) {
    try {
        SQLiteConnection missing("/nonexistent/dir/db.sqlite");
        FAIL() << "Expected DriverError";
    } catch (const DriverError& e) {
        EXPECT_TRUE(ErrorHandler::isConnectionError(e));
    }
}

// ============================================================================
// Dialect
// ============================================================================

TEST_F(SQLiteCursorTest, DialectTranslatesDottedNames) {
    auto translated = dialect_.translateColname("users.name");
    ASSERT_TRUE(translated.has_value());
    EXPECT_EQ(translated->first, "name");
    EXPECT_EQ(translated->second, "users.name");

    EXPECT_FALSE(dialect_.translateColname("name").has_value());
}

TEST_F(SQLiteCursorTest, DialectRawAffinity) {
    EXPECT_EQ(dialect_.rawAffinity(SQLITE_INTEGER), "integer");
    EXPECT_EQ(dialect_.rawAffinity(SQLITE_FLOAT), "float");
    EXPECT_EQ(dialect_.rawAffinity(SQLITE_TEXT), "string");
    EXPECT_EQ(dialect_.rawAffinity(SQLITE_BLOB), "binary");
    EXPECT_EQ(dialect_.rawAffinity(0), "");
}

// ============================================================================
// Results over SQLite
// ============================================================================

TEST_F(SQLiteCursorTest, TextResultByName) {
    Result result(ExecutionContext::forText(
        dialect_, conn_.execute("SELECT id, name AS \"u.name\" FROM users ORDER BY id")));

    EXPECT_EQ(result.fetchStrategyName(), "direct");
    auto row = result.fetchOne();
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->get(std::string("name")), Value(std::string("ann")));
    EXPECT_EQ(row->get(std::string("u.name")), Value(std::string("ann")));
}

TEST_F(SQLiteCursorTest, StreamedResult) {
    ExecutionOptions options;
    options.streamResults = true;
    options.maxRowBuffer = 2;

    Result result(ExecutionContext::forText(
        dialect_, conn_.execute("SELECT id FROM users ORDER BY id"), options));

    EXPECT_EQ(result.fetchStrategyName(), "growth-buffered");
    EXPECT_THAT(result.scalars(), ElementsAre(Value(int64_t{1}), Value(int64_t{2}),
                                              Value(int64_t{3})));
    EXPECT_EQ(result.state(), ResultState::SoftClosed);
    EXPECT_TRUE(result.fetchAll().empty());
}

TEST_F(SQLiteCursorTest, BufferedResult) {
    ExecutionOptions options;
    options.bufferResults = true;

    Result result(ExecutionContext::forText(
        dialect_, conn_.execute("SELECT name FROM users ORDER BY id"), options));

    EXPECT_EQ(result.fetchStrategyName(), "fully-buffered");
    EXPECT_EQ(result.fetchMany(2).size(), 2u);
    EXPECT_EQ(result.fetchMany(2).size(), 1u);
}

TEST_F(SQLiteCursorTest, StatementResultSkipsMatchingDecoders) {
    auto users = Table::create("users", {{"id", integerType()}, {"name", stringType()}});
    auto stmt = select({users->c("id"), users->c("name")});

    Result result(ExecutionContext::forStatement(
        dialect_, conn_.execute("SELECT id, name FROM users ORDER BY id"), stmt));

    const auto& processors = result.metadata().processors();
    ASSERT_EQ(processors.size(), 2u);
    EXPECT_FALSE(processors[0]);
    EXPECT_FALSE(processors[1]);

    auto row = result.first();
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->get(key(users->c("id"))), Value(int64_t{1}));
    EXPECT_EQ(row->get(key(users->c("name"))), Value(std::string("ann")));
}

TEST_F(SQLiteCursorTest, StatementResultDecodesMismatchedAffinity) {
    // id declared as a string column; SQLite reports integer affinity
    auto users = Table::create("users", {{"id", stringType()}, {"name", stringType()}});
    auto stmt = select({users->c("id"), users->c("name")});

    Result result(ExecutionContext::forStatement(
        dialect_, conn_.execute("SELECT id, name FROM users ORDER BY id"), stmt));

    const auto& processors = result.metadata().processors();
    EXPECT_TRUE(processors[0]);
    EXPECT_FALSE(processors[1]);

    auto row = result.first();
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->at(0), Value(std::string("1")));
}

TEST_F(SQLiteCursorTest, StatementResultsShareCachedMetadata) {
    CacheConfig config;
    MetadataCache cache(config);
    auto users = Table::create("users", {{"id", integerType()}, {"name", stringType()}});

    auto byId = [&](int64_t id) {
        auto stmt = select({users->c("name")});
        stmt->where(eq(users->c("id"), literal(id)));
        return stmt;
    };

    Result first(ExecutionContext::forStatement(
        dialect_, conn_.execute("SELECT name FROM users WHERE id = 1"), byId(1), &cache));
    Result second(ExecutionContext::forStatement(
        dialect_, conn_.execute("SELECT name FROM users WHERE id = 2"), byId(2), &cache));

    EXPECT_EQ(first.metadataPtr(), second.metadataPtr());
    EXPECT_EQ(first.scalar(), Value(std::string("ann")));
    EXPECT_EQ(second.scalar(), Value(std::string("bob")));
    EXPECT_EQ(cache.getStats().hits, 1u);
}

TEST_F(SQLiteCursorTest, DmlResultReturnsNoRows) {
    Result result(ExecutionContext::forText(
        dialect_, conn_.execute("DELETE FROM users WHERE id = 1")));

    EXPECT_FALSE(result.returnsRows());
    EXPECT_EQ(result.fetchStrategyName(), "no-rows");
    EXPECT_EQ(result.rowCount(), 1);
    EXPECT_THROW(result.fetchOne(), ResourceClosedError);
    EXPECT_THROW(result.metadata(), ResourceClosedError);
}
