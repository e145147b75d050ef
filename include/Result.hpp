#pragma once

/**
 * @file Result.hpp
 * @brief Consumer-facing result of an executed statement.
 */

#include "CacheKey.hpp"
#include "Config.hpp"
#include "Dialect.hpp"
#include "DriverCursor.hpp"
#include "Elements.hpp"
#include "FetchStrategy.hpp"
#include "MetadataCache.hpp"
#include "Row.hpp"
#include "RowMetadata.hpp"
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlcursor {

struct ExecutionOptions {
    bool streamResults = false;     // growth-buffered fetching
    bool bufferResults = false;     // drain the cursor up front
    size_t maxRowBuffer = BufferedRowFetchStrategy::kDefaultMaxRowBuffer;
    size_t growthFactor = BufferedRowFetchStrategy::kDefaultGrowthFactor;
    std::optional<size_t> yieldPer;
    bool echo = false;              // log column keys and every row at debug level

    static ExecutionOptions fromConfig(const ResultConfig& config);
};

/**
 * @brief Everything a Result needs from the execution that produced it.
 */
struct ExecutionContext {
    const Dialect* dialect = nullptr;
    std::unique_ptr<DriverCursor> cursor;
    ExecutionOptions options;

    // Invoked statement; null for plain SQL strings
    ElementPtr statement;

    MetadataCache* cache = nullptr;
    std::optional<CacheKey> cacheKey;

    // Context for a statement construct; generates the cache key when a
    // cache is given
    static ExecutionContext forStatement(const Dialect& dialect,
                                         std::unique_ptr<DriverCursor> cursor,
                                         ElementPtr statement,
                                         MetadataCache* cache = nullptr,
                                         ExecutionOptions options = {});

    // Context for plain SQL without declared columns
    static ExecutionContext forText(const Dialect& dialect, std::unique_ptr<DriverCursor> cursor,
                                    ExecutionOptions options = {});
};

enum class ResultState {
    Open,
    SoftClosed,     // exhausted or never returned rows; fetches read empty
    HardClosed      // closed explicitly; fetches raise ResourceClosedError
};

class MappingResult;

/**
 * @brief Iterable result over a driver cursor.
 *
 * Rows are decoded once as they are fetched. The result closes its cursor
 * as soon as the rows are exhausted; close() makes any further fetch
 * raise ResourceClosedError. Rows point at metadata the Result owns and
 * must not outlive it.
 */
class Result {
public:
    explicit Result(ExecutionContext context);
    ~Result() = default;

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;
    Result(Result&&) = default;
    Result& operator=(Result&&) = default;

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Row;
        using difference_type = std::ptrdiff_t;
        using pointer = const Row*;
        using reference = const Row&;

        Iterator() = default;
        explicit Iterator(Result* result);

        reference operator*() const { return *m_current; }
        pointer operator->() const { return &*m_current; }
        Iterator& operator++();

        bool operator==(const Iterator& other) const { return m_result == other.m_result; }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        void advance();

        Result* m_result = nullptr;
        std::optional<Row> m_current;
    };

    Iterator begin() { return Iterator(this); }
    Iterator end() { return Iterator(); }

    std::optional<Row> fetchOne();

    // Uses the yield-per size, then the driver batch, when size is omitted
    std::vector<Row> fetchMany(std::optional<size_t> size = std::nullopt);

    std::vector<Row> fetchAll();

    // First row, then close
    std::optional<Row> first();

    // Exactly one row, then close; throws NoResultFound, MultipleResultsFound
    Row one();

    // First column of the first row, then close
    std::optional<Value> scalar();

    // One column of every remaining row
    std::vector<Value> scalars(const LookupKey& key = int64_t{0});

    // Remaining rows in chunks of size (yield-per size or driver batch when omitted)
    void partitions(const std::function<void(std::vector<Row>&&)>& consumer,
                    std::optional<size_t> size = std::nullopt);

    std::vector<std::string> keys() const;

    MappingResult mappings();

    // Restrict rows to the given columns, in that order
    Result& columns(const std::vector<LookupKey>& keys);

    // Fetch in fixed batches of num rows from now on
    Result& yieldPer(size_t num);

    void close() { softClose(true); }

    bool closed() const { return m_closed; }
    ResultState state() const;
    bool returnsRows() const { return m_metadata != nullptr; }

    int64_t rowCount() const { return m_rowCount; }
    std::optional<int64_t> lastRowId() const { return m_lastRowId; }

    // Throws ResourceClosedError for results that do not return rows
    const RowMetadata& metadata() const;
    RowMetadataPtr metadataPtr() const { return m_metadata; }

    std::string fetchStrategyName() const { return m_strategy->name(); }

    // Strategy plumbing

    // Idempotent; a hard close also blocks further fetches
    void softClose(bool hard = false);

    // Swap in a new strategy; the old one is kept alive until the next call
    void replaceStrategy(std::unique_ptr<FetchStrategy> strategy);

    void captureSideChannel(const DriverCursor& cursor);

private:
    RowMetadataPtr initMetadata(const ExecutionContext& context,
                                const std::vector<ColumnDescription>& description) const;
    std::unique_ptr<FetchStrategy> createStrategy(std::unique_ptr<DriverCursor> cursor,
                                                  bool returnsRows,
                                                  const ExecutionOptions& options);
    Row makeRow(RawRow raw) const;
    std::vector<Row> makeRows(std::vector<RawRow> raw) const;
    void beginCall();

    std::unique_ptr<FetchStrategy> m_strategy;
    std::vector<std::unique_ptr<FetchStrategy>> m_retired;

    RowMetadataPtr m_metadata;
    std::vector<RowMetadataPtr> m_previousMetadata;

    std::optional<size_t> m_yieldPer;
    bool m_echo = false;
    bool m_softClosed = false;
    bool m_closed = false;

    int64_t m_rowCount = -1;
    std::optional<int64_t> m_lastRowId;
};

// Result view returning RowMapping instead of Row
class MappingResult {
public:
    explicit MappingResult(Result& result)
        : m_result(result) {}

    std::optional<RowMapping> fetchOne();
    std::vector<RowMapping> fetchMany(std::optional<size_t> size = std::nullopt);
    std::vector<RowMapping> fetchAll();
    std::optional<RowMapping> first();
    RowMapping one();

    std::vector<std::string> keys() const { return m_result.keys(); }

private:
    static std::vector<RowMapping> toMappings(const std::vector<Row>& rows);

    Result& m_result;
};

}  // namespace sqlcursor
