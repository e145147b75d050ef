#include "Result.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqlcursor {

ExecutionOptions ExecutionOptions::fromConfig(const ResultConfig& config) {
    ExecutionOptions options;
    options.streamResults = config.stream_results;
    options.bufferResults = config.buffer_results;
    options.maxRowBuffer = config.max_row_buffer;
    options.growthFactor = config.growth_factor;
    if (config.yield_per > 0) {
        options.yieldPer = config.yield_per;
    }
    options.echo = config.echo;
    return options;
}

ExecutionContext ExecutionContext::forStatement(const Dialect& dialect,
                                                std::unique_ptr<DriverCursor> cursor,
                                                ElementPtr statement, MetadataCache* cache,
                                                ExecutionOptions options) {
    ExecutionContext context;
    context.dialect = &dialect;
    context.cursor = std::move(cursor);
    context.options = options;
    context.statement = std::move(statement);
    if (cache && cache->enabled() && context.statement) {
        context.cache = cache;
        context.cacheKey = CacheKeyGenerator::generate(*context.statement);
    }
    return context;
}

ExecutionContext ExecutionContext::forText(const Dialect& dialect,
                                           std::unique_ptr<DriverCursor> cursor,
                                           ExecutionOptions options) {
    ExecutionContext context;
    context.dialect = &dialect;
    context.cursor = std::move(cursor);
    context.options = options;
    return context;
}

// ============================================================================
// Construction
// ============================================================================

Result::Result(ExecutionContext context)
    : m_yieldPer(context.options.yieldPer)
    , m_echo(context.options.echo) {
    if (!context.cursor || !context.dialect) {
        throw InvalidRequestError("Execution context has no cursor or dialect");
    }
    ErrorContext errorContext("result setup");

    captureSideChannel(*context.cursor);
    const auto description = context.cursor->description();
    if (description) {
        m_metadata = initMetadata(context, *description);
        if (m_echo) {
            std::string cols;
            for (const auto& key : m_metadata->keys()) {
                cols += cols.empty() ? key : ", " + key;
            }
            spdlog::debug("Col ({})", cols);
        }
    }

    m_strategy = createStrategy(std::move(context.cursor), description.has_value(),
                                context.options);
    if (!description) {
        softClose();
    } else if (m_yieldPer) {
        m_strategy->yieldPer(*this, *m_yieldPer);
    }
}

RowMetadataPtr Result::initMetadata(const ExecutionContext& context,
                                    const std::vector<ColumnDescription>& description) const {
    const auto* select = dynamic_cast<const SelectBase*>(context.statement.get());
    if (!select) {
        return RowMetadata::resolve(*context.dialect, description, nullptr);
    }

    if (context.cache && context.cacheKey) {
        if (auto entry = context.cache->get(*context.cacheKey)) {
            return entry->metadata->adaptTo(entry->resultColumns.columns,
                                            select->exportedColumns());
        }
        auto entry = std::make_shared<CompiledCacheEntry>();
        entry->statement = context.statement;
        entry->resultColumns = select->resultColumns();
        entry->metadata = RowMetadata::resolve(*context.dialect, description,
                                               &entry->resultColumns);
        context.cache->put(*context.cacheKey, entry);
        return entry->metadata;
    }

    const auto declared = select->resultColumns();
    return RowMetadata::resolve(*context.dialect, description, &declared);
}

std::unique_ptr<FetchStrategy> Result::createStrategy(std::unique_ptr<DriverCursor> cursor,
                                                      bool returnsRows,
                                                      const ExecutionOptions& options) {
    if (!returnsRows) {
        cursor->close();
        return std::make_unique<NoCursorDMLFetchStrategy>();
    }
    if (options.bufferResults) {
        return std::make_unique<FullyBufferedFetchStrategy>(std::move(cursor));
    }
    if (options.streamResults) {
        return BufferedRowFetchStrategy::create(std::move(cursor), options.maxRowBuffer,
                                                options.growthFactor);
    }
    return std::make_unique<CursorFetchStrategy>(std::move(cursor));
}

// ============================================================================
// Fetching
// ============================================================================

void Result::beginCall() {
    m_retired.clear();
}

Row Result::makeRow(RawRow raw) const {
    if (const auto& filter = m_metadata->tupleFilter()) {
        RawRow picked;
        picked.reserve(filter->size());
        for (size_t index : *filter) {
            picked.push_back(std::move(raw.at(index)));
        }
        raw = std::move(picked);
    }
    Row row = Row::decode(m_metadata, m_metadata->processors(), std::move(raw));
    if (m_echo) {
        spdlog::debug("Row {}", row.toString());
    }
    return row;
}

std::vector<Row> Result::makeRows(std::vector<RawRow> raw) const {
    std::vector<Row> rows;
    rows.reserve(raw.size());
    for (auto& values : raw) {
        rows.push_back(makeRow(std::move(values)));
    }
    return rows;
}

std::optional<Row> Result::fetchOne() {
    beginCall();
    ErrorContext errorContext("fetchOne");
    auto raw = m_strategy->fetchOne(*this);
    if (!raw) {
        return std::nullopt;
    }
    return makeRow(std::move(*raw));
}

std::vector<Row> Result::fetchMany(std::optional<size_t> size) {
    beginCall();
    ErrorContext errorContext("fetchMany");
    if (!size) {
        size = m_yieldPer;
    }
    return makeRows(m_strategy->fetchMany(*this, size));
}

std::vector<Row> Result::fetchAll() {
    beginCall();
    ErrorContext errorContext("fetchAll");
    return makeRows(m_strategy->fetchAll(*this));
}

std::optional<Row> Result::first() {
    auto row = fetchOne();
    softClose(true);
    return row;
}

Row Result::one() {
    auto row = fetchOne();
    if (!row) {
        softClose(true);
        throw NoResultFound();
    }
    auto extra = fetchOne();
    softClose(true);
    if (extra) {
        throw MultipleResultsFound();
    }
    return std::move(*row);
}

std::optional<Value> Result::scalar() {
    auto row = first();
    if (!row) {
        return std::nullopt;
    }
    return row->at(0);
}

std::vector<Value> Result::scalars(const LookupKey& key) {
    std::vector<Value> values;
    for (const auto& row : fetchAll()) {
        values.push_back(row.get(key));
    }
    return values;
}

void Result::partitions(const std::function<void(std::vector<Row>&&)>& consumer,
                        std::optional<size_t> size) {
    while (true) {
        auto rows = fetchMany(size);
        if (rows.empty()) {
            break;
        }
        consumer(std::move(rows));
    }
}

std::vector<std::string> Result::keys() const {
    if (!m_metadata) {
        return {};
    }
    return m_metadata->keys();
}

MappingResult Result::mappings() {
    return MappingResult(*this);
}

Result& Result::columns(const std::vector<LookupKey>& keys) {
    beginCall();
    auto reduced = metadata().reduce(keys);
    m_previousMetadata.push_back(std::move(m_metadata));
    m_metadata = std::move(reduced);
    return *this;
}

Result& Result::yieldPer(size_t num) {
    beginCall();
    m_yieldPer = num;
    m_strategy->yieldPer(*this, num);
    return *this;
}

ResultState Result::state() const {
    if (m_closed) {
        return ResultState::HardClosed;
    }
    if (m_softClosed) {
        return ResultState::SoftClosed;
    }
    return ResultState::Open;
}

const RowMetadata& Result::metadata() const {
    if (!m_metadata) {
        throw ResourceClosedError::noRows();
    }
    return *m_metadata;
}

// ============================================================================
// Strategy plumbing
// ============================================================================

void Result::softClose(bool hard) {
    if ((!hard && m_softClosed) || (hard && m_closed)) {
        return;
    }
    if (hard) {
        m_closed = true;
        m_strategy->hardClose(*this);
    } else {
        m_strategy->softClose(*this);
    }
    if (!m_softClosed) {
        m_softClosed = true;
        spdlog::debug("Result {} (rowcount {})", hard ? "closed" : "exhausted", m_rowCount);
    }
}

void Result::replaceStrategy(std::unique_ptr<FetchStrategy> strategy) {
    spdlog::debug("Fetch strategy {} -> {}", m_strategy ? m_strategy->name() : "none",
                  strategy->name());
    m_retired.push_back(std::move(m_strategy));
    m_strategy = std::move(strategy);
}

void Result::captureSideChannel(const DriverCursor& cursor) {
    const int64_t count = cursor.rowCount();
    if (count >= 0) {
        m_rowCount = count;
    }
    if (auto id = cursor.lastRowId()) {
        m_lastRowId = id;
    }
}

// ============================================================================
// Iteration and mapping views
// ============================================================================

Result::Iterator::Iterator(Result* result)
    : m_result(result) {
    advance();
}

Result::Iterator& Result::Iterator::operator++() {
    advance();
    return *this;
}

void Result::Iterator::advance() {
    if (!m_result) {
        return;
    }
    m_current = m_result->fetchOne();
    if (!m_current) {
        m_result = nullptr;
    }
}

std::vector<RowMapping> MappingResult::toMappings(const std::vector<Row>& rows) {
    std::vector<RowMapping> mappings;
    mappings.reserve(rows.size());
    for (const auto& row : rows) {
        mappings.push_back(row.mapping());
    }
    return mappings;
}

std::optional<RowMapping> MappingResult::fetchOne() {
    auto row = m_result.fetchOne();
    if (!row) {
        return std::nullopt;
    }
    return row->mapping();
}

std::vector<RowMapping> MappingResult::fetchMany(std::optional<size_t> size) {
    return toMappings(m_result.fetchMany(size));
}

std::vector<RowMapping> MappingResult::fetchAll() {
    return toMappings(m_result.fetchAll());
}

std::optional<RowMapping> MappingResult::first() {
    auto row = m_result.first();
    if (!row) {
        return std::nullopt;
    }
    return row->mapping();
}

RowMapping MappingResult::one() {
    return m_result.one().mapping();
}

}  // namespace sqlcursor
