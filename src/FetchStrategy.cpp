#include "FetchStrategy.hpp"
#include "ErrorHandler.hpp"
#include "Result.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace sqlcursor {

void FetchStrategy::handleException(Result&, std::exception_ptr error) {
    ErrorHandler::handleExecutionError(error, ErrorContext::current());
}

// ============================================================================
// Direct cursor fetching
// ============================================================================

CursorFetchStrategy::CursorFetchStrategy(std::unique_ptr<DriverCursor> cursor)
    : m_cursor(std::move(cursor)) {
}

std::optional<RawRow> CursorFetchStrategy::fetchOne(Result& result) {
    std::optional<RawRow> row;
    try {
        row = m_cursor->fetchOne();
    } catch (...) {
        handleException(result, std::current_exception());
    }
    if (!row) {
        result.softClose();
    }
    return row;
}

std::vector<RawRow> CursorFetchStrategy::fetchMany(Result& result, std::optional<size_t> size) {
    std::vector<RawRow> rows;
    try {
        rows = m_cursor->fetchMany(size ? *size : m_cursor->arraySize());
    } catch (...) {
        handleException(result, std::current_exception());
    }
    if (rows.empty()) {
        result.softClose();
    }
    return rows;
}

std::vector<RawRow> CursorFetchStrategy::fetchAll(Result& result) {
    std::vector<RawRow> rows;
    try {
        rows = m_cursor->fetchAll();
    } catch (...) {
        handleException(result, std::current_exception());
    }
    result.softClose();
    return rows;
}

void CursorFetchStrategy::releaseCursor(Result& result) {
    if (!m_cursor) {
        return;
    }
    result.captureSideChannel(*m_cursor);
    try {
        m_cursor->close();
    } catch (const std::exception& e) {
        spdlog::error("Error closing cursor: {}", e.what());
    }
    m_cursor.reset();
}

void CursorFetchStrategy::softClose(Result& result) {
    releaseCursor(result);
    result.replaceStrategy(std::make_unique<NoCursorDQLFetchStrategy>(false));
}

void CursorFetchStrategy::hardClose(Result& result) {
    releaseCursor(result);
    result.replaceStrategy(std::make_unique<NoCursorDQLFetchStrategy>(true));
}

void CursorFetchStrategy::yieldPer(Result& result, size_t num) {
    result.replaceStrategy(std::make_unique<BufferedRowFetchStrategy>(
        std::move(m_cursor), num, std::deque<RawRow>{}, 0));
}

void CursorFetchStrategy::handleException(Result& result, std::exception_ptr error) {
    // Releases the cursor and retires this strategy; later reads raise
    // ResourceClosedError
    result.softClose(true);
    FetchStrategy::handleException(result, error);
}

// ============================================================================
// Growth-buffered fetching
// ============================================================================

BufferedRowFetchStrategy::BufferedRowFetchStrategy(std::unique_ptr<DriverCursor> cursor,
                                                   size_t maxRowBuffer,
                                                   std::deque<RawRow> initialBuffer,
                                                   size_t growthFactor)
    : CursorFetchStrategy(std::move(cursor))
    , m_buffer(std::move(initialBuffer))
    , m_maxRowBuffer(maxRowBuffer)
    , m_growthFactor(growthFactor)
    , m_bufsize(growthFactor ? std::min(maxRowBuffer, growthFactor) : maxRowBuffer) {
}

std::unique_ptr<BufferedRowFetchStrategy>
BufferedRowFetchStrategy::create(std::unique_ptr<DriverCursor> cursor, size_t maxRowBuffer,
                                 size_t growthFactor) {
    std::deque<RawRow> initial;
    try {
        for (auto& row : cursor->fetchMany(1)) {
            initial.push_back(std::move(row));
        }
    } catch (...) {
        auto error = std::current_exception();
        try {
            cursor->close();
        } catch (const std::exception& e) {
            spdlog::warn("Error closing cursor after failure: {}", e.what());
        }
        ErrorHandler::handleExecutionError(error, ErrorContext::current());
    }
    return std::make_unique<BufferedRowFetchStrategy>(std::move(cursor), maxRowBuffer,
                                                      std::move(initial), growthFactor);
}

void BufferedRowFetchStrategy::bufferRows(Result& result) {
    const size_t size = m_bufsize;
    std::vector<RawRow> rows;
    try {
        rows = size < 1 ? m_cursor->fetchAll() : m_cursor->fetchMany(size);
    } catch (...) {
        handleException(result, std::current_exception());
    }
    if (rows.empty()) {
        return;
    }
    for (auto& row : rows) {
        m_buffer.push_back(std::move(row));
    }
    if (m_growthFactor && size < m_maxRowBuffer) {
        m_bufsize = std::min(m_maxRowBuffer, size * m_growthFactor);
    }
}

std::optional<RawRow> BufferedRowFetchStrategy::fetchOne(Result& result) {
    if (m_buffer.empty()) {
        bufferRows(result);
        if (m_buffer.empty()) {
            result.softClose();
            return std::nullopt;
        }
    }
    RawRow row = std::move(m_buffer.front());
    m_buffer.pop_front();
    return row;
}

std::vector<RawRow> BufferedRowFetchStrategy::fetchMany(Result& result,
                                                        std::optional<size_t> size) {
    if (!size) {
        return fetchAll(result);
    }
    if (*size > m_buffer.size()) {
        std::vector<RawRow> more;
        try {
            more = m_cursor->fetchMany(*size - m_buffer.size());
        } catch (...) {
            handleException(result, std::current_exception());
        }
        for (auto& row : more) {
            m_buffer.push_back(std::move(row));
        }
    }
    const size_t count = std::min(*size, m_buffer.size());
    std::vector<RawRow> rows;
    rows.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        rows.push_back(std::move(m_buffer.front()));
        m_buffer.pop_front();
    }
    if (rows.empty()) {
        result.softClose();
    }
    return rows;
}

std::vector<RawRow> BufferedRowFetchStrategy::fetchAll(Result& result) {
    std::vector<RawRow> rows(std::make_move_iterator(m_buffer.begin()),
                             std::make_move_iterator(m_buffer.end()));
    m_buffer.clear();
    std::vector<RawRow> rest;
    try {
        rest = m_cursor->fetchAll();
    } catch (...) {
        handleException(result, std::current_exception());
    }
    for (auto& row : rest) {
        rows.push_back(std::move(row));
    }
    result.softClose();
    return rows;
}

void BufferedRowFetchStrategy::softClose(Result& result) {
    m_buffer.clear();
    CursorFetchStrategy::softClose(result);
}

void BufferedRowFetchStrategy::hardClose(Result& result) {
    m_buffer.clear();
    CursorFetchStrategy::hardClose(result);
}

void BufferedRowFetchStrategy::yieldPer(Result&, size_t num) {
    m_growthFactor = 0;
    m_maxRowBuffer = num;
    m_bufsize = num;
}

// ============================================================================
// Fully buffered fetching
// ============================================================================

FullyBufferedFetchStrategy::FullyBufferedFetchStrategy(
    std::unique_ptr<DriverCursor> cursor, std::optional<std::vector<RawRow>> initialBuffer)
    : CursorFetchStrategy(std::move(cursor)) {
    std::vector<RawRow> rows;
    if (initialBuffer) {
        rows = std::move(*initialBuffer);
    } else {
        try {
            rows = m_cursor->fetchAll();
        } catch (...) {
            auto error = std::current_exception();
            try {
                m_cursor->close();
            } catch (const std::exception& e) {
                spdlog::warn("Error closing cursor after failure: {}", e.what());
            }
            ErrorHandler::handleExecutionError(error, ErrorContext::current());
        }
    }
    for (auto& row : rows) {
        m_buffer.push_back(std::move(row));
    }
    spdlog::debug("Buffered {} rows", m_buffer.size());
}

std::optional<RawRow> FullyBufferedFetchStrategy::fetchOne(Result& result) {
    if (m_buffer.empty()) {
        result.softClose();
        return std::nullopt;
    }
    RawRow row = std::move(m_buffer.front());
    m_buffer.pop_front();
    return row;
}

std::vector<RawRow> FullyBufferedFetchStrategy::fetchMany(Result& result,
                                                          std::optional<size_t> size) {
    if (!size) {
        return fetchAll(result);
    }
    const size_t count = std::min(*size, m_buffer.size());
    std::vector<RawRow> rows;
    rows.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        rows.push_back(std::move(m_buffer.front()));
        m_buffer.pop_front();
    }
    if (rows.empty()) {
        result.softClose();
    }
    return rows;
}

std::vector<RawRow> FullyBufferedFetchStrategy::fetchAll(Result& result) {
    std::vector<RawRow> rows(std::make_move_iterator(m_buffer.begin()),
                             std::make_move_iterator(m_buffer.end()));
    m_buffer.clear();
    result.softClose();
    return rows;
}

void FullyBufferedFetchStrategy::softClose(Result& result) {
    m_buffer.clear();
    CursorFetchStrategy::softClose(result);
}

void FullyBufferedFetchStrategy::hardClose(Result& result) {
    m_buffer.clear();
    CursorFetchStrategy::hardClose(result);
}

// ============================================================================
// No cursor
// ============================================================================

std::optional<RawRow> NoCursorFetchStrategy::fetchOne(Result& result) {
    nonExistentCursor(result);
    return std::nullopt;
}

std::vector<RawRow> NoCursorFetchStrategy::fetchMany(Result& result, std::optional<size_t>) {
    nonExistentCursor(result);
    return {};
}

std::vector<RawRow> NoCursorFetchStrategy::fetchAll(Result& result) {
    nonExistentCursor(result);
    return {};
}

void NoCursorDQLFetchStrategy::nonExistentCursor(Result&) const {
    if (m_closed) {
        throw ResourceClosedError::closed();
    }
}

void NoCursorDMLFetchStrategy::nonExistentCursor(Result&) const {
    throw ResourceClosedError::noRows();
}

}  // namespace sqlcursor
