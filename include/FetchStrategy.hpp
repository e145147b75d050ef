#pragma once

/**
 * @file FetchStrategy.hpp
 * @brief Row fetching policies plugged into a Result.
 *
 * A Result delegates every fetch to its current strategy. Closing swaps
 * the strategy for a cursor-less one, so a closed or exhausted result
 * never touches the driver again.
 */

#include "DriverCursor.hpp"
#include <deque>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlcursor {

class Result;

class FetchStrategy {
public:
    virtual ~FetchStrategy() = default;

    virtual std::string name() const = 0;

    virtual std::optional<RawRow> fetchOne(Result& result) = 0;

    // size std::nullopt means the driver's default batch
    virtual std::vector<RawRow> fetchMany(Result& result, std::optional<size_t> size) = 0;

    virtual std::vector<RawRow> fetchAll(Result& result) = 0;

    // Release the cursor after exhaustion; result stays readable as empty
    virtual void softClose(Result& result) = 0;

    // Release the cursor on explicit close; later fetches fail
    virtual void hardClose(Result& result) = 0;

    virtual void yieldPer(Result& result, size_t num) {
        (void)result;
        (void)num;
    }

    [[noreturn]] virtual void handleException(Result& result, std::exception_ptr error);
};

/**
 * @brief Fetches straight from the driver cursor, one call per request.
 */
class CursorFetchStrategy : public FetchStrategy {
public:
    explicit CursorFetchStrategy(std::unique_ptr<DriverCursor> cursor);

    std::string name() const override { return "direct"; }

    std::optional<RawRow> fetchOne(Result& result) override;
    std::vector<RawRow> fetchMany(Result& result, std::optional<size_t> size) override;
    std::vector<RawRow> fetchAll(Result& result) override;

    void softClose(Result& result) override;
    void hardClose(Result& result) override;
    void yieldPer(Result& result, size_t num) override;

    [[noreturn]] void handleException(Result& result, std::exception_ptr error) override;

protected:
    // Close the driver cursor once, capturing side-channel data first
    void releaseCursor(Result& result);

    std::unique_ptr<DriverCursor> m_cursor;
};

/**
 * @brief Reads ahead in growing batches.
 *
 * Starts with the single row fetched at creation, then requests batches
 * that grow by the growth factor up to the maximum buffer size. A growth
 * factor of zero keeps the batch size fixed.
 */
class BufferedRowFetchStrategy : public CursorFetchStrategy {
public:
    static constexpr size_t kDefaultMaxRowBuffer = 1000;
    static constexpr size_t kDefaultGrowthFactor = 5;

    BufferedRowFetchStrategy(std::unique_ptr<DriverCursor> cursor,
                             size_t maxRowBuffer = kDefaultMaxRowBuffer,
                             std::deque<RawRow> initialBuffer = {},
                             size_t growthFactor = kDefaultGrowthFactor);

    // Fetches the first row before the strategy takes over
    static std::unique_ptr<BufferedRowFetchStrategy>
    create(std::unique_ptr<DriverCursor> cursor, size_t maxRowBuffer, size_t growthFactor);

    std::string name() const override { return "growth-buffered"; }

    std::optional<RawRow> fetchOne(Result& result) override;
    std::vector<RawRow> fetchMany(Result& result, std::optional<size_t> size) override;
    std::vector<RawRow> fetchAll(Result& result) override;

    void softClose(Result& result) override;
    void hardClose(Result& result) override;
    void yieldPer(Result& result, size_t num) override;

    size_t bufferSize() const { return m_bufsize; }

private:
    void bufferRows(Result& result);

    std::deque<RawRow> m_buffer;
    size_t m_maxRowBuffer;
    size_t m_growthFactor;
    size_t m_bufsize;
};

/**
 * @brief Drains the driver cursor up front and serves rows from memory.
 */
class FullyBufferedFetchStrategy : public CursorFetchStrategy {
public:
    FullyBufferedFetchStrategy(std::unique_ptr<DriverCursor> cursor,
                               std::optional<std::vector<RawRow>> initialBuffer = std::nullopt);

    std::string name() const override { return "fully-buffered"; }

    std::optional<RawRow> fetchOne(Result& result) override;
    std::vector<RawRow> fetchMany(Result& result, std::optional<size_t> size) override;
    std::vector<RawRow> fetchAll(Result& result) override;

    void softClose(Result& result) override;
    void hardClose(Result& result) override;
    void yieldPer(Result&, size_t) override {}

private:
    std::deque<RawRow> m_buffer;
};

// Strategy of a result with no cursor behind it
class NoCursorFetchStrategy : public FetchStrategy {
public:
    std::optional<RawRow> fetchOne(Result& result) override;
    std::vector<RawRow> fetchMany(Result& result, std::optional<size_t> size) override;
    std::vector<RawRow> fetchAll(Result& result) override;

    void softClose(Result&) override {}
    void hardClose(Result&) override {}

protected:
    // Called before answering any fetch; raises when fetching is an error
    virtual void nonExistentCursor(Result& result) const = 0;
};

/**
 * @brief Row-returning result whose cursor is gone.
 *
 * Exhausted results read as empty; explicitly closed ones raise.
 */
class NoCursorDQLFetchStrategy : public NoCursorFetchStrategy {
public:
    explicit NoCursorDQLFetchStrategy(bool closed)
        : m_closed(closed) {}

    std::string name() const override { return m_closed ? "closed" : "exhausted"; }

    void hardClose(Result&) override { m_closed = true; }

protected:
    void nonExistentCursor(Result& result) const override;

private:
    bool m_closed;
};

// Statement that never returned rows; every fetch raises
class NoCursorDMLFetchStrategy : public NoCursorFetchStrategy {
public:
    std::string name() const override { return "no-rows"; }

protected:
    void nonExistentCursor(Result& result) const override;
};

}  // namespace sqlcursor
