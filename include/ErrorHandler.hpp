#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace sqlcursor {

// Driver family an error came from
enum class Backend {
    Unknown,
    SQLite,
    PostgreSQL,
    MySQL
};

// Base class for every error raised by the result layer
class SqlCursorError : public std::runtime_error {
public:
    explicit SqlCursorError(const std::string& message)
        : std::runtime_error(message) {}
};

// Operation is not valid for the current state or arguments
class InvalidRequestError : public SqlCursorError {
public:
    using SqlCursorError::SqlCursorError;
};

// one() found no row
class NoResultFound : public InvalidRequestError {
public:
    NoResultFound()
        : InvalidRequestError("No row was found when one was required") {}
};

// one() found more than one row
class MultipleResultsFound : public InvalidRequestError {
public:
    MultipleResultsFound()
        : InvalidRequestError("Multiple rows were found when exactly one was required") {}
};

// Lookup key is not part of the result
class NoSuchColumnError : public InvalidRequestError {
public:
    explicit NoSuchColumnError(const std::string& key);
};

// Lookup key matches more than one result column
class AmbiguousColumnError : public InvalidRequestError {
public:
    explicit AmbiguousColumnError(const std::string& key);
};

// Fetch on a closed result, or on a result that never returned rows
class ResourceClosedError : public InvalidRequestError {
public:
    using InvalidRequestError::InvalidRequestError;

    static ResourceClosedError closed();
    static ResourceClosedError noRows();
};

// Named attribute access on a row for a name the row does not have
class AttributeError : public SqlCursorError {
public:
    using SqlCursorError::SqlCursorError;
};

// Error reported by a database driver, carried through unchanged
class DriverError : public SqlCursorError {
public:
    DriverError(Backend backend, int errorCode, const std::string& message,
                const std::string& sqlState = "");

    Backend backend() const { return m_backend; }
    int errorCode() const { return m_errorCode; }
    const std::string& sqlState() const { return m_sqlState; }

private:
    Backend m_backend;
    int m_errorCode;
    std::string m_sqlState;
};

class ErrorHandler {
public:
    // Uniform hook for failures raised while talking to a driver cursor.
    // Logs with the active ErrorContext and rethrows; foreign exceptions
    // are wrapped in DriverError.
    [[noreturn]] static void handleExecutionError(std::exception_ptr error,
                                                  const std::string& context);

    // Check if error is retryable by the caller
    static bool isRetryable(const DriverError& error);

    // Check if error indicates connection issue
    static bool isConnectionError(const DriverError& error);

    static std::string backendName(Backend backend);
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    explicit ErrorContext(const std::string& context);
    ~ErrorContext();

    ErrorContext(const ErrorContext&) = delete;
    ErrorContext& operator=(const ErrorContext&) = delete;

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

}  // namespace sqlcursor
