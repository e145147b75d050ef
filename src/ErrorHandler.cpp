#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqlcursor {

thread_local std::string ErrorContext::s_currentContext;

NoSuchColumnError::NoSuchColumnError(const std::string& key)
    : InvalidRequestError("Could not locate column in row for column '" + key + "'") {
}

AmbiguousColumnError::AmbiguousColumnError(const std::string& key)
    : InvalidRequestError("Ambiguous column name '" + key +
                          "' in result set column descriptions") {
}

ResourceClosedError ResourceClosedError::closed() {
    return ResourceClosedError("This result object is closed.");
}

ResourceClosedError ResourceClosedError::noRows() {
    return ResourceClosedError(
        "This result object does not return rows. It has been closed automatically.");
}

DriverError::DriverError(Backend backend, int errorCode, const std::string& message,
                         const std::string& sqlState)
    : SqlCursorError(message)
    , m_backend(backend)
    , m_errorCode(errorCode)
    , m_sqlState(sqlState) {
}

void ErrorHandler::handleExecutionError(std::exception_ptr error, const std::string& context) {
    const std::string where = context.empty() ? "cursor" : context;
    try {
        std::rethrow_exception(error);
    } catch (const DriverError& e) {
        spdlog::error("{} error {} during {}: {}", backendName(e.backend()), e.errorCode(),
                      where, e.what());
        throw;
    } catch (const SqlCursorError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Driver failure during {}: {}", where, e.what());
        throw DriverError(Backend::Unknown, -1, e.what());
    } catch (...) {
        spdlog::error("Unknown driver failure during {}", where);
        throw DriverError(Backend::Unknown, -1, "unknown driver error");
    }
}

bool ErrorHandler::isRetryable(const DriverError& error) {
    switch (error.backend()) {
        case Backend::SQLite:
            switch (error.errorCode()) {
                case 5:     // SQLITE_BUSY
                case 6:     // SQLITE_LOCKED
                    return true;
                default:
                    return false;
            }
        case Backend::PostgreSQL:
            return error.sqlState() == "40001"     // serialization_failure
                || error.sqlState() == "40P01"     // deadlock_detected
                || error.sqlState() == "55P03";    // lock_not_available
        case Backend::MySQL:
            switch (error.errorCode()) {
                case 1205:  // ER_LOCK_WAIT_TIMEOUT
                case 1213:  // ER_LOCK_DEADLOCK
                case 1177:  // ER_TOO_MANY_CONCURRENT_TRXS
                case 2006:  // CR_SERVER_GONE_ERROR
                case 2013:  // CR_SERVER_LOST
                    return true;
                default:
                    return false;
            }
        default:
            return false;
    }
}

bool ErrorHandler::isConnectionError(const DriverError& error) {
    switch (error.backend()) {
        case Backend::SQLite:
            return error.errorCode() == 14;        // SQLITE_CANTOPEN
        case Backend::PostgreSQL:
            // Class 08: connection exception
            return error.sqlState().rfind("08", 0) == 0;
        case Backend::MySQL:
            switch (error.errorCode()) {
                case 2002:  // CR_CONNECTION_ERROR
                case 2003:  // CR_CONN_HOST_ERROR
                case 2005:  // CR_UNKNOWN_HOST
                case 2006:  // CR_SERVER_GONE_ERROR
                case 2013:  // CR_SERVER_LOST
                case 2014:  // CR_COMMANDS_OUT_OF_SYNC
                    return true;
                default:
                    return false;
            }
        default:
            return false;
    }
}

std::string ErrorHandler::backendName(Backend backend) {
    switch (backend) {
        case Backend::SQLite:
            return "SQLite";
        case Backend::PostgreSQL:
            return "PostgreSQL";
        case Backend::MySQL:
            return "MySQL";
        default:
            return "Driver";
    }
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

}  // namespace sqlcursor
