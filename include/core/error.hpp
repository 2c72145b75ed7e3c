#pragma once

#include <stdexcept>
#include <string>

namespace sqlmemo {

/**
 * @brief Error categories raised by the executor and its collaborators
 */
enum class ErrorCode {
    NONE,
    SESSION_CLOSED,             // Operation attempted after close
    MISCONFIGURED_ENVIRONMENT,  // Isolated re-fetch without environment / data source
    RECURSIVE_QUERY,            // Direct re-entrant query on an in-flight fingerprint
    TOO_MANY_RESULTS,           // Single object requested, several rows returned
    STATEMENT_NOT_FOUND,
    REFLECTION_ERROR,           // Bad property path
    DATA_ACCESS,                // Fetch, update or transaction failure
    CONFIG_ERROR
};

[[nodiscard]] inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                      return "NONE";
        case ErrorCode::SESSION_CLOSED:            return "SESSION_CLOSED";
        case ErrorCode::MISCONFIGURED_ENVIRONMENT: return "MISCONFIGURED_ENVIRONMENT";
        case ErrorCode::RECURSIVE_QUERY:           return "RECURSIVE_QUERY";
        case ErrorCode::TOO_MANY_RESULTS:          return "TOO_MANY_RESULTS";
        case ErrorCode::STATEMENT_NOT_FOUND:       return "STATEMENT_NOT_FOUND";
        case ErrorCode::REFLECTION_ERROR:          return "REFLECTION_ERROR";
        case ErrorCode::DATA_ACCESS:               return "DATA_ACCESS";
        case ErrorCode::CONFIG_ERROR:              return "CONFIG_ERROR";
        default:                                   return "UNKNOWN";
    }
}

/**
 * @brief Base of every exception thrown by sqlmemo
 */
class SqlMemoError : public std::runtime_error {
public:
    SqlMemoError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Executor / session misuse (closed session, bad configuration, ...)
 */
class ExecutorError : public SqlMemoError {
public:
    ExecutorError(ErrorCode code, const std::string& message)
        : SqlMemoError(code, message) {}
};

/**
 * @brief Failure reported by the database or a transaction primitive
 *
 * Propagated to the caller unchanged; the memo entry of the failed
 * fetch is removed so a later call can retry.
 */
class DataAccessError : public SqlMemoError {
public:
    explicit DataAccessError(const std::string& message)
        : SqlMemoError(ErrorCode::DATA_ACCESS, message) {}
};

} // namespace sqlmemo
