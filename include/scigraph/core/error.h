#ifndef SCIGRAPH_CORE_ERROR_H_
#define SCIGRAPH_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace scigraph {
namespace core {

/**
 * @brief Base class for all scigraph errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        STORE_UNAVAILABLE = 3,
        QUERY_EXECUTION = 4,
        SCHEMA = 5,
        CACHE_CORRUPTION = 6,
        INTERNAL = 7
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Returns a stable upper-case name for an error code
 */
const char* ErrorCodeName(Error::Code code);

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating resource not found
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief A backing file or directory is missing or unreadable
 */
class StoreUnavailableError : public Error {
public:
    explicit StoreUnavailableError(const std::string& message)
        : Error(message, Code::STORE_UNAVAILABLE) {}
};

/**
 * @brief The engine rejected or failed a composed query
 *
 * Carries the offending query text for diagnosis.
 */
class QueryExecutionError : public Error {
public:
    QueryExecutionError(const std::string& message, std::string query)
        : Error(message + "\nquery: " + query, Code::QUERY_EXECUTION),
          query_(std::move(query)) {}

    const std::string& query() const { return query_; }

private:
    std::string query_;
};

/**
 * @brief An expected column is absent after a join
 */
class SchemaError : public Error {
public:
    explicit SchemaError(const std::string& message)
        : Error(message, Code::SCHEMA) {}
};

/**
 * @brief A cache file exists but cannot be deserialized
 */
class CacheCorruptionError : public Error {
public:
    explicit CacheCorruptionError(const std::string& message)
        : Error(message, Code::CACHE_CORRUPTION) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
};

} // namespace core
} // namespace scigraph

#endif // SCIGRAPH_CORE_ERROR_H_
