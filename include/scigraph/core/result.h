#ifndef SCIGRAPH_CORE_RESULT_H_
#define SCIGRAPH_CORE_RESULT_H_

#include <string>
#include <optional>
#include <memory>
#include <stdexcept>
#include <utility>
#include "scigraph/core/error.h"

namespace scigraph {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * Usage:
 * ```
 * Result<int> foo() {
 *     if (error_condition) {
 *         return Result<int>::error("error message", Error::Code::INVALID_ARGUMENT);
 *     }
 *     return Result<int>(42);
 * }
 *
 * auto result = foo();
 * if (result.ok()) {
 *     int value = result.value();
 * } else {
 *     std::string error = result.error();
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_msg_(std::nullopt) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, Error::Code code, ErrorTag)
        : value_(), error_msg_(std::move(error_msg)), code_(code) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)),
          error_msg_(std::move(other.error_msg_)),
          code_(other.code_) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_msg_ = std::move(other.error_msg_);
            code_ = other.code_;
        }
        return *this;
    }

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_msg_.has_value(); }
    bool has_error() const { return error_msg_.has_value(); }

    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }

    Error::Code code() const { return code_; }

    const T& value() const { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(const std::string& message,
                           Error::Code code = Error::Code::UNKNOWN) {
        return Result<T>(message, code, ErrorTag{});
    }

    static Result<T> error(const Error& e) {
        return Result<T>(e.what(), e.code(), ErrorTag{});
    }

    // Propagates the error of a result of another type
    template<typename U>
    static Result<T> error_from(const Result<U>& other) {
        return Result<T>(other.error(), other.code(), ErrorTag{});
    }

private:
    T value_;
    std::optional<std::string> error_msg_;
    Error::Code code_ = Error::Code::UNKNOWN;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() : error_msg_(std::nullopt) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, Error::Code code, ErrorTag)
        : error_msg_(std::move(error_msg)), code_(code) {}

    bool ok() const { return !error_msg_.has_value(); }
    bool has_error() const { return error_msg_.has_value(); }

    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }

    Error::Code code() const { return code_; }

    static Result<void> error(const std::string& message,
                              Error::Code code = Error::Code::UNKNOWN) {
        return Result<void>(message, code, ErrorTag{});
    }

    static Result<void> error(const Error& e) {
        return Result<void>(e.what(), e.code(), ErrorTag{});
    }

    template<typename U>
    static Result<void> error_from(const Result<U>& other) {
        return Result<void>(other.error(), other.code(), ErrorTag{});
    }

private:
    std::optional<std::string> error_msg_;
    Error::Code code_ = Error::Code::UNKNOWN;
};

} // namespace core
} // namespace scigraph

#endif // SCIGRAPH_CORE_RESULT_H_
