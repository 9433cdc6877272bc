#pragma once

#include "errors.hpp"
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace lifeline::core {

// Value-or-error return type for fallible operations
template<typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    static Result<T, E> ok(T value) {
        return Result<T, E>(std::move(value));
    }

    static Result<T, E> err(E error) {
        return Result<T, E>(std::move(error));
    }

    static Result<T, E> err(ErrorCode code) {
        return Result<T, E>(E{code});
    }

    static Result<T, E> err(ErrorCode code, std::string message) {
        return Result<T, E>(E{code, std::move(message)});
    }

    static Result<T, E> err(ErrorCode code, std::string message, std::string context) {
        return Result<T, E>(E{code, std::move(message), std::move(context)});
    }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    T& value() & {
        check_ok();
        return std::get<T>(data_);
    }

    const T& value() const& {
        check_ok();
        return std::get<T>(data_);
    }

    T&& value() && {
        check_ok();
        return std::get<T>(std::move(data_));
    }

    E& error() & {
        check_err();
        return std::get<E>(data_);
    }

    const E& error() const& {
        check_err();
        return std::get<E>(data_);
    }

    E&& error() && {
        check_err();
        return std::get<E>(std::move(data_));
    }

    T* operator->() {
        return is_ok() ? &std::get<T>(data_) : nullptr;
    }

    const T* operator->() const {
        return is_ok() ? &std::get<T>(data_) : nullptr;
    }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

    // Transform the value if ok, pass through error
    template<typename F>
    auto map(F&& f) const -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(f(std::get<T>(data_)));
        }
        return Result<U, E>::err(std::get<E>(data_));
    }

    // Chain operations that return Result
    template<typename F>
    auto and_then(F&& f) const -> std::invoke_result_t<F, const T&> {
        using ResultType = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return f(std::get<T>(data_));
        }
        return ResultType::err(std::get<E>(data_));
    }

    T unwrap_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(data_);
        }
        return default_value;
    }

private:
    std::variant<T, E> data_;

    void check_ok() const {
        if (!is_ok()) {
            throw std::runtime_error("Result::value() called on error");
        }
    }

    void check_err() const {
        if (!is_err()) {
            throw std::runtime_error("Result::error() called on ok");
        }
    }
};

// Specialization for operations with no value
template<typename E>
class Result<void, E> {
public:
    Result() : has_error_(false) {}
    Result(const E& error) : error_(error), has_error_(true) {}
    Result(E&& error) : error_(std::move(error)), has_error_(true) {}

    static Result<void, E> ok() {
        return Result<void, E>();
    }

    static Result<void, E> err(E error) {
        return Result<void, E>(std::move(error));
    }

    static Result<void, E> err(ErrorCode code) {
        return Result<void, E>(E{code});
    }

    static Result<void, E> err(ErrorCode code, std::string message) {
        return Result<void, E>(E{code, std::move(message)});
    }

    static Result<void, E> err(ErrorCode code, std::string message, std::string context) {
        return Result<void, E>(E{code, std::move(message), std::move(context)});
    }

    bool is_ok() const { return !has_error_; }
    bool is_err() const { return has_error_; }
    explicit operator bool() const { return is_ok(); }

    E& error() & {
        if (!has_error_) {
            throw std::runtime_error("Result::error() called on ok");
        }
        return error_;
    }

    const E& error() const& {
        if (!has_error_) {
            throw std::runtime_error("Result::error() called on ok");
        }
        return error_;
    }

    E&& error() && {
        if (!has_error_) {
            throw std::runtime_error("Result::error() called on ok");
        }
        return std::move(error_);
    }

private:
    E error_;
    bool has_error_;
};

using Status = Result<void, Error>;

// Early return on error from a function returning Status
#define LIFELINE_TRY_VOID(expr) \
    do { \
        auto&& _lifeline_result = (expr); \
        if (_lifeline_result.is_err()) { \
            return std::move(_lifeline_result).error(); \
        } \
    } while (0)

}  // namespace lifeline::core
