#pragma once

#include <sortid/error.hpp>
#include <variant>
#include <functional>

namespace sortid {

template<typename T>
class Result {
    std::variant<T, SortidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SortidError so SORTID_TRY can return errors across Result<T> types
    Result(SortidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SortidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SortidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    SortidError& error() & { return std::get<SortidError>(data_); }
    const SortidError& error() const& { return std::get<SortidError>(data_); }
    SortidError&& error() && { return std::get<SortidError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SORTID_TRY(expr) \
    do { \
        auto _sortid_result = (expr); \
        if (_sortid_result.is_err()) return std::move(_sortid_result).error(); \
    } while(0)

// Declares `var` from an Ok result, or returns the error from the enclosing function
#define SORTID_TRY_ASSIGN(var, expr) \
    auto _sortid_##var = (expr); \
    if (_sortid_##var.is_err()) return std::move(_sortid_##var).error(); \
    auto var = std::move(_sortid_##var).value()

} // namespace sortid
