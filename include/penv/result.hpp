#pragma once

#include <penv/error.hpp>
#include <variant>
#include <functional>

namespace penv {

template<typename T>
class Result {
    std::variant<T, PenvError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from PenvError so PENV_TRY can forward errors between Result<T> types
    Result(PenvError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PenvError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<PenvError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    PenvError& error() & { return std::get<PenvError>(data_); }
    const PenvError& error() const& { return std::get<PenvError>(data_); }
    PenvError&& error() && { return std::get<PenvError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

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
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define PENV_TRY(expr) \
    do { \
        auto _penv_result = (expr); \
        if (_penv_result.is_err()) return std::move(_penv_result).error(); \
    } while(0)

} // namespace penv
