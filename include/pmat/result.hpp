#pragma once

#include <pmat/error.hpp>
#include <variant>
#include <functional>

namespace pmat {

template<typename T>
class Result {
    std::variant<T, PmatError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from PmatError so PMAT_TRY can return errors across Result<T> types
    Result(PmatError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PmatError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<PmatError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    PmatError& error() & { return std::get<PmatError>(data_); }
    const PmatError& error() const& { return std::get<PmatError>(data_); }
    PmatError&& error() && { return std::get<PmatError>(std::move(data_)); }

    T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

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
    Result map_err(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return Result::err(f(error()));
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define PMAT_TRY(expr) \
    do { \
        auto _pmat_result = (expr); \
        if (_pmat_result.is_err()) return std::move(_pmat_result).error(); \
    } while(0)

} // namespace pmat
