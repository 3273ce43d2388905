#pragma once

#include <zb/error.hpp>
#include <variant>
#include <functional>

namespace zb {

template<typename T>
class Result {
    std::variant<T, ZbError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from ZbError so ZB_TRY can return errors across Result<T> types
    Result(ZbError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ZbError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ZbError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    ZbError& error() & { return std::get<ZbError>(data_); }
    const ZbError& error() const& { return std::get<ZbError>(data_); }
    ZbError&& error() && { return std::get<ZbError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Error code shortcut; only meaningful when is_err()
    ZbError::Code code() const { return error().code; }

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
            return std::move(*this);
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define ZB_TRY(expr) \
    do { \
        auto _zb_result = (expr); \
        if (_zb_result.is_err()) return std::move(_zb_result).error(); \
    } while(0)

} // namespace zb
