#pragma once

#include <muster/error.hpp>
#include <variant>
#include <functional>
#include <utility>

namespace muster {

template<typename T>
class Result {
    std::variant<T, MusterError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from MusterError so MUSTER_TRY can return errors across Result<T> types
    Result(MusterError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(MusterError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<MusterError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    MusterError& error() & { return std::get<MusterError>(data_); }
    const MusterError& error() const& { return std::get<MusterError>(data_); }
    MusterError&& error() && { return std::get<MusterError>(std::move(data_)); }

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

    // Rewrites the error (e.g. to attach a note), leaving Ok untouched
    template<typename F>
    Result map_err(F&& f) && {
        if (is_err()) {
            return Result::err(f(std::move(*this).error()));
        }
        return std::move(*this);
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

#define MUSTER_TRY(expr) \
    do { \
        auto _muster_result = (expr); \
        if (_muster_result.is_err()) return std::move(_muster_result).error(); \
    } while(0)

} // namespace muster
