#pragma once

#include <ghostcomment/error.hpp>
#include <variant>

namespace ghostcomment {

template<typename T>
class Result {
    std::variant<T, GcError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from GcError so GC_TRY can return errors across Result<T> types
    Result(GcError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(GcError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<GcError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    GcError& error() & { return std::get<GcError>(data_); }
    const GcError& error() const& { return std::get<GcError>(data_); }
    GcError&& error() && { return std::get<GcError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define GC_TRY(expr) \
    do { \
        auto _gc_result = (expr); \
        if (_gc_result.is_err()) return std::move(_gc_result).error(); \
    } while(0)

} // namespace ghostcomment
