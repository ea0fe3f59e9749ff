#pragma once

#include <pgbranch/error.hpp>
#include <variant>

namespace pgbranch {

template<typename T>
class Result {
    std::variant<T, PgbranchError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from PgbranchError so PGBRANCH_TRY can return errors across Result<T> types
    Result(PgbranchError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PgbranchError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<PgbranchError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    PgbranchError& error() & { return std::get<PgbranchError>(data_); }
    const PgbranchError& error() const& { return std::get<PgbranchError>(data_); }
    PgbranchError&& error() && { return std::get<PgbranchError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define PGBRANCH_TRY(expr) \
    do { \
        auto _pgbranch_result = (expr); \
        if (_pgbranch_result.is_err()) return std::move(_pgbranch_result).error(); \
    } while(0)

} // namespace pgbranch
