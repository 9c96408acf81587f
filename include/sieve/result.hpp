#pragma once

#include <sieve/error.hpp>
#include <variant>
#include <utility>

namespace sieve {

template<typename T>
class Result {
    std::variant<T, SieveError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SieveError so SIEVE_TRY can return errors across Result<T> types
    Result(SieveError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SieveError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SieveError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    SieveError& error() & { return std::get<SieveError>(data_); }
    const SieveError& error() const& { return std::get<SieveError>(data_); }
    SieveError&& error() && { return std::get<SieveError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SIEVE_TRY(expr) \
    do { \
        auto _sieve_result = (expr); \
        if (_sieve_result.is_err()) return std::move(_sieve_result).error(); \
    } while(0)

} // namespace sieve
