#pragma once

#include <finl/error.hpp>
#include <variant>

namespace finl {

template<typename T>
class Result {
    std::variant<T, FinlError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from FinlError so FINL_TRY can return errors across Result<T> types
    Result(FinlError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(FinlError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<FinlError>(data_); }

    // True when this is an error with the given code
    bool has_code(FinlError::Code code) const {
        return is_err() && error().code == code;
    }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    FinlError& error() & { return std::get<FinlError>(data_); }
    const FinlError& error() const& { return std::get<FinlError>(data_); }
    FinlError&& error() && { return std::get<FinlError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define FINL_TRY(expr) \
    do { \
        auto _finl_result = (expr); \
        if (_finl_result.is_err()) return std::move(_finl_result).error(); \
    } while(0)

} // namespace finl
