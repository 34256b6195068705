#pragma once

#include <revise/error.hpp>
#include <variant>
#include <utility>

namespace revise {

template<typename T>
class Result {
    std::variant<T, ReviseError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from ReviseError so REVISE_TRY can return errors across Result<T> types
    Result(ReviseError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ReviseError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ReviseError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    ReviseError& error() & { return std::get<ReviseError>(data_); }
    const ReviseError& error() const& { return std::get<ReviseError>(data_); }
    ReviseError&& error() && { return std::get<ReviseError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define REVISE_TRY(expr) \
    do { \
        auto _revise_result = (expr); \
        if (_revise_result.is_err()) return std::move(_revise_result).error(); \
    } while(0)

} // namespace revise
