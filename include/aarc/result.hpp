#pragma once

#include <aarc/error.hpp>
#include <variant>

namespace aarc {

template<typename T>
class Result {
    std::variant<T, AarcError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from AarcError so AARC_TRY can return errors across Result<T> types
    Result(AarcError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(AarcError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<AarcError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    AarcError& error() & { return std::get<AarcError>(data_); }
    const AarcError& error() const& { return std::get<AarcError>(data_); }
    AarcError&& error() && { return std::get<AarcError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

inline bool is_cancelled(const Status& s) {
    return s.is_err() && s.error().code == AarcError::Cancelled;
}

#define AARC_TRY(expr) \
    do { \
        auto _aarc_result = (expr); \
        if (_aarc_result.is_err()) return std::move(_aarc_result).error(); \
    } while(0)

} // namespace aarc
