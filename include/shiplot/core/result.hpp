#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace shiplot {

/**
 * @brief Failure categories shared by every module
 *
 * Setup paths treat Config/InvalidArgument as fatal, transfer jobs treat the
 * rest as per-file failures.
 */
enum class ErrorCode {
    InvalidArgument,
    Config,
    Io,
    NotFound,
    SizeMismatch,
    Protocol,
    Network,
    Cancelled
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::Config: return "config";
        case ErrorCode::Io: return "io";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::SizeMismatch: return "size_mismatch";
        case ErrorCode::Protocol: return "protocol";
        case ErrorCode::Network: return "network";
        case ErrorCode::Cancelled: return "cancelled";
    }
    return "unknown";
}

struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    std::string to_string() const {
        return std::string(error_code_name(code)) + ": " + message;
    }
};

// Wrappers keep construction unambiguous when T and E are the same type
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

private:
    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(ErrValue<Error>(Error{code, std::move(message)}));
}

template<typename T>
Result<T> Err(Error error) {
    return Result<T>(ErrValue<Error>(std::move(error)));
}

} // namespace shiplot
