// =============================================================================
// CastLink - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Transport, codec, crypto and session operations return it instead of
// throwing; the error carries an ErrorKind from the link error taxonomy plus
// a human-readable cause.
//
// Usage:
//   Result<size_t> receive(uint8_t* buf, size_t cap) {
//       if (n == 0) return Err<size_t>(ErrorKind::PeerClosed, "peer closed");
//       return Ok(n);
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace castlink {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorKind {
    ConnectTimeout,
    ConnectRefused,
    PairingRequired,
    PeerClosed,
    IoError,
    Malformed,        // protocol violation
    AuthFailed,       // decrypt / tag mismatch
    AlreadyActive,    // API misuse: a session is already Connecting/Connected
    InvalidArgument,  // bad target address, bad config value
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::ConnectTimeout:  return "ConnectTimeout";
        case ErrorKind::ConnectRefused:  return "ConnectRefused";
        case ErrorKind::PairingRequired: return "PairingRequired";
        case ErrorKind::PeerClosed:      return "PeerClosed";
        case ErrorKind::IoError:         return "IoError";
        case ErrorKind::Malformed:       return "Malformed";
        case ErrorKind::AuthFailed:      return "AuthFailed";
        case ErrorKind::AlreadyActive:   return "AlreadyActive";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::IoError;
    std::string message;
    int code = 0;  // errno / WSA error where one exists

    Error() = default;
    Error(ErrorKind k, std::string msg, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return kind == other.kind && code == other.code && message == other.message;
    }
};

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructor (from E or derived)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Access value (throws if error)
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    // Access error (throws if success)
    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<E>(data_);
        return std::nullopt;
    }

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T>
Result<T, Error> Err(ErrorKind kind, std::string message, int code = 0) {
    return Result<T, Error>(Error(kind, std::move(message), code));
}

} // namespace castlink
