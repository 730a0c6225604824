#pragma once

#include <optional>
#include <string>
#include <utility>

enum class ErrorKind {
    Auth,               // token endpoint unreachable or rejected us
    RateLimit,          // local or provider budget exhausted
    TransientHttp,      // retries exhausted on 5xx / 429 / transport errors
    PermanentHttp,      // 4xx other than 401/429, or a malformed body
    StorageCorruption   // state file unreadable
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Auth: return "auth";
        case ErrorKind::RateLimit: return "rate_limit";
        case ErrorKind::TransientHttp: return "transient_http";
        case ErrorKind::PermanentHttp: return "permanent_http";
        case ErrorKind::StorageCorruption: return "storage_corruption";
    }
    return "unknown";
}

struct FetchError {
    ErrorKind kind;
    std::string message;
    long http_status = 0;
};

// Result of an operation that talks to the provider. Holds either a value or
// a FetchError; callers switch on error().kind.
template <typename T>
class Outcome {
public:
    static Outcome success(T value) {
        Outcome out;
        out.value_ = std::move(value);
        return out;
    }

    static Outcome failure(ErrorKind kind, std::string message, long http_status = 0) {
        Outcome out;
        out.error_ = FetchError{kind, std::move(message), http_status};
        return out;
    }

    static Outcome failure(FetchError error) {
        Outcome out;
        out.error_ = std::move(error);
        return out;
    }

    bool ok() const { return value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const FetchError& error() const { return *error_; }

private:
    Outcome() = default;

    std::optional<T> value_;
    std::optional<FetchError> error_;
};
