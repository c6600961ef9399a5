#pragma once
// Status and Result: how every tier reports failure
//
// Validation and Integrity go back to the caller. Throttled carries a
// cached answer alongside it. Corruption is handled inside the tier that
// owns the store and only shows up in reports.

#include <optional>
#include <string>
#include <utility>

namespace cortex {

enum class ErrorCode {
    Ok = 0,
    Validation,   // Malformed input
    Integrity,    // Broken reference or uniqueness
    Throttled,    // Requested too soon, prior result returned
    Corruption,   // Unreadable store file
    NotFound,     // No record with that id
    Io,           // File system failure
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:         return "ok";
        case ErrorCode::Validation: return "validation_error";
        case ErrorCode::Integrity:  return "integrity_error";
        case ErrorCode::Throttled:  return "throttled";
        case ErrorCode::Corruption: return "corruption_error";
        case ErrorCode::NotFound:   return "not_found";
        case ErrorCode::Io:         return "io_error";
    }
    return "unknown";
}

struct Status {
    ErrorCode code = ErrorCode::Ok;
    std::string message;

    Status() = default;
    Status(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    static Status ok() { return {}; }
    static Status validation(std::string msg) { return {ErrorCode::Validation, std::move(msg)}; }
    static Status integrity(std::string msg) { return {ErrorCode::Integrity, std::move(msg)}; }
    static Status throttled(std::string msg) { return {ErrorCode::Throttled, std::move(msg)}; }
    static Status corruption(std::string msg) { return {ErrorCode::Corruption, std::move(msg)}; }
    static Status not_found(std::string msg) { return {ErrorCode::NotFound, std::move(msg)}; }
    static Status io(std::string msg) { return {ErrorCode::Io, std::move(msg)}; }

    bool is_ok() const { return code == ErrorCode::Ok; }
    explicit operator bool() const { return is_ok(); }

    std::string to_string() const {
        if (is_ok()) return "ok";
        return std::string(error_code_name(code)) + ": " + message;
    }
};

// Value or status. A value may accompany a non-ok status (Throttled).
template<typename T>
struct Result {
    Status status;
    std::optional<T> value;

    Result() = default;
    Result(T v) : value(std::move(v)) {}
    Result(Status s) : status(std::move(s)) {}
    Result(Status s, T v) : status(std::move(s)), value(std::move(v)) {}

    bool ok() const { return status.is_ok() && value.has_value(); }
    explicit operator bool() const { return ok(); }

    T& operator*() { return *value; }
    const T& operator*() const { return *value; }
    T* operator->() { return &*value; }
    const T* operator->() const { return &*value; }
};

} // namespace cortex
