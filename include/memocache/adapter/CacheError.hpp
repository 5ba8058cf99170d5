#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace memocache {
namespace adapter {

// Failure kinds reported by CacheAdapter. None of them is fatal: a cache that
// times out or misses is a reason to recompute, not to crash.
enum class CacheErrorKind {
    ReadTimeout,         // deadline elapsed before the transport answered
    ReadError,           // transport failed on fetch
    KeyNotFound,         // cache miss
    JsonParsingFailed,   // stored payload is not valid JSON
    WriteError,          // transport failed on store
    WriteFailed,         // transport answered but did not acknowledge the write
    JsonStringifyFailed  // value could not be serialized
};

inline const char* toString(CacheErrorKind kind) {
    switch (kind) {
        case CacheErrorKind::ReadTimeout: return "READ_TIMEOUT";
        case CacheErrorKind::ReadError: return "READ_ERROR";
        case CacheErrorKind::KeyNotFound: return "READ_KEY_NOT_FOUND";
        case CacheErrorKind::JsonParsingFailed: return "JSON_PARSING_FAILED";
        case CacheErrorKind::WriteError: return "WRITE_ERROR";
        case CacheErrorKind::WriteFailed: return "WRITE_FAILED";
        case CacheErrorKind::JsonStringifyFailed: return "JSON_STRINGIFY_FAILED";
    }
    return "UNKNOWN";
}

struct CacheError {
    CacheErrorKind kind;
    std::string message;
};

// Result of a cache operation: either a value or a CacheError.
template<typename T>
class Result {
public:
    static Result success(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result failure(CacheErrorKind kind, std::string message = {}) {
        Result r;
        r.error_ = CacheError{kind, std::move(message)};
        return r;
    }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    // Throws std::logic_error when called on a failure.
    const T& value() const {
        if (!ok()) {
            throw std::logic_error(std::string("Result::value() on failure: ") + toString(error_->kind));
        }
        return *value_;
    }

    T valueOr(T fallback) const {
        return ok() ? *value_ : std::move(fallback);
    }

    // Throws std::logic_error when called on a success.
    const CacheError& error() const {
        if (ok()) {
            throw std::logic_error("Result::error() on success");
        }
        return *error_;
    }

    bool is(CacheErrorKind kind) const { return error_ && error_->kind == kind; }

private:
    Result() = default;
    std::optional<T> value_;
    std::optional<CacheError> error_;
};

template<>
class Result<void> {
public:
    static Result success() { return Result(); }

    static Result failure(CacheErrorKind kind, std::string message = {}) {
        Result r;
        r.error_ = CacheError{kind, std::move(message)};
        return r;
    }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const CacheError& error() const {
        if (ok()) {
            throw std::logic_error("Result::error() on success");
        }
        return *error_;
    }

    bool is(CacheErrorKind kind) const { return error_ && error_->kind == kind; }

private:
    Result() = default;
    std::optional<CacheError> error_;
};

} // namespace adapter
} // namespace memocache
