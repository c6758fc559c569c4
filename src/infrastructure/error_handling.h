#pragma once

#include <string>
#include <memory>
#include <cstdint>

namespace sciencefund {

enum class ErrorCode {
    OK = 0,
    INVALID_INPUT,
    NOT_FOUND,
    UNAUTHORIZED,
    INVALID_STATE,
    LIMIT_EXCEEDED,
    TRANSFER_FAILED,
    DATABASE_ERROR,
    INTERNAL_ERROR
};

// Rejections of a caller's request are ERROR; failures of the ledger itself
// (storage, broken invariants) are CRITICAL.
enum class ErrorSeverity {
    ERROR,
    CRITICAL
};

struct Error {
    ErrorCode code;
    ErrorSeverity severity;
    std::string message;
    std::string context;
    uint64_t timestamp;

    Error() : code(ErrorCode::OK), severity(ErrorSeverity::ERROR), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg)
        : code(c), severity(ErrorSeverity::ERROR), message(msg), timestamp(0) {}
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    ErrorCode code() const { return error_.code; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

    T valueOr(const T& defaultValue) const { return hasValue_ ? value_ : defaultValue; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    ErrorCode code() const { return error_.code; }
    const Error& error() const { return error_; }

private:
    Error error_;
    bool hasValue_;
};

// Process-wide tally of critical failures. Every reported error is logged
// under its context as category.
class ErrorHandler {
public:
    static ErrorHandler& instance();

    void report(const Error& error);

    uint64_t getErrorCount() const;
    uint64_t getErrorCount(ErrorCode code) const;
    Error getLastError() const;

private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* errorToString(ErrorCode code);
std::string describe(const Error& error);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

#define SCIENCEFUND_CHECK(expr, code, msg) if (!(expr)) return sciencefund::makeError(code, msg)

}
