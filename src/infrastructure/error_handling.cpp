#include "error_handling.h"
#include "utils/logger.h"
#include <mutex>
#include <map>
#include <ctime>

namespace sciencefund {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_INPUT: return "Invalid input";
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::UNAUTHORIZED: return "Unauthorized";
        case ErrorCode::INVALID_STATE: return "Invalid state";
        case ErrorCode::LIMIT_EXCEEDED: return "Limit exceeded";
        case ErrorCode::TRANSFER_FAILED: return "Transfer failed";
        case ErrorCode::DATABASE_ERROR: return "Database error";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

std::string describe(const Error& error) {
    std::string out = errorToString(error.code);
    if (!error.message.empty()) out += ": " + error.message;
    if (!error.context.empty()) out += " [" + error.context + "]";
    return out;
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err(code, message);
    if (code == ErrorCode::DATABASE_ERROR || code == ErrorCode::INTERNAL_ERROR) {
        err.severity = ErrorSeverity::CRITICAL;
    }
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

struct ErrorHandler::Impl {
    std::map<ErrorCode, uint64_t> counts;
    uint64_t total = 0;
    Error last;
    mutable std::mutex mtx;
};

ErrorHandler::ErrorHandler() : impl_(std::make_unique<Impl>()) {}

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler inst;
    return inst;
}

void ErrorHandler::report(const Error& error) {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->counts[error.code]++;
        impl_->total++;
        impl_->last = error;
    }
    utils::LogLevel level = error.severity == ErrorSeverity::CRITICAL ? utils::LogLevel::ERROR : utils::LogLevel::WARN;
    utils::Logger::write(level, error.context.empty() ? "error" : error.context, describe(error));
}

uint64_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->total;
}

uint64_t ErrorHandler::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->counts.find(code);
    return it != impl_->counts.end() ? it->second : 0;
}

Error ErrorHandler::getLastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->last;
}

}
