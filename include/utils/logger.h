#pragma once

#include <string>
#include <functional>
#include <cstdint>

namespace sciencefund {
namespace utils {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    uint64_t timestamp;
};

struct LogSettings {
    std::string path;
    LogLevel level = LogLevel::INFO;
    bool console = true;
    uint64_t maxFileSize = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
};

// Process-wide sink. Lines go to the console and/or a size-rotated file
// (path, path.1 ... path.N-1); the onLog hook sees every entry that passes
// the level filter, including those written before init().
class Logger {
public:
    static bool init(const LogSettings& settings);
    static void shutdown();

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool parseLevel(const std::string& name, LogLevel& out);
    static const char* levelName(LogLevel level);

    static void write(LogLevel level, const std::string& category, const std::string& msg);
    static void onLog(std::function<void(const LogEntry&)> callback);
};

#define SCIENCEFUND_LOG(lvl, cat, msg) do { \
    if (sciencefund::utils::Logger::getLevel() <= (lvl)) \
        sciencefund::utils::Logger::write((lvl), (cat), (msg)); \
} while (0)

#define LOG_DEBUG(cat, msg) SCIENCEFUND_LOG(sciencefund::utils::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg) SCIENCEFUND_LOG(sciencefund::utils::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg) SCIENCEFUND_LOG(sciencefund::utils::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) SCIENCEFUND_LOG(sciencefund::utils::LogLevel::ERROR, cat, msg)

}
}
