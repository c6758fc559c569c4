#include "utils/logger.h"
#include <atomic>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace sciencefund {
namespace utils {

namespace {

struct Sink {
    std::mutex mtx;
    LogSettings settings;
    std::ofstream file;
    std::function<void(const LogEntry&)> hook;
};

std::atomic<LogLevel> gLevel{LogLevel::INFO};

Sink& sink() {
    static Sink s;
    return s;
}

std::string rotatedName(const std::string& path, uint32_t index) {
    return index == 0 ? path : path + "." + std::to_string(index);
}

void rotateLocked(Sink& s) {
    s.file.close();
    std::error_code ec;
    const std::string& path = s.settings.path;
    uint32_t keep = s.settings.maxFiles > 0 ? s.settings.maxFiles : 1;
    std::filesystem::remove(rotatedName(path, keep - 1), ec);
    for (uint32_t i = keep - 1; i > 0; i--) {
        std::filesystem::rename(rotatedName(path, i - 1), rotatedName(path, i), ec);
    }
    s.file.open(path, std::ios::app);
}

std::string formatLine(LogLevel level, const std::string& category, const std::string& msg, time_t when) {
    struct tm tmBuf;
    localtime_r(&when, &tmBuf);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmBuf);

    std::ostringstream oss;
    oss << timeBuf << " " << Logger::levelName(level);
    if (!category.empty()) oss << " [" << category << "]";
    oss << " " << msg << "\n";
    return oss.str();
}

}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "OFF";
    }
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    static const std::pair<const char*, LogLevel> names[] = {
        {"debug", LogLevel::DEBUG}, {"info", LogLevel::INFO}, {"warn", LogLevel::WARN},
        {"error", LogLevel::ERROR}, {"off", LogLevel::OFF}};
    for (const auto& entry : names) {
        if (name == entry.first) {
            out = entry.second;
            return true;
        }
    }
    return false;
}

bool Logger::init(const LogSettings& settings) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) s.file.close();
    s.settings = settings;
    gLevel = settings.level;
    if (settings.path.empty()) return true;

    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(settings.path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    s.file.open(settings.path, std::ios::app);
    return s.file.is_open();
}

void Logger::shutdown() {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) s.file.close();
    s.settings.path.clear();
}

void Logger::setLevel(LogLevel level) {
    gLevel = level;
}

LogLevel Logger::getLevel() {
    return gLevel;
}

void Logger::write(LogLevel level, const std::string& category, const std::string& msg) {
    if (level == LogLevel::OFF || level < gLevel.load()) return;

    LogEntry entry{level, category, msg, static_cast<uint64_t>(std::time(nullptr))};
    std::function<void(const LogEntry&)> hook;
    {
        Sink& s = sink();
        std::lock_guard<std::mutex> lock(s.mtx);
        std::string line = formatLine(level, category, msg, static_cast<time_t>(entry.timestamp));
        if (s.settings.console) {
            (level >= LogLevel::WARN ? std::cerr : std::cout) << line;
        }
        if (s.file.is_open()) {
            s.file << line;
            s.file.flush();
            if (s.settings.maxFileSize > 0 &&
                s.file.tellp() > static_cast<std::streampos>(s.settings.maxFileSize)) {
                rotateLocked(s);
            }
        }
        hook = s.hook;
    }
    if (hook) hook(entry);
}

void Logger::onLog(std::function<void(const LogEntry&)> callback) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.hook = std::move(callback);
}

}
}
