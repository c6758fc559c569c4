#include "utils/utils.h"
#include <sstream>
#include <ctime>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace sciencefund {
namespace utils {

std::string Formatter::formatAmount(uint64_t amount) {
    std::string str = std::to_string(amount);
    int insertPosition = static_cast<int>(str.length()) - 3;
    while (insertPosition > 0) { str.insert(insertPosition, ","); insertPosition -= 3; }
    return str;
}

// 250 -> "2.50%"
std::string Formatter::formatBps(uint64_t bps) {
    std::string frac = std::to_string(bps % 100);
    if (frac.size() < 2) frac = "0" + frac;
    return std::to_string(bps / 100) + "." + frac + "%";
}

std::string Formatter::formatTimestamp(uint64_t timestamp) {
    time_t ts = static_cast<time_t>(timestamp);
    struct tm tmBuf;
    gmtime_r(&ts, &tmBuf);
    char buf[64];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tmBuf);
    return std::string(buf);
}

std::string Formatter::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> Formatter::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream ss(str);
    std::string part;
    while (std::getline(ss, part, delimiter)) {
        part = trim(part);
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

std::string Formatter::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

bool Formatter::parseUint64(const std::string& str, uint64_t& out) {
    if (str.empty() || str.size() > 20) return false;
    for (unsigned char c : str) {
        if (!std::isdigit(c)) return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(str.c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0') return false;
    out = static_cast<uint64_t>(v);
    return true;
}

}
}
