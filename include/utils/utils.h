#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace sciencefund {
namespace utils {

class Formatter {
public:
    static std::string formatAmount(uint64_t amount);
    static std::string formatBps(uint64_t bps);
    static std::string formatTimestamp(uint64_t timestamp);
    static std::string trim(const std::string& str);
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static bool parseUint64(const std::string& str, uint64_t& out);
};

}
}
