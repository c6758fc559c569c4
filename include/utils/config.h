#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace sciencefund {
namespace utils {

struct PlatformConfig {
    std::string owner;
    uint64_t feeBps = 250;
    std::string feeRecipient;
    std::vector<std::string> verifiers;
};

struct LedgerConfig {
    std::string dataDir;
    std::string dbFile = "ledger.db";
    std::string logLevel = "info";
    std::string logFile = "sciencefund.log";
    bool logConsole = false;
    uint64_t logMaxSize = 10 * 1024 * 1024;
    uint32_t logMaxFiles = 5;

    std::string dbPath() const;
    std::string logPath() const;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path);
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    uint64_t getUint64(const std::string& key, uint64_t def = 0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, uint64_t value);
    void set(const std::string& key, bool value);
    void setList(const std::string& key, const std::vector<std::string>& values);

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;

    // Owner falls back to "owner", fee recipient to the owner.
    PlatformConfig getPlatformConfig() const;
    LedgerConfig getLedgerConfig() const;
    void setPlatformConfig(const PlatformConfig& config);

    void onChange(std::function<void(const std::string&)> callback);

    std::string getDataDir() const;
    std::string getConfigPath() const;
    void setDataDir(const std::string& path);

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
