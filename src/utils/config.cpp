#include "utils/config.h"
#include "utils/utils.h"
#include <map>
#include <fstream>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <mutex>

namespace sciencefund {
namespace utils {

static std::string joinPath(const std::string& dir, const std::string& file) {
    if (file.empty() || file[0] == '/' || dir.empty()) return file;
    if (file == ":memory:") return file;
    return dir.back() == '/' ? dir + file : dir + "/" + file;
}

std::string LedgerConfig::dbPath() const {
    return joinPath(dataDir, dbFile);
}

std::string LedgerConfig::logPath() const {
    return joinPath(dataDir, logFile);
}

struct Config::Impl {
    std::map<std::string, std::string> data;
    std::string configPath;
    std::string dataDir;
    std::function<void(const std::string&)> changeCallback;
    mutable std::mutex mtx;

    void setLocked(const std::string& key, const std::string& value) {
        data[key] = value;
    }

    bool lookup(const std::string& key, std::string& out) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = data.find(key);
        if (it == data.end()) return false;
        out = it->second;
        return true;
    }

    // A null value erases the key. The change hook runs after the lock is released.
    void update(const std::string& key, const std::string* value) {
        std::function<void(const std::string&)> hook;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (value) data[key] = *value;
            else data.erase(key);
            hook = changeCallback;
        }
        if (hook) hook(key);
    }

    void defaults() {
        setLocked("platform.owner", "owner");
        setLocked("platform.fee_bps", "250");
        setLocked("platform.fee_recipient", "");
        setLocked("platform.verifiers", "");
        setLocked("ledger.db_file", "ledger.db");
        setLocked("log.level", "info");
        setLocked("log.file", "sciencefund.log");
        setLocked("log.console", "false");
        setLocked("log.max_size", "10485760");
        setLocked("log.max_files", "5");
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    const char* home = std::getenv("HOME");
    if (home) {
        impl_->dataDir = std::string(home) + "/.sciencefund";
    } else {
        impl_->dataDir = ".sciencefund";
    }
    impl_->defaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

void Config::reset() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data.clear();
    impl_->configPath.clear();
    impl_->defaults();
}

bool Config::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    for (std::string raw; std::getline(in, raw);) {
        std::string line = Formatter::trim(raw);
        size_t eq = line.find('=');
        if (line.empty() || line[0] == '#' || eq == std::string::npos) continue;
        std::string key = Formatter::trim(line.substr(0, eq));
        if (!key.empty()) impl_->setLocked(key, Formatter::trim(line.substr(eq + 1)));
    }
    return true;
}

// Keys are written sorted, with a blank line between top-level sections.
bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const std::string& target = path.empty() ? impl_->configPath : path;
    if (target.empty()) return false;

    std::ofstream out(target);
    if (!out) return false;
    out << "# ScienceFund ledger configuration\n";

    std::string section = "\x01";
    for (const auto& entry : impl_->data) {
        std::string current = entry.first.substr(0, entry.first.find('.'));
        if (current != section) out << "\n";
        section = current;
        out << entry.first << "=" << entry.second << "\n";
    }
    return static_cast<bool>(out);
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::string value;
    return impl_->lookup(key, value) ? value : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::string value;
    if (!impl_->lookup(key, value)) return def;
    bool negative = !value.empty() && value[0] == '-';
    uint64_t magnitude = 0;
    if (!Formatter::parseUint64(negative ? value.substr(1) : value, magnitude)) return def;
    if (magnitude > static_cast<uint64_t>(std::numeric_limits<int>::max())) return def;
    int result = static_cast<int>(magnitude);
    return negative ? -result : result;
}

uint64_t Config::getUint64(const std::string& key, uint64_t def) const {
    std::string value;
    uint64_t result = 0;
    if (!impl_->lookup(key, value) || !Formatter::parseUint64(value, result)) return def;
    return result;
}

bool Config::getBool(const std::string& key, bool def) const {
    std::string value;
    if (!impl_->lookup(key, value)) return def;
    for (auto& c : value) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::string value;
    if (!impl_->lookup(key, value)) return {};
    return Formatter::split(value, ',');
}

void Config::set(const std::string& key, const std::string& value) {
    impl_->update(key, &value);
}

void Config::set(const std::string& key, const char* value) {
    set(key, std::string(value ? value : ""));
}

void Config::set(const std::string& key, int value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, uint64_t value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, bool value) {
    set(key, std::string(value ? "true" : "false"));
}

void Config::setList(const std::string& key, const std::vector<std::string>& values) {
    set(key, Formatter::join(values, ","));
}

bool Config::has(const std::string& key) const {
    std::string ignored;
    return impl_->lookup(key, ignored);
}

void Config::remove(const std::string& key) {
    impl_->update(key, nullptr);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (auto it = impl_->data.lower_bound(prefix);
         it != impl_->data.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
        result.push_back(it->first);
    }
    return result;
}

PlatformConfig Config::getPlatformConfig() const {
    PlatformConfig cfg;
    cfg.owner = getString("platform.owner", "owner");
    if (cfg.owner.empty()) cfg.owner = "owner";
    cfg.feeBps = getUint64("platform.fee_bps", 250);
    cfg.feeRecipient = getString("platform.fee_recipient", "");
    if (cfg.feeRecipient.empty()) cfg.feeRecipient = cfg.owner;
    cfg.verifiers = getList("platform.verifiers");
    return cfg;
}

LedgerConfig Config::getLedgerConfig() const {
    LedgerConfig cfg;
    cfg.dataDir = getDataDir();
    cfg.dbFile = getString("ledger.db_file", "ledger.db");
    cfg.logLevel = getString("log.level", "info");
    cfg.logFile = getString("log.file", "sciencefund.log");
    cfg.logConsole = getBool("log.console", false);
    cfg.logMaxSize = getUint64("log.max_size", cfg.logMaxSize);
    cfg.logMaxFiles = static_cast<uint32_t>(getUint64("log.max_files", cfg.logMaxFiles));
    return cfg;
}

void Config::setPlatformConfig(const PlatformConfig& cfg) {
    set("platform.owner", cfg.owner);
    set("platform.fee_bps", cfg.feeBps);
    set("platform.fee_recipient", cfg.feeRecipient);
    setList("platform.verifiers", cfg.verifiers);
}

void Config::onChange(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->changeCallback = callback;
}

std::string Config::getDataDir() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->dataDir;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

void Config::setDataDir(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->dataDir = path;
}

}
}
