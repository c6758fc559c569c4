#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace sciencefund {
namespace database {

class WriteBatch {
public:
    WriteBatch();
    ~WriteBatch();
    void put(const std::string& key, const std::vector<uint8_t>& value);
    void clear();
    size_t size() const;
private:
    friend class Database;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Single-table key/value store on SQLite. All methods are thread safe.
class Database {
public:
    Database();
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // ":memory:" opens a private in-memory database.
    bool open(const std::string& path);
    void close();
    bool isOpen() const;

    bool put(const std::string& key, const std::vector<uint8_t>& value);
    bool put(const std::string& key, const std::string& value);
    bool get(const std::string& key, std::vector<uint8_t>& out) const;

    // Applies every put in one SQLite transaction, or none of them.
    bool write(WriteBatch& batch);

    // Visits keys starting with prefix in key order; fn returns false to stop.
    bool forEach(const std::string& prefix,
                 std::function<bool(const std::string&, const std::vector<uint8_t>&)> fn) const;

    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
