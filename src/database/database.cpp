#include "database/database.h"
#include "utils/logger.h"
#include <sqlite3.h>
#include <mutex>

namespace sciencefund {
namespace database {

namespace {

class Statement {
public:
    Statement(sqlite3* db, const char* sql) : stmt_(nullptr) {
        if (db) sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool valid() const { return stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

    bool bindText(int idx, const std::string& s) {
        return sqlite3_bind_text(stmt_, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT) == SQLITE_OK;
    }
    bool bindBlob(int idx, const std::vector<uint8_t>& v) {
        return sqlite3_bind_blob(stmt_, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT) == SQLITE_OK;
    }
    int step() { return sqlite3_step(stmt_); }

    std::string columnText(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        int len = sqlite3_column_bytes(stmt_, col);
        if (!text) return std::string();
        return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len));
    }
    std::vector<uint8_t> columnBlob(int col) const {
        const void* blob = sqlite3_column_blob(stmt_, col);
        int blobSize = sqlite3_column_bytes(stmt_, col);
        if (!blob || blobSize <= 0) return {};
        return std::vector<uint8_t>(static_cast<const uint8_t*>(blob),
                                    static_cast<const uint8_t*>(blob) + blobSize);
    }

private:
    sqlite3_stmt* stmt_;
};

// Smallest string greater than every string that starts with prefix.
std::string prefixUpperBound(const std::string& prefix) {
    std::string upper = prefix;
    while (!upper.empty()) {
        unsigned char last = static_cast<unsigned char>(upper.back());
        if (last < 0xFF) {
            upper.back() = static_cast<char>(last + 1);
            return upper;
        }
        upper.pop_back();
    }
    return upper;
}

}

struct WriteBatch::Impl {
    std::vector<std::pair<std::string, std::vector<uint8_t>>> puts;
};

WriteBatch::WriteBatch() : impl_(std::make_unique<Impl>()) {}
WriteBatch::~WriteBatch() = default;

void WriteBatch::put(const std::string& key, const std::vector<uint8_t>& value) {
    impl_->puts.emplace_back(key, value);
}

void WriteBatch::clear() {
    impl_->puts.clear();
}

size_t WriteBatch::size() const {
    return impl_->puts.size();
}

struct Database::Impl {
    sqlite3* db = nullptr;
    std::string lastError;
    mutable std::mutex mtx;

    bool exec(const char* sql) {
        char* errMsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            lastError = errMsg ? errMsg : sqlite3_errstr(rc);
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    }

    void recordError() {
        lastError = db ? sqlite3_errmsg(db) : "database not open";
    }
};

Database::Database() : impl_(std::make_unique<Impl>()) {}

Database::~Database() { close(); }

bool Database::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) return false;

    int rc = sqlite3_open(path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        impl_->recordError();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        LOG_ERROR("db", "open failed for " + path + ": " + impl_->lastError);
        return false;
    }

    if (!impl_->exec("CREATE TABLE IF NOT EXISTS kv (key TEXT PRIMARY KEY, value BLOB) WITHOUT ROWID;")) {
        LOG_ERROR("db", "schema creation failed: " + impl_->lastError);
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    if (path != ":memory:" &&
        !(impl_->exec("PRAGMA journal_mode=WAL;") && impl_->exec("PRAGMA synchronous=FULL;"))) {
        LOG_WARN("db", "pragma setup failed for " + path + ": " + impl_->lastError);
    }

    return true;
}

void Database::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool Database::isOpen() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->db != nullptr;
}

bool Database::put(const std::string& key, const std::vector<uint8_t>& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    Statement stmt(impl_->db, "INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?);");
    if (!stmt.valid() || !stmt.bindText(1, key) || !stmt.bindBlob(2, value)) {
        impl_->recordError();
        return false;
    }
    if (stmt.step() != SQLITE_DONE) {
        impl_->recordError();
        return false;
    }
    return true;
}

bool Database::put(const std::string& key, const std::string& value) {
    return put(key, std::vector<uint8_t>(value.begin(), value.end()));
}

bool Database::get(const std::string& key, std::vector<uint8_t>& out) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    Statement stmt(impl_->db, "SELECT value FROM kv WHERE key = ?;");
    if (!stmt.valid() || !stmt.bindText(1, key)) return false;
    if (stmt.step() != SQLITE_ROW) return false;
    out = stmt.columnBlob(0);
    return true;
}

bool Database::write(WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) {
        impl_->recordError();
        return false;
    }

    if (!impl_->exec("BEGIN IMMEDIATE TRANSACTION;")) return false;

    bool ok = true;
    for (const auto& [key, value] : batch.impl_->puts) {
        Statement stmt(impl_->db, "INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?);");
        if (!stmt.valid() || !stmt.bindText(1, key) || !stmt.bindBlob(2, value) ||
            stmt.step() != SQLITE_DONE) {
            impl_->recordError();
            ok = false;
            break;
        }
    }

    if (!ok) {
        std::string cause = impl_->lastError;
        impl_->exec("ROLLBACK;");
        impl_->lastError = cause;
        LOG_ERROR("db", "batch write rolled back: " + cause);
        return false;
    }

    if (!impl_->exec("COMMIT;")) {
        std::string cause = impl_->lastError;
        impl_->exec("ROLLBACK;");
        impl_->lastError = cause;
        LOG_ERROR("db", "commit failed: " + cause);
        return false;
    }

    batch.clear();
    return true;
}

bool Database::forEach(const std::string& prefix,
                       std::function<bool(const std::string&, const std::vector<uint8_t>&)> fn) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    std::string upper = prefixUpperBound(prefix);
    const char* sql = upper.empty()
        ? "SELECT key, value FROM kv WHERE key >= ? ORDER BY key;"
        : "SELECT key, value FROM kv WHERE key >= ? AND key < ? ORDER BY key;";

    Statement stmt(impl_->db, sql);
    if (!stmt.valid() || !stmt.bindText(1, prefix)) return false;
    if (!upper.empty() && !stmt.bindText(2, upper)) return false;

    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        if (!fn(stmt.columnText(0), stmt.columnBlob(1))) return true;
    }
    return rc == SQLITE_DONE;
}

std::string Database::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->lastError;
}

}
}
