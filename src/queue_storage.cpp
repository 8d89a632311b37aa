#include "attachq/queue_storage.hpp"
#include "attachq/log.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

namespace attachq {

namespace {

constexpr const char* STORAGE_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS kv_store (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL,
    updated_at INTEGER NOT NULL
) WITHOUT ROWID;
)";

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("[queue-storage] SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("[queue-storage] SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

void prepare(sqlite3* db, const char* sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db, sql, -1, stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Cannot prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

int64_t now_epoch_ms() {
    return to_epoch_ms(Clock::now());
}

}  // namespace

QueueStorage::QueueStorage(std::filesystem::path db_path, std::string key)
    : db_path_(std::move(db_path)), key_(std::move(key)) {}

QueueStorage::~QueueStorage() {
    std::lock_guard lock(db_mutex_);
    close();
}

void QueueStorage::close() {
    if (stmt_get_) sqlite3_finalize(stmt_get_);
    if (stmt_put_) sqlite3_finalize(stmt_put_);
    if (stmt_delete_) sqlite3_finalize(stmt_delete_);
    stmt_get_ = stmt_put_ = stmt_delete_ = nullptr;

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool QueueStorage::ensure_open() {
    if (db_) return true;

    try {
        if (db_path_.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(db_path_.parent_path(), ec);
            if (ec) {
                throw std::runtime_error("Cannot create " + db_path_.parent_path().string() +
                                         ": " + ec.message());
            }
        }

        int rc = sqlite3_open(db_path_.c_str(), &db_);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Cannot open queue database: " +
                                     std::string(db_ ? sqlite3_errmsg(db_) : "out of memory"));
        }

        sql_exec(db_, "PRAGMA journal_mode=WAL");
        sql_exec(db_, "PRAGMA synchronous=FULL");
        sql_exec(db_, "PRAGMA busy_timeout=5000");
        if (!sql_exec(db_, STORAGE_SCHEMA)) {
            throw std::runtime_error("Cannot create queue schema");
        }

        prepare(db_, "SELECT value FROM kv_store WHERE key = ?1", &stmt_get_);
        prepare(db_,
                "INSERT OR REPLACE INTO kv_store (key, value, updated_at) VALUES (?1, ?2, ?3)",
                &stmt_put_);
        prepare(db_, "DELETE FROM kv_store WHERE key = ?1", &stmt_delete_);
        return true;
    } catch (const std::exception& e) {
        log_error("[queue-storage] %s (%s)", e.what(), db_path_.c_str());
        close();
        return false;
    }
}

std::optional<std::string> QueueStorage::read_raw() {
    std::lock_guard lock(db_mutex_);
    if (!ensure_open()) return std::nullopt;

    sqlite3_reset(stmt_get_);
    sqlite3_bind_text(stmt_get_, 1, key_.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sql_step_retry(stmt_get_);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) {
        log_error("[queue-storage] Failed to read queue: %s", sqlite3_errmsg(db_));
        return std::nullopt;
    }

    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_get_, 0));
    std::string value = text ? text : "";
    sqlite3_reset(stmt_get_);
    return value;
}

bool QueueStorage::write_raw(const std::string& value) {
    std::lock_guard lock(db_mutex_);
    if (!ensure_open()) return false;

    sqlite3_reset(stmt_put_);
    sqlite3_bind_text(stmt_put_, 1, key_.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_put_, 2, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_put_, 3, now_epoch_ms());
    int rc = sql_step_retry(stmt_put_);
    sqlite3_reset(stmt_put_);
    if (rc != SQLITE_DONE) {
        log_error("[queue-storage] Failed to save queue: %s (rc=%d)", sqlite3_errmsg(db_), rc);
        return false;
    }
    return true;
}

std::vector<QueueItem> QueueStorage::load_queue() {
    auto raw = read_raw();
    if (!raw || raw->empty()) return {};

    try {
        auto j = nlohmann::json::parse(*raw);
        PersistedQueue persisted;
        from_json(j, persisted);

        if (persisted.version != kPersistedQueueVersion) {
            return migrate(persisted);
        }
        return std::move(persisted.items);
    } catch (const std::exception& e) {
        log_error("[queue-storage] Failed to load queue: %s", e.what());
        return {};
    }
}

bool QueueStorage::save_queue(const std::vector<QueueItem>& items) {
    std::string serialized;
    try {
        PersistedQueue persisted;
        persisted.items = items;
        nlohmann::json j = persisted;
        serialized = j.dump();
    } catch (const std::exception& e) {
        log_error("[queue-storage] Failed to serialize queue: %s", e.what());
        return false;
    }
    return write_raw(serialized);
}

bool QueueStorage::clear_queue() {
    std::lock_guard lock(db_mutex_);
    if (!ensure_open()) return false;

    sqlite3_reset(stmt_delete_);
    sqlite3_bind_text(stmt_delete_, 1, key_.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sql_step_retry(stmt_delete_);
    sqlite3_reset(stmt_delete_);
    if (rc != SQLITE_DONE) {
        log_error("[queue-storage] Failed to clear queue: %s (rc=%d)", sqlite3_errmsg(db_), rc);
        return false;
    }
    return true;
}

// Only version 1 exists; anything else is reset rather than coerced.
std::vector<QueueItem> QueueStorage::migrate(const PersistedQueue& persisted) {
    log_warn("[queue-storage] Unknown queue version %d, resetting", persisted.version);
    return {};
}

}  // namespace attachq
