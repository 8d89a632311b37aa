#pragma once

#include "attachq/queue_types.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward declarations
struct sqlite3;
struct sqlite3_stmt;

namespace attachq {

/// Storage key the queue snapshot lives under.
constexpr const char* kDefaultQueueStorageKey = "attachq/upload-queue";

/// Durable key-value persistence of the full queue snapshot.
///
/// Backed by a single-table SQLite database (WAL, synchronous=FULL). Each
/// save replaces the whole PersistedQueue envelope in one statement, so a
/// reader never observes a half-written queue.
///
/// None of the public operations throw. Load failures degrade to an empty
/// queue; save and clear failures are logged and reported through the
/// return value. The database is opened lazily and reopened after a failed
/// open, so a transient problem (missing directory, locked file) does not
/// disable persistence for the rest of the session.
class QueueStorage {
public:
    explicit QueueStorage(std::filesystem::path db_path,
                          std::string key = kDefaultQueueStorageKey);
    ~QueueStorage();

    QueueStorage(const QueueStorage&) = delete;
    QueueStorage& operator=(const QueueStorage&) = delete;

    /// Load queue items. Returns an empty vector when nothing is stored, the
    /// record is unreadable, or its version is unknown (logged as a warning).
    std::vector<QueueItem> load_queue();

    /// Replace the stored snapshot. Returns false on failure (already logged).
    bool save_queue(const std::vector<QueueItem>& items);

    /// Remove the stored snapshot. Returns false on failure (already logged).
    bool clear_queue();

    /// Raw stored record, or nullopt if absent/unreadable. Used by tooling and tests.
    std::optional<std::string> read_raw();

    /// Store a raw record verbatim. Used by tooling and tests.
    bool write_raw(const std::string& value);

    const std::filesystem::path& path() const { return db_path_; }

private:
    bool ensure_open();
    void close();

    std::vector<QueueItem> migrate(const PersistedQueue& persisted);

    std::filesystem::path db_path_;
    std::string key_;

    std::mutex db_mutex_;  // Protects db_ and prepared statement usage
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_get_ = nullptr;
    sqlite3_stmt* stmt_put_ = nullptr;
    sqlite3_stmt* stmt_delete_ = nullptr;
};

}  // namespace attachq
