#pragma once

#include <filesystem>
#include <string>

namespace attachq {

/// Exclusive, non-blocking ownership of a queue database across processes.
///
/// Holds flock(LOCK_EX) on a lock file next to the database for as long as
/// it is locked. The kernel drops the lock when the process exits, so a
/// crashed daemon never leaves a stale owner behind. Two QueueLock objects
/// on the same file conflict even within one process.
class QueueLock {
public:
    explicit QueueLock(std::filesystem::path lock_path);
    ~QueueLock();

    QueueLock(const QueueLock&) = delete;
    QueueLock& operator=(const QueueLock&) = delete;

    /// Lock file used for a queue database: "<db_path>.lock".
    static std::filesystem::path for_database(const std::filesystem::path& db_path);

    /// Take the lock without waiting.
    /// Returns error message on failure, empty string on success.
    std::string try_lock();

    void unlock();

    bool locked() const { return fd_ >= 0; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

}  // namespace attachq
