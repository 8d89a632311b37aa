#include "attachq/queue_lock.hpp"
#include "attachq/log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/file.h>
#include <unistd.h>
#include <utility>

namespace attachq {

QueueLock::QueueLock(std::filesystem::path lock_path) : path_(std::move(lock_path)) {}

QueueLock::~QueueLock() {
    unlock();
}

std::filesystem::path QueueLock::for_database(const std::filesystem::path& db_path) {
    auto p = db_path;
    p += ".lock";
    return p;
}

std::string QueueLock::try_lock() {
    if (fd_ >= 0) return "";

    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return "Cannot open lock file " + path_.string() + ": " + std::strerror(errno);
    }
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return "Queue " + path_.string() + " is in use by another attachq process";
        }
        return "Cannot lock " + path_.string() + ": " + std::strerror(err);
    }

    // Owner pid, for humans inspecting the file
    std::string pid = std::to_string(getpid()) + "\n";
    if (::ftruncate(fd, 0) != 0 || ::write(fd, pid.data(), pid.size()) < 0) {
        log_debug("[queue-lock] Could not record pid in %s", path_.c_str());
    }

    fd_ = fd;
    return "";
}

void QueueLock::unlock() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

}  // namespace attachq
