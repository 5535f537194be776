#pragma once

#include <filesystem>
#ifdef __unix__
#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace layerstore {

// Shared advisory lock on an existing file for readers (best-effort, non-blocking).
// Unix: flock on the file itself. Elsewhere: no-op that reports unlocked.
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& target)
        : target_(target) {
        acquire();
    }

    ~FileLock() { release(); }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return locked_; }

private:
    void acquire();
    void release();

    std::filesystem::path target_;
    bool locked_{false};
#ifdef __unix__
    int fd_{-1};
#endif
};

// ---- Implementation ----

inline void FileLock::acquire() {
#ifdef __unix__
    fd_ = ::open(target_.c_str(), O_RDONLY);
    if (fd_ < 0) return;
    if (::flock(fd_, LOCK_SH | LOCK_NB) == 0) {
        locked_ = true;
        return;
    }
    ::close(fd_);
    fd_ = -1;
#endif
}

inline void FileLock::release() {
#ifdef __unix__
    if (fd_ >= 0) {
        if (locked_) ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
#endif
    locked_ = false;
}

}  // namespace layerstore
