#pragma once
#include <string>
#include <filesystem>
#include <spdlog/spdlog.h>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#endif

namespace term_coder {

// Root-scoped advisory lock (<root>/.term-coder/apply.lock) held for the
// duration of one apply. Non-blocking: a busy lock leaves acquired() false.
// The kernel drops the flock if the holder dies, so no stale-lock cleanup.
class ApplyLock {
public:
    explicit ApplyLock(const std::filesystem::path& root) {
        path_ = root / ".term-coder" / "apply.lock";
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            spdlog::error("🔒 Cannot create lock directory {}: {}", path_.parent_path().string(), ec.message());
            return;
        }
#ifndef _WIN32
        fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            spdlog::error("🔒 Cannot open lock file {}", path_.string());
            return;
        }
        if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) {
            acquired_ = true;
        } else {
            spdlog::warn("🔒 Another apply holds {}", path_.string());
            ::close(fd_);
            fd_ = -1;
        }
#else
        acquired_ = true;
#endif
    }

    ~ApplyLock() {
#ifndef _WIN32
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
#endif
    }

    ApplyLock(const ApplyLock&) = delete;
    ApplyLock& operator=(const ApplyLock&) = delete;

    bool acquired() const { return acquired_; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
    bool acquired_ = false;
};

}
