#include "util/FileLock.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <fmt/format.h>

using namespace sw::util;

FileLock::FileLock(std::filesystem::path p, const Mode mode) : path_(std::move(p)) {
    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path());

    fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0)
        throw std::runtime_error(fmt::format("FileLock: open {} failed: {}", path_.string(), std::strerror(errno)));

    const int op = mode == Mode::TryOnce ? LOCK_EX | LOCK_NB : LOCK_EX;
    int rc;
    do {
        rc = ::flock(fd_, op);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        const int err = errno;
        ::close(fd_);
        fd_ = -1;
        if (err == EWOULDBLOCK) throw LockBusy(fmt::format("{} is held by another process", path_.string()));
        throw std::runtime_error(fmt::format("FileLock: flock {} failed: {}", path_.string(), std::strerror(err)));
    }
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}
