#pragma once

#include <filesystem>
#include <stdexcept>

namespace sw::util {

// Thrown by a TryOnce FileLock when another open file description holds the lock
struct LockBusy : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Exclusive flock(2) on `path`, held until destruction. Works across processes
// and between separate FileLock objects in one process.
class FileLock {
public:
    enum class Mode { Wait, TryOnce };

    explicit FileLock(std::filesystem::path path, Mode mode = Mode::Wait);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

}
