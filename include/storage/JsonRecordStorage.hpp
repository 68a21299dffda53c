#pragma once

#include "storage/RecordStorage.hpp"
#include "util/FileLock.hpp"

#include <filesystem>
#include <mutex>

namespace sw::storage {

// Sole writer of `file`. Construction takes an exclusive lock on "<file>.lock"
// and throws util::LockBusy while another instance, in this process or any
// other, still owns the file.
class JsonRecordStorage final : public RecordStorage {
public:
    explicit JsonRecordStorage(std::filesystem::path file);

    std::vector<types::ServiceRecord> loadAll() override;
    void saveAll(const std::vector<types::ServiceRecord>& records) override;
    std::optional<types::ServiceRecord> loadById(const std::string& id) override;

    [[nodiscard]] const std::filesystem::path& file() const { return file_; }

private:
    std::filesystem::path file_;
    util::FileLock owner_;
    std::mutex mutex_;

    std::vector<types::ServiceRecord> readLocked() const;
};

}
