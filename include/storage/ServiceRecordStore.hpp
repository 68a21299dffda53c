#pragma once

#include "types/ServiceRecord.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sw::storage {

class RecordStorage;

// Authoritative in-memory collection. Every accessor returns copies.
class ServiceRecordStore {
public:
    explicit ServiceRecordStore(std::shared_ptr<RecordStorage> storage);

    void load();
    void persist();

    [[nodiscard]] std::vector<types::ServiceRecord> getAll() const;
    [[nodiscard]] std::optional<types::ServiceRecord> get(const std::string& id) const;
    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] size_t size() const;

    // Throws std::invalid_argument on duplicate id
    void add(types::ServiceRecord record);
    bool remove(const std::string& id);

    // Bumps updated_at. nullopt if the id is unknown.
    std::optional<types::ServiceRecord> setStatus(const std::string& id, types::ServiceStatus status);

    // Only applies when the current status still equals `expected`
    std::optional<types::ServiceRecord> compareAndSetStatus(const std::string& id,
                                                           types::ServiceStatus expected,
                                                           types::ServiceStatus desired);

    // The mutator may not change the id; throws std::logic_error if it does
    std::optional<types::ServiceRecord> update(const std::string& id,
                                               const std::function<void(types::ServiceRecord&)>& mutator);

private:
    std::shared_ptr<RecordStorage> storage_;

    mutable std::mutex mutex_;
    std::vector<types::ServiceRecord> records_;

    // Held across snapshot + save so writes land in order
    std::mutex persistMutex_;

    types::ServiceRecord* findLocked(const std::string& id);
    const types::ServiceRecord* findLocked(const std::string& id) const;
};

}
