#include "storage/ServiceRecordStore.hpp"
#include "storage/RecordStorage.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace sw::storage;
using namespace sw::types;
using namespace sw::logging;

ServiceRecordStore::ServiceRecordStore(std::shared_ptr<RecordStorage> storage)
    : storage_(std::move(storage)) {
    if (!storage_) throw std::invalid_argument("ServiceRecordStore requires a storage backend");
}

void ServiceRecordStore::load() {
    auto loaded = storage_->loadAll();

    std::scoped_lock lock(mutex_);
    records_.clear();
    for (auto& record : loaded) {
        if (findLocked(record.id)) {
            LogRegistry::store()->warn("[ServiceRecordStore] Skipping duplicate record {}", record.id);
            continue;
        }
        records_.push_back(std::move(record));
    }

    LogRegistry::store()->info("[ServiceRecordStore] Loaded {} services", records_.size());
}

void ServiceRecordStore::persist() {
    std::scoped_lock persistLock(persistMutex_);
    storage_->saveAll(getAll());
}

std::vector<ServiceRecord> ServiceRecordStore::getAll() const {
    std::scoped_lock lock(mutex_);
    return records_;
}

std::optional<ServiceRecord> ServiceRecordStore::get(const std::string& id) const {
    std::scoped_lock lock(mutex_);
    if (const auto* r = findLocked(id)) return *r;
    return std::nullopt;
}

bool ServiceRecordStore::contains(const std::string& id) const {
    std::scoped_lock lock(mutex_);
    return findLocked(id) != nullptr;
}

size_t ServiceRecordStore::size() const {
    std::scoped_lock lock(mutex_);
    return records_.size();
}

void ServiceRecordStore::add(ServiceRecord record) {
    std::scoped_lock lock(mutex_);
    if (findLocked(record.id)) throw std::invalid_argument("Service already exists: " + record.id);
    records_.push_back(std::move(record));
}

bool ServiceRecordStore::remove(const std::string& id) {
    std::scoped_lock lock(mutex_);
    const auto erased = std::erase_if(records_, [&](const ServiceRecord& r) { return r.id == id; });
    return erased > 0;
}

std::optional<ServiceRecord> ServiceRecordStore::setStatus(const std::string& id, const ServiceStatus status) {
    std::scoped_lock lock(mutex_);
    auto* r = findLocked(id);
    if (!r) return std::nullopt;
    r->status = status;
    r->touch();
    return *r;
}

std::optional<ServiceRecord> ServiceRecordStore::compareAndSetStatus(const std::string& id,
                                                                     const ServiceStatus expected,
                                                                     const ServiceStatus desired) {
    std::scoped_lock lock(mutex_);
    auto* r = findLocked(id);
    if (!r || r->status != expected) return std::nullopt;
    r->status = desired;
    r->touch();
    return *r;
}

std::optional<ServiceRecord> ServiceRecordStore::update(const std::string& id,
                                                        const std::function<void(ServiceRecord&)>& mutator) {
    std::scoped_lock lock(mutex_);
    auto* r = findLocked(id);
    if (!r) return std::nullopt;

    ServiceRecord copy = *r;
    mutator(copy);
    if (copy.id != id) throw std::logic_error("Service id is immutable: " + id);

    copy.touch();
    *r = std::move(copy);
    return *r;
}

ServiceRecord* ServiceRecordStore::findLocked(const std::string& id) {
    const auto it = std::ranges::find_if(records_, [&](const ServiceRecord& r) { return r.id == id; });
    return it == records_.end() ? nullptr : &*it;
}

const ServiceRecord* ServiceRecordStore::findLocked(const std::string& id) const {
    const auto it = std::ranges::find_if(records_, [&](const ServiceRecord& r) { return r.id == id; });
    return it == records_.end() ? nullptr : &*it;
}
