#include "lifecycle/TransitionScope.hpp"
#include "storage/ServiceRecordStore.hpp"
#include "logging/LogRegistry.hpp"

#include <exception>

using namespace sw::lifecycle;
using namespace sw::types;
using namespace sw::logging;

TransitionScope::TransitionScope(std::shared_ptr<storage::ServiceRecordStore> store, std::string id,
                                 const ServiceStatus lastGood)
    : store_(std::move(store)), id_(std::move(id)), lastGood_(lastGood), uncaught_(std::uncaught_exceptions()) {}

TransitionScope::~TransitionScope() {
    if (std::uncaught_exceptions() > uncaught_) settle();
}

ServiceStatus TransitionScope::settledStatus(const ServiceStatus current, const ServiceStatus lastGood) {
    switch (current) {
        case ServiceStatus::Installing:
        case ServiceStatus::Uninstalling:
            return ServiceStatus::Error;
        case ServiceStatus::Starting:
        case ServiceStatus::Stopping:
            return isTransitioning(lastGood) ? ServiceStatus::Error : lastGood;
        default:
            return current;
    }
}

void TransitionScope::settle() const {
    try {
        const auto record = store_->get(id_);
        if (!record || !isTransitioning(record->status)) return;

        const auto target = settledStatus(record->status, lastGood_);
        store_->setStatus(id_, target);
        LogRegistry::lifecycle()->warn("[TransitionScope] {} left {} by an unexpected error, now {}",
                                       id_, to_string(record->status), to_string(target));
        store_->persist();
    } catch (const std::exception& e) {
        LogRegistry::lifecycle()->error("[TransitionScope] Could not settle {}: {}", id_, e.what());
    }
}
