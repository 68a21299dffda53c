#include "monitor/BaselineMonitor.hpp"
#include "host/ServiceHostAdapter.hpp"
#include "lifecycle/InFlightRegistry.hpp"
#include "storage/ServiceRecordStore.hpp"
#include "logging/LogRegistry.hpp"

using namespace sw::monitor;
using namespace sw::types;
using namespace sw::logging;

BaselineMonitor::BaselineMonitor(std::shared_ptr<storage::ServiceRecordStore> store,
                                 std::shared_ptr<host::ServiceHostAdapter> adapter,
                                 std::shared_ptr<lifecycle::InFlightRegistry> inflight,
                                 const std::chrono::milliseconds interval)
    : AsyncService("BaselineMonitor"),
      store_(std::move(store)),
      adapter_(std::move(adapter)),
      inflight_(std::move(inflight)),
      interval_(interval) {
    if (!store_ || !adapter_ || !inflight_)
        throw std::invalid_argument("BaselineMonitor requires a store, a host adapter and an in-flight registry");
}

BaselineMonitor::~BaselineMonitor() {
    stop();
}

std::vector<ServiceRecord> BaselineMonitor::sweep() {
    std::vector<ServiceRecord> changed;

    for (const auto& record : store_->getAll()) {
        if (inflight_->isBusy(record.id)) continue;

        const auto live = adapter_->queryStatus(record.id);
        if (live == record.status) continue;

        // Loses to any operation that touched the record since the snapshot
        if (auto updated = store_->compareAndSetStatus(record.id, record.status, live)) {
            LogRegistry::monitor()->debug("[BaselineMonitor] {} {} -> {}",
                                          record.id, to_string(record.status), to_string(live));
            changed.push_back(std::move(*updated));
        }
    }

    if (changed.empty()) return changed;

    try {
        store_->persist();
    } catch (const std::exception& e) {
        LogRegistry::monitor()->error("[BaselineMonitor] Failed to persist sweep results: {}", e.what());
    }

    events_.publish(BaselineUpdate{changed});
    return changed;
}

void BaselineMonitor::runLoop() {
    while (!shouldStop()) {
        try {
            sweep();
        } catch (const std::exception& e) {
            LogRegistry::monitor()->error("[BaselineMonitor] Sweep failed: {}", e.what());
        }
        lazySleep(interval_);
    }
}
