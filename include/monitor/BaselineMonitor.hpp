#pragma once

#include "concurrency/AsyncService.hpp"
#include "events/EventChannel.hpp"
#include "types/ServiceRecord.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace sw::host { class ServiceHostAdapter; }
namespace sw::lifecycle { class InFlightRegistry; }
namespace sw::storage { class ServiceRecordStore; }

namespace sw::monitor {

struct BaselineUpdate {
    std::vector<types::ServiceRecord> changed;
};

// Low-frequency full-fleet reconciliation. Backstop for anything the
// polling coordinator misses.
class BaselineMonitor final : public concurrency::AsyncService {
public:
    BaselineMonitor(std::shared_ptr<storage::ServiceRecordStore> store,
                    std::shared_ptr<host::ServiceHostAdapter> adapter,
                    std::shared_ptr<lifecycle::InFlightRegistry> inflight,
                    std::chrono::milliseconds interval = std::chrono::seconds(5));
    ~BaselineMonitor() override;

    // Returns the records changed by this sweep
    std::vector<types::ServiceRecord> sweep();

    events::EventChannel<BaselineUpdate>& events() { return events_; }

    [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }

protected:
    void runLoop() override;

private:
    std::shared_ptr<storage::ServiceRecordStore> store_;
    std::shared_ptr<host::ServiceHostAdapter> adapter_;
    std::shared_ptr<lifecycle::InFlightRegistry> inflight_;
    std::chrono::milliseconds interval_;
    events::EventChannel<BaselineUpdate> events_{"BaselineMonitor"};
};

}
