#pragma once

#include "concurrency/AsyncService.hpp"
#include "events/EventChannel.hpp"
#include "types/ServiceStatus.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace sw::concurrency { class ThreadPool; }
namespace sw::host { class ServiceHostAdapter; }

namespace sw::monitor {

struct StatusBatch {
    std::map<std::string, types::ServiceStatus> status_updates;
};

// Fast follow-up polling for services in transition. The ticker idles with no
// deadline while nothing is tracked.
class PollingCoordinator final : public concurrency::AsyncService {
public:
    struct Options {
        std::chrono::milliseconds max_tracked{30000};
        unsigned int max_concurrent_queries = 5;
    };

    PollingCoordinator(std::shared_ptr<host::ServiceHostAdapter> adapter, Options options);
    ~PollingCoordinator() override;

    // Re-tracking a pending id refreshes its start time
    void trackService(const std::string& id);

    // One synchronous tick: query every pending id, drop settled or expired
    // entries, publish the batch
    void tickOnce();

    [[nodiscard]] bool isTimerActive() const;
    [[nodiscard]] std::optional<std::chrono::milliseconds> currentInterval() const;
    [[nodiscard]] size_t pendingCount() const;
    [[nodiscard]] bool isTracking(const std::string& id) const;

    events::EventChannel<StatusBatch>& events() { return events_; }

    static std::optional<std::chrono::milliseconds> intervalFor(size_t pending);

protected:
    void runLoop() override;

private:
    std::shared_ptr<host::ServiceHostAdapter> adapter_;
    Options options_;
    std::unique_ptr<concurrency::ThreadPool> pool_;
    events::EventChannel<StatusBatch> events_{"PollingCoordinator"};

    mutable std::mutex mutex_;
    std::map<std::string, std::chrono::steady_clock::time_point> pending_;
    std::optional<std::chrono::milliseconds> interval_;

    std::mutex tickMutex_;

    void recomputeLocked();
};

}
