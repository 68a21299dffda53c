#pragma once

#include "config/Config.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace sw::concurrency { class AsyncService; }
namespace sw::control { class ServiceControl; }
namespace sw::host { class ServiceHostAdapter; }
namespace sw::lifecycle { class InFlightRegistry; class Orchestrator; }
namespace sw::monitor { class BaselineMonitor; class PollingCoordinator; }
namespace sw::process { class Runner; }
namespace sw::storage { class ServiceRecordStore; }

namespace sw::runtime {

// Builds every component from configuration and hands them to each other explicitly
class Manager {
public:
    explicit Manager(const config::Config& cfg);

    Manager(const config::Config& cfg,
            std::shared_ptr<process::Runner> runner,
            std::shared_ptr<control::ServiceControl> control);

    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // Loads persisted records. Throws when the metadata file is unreadable.
    void load();

    // load(), starting both monitors, then tracking records persisted mid-transition
    void startAll();
    void stopAll();

    [[nodiscard]] bool allRunning() const;

    [[nodiscard]] std::shared_ptr<lifecycle::Orchestrator> orchestrator() const { return orchestrator_; }
    [[nodiscard]] std::shared_ptr<storage::ServiceRecordStore> store() const { return store_; }
    [[nodiscard]] std::shared_ptr<host::ServiceHostAdapter> adapter() const { return adapter_; }
    [[nodiscard]] std::shared_ptr<monitor::BaselineMonitor> baselineMonitor() const { return baselineMonitor_; }
    [[nodiscard]] std::shared_ptr<monitor::PollingCoordinator> pollingCoordinator() const { return pollingCoordinator_; }

private:
    std::shared_ptr<storage::ServiceRecordStore> store_;
    std::shared_ptr<host::ServiceHostAdapter> adapter_;
    std::shared_ptr<lifecycle::InFlightRegistry> inflight_;
    std::shared_ptr<monitor::PollingCoordinator> pollingCoordinator_;
    std::shared_ptr<monitor::BaselineMonitor> baselineMonitor_;
    std::shared_ptr<lifecycle::Orchestrator> orchestrator_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<concurrency::AsyncService>> services_;
    bool loaded_{false};

    static void tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);
    static void stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);
};

}
