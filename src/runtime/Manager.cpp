#include "runtime/Manager.hpp"
#include "concurrency/AsyncService.hpp"
#include "control/SystemdControl.hpp"
#include "host/ServiceHostAdapter.hpp"
#include "lifecycle/InFlightRegistry.hpp"
#include "lifecycle/Orchestrator.hpp"
#include "monitor/BaselineMonitor.hpp"
#include "monitor/PollingCoordinator.hpp"
#include "process/ForkRunner.hpp"
#include "security/PathGuard.hpp"
#include "storage/JsonRecordStorage.hpp"
#include "storage/ServiceRecordStore.hpp"
#include "logging/LogRegistry.hpp"

using namespace std::chrono;

namespace sw::runtime {

namespace {

security::PathGuard pathGuardFrom(const config::SecurityConfig& cfg) {
    security::PathGuard::Options opts;
    opts.max_length = cfg.max_path_length;
    if (!cfg.allowed_root.empty()) opts.allowed_root = cfg.allowed_root;
    return security::PathGuard(opts);
}

}

Manager::Manager(const config::Config& cfg)
    : Manager(cfg, std::make_shared<process::ForkRunner>(), nullptr) {}

Manager::Manager(const config::Config& cfg,
                 std::shared_ptr<process::Runner> runner,
                 std::shared_ptr<control::ServiceControl> control) {
    if (!runner) runner = std::make_shared<process::ForkRunner>();
    if (!control) control = std::make_shared<control::SystemdControl>(runner, cfg.service_control);

    store_ = std::make_shared<storage::ServiceRecordStore>(
        std::make_shared<storage::JsonRecordStorage>(cfg.paths.data_dir / "services.json"));

    adapter_ = std::make_shared<host::ServiceHostAdapter>(
        host::ServiceHostAdapter::Options::fromConfig(cfg), runner, control);

    inflight_ = std::make_shared<lifecycle::InFlightRegistry>();

    monitor::PollingCoordinator::Options pollOpts;
    pollOpts.max_tracked = duration_cast<milliseconds>(cfg.monitoring.polling_max_tracked);
    pollOpts.max_concurrent_queries = cfg.monitoring.polling_max_concurrent_queries;
    pollingCoordinator_ = std::make_shared<monitor::PollingCoordinator>(adapter_, pollOpts);

    baselineMonitor_ = std::make_shared<monitor::BaselineMonitor>(
        store_, adapter_, inflight_, duration_cast<milliseconds>(cfg.monitoring.baseline_interval));

    orchestrator_ = std::make_shared<lifecycle::Orchestrator>(
        store_, adapter_, inflight_, pollingCoordinator_, lifecycle::RequestValidator(pathGuardFrom(cfg.security)));

    services_["BaselineMonitor"] = baselineMonitor_;
    services_["PollingCoordinator"] = pollingCoordinator_;
}

Manager::~Manager() {
    stopAll();
}

void Manager::load() {
    std::scoped_lock lock(mutex_);
    if (loaded_) return;
    store_->load();
    loaded_ = true;
}

void Manager::startAll() {
    load();

    logging::LogRegistry::warden()->debug("[Manager] Starting all services...");
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [name, svc] : services_) tryStart(name, svc);
    }

    // Anything persisted mid-transition gets fast follow-up right away
    for (const auto& r : store_->getAll())
        if (types::isTransitioning(r.status)) pollingCoordinator_->trackService(r.id);

    logging::LogRegistry::warden()->debug("[Manager] All services started.");
}

void Manager::stopAll() {
    logging::LogRegistry::warden()->debug("[Manager] Stopping all services...");
    std::scoped_lock lock(mutex_);
    for (const auto& [name, svc] : services_) stopService(name, svc);
    logging::LogRegistry::warden()->debug("[Manager] All services stopped.");
}

bool Manager::allRunning() const {
    std::scoped_lock lock(mutex_);
    for (const auto& [_, svc] : services_)
        if (!svc->isRunning()) return false;
    return true;
}

void Manager::tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc || svc->isRunning()) return;
    logging::LogRegistry::warden()->debug("[Manager] Starting service: {}", name);
    svc->start();
}

void Manager::stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc || !svc->isRunning()) return;
    logging::LogRegistry::warden()->debug("[Manager] Stopping service: {}", name);
    svc->stop();
}

}
