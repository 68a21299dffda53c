#include "lifecycle/Orchestrator.hpp"
#include "lifecycle/InFlightRegistry.hpp"
#include "lifecycle/TransitionScope.hpp"
#include "host/ServiceHostAdapter.hpp"
#include "monitor/PollingCoordinator.hpp"
#include "security/CommandGuard.hpp"
#include "storage/ServiceRecordStore.hpp"
#include "types/ServiceRequest.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace sw::lifecycle;
using namespace sw::types;
using namespace sw::logging;
using namespace std::chrono;
namespace fs = std::filesystem;

namespace {

fs::path absoluteFrom(const fs::path& p) {
    if (p.empty() || p.is_absolute()) return p;
    std::error_code ec;
    auto abs = fs::absolute(p, ec);
    return ec ? p : abs;
}

milliseconds since(const steady_clock::time_point start) {
    return duration_cast<milliseconds>(steady_clock::now() - start);
}

OperationResult busy(const OperationType op, const std::string& id) {
    return OperationResult::fail(op, ErrorKind::Conflict,
                                 fmt::format("Another operation is in progress for service {}", id));
}

OperationResult notFound(const OperationType op, const std::string& id) {
    return OperationResult::fail(op, ErrorKind::NotFound, fmt::format("Service {} not found", id));
}

OperationResult illegal(const OperationType op, const ServiceStatus status) {
    return OperationResult::fail(op, ErrorKind::Conflict,
                                 fmt::format("Cannot {} a service that is {}", to_string(op), to_string(status)));
}

}

Orchestrator::Orchestrator(std::shared_ptr<storage::ServiceRecordStore> store,
                           std::shared_ptr<host::ServiceHostAdapter> adapter,
                           std::shared_ptr<InFlightRegistry> inflight,
                           std::shared_ptr<monitor::PollingCoordinator> coordinator,
                           RequestValidator validator)
    : store_(std::move(store)),
      adapter_(std::move(adapter)),
      inflight_(std::move(inflight)),
      coordinator_(std::move(coordinator)),
      validator_(std::move(validator)) {
    if (!store_ || !adapter_ || !inflight_ || !coordinator_)
        throw std::invalid_argument("Orchestrator requires a store, host adapter, in-flight registry and coordinator");
}

ServiceRequest Orchestrator::withAbsolutePaths(const ServiceRequest& request) {
    ServiceRequest out = request;
    out.executable_path = absoluteFrom(request.executable_path);
    if (out.script_path) out.script_path = absoluteFrom(*out.script_path);
    out.working_directory = absoluteFrom(request.working_directory);
    return out;
}

void Orchestrator::applyRequest(ServiceRecord& record, const ServiceRequest& request) {
    const auto req = withAbsolutePaths(request);

    record.display_name = req.display_name;
    if (req.description && !req.description->empty()) record.description = *req.description;
    record.executable_path = req.executable_path.lexically_normal();
    record.script_path = req.script_path && !req.script_path->empty()
                             ? std::optional<fs::path>(req.script_path->lexically_normal())
                             : std::nullopt;
    record.arguments = security::CommandGuard::sanitize(req.arguments);
    record.working_directory = req.working_directory.empty()
                                   ? record.executable_path.parent_path()
                                   : req.working_directory.lexically_normal();
    record.dependencies = req.dependencies;
    record.environment_variables = req.environment_variables;
    record.service_account = req.service_account;
    record.start_mode = startModeFromString(req.start_mode);
    record.stop_timeout_ms = req.stop_timeout_ms;
    record.restart_on_exit = req.restart_on_exit;
}

ServiceStatus Orchestrator::transition(const std::string& id, const ServiceStatus to) {
    const auto updated = store_->setStatus(id, to);
    if (!updated) throw std::runtime_error("Service record vanished during operation: " + id);
    LogRegistry::lifecycle()->debug("[Orchestrator] {} -> {}", id, to_string(to));
    return to;
}

void Orchestrator::persist(OperationResult& result) {
    try {
        store_->persist();
    } catch (const std::exception& e) {
        LogRegistry::lifecycle()->error("[Orchestrator] Failed to persist service metadata: {}", e.what());
        const std::string note = fmt::format("Service metadata was not saved: {}", e.what());
        result.detail = result.detail ? *result.detail + "; " + note : note;
    }
}

void Orchestrator::track(const std::string& id) {
    coordinator_->trackService(id);
}

OperationResult Orchestrator::guarded(const OperationType op, const std::string& id,
                                      const std::function<OperationResult()>& body) {
    const auto started = steady_clock::now();
    LogRegistry::lifecycle()->info("[Orchestrator] {} {} requested", to_string(op), id);

    OperationResult res;
    try {
        res = body();
    } catch (const std::exception& e) {
        LogRegistry::lifecycle()->error("[Orchestrator] {} {} failed unexpectedly: {}", to_string(op), id, e.what());
        res = OperationResult::fail(op, ErrorKind::Internal, "Unexpected error", e.what());
    }

    res.operation = op;
    res.elapsed = since(started);

    if (res) LogRegistry::lifecycle()->info("[Orchestrator] {} {} succeeded in {} ms", to_string(op), id, res.elapsed.count());
    else LogRegistry::lifecycle()->warn("[Orchestrator] {} {} failed ({}): {}",
                                        to_string(op), id, to_string(res.kind), res.message);
    return res;
}

// ---- create / update ----

Result<ServiceRecord> Orchestrator::create(const ServiceRequest& raw) {
    const auto request = withAbsolutePaths(raw);
    ServiceRecord record;
    record.id = generateServiceId();
    std::optional<ServiceRecord> value;

    auto outcome = guarded(OperationType::Install, record.id, [&]() -> OperationResult {
        if (auto errors = validator_.validate(request, record.id, store_->getAll()); !errors.empty())
            return OperationResult::invalid(OperationType::Install, std::move(errors));

        applyRequest(record, request);
        record.status = ServiceStatus::NotInstalled;
        record.created_at = record.updated_at = util::now();

        auto lease = inflight_->tryAcquire(record.id);
        if (!lease) return busy(OperationType::Install, record.id);

        store_->add(record);
        TransitionScope scope(store_, record.id, ServiceStatus::Error);
        transition(record.id, ServiceStatus::Installing);

        auto installed = adapter_->install(record);
        if (!installed) {
            if (installed.kind == ErrorKind::Internal) {
                // Nothing reached the host tool: roll back completely
                store_->remove(record.id);
            } else {
                transition(record.id, ServiceStatus::Error);
                value = store_->get(record.id);
            }
            persist(installed);
            return installed;
        }

        scope.checkpoint(transition(record.id, ServiceStatus::Stopped));

        if (request.auto_start) {
            transition(record.id, ServiceStatus::Starting);
            if (auto started = adapter_->start(record.id); !started) {
                transition(record.id, ServiceStatus::Stopped);
                value = store_->get(record.id);
                auto res = OperationResult::fail(OperationType::Install, started.kind,
                                                 "Service installed but failed to start: " + started.message,
                                                 started.detail);
                persist(res);
                track(record.id);
                return res;
            }
            transition(record.id, ServiceStatus::Running);
        }

        auto res = OperationResult::ok(OperationType::Install,
                                       fmt::format("Service '{}' created", record.display_name));
        persist(res);
        value = store_->get(record.id);
        track(record.id);
        return res;
    });

    return {std::move(outcome), std::move(value)};
}

Result<ServiceRecord> Orchestrator::update(const std::string& id, const ServiceRequest& raw) {
    const auto request = withAbsolutePaths(raw);
    std::optional<ServiceRecord> value;

    auto outcome = guarded(OperationType::Update, id, [&]() -> OperationResult {
        auto lease = inflight_->tryAcquire(id);
        if (!lease) return busy(OperationType::Update, id);

        const auto current = store_->get(id);
        if (!current) return notFound(OperationType::Update, id);
        if (!canUpdate(current->status)) return illegal(OperationType::Update, current->status);

        if (auto errors = validator_.validate(request, id, store_->getAll()); !errors.empty())
            return OperationResult::invalid(OperationType::Update, std::move(errors));

        ServiceRecord candidate = *current;
        applyRequest(candidate, request);

        if (auto res = adapter_->reconfigure(candidate); !res) return res;

        value = store_->update(id, [&](ServiceRecord& r) {
            const auto status = r.status;
            const auto created = r.created_at;
            r = candidate;
            r.status = status;
            r.created_at = created;
        });

        auto res = OperationResult::ok(OperationType::Update, fmt::format("Service '{}' updated", candidate.display_name));
        if (value && value->status == ServiceStatus::Running)
            res.message += "; changes take effect at the next restart";
        persist(res);
        return res;
    });

    return {std::move(outcome), std::move(value)};
}

// ---- start / stop / restart ----

OperationResult Orchestrator::start(const std::string& id) {
    return guarded(OperationType::Start, id, [&]() -> OperationResult {
        auto lease = inflight_->tryAcquire(id);
        if (!lease) return busy(OperationType::Start, id);

        const auto current = store_->get(id);
        if (!current) return notFound(OperationType::Start, id);

        const auto prior = current->status;
        if (!canStart(prior)) return illegal(OperationType::Start, prior);

        TransitionScope scope(store_, id, prior);
        transition(id, ServiceStatus::Starting);
        auto res = adapter_->start(id);
        transition(id, res ? ServiceStatus::Running : prior);
        persist(res);

        if (res) track(id);
        return res;
    });
}

OperationResult Orchestrator::stop(const std::string& id) {
    return guarded(OperationType::Stop, id, [&]() -> OperationResult {
        auto lease = inflight_->tryAcquire(id);
        if (!lease) return busy(OperationType::Stop, id);

        const auto current = store_->get(id);
        if (!current) return notFound(OperationType::Stop, id);

        const auto prior = current->status;
        if (!canStop(prior)) return illegal(OperationType::Stop, prior);

        TransitionScope scope(store_, id, prior);
        transition(id, ServiceStatus::Stopping);
        auto res = adapter_->stop(id);
        transition(id, res ? ServiceStatus::Stopped : prior);
        persist(res);

        if (res) track(id);
        return res;
    });
}

OperationResult Orchestrator::restart(const std::string& id) {
    return guarded(OperationType::Restart, id, [&]() -> OperationResult {
        auto lease = inflight_->tryAcquire(id);
        if (!lease) return busy(OperationType::Restart, id);

        const auto current = store_->get(id);
        if (!current) return notFound(OperationType::Restart, id);

        const auto prior = current->status;
        if (!canStop(prior)) return illegal(OperationType::Restart, prior);

        TransitionScope scope(store_, id, prior);
        transition(id, ServiceStatus::Stopping);
        if (auto stopped = adapter_->stop(id); !stopped) {
            // Nothing destructive happened, the service is still as it was
            transition(id, prior);
            persist(stopped);
            return stopped;
        }

        scope.checkpoint(transition(id, ServiceStatus::Stopped));
        transition(id, ServiceStatus::Starting);

        auto started = adapter_->start(id);
        transition(id, started ? ServiceStatus::Running : ServiceStatus::Stopped);
        if (started) started.message = "Service restarted";
        persist(started);

        track(id);
        return started;
    });
}

// ---- uninstall ----

OperationResult Orchestrator::uninstall(const std::string& id) {
    return guarded(OperationType::Uninstall, id, [&]() -> OperationResult {
        auto lease = inflight_->tryAcquire(id);
        if (!lease) return busy(OperationType::Uninstall, id);

        const auto current = store_->get(id);
        if (!current) return notFound(OperationType::Uninstall, id);

        auto status = current->status;
        TransitionScope scope(store_, id, status);

        if (status == ServiceStatus::Running) {
            transition(id, ServiceStatus::Stopping);
            if (auto stopped = adapter_->stop(id); !stopped) {
                transition(id, ServiceStatus::Running);
                stopped.message = "Failed to stop service before uninstall: " + stopped.message;
                persist(stopped);
                return stopped;
            }
            status = transition(id, ServiceStatus::Stopped);
            scope.checkpoint(status);
        }

        if (!canUninstall(status)) return illegal(OperationType::Uninstall, status);

        transition(id, ServiceStatus::Uninstalling);
        auto res = adapter_->uninstall(*current);

        if (res) {
            store_->remove(id);
            pruneDependents(id, res);
        } else {
            transition(id, ServiceStatus::Error);
        }

        persist(res);
        return res;
    });
}

void Orchestrator::pruneDependents(const std::string& removed, OperationResult& result) {
    for (const auto& record : store_->getAll()) {
        if (std::ranges::find(record.dependencies, removed) == record.dependencies.end()) continue;

        const auto updated = store_->update(record.id, [&](ServiceRecord& r) { std::erase(r.dependencies, removed); });
        if (!updated) continue;
        LogRegistry::lifecycle()->info("[Orchestrator] Dropped dependency {} from {}", removed, record.id);

        // A busy dependent keeps its current host configuration until its next update
        auto lease = inflight_->tryAcquire(record.id);
        if (!lease) continue;

        if (const auto rewritten = adapter_->reconfigure(*updated); !rewritten) {
            const auto note = fmt::format("Could not rewrite configuration of dependent {}: {}", record.id, rewritten.message);
            result.detail = result.detail ? *result.detail + "; " + note : note;
        }
    }
}

// ---- queries ----

std::vector<ServiceRecord> Orchestrator::getAll() const {
    return store_->getAll();
}

std::optional<ServiceRecord> Orchestrator::get(const std::string& id) const {
    return store_->get(id);
}

ServiceStatus Orchestrator::getStatus(const std::string& id) {
    const auto record = store_->get(id);
    if (!record) return ServiceStatus::NotInstalled;
    if (inflight_->isBusy(id)) return record->status;
    return adapter_->queryStatus(id);
}
