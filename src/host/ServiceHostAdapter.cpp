#include "host/ServiceHostAdapter.hpp"
#include "host/HostConfig.hpp"
#include "config/Config.hpp"
#include "control/ServiceControl.hpp"
#include "process/Runner.hpp"
#include "types/ServiceRecord.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <thread>
#include <fmt/format.h>

using namespace sw::host;
using namespace sw::types;
using namespace sw::control;
using namespace sw::process;
using namespace sw::logging;
using namespace std::chrono;
namespace fs = std::filesystem;

namespace {

milliseconds since(const steady_clock::time_point start) {
    return duration_cast<milliseconds>(steady_clock::now() - start);
}

void makeExecutable(const fs::path& p) {
    fs::permissions(p, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add);
}

}

ServiceHostAdapter::Options ServiceHostAdapter::Options::fromConfig(const config::Config& cfg) {
    Options o;
    o.services_dir = cfg.paths.services_dir;
    o.host_binary = cfg.host_tool.template_path;
    o.wrapper_template = cfg.host_tool.wrapper_template_path;
    o.install_timeout = duration_cast<milliseconds>(cfg.host_tool.install_timeout);
    o.command_timeout = duration_cast<milliseconds>(cfg.host_tool.command_timeout);
    o.cleanup_retries = cfg.host_tool.cleanup_retries;
    o.cleanup_retry_delay = cfg.host_tool.cleanup_retry_delay;
    o.status_wait_timeout = duration_cast<milliseconds>(cfg.service_control.status_wait_timeout);
    o.status_poll_interval = cfg.service_control.status_poll_interval;
    return o;
}

ServiceHostAdapter::ServiceHostAdapter(Options options,
                                       std::shared_ptr<Runner> runner,
                                       std::shared_ptr<ServiceControl> control)
    : options_(std::move(options)), runner_(std::move(runner)), control_(std::move(control)) {
    if (!runner_ || !control_) throw std::invalid_argument("ServiceHostAdapter requires a runner and a service control");
}

ServiceStatus ServiceHostAdapter::toServiceStatus(const ControlState state) {
    switch (state) {
        case ControlState::Running: return ServiceStatus::Running;
        case ControlState::Stopped: return ServiceStatus::Stopped;
        case ControlState::StartPending: return ServiceStatus::Starting;
        case ControlState::StopPending: return ServiceStatus::Stopping;
        case ControlState::Paused: return ServiceStatus::Paused;
        case ControlState::PausePending: return ServiceStatus::Stopping;
        case ControlState::ContinuePending: return ServiceStatus::Starting;
        case ControlState::NotFound: return ServiceStatus::NotInstalled;
    }
    return ServiceStatus::Error;
}

ServiceStatus ServiceHostAdapter::queryStatus(const std::string& id) {
    try {
        return toServiceStatus(control_->query(id));
    } catch (const std::exception& e) {
        LogRegistry::control()->warn("[ServiceHostAdapter] Status query failed for {}: {}", id, e.what());
        return ServiceStatus::Error;
    }
}

// ---- install / uninstall ----

void ServiceHostAdapter::stage(const ServiceRecord& record, const Sandbox& box) const {
    if (!fs::is_regular_file(options_.host_binary))
        throw std::runtime_error("Service-host binary not found: " + options_.host_binary.string());

    fs::create_directories(box.logsDirectory());

    fs::copy_file(options_.host_binary, box.hostBinary(), fs::copy_options::overwrite_existing);
    makeExecutable(box.hostBinary());

    util::touchFile(box.stdoutLog());
    util::touchFile(box.stderrLog());

    writeConfig(record, box);
}

void ServiceHostAdapter::writeConfig(const ServiceRecord& record, const Sandbox& box) const {
    if (record.restart_on_exit.enabled) {
        if (!fs::is_regular_file(options_.wrapper_template))
            throw std::runtime_error("Wrapper script template not found: " + options_.wrapper_template.string());
        fs::copy_file(options_.wrapper_template, box.wrapperScript(), fs::copy_options::overwrite_existing);
        makeExecutable(box.wrapperScript());
    }

    util::writeFileAtomic(box.configFile(), renderHostConfig(record, box));
}

OperationResult ServiceHostAdapter::install(const ServiceRecord& record) {
    const auto started = steady_clock::now();
    const auto box = sandbox(record.id);

    try {
        stage(record, box);
    } catch (const std::exception& e) {
        LogRegistry::host()->error("[ServiceHostAdapter] Staging failed for {}: {}", record.id, e.what());
        removeSandbox(box);
        return OperationResult::fail(OperationType::Install, ErrorKind::Internal,
                                     "Failed to prepare service directory", e.what(), since(started));
    }

    LogRegistry::host()->info("[ServiceHostAdapter] Installing {} from {}", record.id, box.directory().string());

    auto res = runHostTool(OperationType::Install, box, "install", options_.install_timeout);
    res.elapsed = since(started);
    if (res) res.message = fmt::format("Service '{}' installed", record.display_name);
    return res;
}

OperationResult ServiceHostAdapter::uninstall(const ServiceRecord& record) {
    const auto started = steady_clock::now();
    const auto box = sandbox(record.id);

    const auto current = queryStatus(record.id);
    if (current != ServiceStatus::Stopped && current != ServiceStatus::NotInstalled) {
        if (auto stopped = stop(record.id); !stopped) {
            stopped.operation = OperationType::Uninstall;
            stopped.message = "Failed to stop service before uninstall: " + stopped.message;
            stopped.elapsed = since(started);
            return stopped;
        }
    }

    std::error_code ec;
    if (fs::exists(box.hostBinary(), ec)) {
        if (auto res = runHostTool(OperationType::Uninstall, box, "uninstall", options_.command_timeout); !res) {
            res.elapsed = since(started);
            return res;
        }
    } else if (ec) {
        return OperationResult::fail(OperationType::Uninstall, ErrorKind::Internal,
                                     "Cannot inspect service directory", ec.message(), since(started));
    } else {
        LogRegistry::host()->warn("[ServiceHostAdapter] No host binary for {}, skipping host uninstall", record.id);
    }

    if (!removeSandbox(box)) {
        auto res = OperationResult::ok(OperationType::Uninstall,
                                       fmt::format("Service '{}' uninstalled", record.display_name), since(started));
        res.detail = "Service directory could not be removed: " + box.directory().string();
        return res;
    }

    return OperationResult::ok(OperationType::Uninstall,
                               fmt::format("Service '{}' uninstalled", record.display_name), since(started));
}

OperationResult ServiceHostAdapter::reconfigure(const ServiceRecord& record) {
    const auto started = steady_clock::now();
    const auto box = sandbox(record.id);

    try {
        if (!box.exists())
            return OperationResult::ok(OperationType::Update, "No service directory to reconfigure", since(started));
        writeConfig(record, box);
    } catch (const std::exception& e) {
        LogRegistry::host()->error("[ServiceHostAdapter] Failed to rewrite configuration for {}: {}", record.id, e.what());
        return OperationResult::fail(OperationType::Update, ErrorKind::Internal,
                                     "Failed to write service configuration", e.what(), since(started));
    }

    return OperationResult::ok(OperationType::Update, "Service configuration rewritten", since(started));
}

OperationResult ServiceHostAdapter::runHostTool(const OperationType op, const Sandbox& box,
                                                const std::string& verb, const milliseconds timeout) const {
    Invocation inv;
    inv.executable = box.hostBinary();
    inv.args = {verb};
    inv.working_directory = box.directory();
    inv.timeout = timeout;

    ProcessResult res;
    try {
        res = runner_->run(inv);
    } catch (const std::exception& e) {
        LogRegistry::host()->error("[ServiceHostAdapter] {} {} could not be run: {}", box.id(), verb, e.what());
        return OperationResult::fail(op, ErrorKind::ExternalTool,
                                     fmt::format("Failed to run service host for {}", verb), e.what());
    }

    LogRegistry::host()->info("[ServiceHostAdapter] {} {} -> exit {} in {} ms",
                              box.id(), verb, res.exit_code, res.elapsed.count());

    if (!res.launched)
        return OperationResult::fail(op, ErrorKind::ExternalTool,
                                     fmt::format("Failed to launch service host for {}", verb), res.error, res.elapsed);

    if (res.timed_out)
        return OperationResult::fail(op, ErrorKind::Timeout,
                                     fmt::format("Service host {} timed out after {} ms", verb, timeout.count()),
                                     res.diagnostics(), res.elapsed);

    if (res.exit_code != 0)
        return OperationResult::fail(op, ErrorKind::ExternalTool,
                                     fmt::format("Service host {} failed with exit code {}", verb, res.exit_code),
                                     res.diagnostics(), res.elapsed);

    return OperationResult::ok(op, "", res.elapsed);
}

bool ServiceHostAdapter::removeSandbox(const Sandbox& box) const {
    const unsigned int attempts = std::max(1u, options_.cleanup_retries);

    for (unsigned int i = 0; i < attempts; ++i) {
        std::error_code ec;
        fs::remove_all(box.directory(), ec);
        if (!ec && !fs::exists(box.directory(), ec)) return true;

        LogRegistry::host()->debug("[ServiceHostAdapter] Cleanup attempt {} for {} failed: {}",
                                   i + 1, box.directory().string(), ec.message());
        if (i + 1 < attempts) std::this_thread::sleep_for(options_.cleanup_retry_delay);
    }

    LogRegistry::host()->warn("[ServiceHostAdapter] Could not remove {}", box.directory().string());
    return false;
}

// ---- start / stop ----

OperationResult ServiceHostAdapter::start(const std::string& id) {
    const auto started = steady_clock::now();

    ControlResult res;
    try {
        res = control_->start(id);
    } catch (const std::exception& e) {
        return OperationResult::fail(OperationType::Start, ErrorKind::ExternalTool,
                                     "Service control start failed", e.what(), since(started));
    }

    if (res.not_found)
        return OperationResult::fail(OperationType::Start, ErrorKind::ExternalTool,
                                     "Service is not installed", res.message, since(started));
    if (res.timed_out)
        return OperationResult::fail(OperationType::Start, ErrorKind::Timeout,
                                     "Service control start timed out", res.message, since(started));
    if (!res.ok)
        return OperationResult::fail(OperationType::Start, ErrorKind::ExternalTool,
                                     "Service control start failed", res.message, since(started));

    return waitForStatus(OperationType::Start, id, {ServiceStatus::Running}, started);
}

OperationResult ServiceHostAdapter::stop(const std::string& id) {
    const auto started = steady_clock::now();

    ControlResult res;
    try {
        res = control_->stop(id);
    } catch (const std::exception& e) {
        return OperationResult::fail(OperationType::Stop, ErrorKind::ExternalTool,
                                     "Service control stop failed", e.what(), since(started));
    }

    if (res.not_found) return OperationResult::ok(OperationType::Stop, "Service is not installed", since(started));
    if (res.timed_out)
        return OperationResult::fail(OperationType::Stop, ErrorKind::Timeout,
                                     "Service control stop timed out", res.message, since(started));
    if (!res.ok)
        return OperationResult::fail(OperationType::Stop, ErrorKind::ExternalTool,
                                     "Service control stop failed", res.message, since(started));

    return waitForStatus(OperationType::Stop, id, {ServiceStatus::Stopped, ServiceStatus::NotInstalled}, started);
}

OperationResult ServiceHostAdapter::restart(const std::string& id) {
    const auto started = steady_clock::now();

    if (auto stopped = stop(id); !stopped) {
        stopped.operation = OperationType::Restart;
        stopped.elapsed = since(started);
        return stopped;
    }

    auto res = start(id);
    res.operation = OperationType::Restart;
    res.elapsed = since(started);
    if (res) res.message = "Service restarted";
    return res;
}

OperationResult ServiceHostAdapter::waitForStatus(const OperationType op, const std::string& id,
                                                  const std::initializer_list<ServiceStatus> accepted,
                                                  const steady_clock::time_point started) {
    const auto deadline = steady_clock::now() + options_.status_wait_timeout;
    auto last = ServiceStatus::Error;

    while (true) {
        last = queryStatus(id);
        if (std::ranges::find(accepted, last) != accepted.end())
            return OperationResult::ok(op, fmt::format("Service is {}", to_string(last)), since(started));

        if (steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(options_.status_poll_interval);
    }

    LogRegistry::host()->warn("[ServiceHostAdapter] {} did not reach target status, last seen {}", id, to_string(last));
    return OperationResult::fail(op, ErrorKind::Timeout,
                                 fmt::format("Timed out after {} ms waiting for service", options_.status_wait_timeout.count()),
                                 "Last observed status: " + to_string(last), since(started));
}
