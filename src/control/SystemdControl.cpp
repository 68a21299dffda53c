#include "control/SystemdControl.hpp"
#include "process/Runner.hpp"
#include "logging/LogRegistry.hpp"

#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

using namespace sw::control;
using namespace sw::process;
using namespace sw::logging;

namespace sw::control {

std::string to_string(const ControlState state) {
    switch (state) {
        case ControlState::Running: return "running";
        case ControlState::Stopped: return "stopped";
        case ControlState::StartPending: return "start_pending";
        case ControlState::StopPending: return "stop_pending";
        case ControlState::Paused: return "paused";
        case ControlState::PausePending: return "pause_pending";
        case ControlState::ContinuePending: return "continue_pending";
        case ControlState::NotFound: return "not_found";
        default: return "unknown";
    }
}

}

// systemctl exit code for "unit not loaded / no such unit"
static constexpr int SYSTEMCTL_EXIT_NO_UNIT = 5;

SystemdControl::SystemdControl(std::shared_ptr<Runner> runner, config::ServiceControlConfig cfg)
    : runner_(std::move(runner)), cfg_(std::move(cfg)) {
    if (!runner_) throw std::invalid_argument("SystemdControl requires a process runner");
}

std::string SystemdControl::unitName(const std::string& name) const {
    return name + cfg_.unit_suffix;
}

ProcessResult SystemdControl::systemctl(std::vector<std::string> args) const {
    Invocation inv;
    inv.executable = cfg_.systemctl_path;
    inv.args = std::move(args);
    inv.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.command_timeout);
    return runner_->run(inv);
}

ControlState SystemdControl::parseShowOutput(const std::string_view output) {
    std::string loadState, activeState;

    std::istringstream in{std::string(output)};
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        const auto key = line.substr(0, eq);
        const auto value = line.substr(eq + 1);
        if (key == "LoadState") loadState = value;
        else if (key == "ActiveState") activeState = value;
    }

    if (loadState == "not-found") return ControlState::NotFound;
    if (activeState == "active" || activeState == "reloading") return ControlState::Running;
    if (activeState == "inactive" || activeState == "failed") return ControlState::Stopped;
    if (activeState == "activating") return ControlState::StartPending;
    if (activeState == "deactivating") return ControlState::StopPending;

    throw std::runtime_error(fmt::format("Unrecognized unit state LoadState='{}' ActiveState='{}'",
                                         loadState, activeState));
}

ControlState SystemdControl::query(const std::string& name) {
    const auto res = systemctl({"show", "-p", "LoadState,ActiveState", "--", unitName(name)});

    if (!res.launched) throw std::runtime_error("Failed to launch systemctl: " + res.error);
    if (res.timed_out) throw std::runtime_error("systemctl show timed out for " + unitName(name));
    if (res.exit_code != 0)
        throw std::runtime_error(fmt::format("systemctl show exited with {}: {}", res.exit_code, res.diagnostics()));

    return parseShowOutput(res.stdout_text);
}

ControlResult SystemdControl::start(const std::string& name) { return transition("start", name); }

ControlResult SystemdControl::stop(const std::string& name) { return transition("stop", name); }

ControlResult SystemdControl::transition(const std::string& verb, const std::string& name) {
    const auto unit = unitName(name);
    const auto res = systemctl({verb, "--no-block", "--", unit});

    ControlResult out;
    if (!res.launched) {
        out.message = "Failed to launch systemctl: " + res.error;
    } else if (res.timed_out) {
        out.timed_out = true;
        out.message = fmt::format("systemctl {} timed out for {}", verb, unit);
    } else if (res.exit_code == SYSTEMCTL_EXIT_NO_UNIT) {
        out.not_found = true;
        out.message = fmt::format("Unit {} not found", unit);
    } else if (res.exit_code != 0) {
        out.message = fmt::format("systemctl {} {} exited with {}: {}", verb, unit, res.exit_code, res.diagnostics());
    } else {
        out.ok = true;
    }

    if (!out.ok) LogRegistry::control()->warn("[SystemdControl] {}", out.message);
    return out;
}
