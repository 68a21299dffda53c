#include "protocols/shell/commands.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/Table.hpp"
#include "util/shellArgsHelpers.hpp"
#include "util/timestamp.hpp"
#include "runtime/Manager.hpp"
#include "lifecycle/Orchestrator.hpp"
#include "types/ServiceRequest.hpp"
#include "logging/LogRegistry.hpp"

#include <filesystem>
#include <fmt/format.h>

using namespace sw::types;
using namespace sw::logging;

namespace sw::shell {

namespace {

CommandResult render(const CommandCall& call, const OperationResult& res,
                     const std::optional<ServiceRecord>& record = std::nullopt) {
    if (hasFlag(call, "json")) {
        nlohmann::json j = res;
        if (record) j["service"] = *record;
        CommandResult out{res.success ? 0 : 1, "", "", j, true};
        if (res.kind == ErrorKind::Validation) out.exit_code = 2;
        return out;
    }

    std::string text = res.message;
    if (record) text += fmt::format("\n  id:     {}\n  status: {}", record->id, to_string(record->status));
    if (res.detail) text += "\n  detail: " + *res.detail;
    for (const auto& e : res.field_errors) text += fmt::format("\n  - {}: {}", e.field, e.message);
    text += fmt::format("\n  ({} ms)\n", res.elapsed.count());

    if (res.success) return {0, text, "", {}, false};
    return {res.kind == ErrorKind::Validation ? 2 : 1, "", text, {}, false};
}

// Relative paths mean relative to where swctl was run, not to the daemon
std::filesystem::path callerPath(const CommandCall& call, const std::string& value) {
    std::filesystem::path p(value);
    if (p.empty() || p.is_absolute() || call.cwd.empty()) return p;
    return call.cwd / p;
}

std::optional<std::string> requireId(const CommandCall& call) {
    if (call.positionals.empty()) return std::nullopt;
    return call.positionals.front();
}

// Overlays command-line options onto `req`. Returns an error message on malformed input.
std::optional<std::string> applyOptions(ServiceRequest& req, const CommandCall& call) {
    if (const auto v = optVal(call, "name")) req.display_name = *v;
    if (const auto v = optVal(call, "description")) req.description = *v;
    if (const auto v = optVal(call, "exe")) req.executable_path = callerPath(call, *v);
    if (const auto v = optVal(call, "script")) req.script_path = callerPath(call, *v);
    if (const auto v = optVal(call, "args")) req.arguments = *v;
    if (const auto v = optVal(call, "workdir")) req.working_directory = callerPath(call, *v);
    if (const auto v = optVal(call, "account")) req.service_account = *v;
    if (const auto v = optVal(call, "start-mode")) req.start_mode = *v;
    if (const auto v = optVal(call, "depends")) req.dependencies = splitList(*v);

    for (const auto& kv : optVals(call, "env")) {
        const auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) return fmt::format("--env expects NAME=VALUE, got '{}'", kv);
        req.environment_variables[kv.substr(0, eq)] = kv.substr(eq + 1);
    }

    if (const auto v = optVal(call, "stop-timeout")) {
        const auto n = parseInt(*v);
        if (!n || *n < 0) return "--stop-timeout expects a non-negative number of milliseconds";
        req.stop_timeout_ms = static_cast<unsigned int>(*n);
    }

    if (hasFlag(call, "restart-on-exit")) req.restart_on_exit.enabled = true;
    if (const auto v = optVal(call, "restart-exit-code")) {
        const auto n = parseInt(*v);
        if (!n) return "--restart-exit-code expects a number";
        req.restart_on_exit.enabled = true;
        req.restart_on_exit.exit_code = *n;
    }

    if (hasFlag(call, "no-autostart")) req.auto_start = false;
    return std::nullopt;
}

ServiceRequest requestFrom(const ServiceRecord& r) {
    ServiceRequest req;
    req.display_name = r.display_name;
    req.description = r.description;
    req.executable_path = r.executable_path;
    req.script_path = r.script_path;
    req.arguments = r.arguments;
    req.working_directory = r.working_directory;
    req.dependencies = r.dependencies;
    req.environment_variables = r.environment_variables;
    req.service_account = r.service_account;
    req.start_mode = to_string(r.start_mode);
    req.stop_timeout_ms = r.stop_timeout_ms;
    req.restart_on_exit = r.restart_on_exit;
    return req;
}

CommandResult handleList(const std::shared_ptr<runtime::Manager>& m, const CommandCall& call) {
    m->load();
    const auto records = m->orchestrator()->getAll();

    if (hasFlag(call, "json")) return okJson(nlohmann::json(records), "");
    if (records.empty()) return ok("No services.");

    Table t({{"ID"}, {"NAME", Align::Left, 40}, {"STATUS"}, {"START"}, {"EXECUTABLE", Align::Left, 50}, {"UPDATED"}});
    for (const auto& r : records)
        t.add_row({r.id, r.display_name, to_string(r.status), to_string(r.start_mode),
                   r.executable_path.string(), util::timestampToString(r.updated_at)});
    return ok(t.render());
}

CommandResult handleStatus(const std::shared_ptr<runtime::Manager>& m, const CommandCall& call) {
    const auto id = requireId(call);
    if (!id) return invalid("usage: swctl status <id>");

    m->load();
    const auto status = m->orchestrator()->getStatus(*id);
    const auto record = m->orchestrator()->get(*id);

    if (hasFlag(call, "json")) {
        nlohmann::json j = {{"id", *id}, {"status", to_string(status)}};
        if (record) j["service"] = *record;
        return okJson(j, "");
    }

    if (!record) return ok(fmt::format("{}: {}", *id, to_string(status)));
    return ok(fmt::format("{} ({}): {}", record->display_name, *id, to_string(status)));
}

CommandResult handleCreate(const std::shared_ptr<runtime::Manager>& m, const CommandCall& call) {
    ServiceRequest req;
    if (const auto err = applyOptions(req, call)) return invalid(*err);

    m->load();
    const auto res = m->orchestrator()->create(req);
    return render(call, res.outcome, res.value);
}

CommandResult handleUpdate(const std::shared_ptr<runtime::Manager>& m, const CommandCall& call) {
    const auto id = requireId(call);
    if (!id) return invalid("usage: swctl update <id> [options]");

    m->load();
    const auto current = m->orchestrator()->get(*id);
    if (!current) return render(call, OperationResult::fail(OperationType::Update, ErrorKind::NotFound,
                                                            fmt::format("Service {} not found", *id)));

    auto req = requestFrom(*current);
    if (const auto err = applyOptions(req, call)) return invalid(*err);

    const auto res = m->orchestrator()->update(*id, req);
    return render(call, res.outcome, res.value);
}

template <typename Op>
CommandResult handleSimple(const std::shared_ptr<runtime::Manager>& m, const CommandCall& call,
                           const std::string& verb, Op op) {
    const auto id = requireId(call);
    if (!id) return invalid(fmt::format("usage: swctl {} <id>", verb));

    m->load();
    const auto res = op(*m->orchestrator(), *id);
    return render(call, res, m->orchestrator()->get(*id));
}

}

void registerServiceCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<runtime::Manager>& manager) {
    r->registerCommand("list", "list", "List managed services",
                       [manager](const CommandCall& c) { return handleList(manager, c); }, {"ls"});

    r->registerCommand("status", "status <id>", "Show the live status of a service",
                       [manager](const CommandCall& c) { return handleStatus(manager, c); });

    r->registerCommand("create",
                       "create --name N --exe PATH [--script PATH] [--args A] [--workdir DIR] [--description D] "
                       "[--depends id,id] [--env K=V]... [--account U] [--start-mode M] [--stop-timeout MS] "
                       "[--restart-on-exit] [--restart-exit-code N] [--no-autostart]",
                       "Install a new service (started unless --no-autostart)",
                       [manager](const CommandCall& c) { return handleCreate(manager, c); }, {"add", "install"});

    r->registerCommand("update", "update <id> [create options]", "Change a service's configuration",
                       [manager](const CommandCall& c) { return handleUpdate(manager, c); }, {"edit"});

    r->registerCommand("start", "start <id>", "Start a service", [manager](const CommandCall& c) {
        return handleSimple(manager, c, "start", [](lifecycle::Orchestrator& o, const std::string& id) { return o.start(id); });
    });

    r->registerCommand("stop", "stop <id>", "Stop a service", [manager](const CommandCall& c) {
        return handleSimple(manager, c, "stop", [](lifecycle::Orchestrator& o, const std::string& id) { return o.stop(id); });
    });

    r->registerCommand("restart", "restart <id>", "Stop then start a service", [manager](const CommandCall& c) {
        return handleSimple(manager, c, "restart", [](lifecycle::Orchestrator& o, const std::string& id) { return o.restart(id); });
    });

    r->registerCommand("uninstall", "uninstall <id>", "Stop, uninstall and remove a service", [manager](const CommandCall& c) {
        return handleSimple(manager, c, "uninstall", [](lifecycle::Orchestrator& o, const std::string& id) { return o.uninstall(id); });
    }, {"rm", "remove"});

    LogRegistry::shell()->debug("[shell] Service commands registered");
}

}
