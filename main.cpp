// swctl: command-line front end for servicewarden
//
//   swctl daemon [--events]   owns the service records, runs both monitors and
//                             serves commands on the control socket
//   swctl <command> ...       forwards the command line to the running daemon

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "monitor/BaselineMonitor.hpp"
#include "monitor/PollingCoordinator.hpp"
#include "protocols/shell/Client.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/Server.hpp"
#include "protocols/shell/commands.hpp"
#include "runtime/Manager.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <fmt/format.h>
#include <paths.h>

using namespace sw::config;
using namespace sw::logging;
using namespace sw::shell;

namespace {

// Pulls "--config PATH" out of argv before the router sees it
std::vector<std::string> extractConfigOption(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            sw::paths::setConfigPath(argv[++i]);
            continue;
        }
        if (a.rfind("--config=", 0) == 0) {
            sw::paths::setConfigPath(a.substr(9));
            continue;
        }
        args.push_back(a);
    }
    return args;
}

void loadConfiguration() {
    const auto cfgPath = sw::paths::getConfigPath();
    const Config cfg = std::filesystem::exists(cfgPath) ? loadConfig(cfgPath) : Config{};

    sw::paths::setLogPath(cfg.paths.log_dir);
    sw::paths::setDataPath(cfg.paths.data_dir);
    sw::paths::setServicesPath(cfg.paths.services_dir);
    ConfigRegistry::init(cfg);
}

int runDaemon(const std::vector<std::string>& args) {
    const bool printEvents = std::ranges::find(args, "--events") != args.end();

    // Blocked before any thread exists so every thread inherits the mask and sigwait sees them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    const auto& cfg = ConfigRegistry::get();
    LogRegistry::init(sw::paths::getLogPath());
    LogRegistry::warden()->info("[swctl] Daemon starting with configuration {}", sw::paths::getConfigPath().string());

    // Takes ownership of services.json; a second daemon on the same data dir stops here
    const auto manager = std::make_shared<sw::runtime::Manager>(cfg);

    const auto baselineToken = manager->baselineMonitor()->events().subscribe(
        [printEvents](const sw::monitor::BaselineUpdate& u) {
            for (const auto& r : u.changed) {
                LogRegistry::monitor()->info("[baseline] {} -> {}", r.id, to_string(r.status));
                if (printEvents)
                    std::cout << fmt::format("[baseline] {} {} -> {}", sw::util::timestampToString(sw::util::now()),
                                             r.id, to_string(r.status)) << std::endl;
            }
        });

    const auto pollToken = manager->pollingCoordinator()->events().subscribe(
        [printEvents](const sw::monitor::StatusBatch& b) {
            for (const auto& [id, status] : b.status_updates) {
                LogRegistry::monitor()->debug("[poll] {} -> {}", id, to_string(status));
                if (printEvents)
                    std::cout << fmt::format("[poll] {} {} -> {}", sw::util::timestampToString(sw::util::now()),
                                             id, to_string(status)) << std::endl;
            }
        });

    manager->startAll();

    const auto router = std::make_shared<Router>();
    registerAllCommands(router, manager);

    Server server(router, cfg.daemon.socket_path, cfg.daemon.worker_threads);
    server.start();

    int sig = 0;
    sigwait(&signals, &sig);
    LogRegistry::warden()->info("[swctl] Received signal {}, shutting down", sig);

    server.stop();
    manager->stopAll();
    manager->baselineMonitor()->events().unsubscribe(baselineToken);
    manager->pollingCoordinator()->events().unsubscribe(pollToken);

    LogRegistry::warden()->info("[swctl] Daemon stopped");
    return EXIT_SUCCESS;
}

int forward(const std::vector<std::string>& args) {
    const Client client(ConfigRegistry::get().daemon.socket_path);
    const auto res = client.execute(args, std::filesystem::current_path());

    if (res.has_data) std::cout << res.data.dump(2) << std::endl;
    else if (!res.stdout_text.empty()) std::cout << res.stdout_text;
    if (!res.stderr_text.empty()) std::cerr << res.stderr_text;
    return res.exit_code;
}

}

int main(int argc, char** argv) {
    const auto args = extractConfigOption(argc, argv);

    try {
        loadConfiguration();
        if (!args.empty() && args.front() == "daemon") return runDaemon(args);
        return forward(args);
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::warden()->error("[swctl] {}", e.what());
        std::cerr << "swctl: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
