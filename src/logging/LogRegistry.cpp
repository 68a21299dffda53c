#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace sw::logging {

void LogRegistry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;
    if (!fs::exists(logDir)) fs::create_directories(logDir);

    const auto log_file = logDir / "servicewarden.log";

    const auto& cnf = config::ConfigRegistry::get().logging;
    const auto& sub_levels = cnf.levels.subsystem_levels;

    const auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(cnf.levels.console_log_level);
    consoleSink->set_color_mode(spdlog::color_mode::automatic);
    consoleSink->set_pattern(LOG_FORMAT);

    const auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file.string(), main_max_bytes_, main_max_files_);
    rotatingSink->set_level(cnf.levels.file_log_level);
    rotatingSink->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, spdlog::sinks_init_list{consoleSink, rotatingSink});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    makeLogger("warden", sub_levels.warden);
    makeLogger("guard", sub_levels.guard);
    makeLogger("store", sub_levels.store);
    makeLogger("host", sub_levels.host);
    makeLogger("control", sub_levels.control);
    makeLogger("lifecycle", sub_levels.lifecycle);
    makeLogger("monitor", sub_levels.monitor);
    makeLogger("shell", sub_levels.shell);

    initialized_ = true;
    warden()->debug("[LogRegistry] Initialized, log dir: {}", logDir.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

}
