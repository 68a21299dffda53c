#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace sw::config {

struct PathsConfig {
    std::filesystem::path data_dir = "/var/lib/servicewarden";
    std::filesystem::path services_dir = "/var/lib/servicewarden/services";
    std::filesystem::path log_dir = "/var/log/servicewarden";
};

struct HostToolConfig {
    std::filesystem::path template_path = "/usr/share/servicewarden/host/servicewarden-host";
    std::filesystem::path wrapper_template_path = "/usr/share/servicewarden/host/wrapper.sh";
    std::chrono::seconds install_timeout{120};
    std::chrono::seconds command_timeout{60};
    unsigned int cleanup_retries = 5;
    std::chrono::milliseconds cleanup_retry_delay{200};
};

struct ServiceControlConfig {
    std::filesystem::path systemctl_path = "/usr/bin/systemctl";
    std::string unit_suffix = ".service";
    std::chrono::seconds command_timeout{15};
    std::chrono::seconds status_wait_timeout{30};
    std::chrono::milliseconds status_poll_interval{500};
};

struct MonitoringConfig {
    std::chrono::seconds baseline_interval{5};
    std::chrono::seconds polling_max_tracked{30};
    unsigned int polling_max_concurrent_queries = 5;
};

struct DaemonConfig {
    std::filesystem::path socket_path = "/run/servicewarden/swctl.sock";
    unsigned int worker_threads = 8;        // concurrent client requests
};

struct SecurityConfig {
    std::filesystem::path allowed_root{};   // empty = no root restriction
    size_t max_path_length = 4096;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum warden    = spdlog::level::info;   // Startup/shutdown, CLI entry
    spdlog::level::level_enum guard     = spdlog::level::warn;   // Rejected paths and arguments
    spdlog::level::level_enum store     = spdlog::level::warn;   // Persistence failures
    spdlog::level::level_enum host      = spdlog::level::info;   // Host-tool invocations and exit codes
    spdlog::level::level_enum control   = spdlog::level::warn;   // OS service-control failures
    spdlog::level::level_enum lifecycle = spdlog::level::info;   // Operation begin/end, transitions
    spdlog::level::level_enum monitor   = spdlog::level::warn;   // Sweep/tick failures only
    spdlog::level::level_enum shell     = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
};

struct Config {
    PathsConfig paths;
    HostToolConfig host_tool;
    ServiceControlConfig service_control;
    MonitoringConfig monitoring;
    SecurityConfig security;
    DaemonConfig daemon;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

} // namespace sw::config
