#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sw::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum level_or(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<PathsConfig> {
    static Node encode(const PathsConfig& rhs) {
        Node node;
        node["data_dir"] = rhs.data_dir.string();
        node["services_dir"] = rhs.services_dir.string();
        node["log_dir"] = rhs.log_dir.string();
        return node;
    }

    static bool decode(const Node& node, PathsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.data_dir = node["data_dir"].as<std::string>(rhs.data_dir.string());
        // services live under data_dir unless explicitly moved
        rhs.services_dir = node["services_dir"].as<std::string>((rhs.data_dir / "services").string());
        rhs.log_dir = node["log_dir"].as<std::string>(rhs.log_dir.string());
        return true;
    }
};

template<>
struct convert<HostToolConfig> {
    static Node encode(const HostToolConfig& rhs) {
        Node node;
        node["template_path"] = rhs.template_path.string();
        node["wrapper_template_path"] = rhs.wrapper_template_path.string();
        node["install_timeout_seconds"] = rhs.install_timeout.count();
        node["command_timeout_seconds"] = rhs.command_timeout.count();
        node["cleanup_retries"] = rhs.cleanup_retries;
        node["cleanup_retry_delay_ms"] = rhs.cleanup_retry_delay.count();
        return node;
    }

    static bool decode(const Node& node, HostToolConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.template_path = node["template_path"].as<std::string>(rhs.template_path.string());
        rhs.wrapper_template_path = node["wrapper_template_path"].as<std::string>(rhs.wrapper_template_path.string());
        rhs.install_timeout = std::chrono::seconds(node["install_timeout_seconds"].as<long>(120));
        rhs.command_timeout = std::chrono::seconds(node["command_timeout_seconds"].as<long>(60));
        rhs.cleanup_retries = node["cleanup_retries"].as<unsigned int>(5);
        rhs.cleanup_retry_delay = std::chrono::milliseconds(node["cleanup_retry_delay_ms"].as<long>(200));
        return true;
    }
};

template<>
struct convert<ServiceControlConfig> {
    static Node encode(const ServiceControlConfig& rhs) {
        Node node;
        node["systemctl_path"] = rhs.systemctl_path.string();
        node["unit_suffix"] = rhs.unit_suffix;
        node["command_timeout_seconds"] = rhs.command_timeout.count();
        node["status_wait_timeout_seconds"] = rhs.status_wait_timeout.count();
        node["status_poll_interval_ms"] = rhs.status_poll_interval.count();
        return node;
    }

    static bool decode(const Node& node, ServiceControlConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.systemctl_path = node["systemctl_path"].as<std::string>(rhs.systemctl_path.string());
        rhs.unit_suffix = node["unit_suffix"].as<std::string>(".service");
        rhs.command_timeout = std::chrono::seconds(node["command_timeout_seconds"].as<long>(15));
        rhs.status_wait_timeout = std::chrono::seconds(node["status_wait_timeout_seconds"].as<long>(30));
        rhs.status_poll_interval = std::chrono::milliseconds(node["status_poll_interval_ms"].as<long>(500));
        return true;
    }
};

template<>
struct convert<MonitoringConfig> {
    static Node encode(const MonitoringConfig& rhs) {
        Node node;
        node["baseline_interval_seconds"] = rhs.baseline_interval.count();
        node["polling_max_tracked_seconds"] = rhs.polling_max_tracked.count();
        node["polling_max_concurrent_queries"] = rhs.polling_max_concurrent_queries;
        return node;
    }

    static bool decode(const Node& node, MonitoringConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.baseline_interval = std::chrono::seconds(node["baseline_interval_seconds"].as<long>(5));
        rhs.polling_max_tracked = std::chrono::seconds(node["polling_max_tracked_seconds"].as<long>(30));
        rhs.polling_max_concurrent_queries = node["polling_max_concurrent_queries"].as<unsigned int>(5);
        if (rhs.polling_max_concurrent_queries == 0) rhs.polling_max_concurrent_queries = 1;
        return true;
    }
};

template<>
struct convert<DaemonConfig> {
    static Node encode(const DaemonConfig& rhs) {
        Node node;
        node["socket_path"] = rhs.socket_path.string();
        node["worker_threads"] = rhs.worker_threads;
        return node;
    }

    static bool decode(const Node& node, DaemonConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.socket_path = node["socket_path"].as<std::string>(rhs.socket_path.string());
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(8);
        if (rhs.worker_threads == 0) rhs.worker_threads = 1;
        return true;
    }
};

template<>
struct convert<SecurityConfig> {
    static Node encode(const SecurityConfig& rhs) {
        Node node;
        node["allowed_root"] = rhs.allowed_root.string();
        node["max_path_length"] = rhs.max_path_length;
        return node;
    }

    static bool decode(const Node& node, SecurityConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.allowed_root = node["allowed_root"].as<std::string>("");
        rhs.max_path_length = node["max_path_length"].as<size_t>(4096);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["warden"]    = to_std_string(spdlog::level::to_string_view(rhs.warden));
        node["guard"]     = to_std_string(spdlog::level::to_string_view(rhs.guard));
        node["store"]     = to_std_string(spdlog::level::to_string_view(rhs.store));
        node["host"]      = to_std_string(spdlog::level::to_string_view(rhs.host));
        node["control"]   = to_std_string(spdlog::level::to_string_view(rhs.control));
        node["lifecycle"] = to_std_string(spdlog::level::to_string_view(rhs.lifecycle));
        node["monitor"]   = to_std_string(spdlog::level::to_string_view(rhs.monitor));
        node["shell"]     = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.warden    = level_or(node["warden"], rhs.warden);
        rhs.guard     = level_or(node["guard"], rhs.guard);
        rhs.store     = level_or(node["store"], rhs.store);
        rhs.host      = level_or(node["host"], rhs.host);
        rhs.control   = level_or(node["control"], rhs.control);
        rhs.lifecycle = level_or(node["lifecycle"], rhs.lifecycle);
        rhs.monitor   = level_or(node["monitor"], rhs.monitor);
        rhs.shell     = level_or(node["shell"], rhs.shell);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = level_or(node["console_log_level"], spdlog::level::warn);
        rhs.file_log_level = level_or(node["file_log_level"], spdlog::level::info);
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

}
