#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace sw::config {

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("Config file not found: " + path.string());

    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["paths"]) YAML::convert<PathsConfig>::decode(node, cfg.paths);
    if (auto node = root["host_tool"]) YAML::convert<HostToolConfig>::decode(node, cfg.host_tool);
    if (auto node = root["service_control"]) YAML::convert<ServiceControlConfig>::decode(node, cfg.service_control);
    if (auto node = root["monitoring"]) YAML::convert<MonitoringConfig>::decode(node, cfg.monitoring);
    if (auto node = root["security"]) YAML::convert<SecurityConfig>::decode(node, cfg.security);
    if (auto node = root["daemon"]) YAML::convert<DaemonConfig>::decode(node, cfg.daemon);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

} // namespace sw::config
