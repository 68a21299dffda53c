#pragma once

#include "types/ServiceStatus.hpp"

#include <ctime>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace sw::types {

enum class StartMode { Automatic, Manual, Disabled };

std::string to_string(StartMode mode);
// Unknown or empty input falls back to Automatic
StartMode startModeFromString(const std::string& s);

struct RestartPolicy {
    bool enabled{false};
    int exit_code{99};

    bool operator==(const RestartPolicy&) const = default;
};

struct ServiceRecord {
    std::string id;
    std::string display_name, description{"Managed by servicewarden"};
    std::filesystem::path executable_path;
    std::optional<std::filesystem::path> script_path;
    std::string arguments;
    std::filesystem::path working_directory;
    std::vector<std::string> dependencies;
    std::map<std::string, std::string> environment_variables;
    std::optional<std::string> service_account;
    StartMode start_mode{StartMode::Automatic};
    unsigned int stop_timeout_ms{15000};
    RestartPolicy restart_on_exit;
    ServiceStatus status{ServiceStatus::NotInstalled};
    std::time_t created_at{}, updated_at{};

    // Script path (quoted) followed by the user arguments
    [[nodiscard]] std::string fullArguments() const;

    void touch();
};

std::string generateServiceId();

void to_json(nlohmann::json& j, const ServiceRecord& r);
void from_json(const nlohmann::json& j, ServiceRecord& r);

}
