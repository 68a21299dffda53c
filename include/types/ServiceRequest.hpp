#pragma once

#include "types/ServiceRecord.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sw::types {

// Input for create and update. Nothing in here has been validated.
struct ServiceRequest {
    std::string display_name;
    std::optional<std::string> description;
    std::filesystem::path executable_path;
    std::optional<std::filesystem::path> script_path;
    std::string arguments;
    std::filesystem::path working_directory;
    bool auto_start{true};
    std::vector<std::string> dependencies;
    std::map<std::string, std::string> environment_variables;
    std::optional<std::string> service_account;
    std::string start_mode{"Automatic"};
    unsigned int stop_timeout_ms{15000};
    RestartPolicy restart_on_exit;
};

}
