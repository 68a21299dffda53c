#include "lifecycle/RequestValidator.hpp"
#include "lifecycle/DependencyValidator.hpp"
#include "security/CommandGuard.hpp"
#include "types/ServiceRecord.hpp"
#include "types/ServiceRequest.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

using namespace sw::lifecycle;
using namespace sw::security;
using namespace sw::types;
using namespace sw::logging;
namespace fs = std::filesystem;

RequestValidator::RequestValidator(PathGuard pathGuard) : pathGuard_(std::move(pathGuard)) {}

bool RequestValidator::isValidEnvName(const std::string& name) {
    if (name.empty()) return false;
    const auto first = static_cast<unsigned char>(name.front());
    if (!std::isalpha(first) && first != '_') return false;
    return std::ranges::all_of(name, [](const char c) {
        const auto u = static_cast<unsigned char>(c);
        return std::isalnum(u) || u == '_';
    });
}

bool RequestValidator::isValidEnvValue(const std::string& value) {
    return value.find_first_of(std::string("\0\r\n", 3)) == std::string::npos;
}

bool RequestValidator::isValidAccountName(const std::string& account) {
    if (account.empty()) return false;
    return std::ranges::all_of(account, [](const char c) {
        const auto u = static_cast<unsigned char>(c);
        return std::isalnum(u) || u == '.' || u == '_' || u == '@' || u == '$' || u == '\\' || u == '-';
    });
}

void RequestValidator::checkPath(std::vector<FieldError>& errors, const std::string& field,
                                 const fs::path& path) const {
    if (const auto res = pathGuard_.validate(path.string()); !res) {
        LogRegistry::guard()->warn("[RequestValidator] Rejected {} '{}': {}", field, path.string(), res.reason);
        errors.push_back({field, res.reason});
    }
}

std::vector<FieldError> RequestValidator::validate(const ServiceRequest& request,
                                                   const std::string& selfId,
                                                   const std::vector<ServiceRecord>& fleet) const {
    std::vector<FieldError> errors;

    if (request.display_name.size() < DISPLAY_NAME_MIN || request.display_name.size() > DISPLAY_NAME_MAX)
        errors.push_back({"display_name", fmt::format("Must be between {} and {} characters",
                                                      DISPLAY_NAME_MIN, DISPLAY_NAME_MAX)});

    if (request.description && request.description->size() > DESCRIPTION_MAX)
        errors.push_back({"description", fmt::format("Must be at most {} characters", DESCRIPTION_MAX)});

    if (request.executable_path.empty()) {
        errors.push_back({"executable_path", "Executable path is required"});
    } else {
        const auto before = errors.size();
        checkPath(errors, "executable_path", request.executable_path);
        if (errors.size() == before && !fs::is_regular_file(request.executable_path))
            errors.push_back({"executable_path", "Executable does not exist"});
    }

    if (request.script_path && !request.script_path->empty()) {
        const auto before = errors.size();
        checkPath(errors, "script_path", *request.script_path);
        if (errors.size() == before && !fs::is_regular_file(*request.script_path))
            errors.push_back({"script_path", "Script does not exist"});
    }

    if (!request.working_directory.empty()) {
        const auto before = errors.size();
        checkPath(errors, "working_directory", request.working_directory);
        if (errors.size() == before && !fs::is_directory(request.working_directory))
            errors.push_back({"working_directory", "Working directory does not exist"});
    }

    if (const auto res = CommandGuard::validate(request.arguments); !res) {
        LogRegistry::guard()->warn("[RequestValidator] Rejected arguments: {}", res.reason);
        errors.push_back({"arguments", res.reason});
    }

    for (const auto& [name, value] : request.environment_variables) {
        if (!isValidEnvName(name))
            errors.push_back({"environment_variables", fmt::format("Invalid variable name '{}'", name)});
        else if (!isValidEnvValue(value))
            errors.push_back({"environment_variables", fmt::format("Value of '{}' contains a line break or NUL", name)});
    }

    if (request.service_account && !isValidAccountName(*request.service_account))
        errors.push_back({"service_account", "Invalid account name"});

    if (request.start_mode != "Automatic" && request.start_mode != "Manual" && request.start_mode != "Disabled")
        errors.push_back({"start_mode", "Must be one of Automatic, Manual, Disabled"});

    if (request.stop_timeout_ms > STOP_TIMEOUT_MAX_MS)
        errors.push_back({"stop_timeout_ms", fmt::format("Must be at most {} ms", STOP_TIMEOUT_MAX_MS)});

    if (request.restart_on_exit.exit_code < 0 || request.restart_on_exit.exit_code > 255)
        errors.push_back({"restart_on_exit", "Exit code must be between 0 and 255"});

    for (auto& msg : DependencyValidator::validate(selfId, request.dependencies, DependencyValidator::graphOf(fleet)))
        errors.push_back({"dependencies", std::move(msg)});

    return errors;
}
