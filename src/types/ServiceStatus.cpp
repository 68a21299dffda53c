#include "types/ServiceStatus.hpp"

#include <stdexcept>

using namespace sw::types;

std::string sw::types::to_string(const ServiceStatus status) {
    switch (status) {
        case ServiceStatus::NotInstalled: return "NotInstalled";
        case ServiceStatus::Stopped: return "Stopped";
        case ServiceStatus::Running: return "Running";
        case ServiceStatus::Starting: return "Starting";
        case ServiceStatus::Stopping: return "Stopping";
        case ServiceStatus::Paused: return "Paused";
        case ServiceStatus::Error: return "Error";
        case ServiceStatus::Installing: return "Installing";
        case ServiceStatus::Uninstalling: return "Uninstalling";
        default: return "Unknown";
    }
}

ServiceStatus sw::types::statusFromString(const std::string& s) {
    if (s == "NotInstalled") return ServiceStatus::NotInstalled;
    if (s == "Stopped") return ServiceStatus::Stopped;
    if (s == "Running") return ServiceStatus::Running;
    if (s == "Starting") return ServiceStatus::Starting;
    if (s == "Stopping") return ServiceStatus::Stopping;
    if (s == "Paused") return ServiceStatus::Paused;
    if (s == "Error") return ServiceStatus::Error;
    if (s == "Installing") return ServiceStatus::Installing;
    if (s == "Uninstalling") return ServiceStatus::Uninstalling;
    throw std::invalid_argument("Invalid ServiceStatus: " + s);
}
