#pragma once

#include <string>

namespace sw::types {

enum class ServiceStatus {
    NotInstalled,
    Stopped,
    Running,
    Starting,
    Stopping,
    Paused,
    Error,
    Installing,
    Uninstalling
};

std::string to_string(ServiceStatus status);
ServiceStatus statusFromString(const std::string& s);

// Transition table. Every precondition check in the orchestrator goes through these.

constexpr bool isTransitioning(const ServiceStatus s) {
    switch (s) {
        case ServiceStatus::Starting:
        case ServiceStatus::Stopping:
        case ServiceStatus::Installing:
        case ServiceStatus::Uninstalling:
            return true;
        default:
            return false;
    }
}

constexpr bool canStart(const ServiceStatus s) {
    return s == ServiceStatus::Stopped || s == ServiceStatus::NotInstalled;
}

constexpr bool canStop(const ServiceStatus s) {
    return s == ServiceStatus::Running || s == ServiceStatus::Starting;
}

constexpr bool canUninstall(const ServiceStatus s) {
    return s == ServiceStatus::Stopped || s == ServiceStatus::NotInstalled || s == ServiceStatus::Error;
}

constexpr bool canUpdate(const ServiceStatus s) {
    return !isTransitioning(s);
}

}
