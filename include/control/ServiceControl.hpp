#pragma once

#include <string>

namespace sw::control {

enum class ControlState {
    Running,
    Stopped,
    StartPending,
    StopPending,
    Paused,
    PausePending,
    ContinuePending,
    NotFound
};

std::string to_string(ControlState state);

struct ControlResult {
    bool ok{false};
    bool not_found{false};
    bool timed_out{false};
    std::string message;
};

// OS service-control primitive, addressed by service id
class ServiceControl {
public:
    virtual ~ServiceControl() = default;

    // Throws std::runtime_error when the state cannot be determined
    virtual ControlState query(const std::string& name) = 0;

    // Request a transition, never wait for it
    virtual ControlResult start(const std::string& name) = 0;
    virtual ControlResult stop(const std::string& name) = 0;
};

}
