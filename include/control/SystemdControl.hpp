#pragma once

#include "control/ServiceControl.hpp"
#include "config/Config.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace sw::process { class Runner; struct ProcessResult; }

namespace sw::control {

class SystemdControl final : public ServiceControl {
public:
    SystemdControl(std::shared_ptr<process::Runner> runner, config::ServiceControlConfig cfg);

    ControlState query(const std::string& name) override;
    ControlResult start(const std::string& name) override;
    ControlResult stop(const std::string& name) override;

    [[nodiscard]] std::string unitName(const std::string& name) const;

    // Parses `systemctl show -p LoadState,ActiveState` output
    static ControlState parseShowOutput(std::string_view output);

private:
    std::shared_ptr<process::Runner> runner_;
    config::ServiceControlConfig cfg_;

    process::ProcessResult systemctl(std::vector<std::string> args) const;
    ControlResult transition(const std::string& verb, const std::string& name);
};

}
