#pragma once

#include "host/Sandbox.hpp"
#include "types/OperationResult.hpp"
#include "types/ServiceStatus.hpp"

#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <string>

namespace sw::config { struct Config; }
namespace sw::control { class ServiceControl; enum class ControlState; }
namespace sw::process { class Runner; }
namespace sw::types { struct ServiceRecord; }

namespace sw::host {

// The only component that touches the service-host tool and the OS service manager.
// Every operation returns an OperationResult; nothing thrown inside escapes.
class ServiceHostAdapter {
public:
    struct Options {
        std::filesystem::path services_dir;
        std::filesystem::path host_binary;
        std::filesystem::path wrapper_template;
        std::chrono::milliseconds install_timeout{120000};
        std::chrono::milliseconds command_timeout{60000};
        unsigned int cleanup_retries = 5;
        std::chrono::milliseconds cleanup_retry_delay{200};
        std::chrono::milliseconds status_wait_timeout{30000};
        std::chrono::milliseconds status_poll_interval{500};

        static Options fromConfig(const config::Config& cfg);
    };

    ServiceHostAdapter(Options options,
                       std::shared_ptr<process::Runner> runner,
                       std::shared_ptr<control::ServiceControl> control);

    // Failures before the host tool runs come back as ErrorKind::Internal with the sandbox removed
    types::OperationResult install(const types::ServiceRecord& record);
    types::OperationResult uninstall(const types::ServiceRecord& record);

    types::OperationResult start(const std::string& id);
    types::OperationResult stop(const std::string& id);
    types::OperationResult restart(const std::string& id);

    // Rewrite the host configuration of an existing sandbox
    types::OperationResult reconfigure(const types::ServiceRecord& record);

    types::ServiceStatus queryStatus(const std::string& id);

    [[nodiscard]] Sandbox sandbox(const std::string& id) const { return {options_.services_dir, id}; }
    [[nodiscard]] const Options& options() const { return options_; }

    static types::ServiceStatus toServiceStatus(control::ControlState state);

private:
    Options options_;
    std::shared_ptr<process::Runner> runner_;
    std::shared_ptr<control::ServiceControl> control_;

    void stage(const types::ServiceRecord& record, const Sandbox& box) const;
    void writeConfig(const types::ServiceRecord& record, const Sandbox& box) const;
    bool removeSandbox(const Sandbox& box) const;

    types::OperationResult runHostTool(types::OperationType op, const Sandbox& box,
                                       const std::string& verb, std::chrono::milliseconds timeout) const;

    types::OperationResult waitForStatus(types::OperationType op, const std::string& id,
                                         std::initializer_list<types::ServiceStatus> accepted,
                                         std::chrono::steady_clock::time_point started);
};

}
