#pragma once

#include "protocols/shell/types.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace sw::shell {

// Nothing is accepting connections on the control socket
struct DaemonUnavailable : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Sends one command line to the daemon's Server and waits for its reply
class Client {
public:
    explicit Client(std::filesystem::path socketPath);

    // Throws DaemonUnavailable when no daemon is listening, std::runtime_error
    // when the connection breaks before a reply arrives
    [[nodiscard]] CommandResult execute(const std::vector<std::string>& args,
                                        const std::filesystem::path& cwd) const;

private:
    std::filesystem::path socketPath_;
};

}
