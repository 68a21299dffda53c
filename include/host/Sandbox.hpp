#pragma once

#include <filesystem>
#include <string>

namespace sw::host {

// Per-service directory layout. Log viewers depend on these names.
class Sandbox {
public:
    Sandbox(const std::filesystem::path& servicesDir, std::string id)
        : id_(std::move(id)), dir_(servicesDir / id_) {}

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const std::filesystem::path& directory() const { return dir_; }

    [[nodiscard]] std::filesystem::path hostBinary() const { return dir_ / id_; }
    [[nodiscard]] std::filesystem::path configFile() const { return dir_ / (id_ + ".xml"); }
    [[nodiscard]] std::filesystem::path logsDirectory() const { return dir_ / "logs"; }
    [[nodiscard]] std::filesystem::path stdoutLog() const { return logsDirectory() / (id_ + ".out.log"); }
    [[nodiscard]] std::filesystem::path stderrLog() const { return logsDirectory() / (id_ + ".err.log"); }
    [[nodiscard]] std::filesystem::path wrapperScript() const { return dir_ / "wrapper.sh"; }

    [[nodiscard]] bool exists() const { return std::filesystem::is_directory(dir_); }

private:
    std::string id_;
    std::filesystem::path dir_;
};

}
