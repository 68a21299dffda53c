#include <paths.h>

#include <cstdlib>
#include <mutex>
#include <unistd.h>

namespace sw::paths {

namespace {
std::mutex mutex_;
std::filesystem::path configPath_;
std::filesystem::path logPath_ = "/var/log/servicewarden";
std::filesystem::path dataPath_ = "/var/lib/servicewarden";
std::filesystem::path servicesPath_ = "/var/lib/servicewarden/services";
}

std::filesystem::path getConfigPath() {
    std::scoped_lock lock(mutex_);
    if (!configPath_.empty()) return configPath_;
    if (const char* env = std::getenv("SERVICEWARDEN_CONFIG"); env && *env) return env;
    return "/etc/servicewarden/config.yaml";
}

std::filesystem::path getLogPath() {
    std::scoped_lock lock(mutex_);
    return logPath_;
}

std::filesystem::path getDataPath() {
    std::scoped_lock lock(mutex_);
    return dataPath_;
}

std::filesystem::path getServicesPath() {
    std::scoped_lock lock(mutex_);
    return servicesPath_;
}

void setConfigPath(const std::filesystem::path& path) {
    std::scoped_lock lock(mutex_);
    configPath_ = path;
}

void setLogPath(const std::filesystem::path& path) {
    std::scoped_lock lock(mutex_);
    logPath_ = path;
}

void setDataPath(const std::filesystem::path& path) {
    std::scoped_lock lock(mutex_);
    dataPath_ = path;
}

void setServicesPath(const std::filesystem::path& path) {
    std::scoped_lock lock(mutex_);
    servicesPath_ = path;
}

void setPathsForTesting() {
    const auto root = std::filesystem::temp_directory_path() /
                      ("servicewarden_test_" + std::to_string(::getpid()));
    setLogPath(root / "log");
    setDataPath(root / "data");
    setServicesPath(root / "services");
}

}
