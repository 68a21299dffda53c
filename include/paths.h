#pragma once

#include <filesystem>

namespace sw::paths {

// Resolved once from $SERVICEWARDEN_CONFIG, falls back to /etc/servicewarden/config.yaml
std::filesystem::path getConfigPath();

std::filesystem::path getLogPath();
std::filesystem::path getDataPath();
std::filesystem::path getServicesPath();

void setConfigPath(const std::filesystem::path& path);
void setLogPath(const std::filesystem::path& path);
void setDataPath(const std::filesystem::path& path);
void setServicesPath(const std::filesystem::path& path);

// Points every path at a scratch directory under the system temp dir
void setPathsForTesting();

}
