#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace sw::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const std::filesystem::path& logDir);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> warden()    { return get("warden"); }
    static std::shared_ptr<spdlog::logger> guard()     { return get("guard"); }
    static std::shared_ptr<spdlog::logger> store()     { return get("store"); }
    static std::shared_ptr<spdlog::logger> host()      { return get("host"); }
    static std::shared_ptr<spdlog::logger> control()   { return get("control"); }
    static std::shared_ptr<spdlog::logger> lifecycle() { return get("lifecycle"); }
    static std::shared_ptr<spdlog::logger> monitor()   { return get("monitor"); }
    static std::shared_ptr<spdlog::logger> shell()     { return get("shell"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    // remember main sink params used in init()
    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

} // namespace sw::logging
