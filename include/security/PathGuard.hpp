#pragma once

#include "security/GuardResult.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sw::security {

// Lexical checks. Relative paths are resolved against the current directory
// for the allowed-root check only. Existence is the caller's concern.
class PathGuard {
public:
    struct Options {
        size_t max_length = 4096;
        std::optional<std::filesystem::path> allowed_root;
    };

    PathGuard() = default;
    explicit PathGuard(Options options);

    [[nodiscard]] GuardResult validate(const std::string& path) const;

    [[nodiscard]] const Options& options() const { return options_; }

    static bool isUncPath(std::string_view path);
    static bool hasParentSegment(std::string_view path);
    static bool isReservedDeviceName(const std::string& component);

    // Split on both '/' and '\\', dropping empty segments
    static std::vector<std::string> segments(std::string_view path);

private:
    Options options_;

    [[nodiscard]] bool isUnderAllowedRoot(const std::filesystem::path& path) const;
};

}
