#include "security/PathGuard.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fmt/core.h>

using namespace sw::security;
namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 22> RESERVED_NAMES = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
};

bool isBlank(const std::string& s) {
    return std::ranges::all_of(s, [](const unsigned char c) { return std::isspace(c); });
}

bool hasControlChars(const std::string& s) {
    return std::ranges::any_of(s, [](const unsigned char c) { return c < 0x20 || c == 0x7F; });
}

}

PathGuard::PathGuard(Options options) : options_(std::move(options)) {}

GuardResult PathGuard::validate(const std::string& path) const {
    if (path.empty() || isBlank(path)) return GuardResult::rejected("Path is empty");

    if (path.size() > options_.max_length)
        return GuardResult::rejected(fmt::format("Path exceeds maximum length of {} characters", options_.max_length));

    if (hasControlChars(path)) return GuardResult::rejected("Path contains control characters");

    if (isUncPath(path)) return GuardResult::rejected("UNC/network paths are not allowed");

    if (hasParentSegment(path)) return GuardResult::rejected("Parent-directory traversal ('..') is not allowed");

    const auto parts = segments(path);
    if (!parts.empty() && isReservedDeviceName(parts.back()))
        return GuardResult::rejected(fmt::format("'{}' is a reserved device name", parts.back()));

    const fs::path p(path);
    if (p.is_absolute()) {
        const auto normal = p.lexically_normal();
        const auto first = normal.begin();
        if (first != normal.end() && std::next(first) != normal.end() && *std::next(first) == "dev")
            return GuardResult::rejected("Device paths are not allowed");
    }

    if (options_.allowed_root && !options_.allowed_root->empty() && !isUnderAllowedRoot(p))
        return GuardResult::rejected(fmt::format("Path is outside the allowed root {}", options_.allowed_root->string()));

    return GuardResult::accepted();
}

bool PathGuard::isUncPath(const std::string_view path) {
    if (path.size() < 2) return false;
    const auto sep = [](const char c) { return c == '\\' || c == '/'; };
    return sep(path[0]) && sep(path[1]);
}

bool PathGuard::hasParentSegment(const std::string_view path) {
    const auto parts = segments(path);
    return std::ranges::any_of(parts, [](const std::string& s) { return s == ".."; });
}

bool PathGuard::isReservedDeviceName(const std::string& component) {
    // Reserved regardless of extension: "nul.txt" is still NUL
    std::string stem = component.substr(0, component.find('.'));
    while (!stem.empty() && (stem.back() == ' ')) stem.pop_back();
    std::ranges::transform(stem, stem.begin(), [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return std::ranges::find(RESERVED_NAMES, std::string_view(stem)) != RESERVED_NAMES.end();
}

std::vector<std::string> PathGuard::segments(const std::string_view path) {
    std::vector<std::string> out;
    std::string current;
    for (const char c : path) {
        if (c == '/' || c == '\\') {
            if (!current.empty()) out.push_back(std::move(current));
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) out.push_back(std::move(current));
    return out;
}

bool PathGuard::isUnderAllowedRoot(const fs::path& path) const {
    const auto root = options_.allowed_root->lexically_normal();

    auto resolved = path;
    if (!resolved.is_absolute()) {
        std::error_code ec;
        resolved = fs::absolute(path, ec);
        if (ec) return false;
    }
    const auto candidate = resolved.lexically_normal();

    auto c = candidate.begin();
    for (const auto& part : root) {
        if (part.empty()) continue;   // trailing separator
        if (c == candidate.end() || *c != part) return false;
        ++c;
    }
    return true;
}
