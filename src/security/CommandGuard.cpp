#include "security/CommandGuard.hpp"

#include <array>
#include <cctype>
#include <stdexcept>
#include <string_view>
#include <utility>

using namespace sw::security;

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 5> FORBIDDEN = {{
    {"&&", "command chaining ('&&')"},
    {"||", "command chaining ('||')"},
    {";", "command separator (';')"},
    {"`", "command substitution (backtick)"},
    {"$(", "command substitution ('$(')"},
}};

}

GuardResult CommandGuard::validate(const std::string& arguments) {
    if (arguments.empty()) return GuardResult::accepted();

    for (const auto& [pattern, label] : FORBIDDEN)
        if (arguments.find(pattern) != std::string::npos)
            return GuardResult::rejected("Arguments contain " + std::string(label));

    for (size_t i = 0; i < arguments.size(); ++i) {
        const char c = arguments[i];
        if (c == '\n' || c == '\r' || c == '\0')
            return GuardResult::rejected("Arguments contain a line break or NUL character");
        if (c == '|' && (i == 0 || arguments[i - 1] != '\\'))
            return GuardResult::rejected("Arguments contain an unescaped pipe ('|')");
    }

    return GuardResult::accepted();
}

std::string CommandGuard::sanitize(const std::string& arguments) {
    if (const auto check = validate(arguments); !check)
        throw std::invalid_argument(check.reason);

    const auto notSpace = [](const unsigned char c) { return !std::isspace(c); };
    auto begin = arguments.begin();
    auto end = arguments.end();
    while (begin != end && !notSpace(static_cast<unsigned char>(*begin))) ++begin;
    while (end != begin && !notSpace(static_cast<unsigned char>(*(end - 1)))) --end;
    return {begin, end};
}

std::string CommandGuard::quote(const std::string& token) {
    const bool needsQuoting = token.empty() ||
        token.find_first_of(" \t\"\\") != std::string::npos;
    if (!needsQuoting) return token;

    std::string out = "\"";
    for (const char c : token) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}
