#include "protocols/shell/Router.hpp"
#include "protocols/shell/Parser.hpp"
#include "util/shellArgsHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/core.h>

using namespace sw::shell;
using namespace sw::logging;

void Router::registerCommand(const std::string& name,
                             const std::string& synopsis,
                             const std::string& description,
                             CommandHandler handler,
                             const std::unordered_set<std::string>& aliases) {
    const std::string key = normalize(name);

    CommandInfo info{description.empty() ? "No description provided." : description, synopsis, std::move(handler), {}};

    for (const auto& alias : aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            LogRegistry::shell()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                       a, aliasMap_.at(a), key);
            continue;
        }
        info.aliases.insert(a);
        aliasMap_[a] = key;
    }

    commands_[key] = std::move(info);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const auto n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

CommandResult Router::execute(const std::vector<std::string>& args, const std::filesystem::path& cwd) const {
    auto call = parseTokens(tokenize(args));
    call.cwd = cwd;

    if (call.name.empty()) {
        if (hasFlag(call, "help") || hasFlag(call, "h") || call.options.empty()) return ok(helpText());
        return invalid("No command provided.");
    }

    const auto canonical = canonicalFor(call.name);
    LogRegistry::shell()->debug("[Router] Executing command: '{}'", canonical);

    if (!commands_.contains(canonical))
        return invalid(fmt::format("Unknown command: {}\n\n{}", call.name, helpText()));

    const auto& info = commands_.at(canonical);
    if (hasFlag(call, "help") || hasFlag(call, "h"))
        return ok(fmt::format("usage: swctl {}\n\n  {}\n", info.synopsis, info.description));

    call.name = canonical;
    return info.handler(call);
}

std::string Router::helpText() const {
    size_t width = 0;
    for (const auto& [_, info] : commands_) width = std::max(width, info.synopsis.size());

    std::string out = "usage: swctl <command> [options] [--json]\n"
                      "       swctl daemon [--events]   (serves these commands; must be running)\n\ncommands:\n";
    for (const auto& [_, info] : commands_)
        out += fmt::format("  {:<{}}  {}\n", info.synopsis, width, info.description);
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}
