#pragma once

#include "protocols/shell/types.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace sw::shell {

class Router {
public:
    void registerCommand(const std::string& name,
                         const std::string& synopsis,
                         const std::string& description,
                         CommandHandler handler,
                         const std::unordered_set<std::string>& aliases = {});

    // `cwd` is where relative paths in the arguments were typed
    CommandResult execute(const std::vector<std::string>& args, const std::filesystem::path& cwd = {}) const;

    [[nodiscard]] std::string helpText() const;

private:
    std::map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

}
