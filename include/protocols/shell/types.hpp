#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace sw::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;       // repeated keys are kept in order
    std::vector<std::string> positionals;
    std::filesystem::path cwd;         // caller's working directory; empty means this process's
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;           // CLI stdout
    std::string stderr_text;           // CLI stderr
    nlohmann::json data;               // optional machine-readable payload
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string description;
    std::string synopsis;
    CommandHandler handler;
    std::unordered_set<std::string> aliases;
};

}
