#pragma once

#include "protocols/shell/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sw::shell {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);
CommandResult okJson(const nlohmann::json& data, std::string text);

// Last value given for `key`
std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

// Every value given for `key`, in order
std::vector<std::string> optVals(const CommandCall& c, const std::string& key);

std::optional<int> parseInt(const std::string& sv);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);

// Splits "a,b,,c" into {"a","b","c"}
std::vector<std::string> splitList(const std::string& s);

}
