#include "util/shellArgsHelpers.hpp"

#include <charconv>

namespace sw::shell {

CommandResult invalid(std::string msg) {
    if (!msg.empty() && msg.back() != '\n') msg.push_back('\n');
    return {2, "", std::move(msg), {}, false};
}

CommandResult ok(std::string out) {
    if (!out.empty() && out.back() != '\n') out.push_back('\n');
    return {0, std::move(out), "", {}, false};
}

CommandResult okJson(const nlohmann::json& data, std::string text) {
    auto res = ok(std::move(text));
    res.data = data;
    res.has_data = true;
    return res;
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    std::optional<std::string> last;
    for (const auto& [k, v] : c.options)
        if (k == key && v) last = v;
    return last;
}

std::vector<std::string> optVals(const CommandCall& c, const std::string& key) {
    std::vector<std::string> out;
    for (const auto& [k, v] : c.options)
        if (k == key && v) out.push_back(*v);
    return out;
}

std::optional<int> parseInt(const std::string& sv) {
    int value = 0;
    const auto* begin = sv.data();
    const auto* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || sv.empty()) return std::nullopt;
    return value;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, _] : c.options)
        if (k == key) return true;
    return false;
}

std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        const auto comma = s.find(',', start);
        const auto end = comma == std::string::npos ? s.size() : comma;
        if (end > start) out.push_back(s.substr(start, end - start));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

}
