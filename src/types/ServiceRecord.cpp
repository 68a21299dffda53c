#include "types/ServiceRecord.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/uuid_generators.hpp>

using namespace sw::types;

std::string sw::types::to_string(const StartMode mode) {
    switch (mode) {
        case StartMode::Automatic: return "Automatic";
        case StartMode::Manual: return "Manual";
        case StartMode::Disabled: return "Disabled";
        default: return "Automatic";
    }
}

StartMode sw::types::startModeFromString(const std::string& s) {
    std::string lower;
    lower.reserve(s.size());
    for (const unsigned char c : s) lower.push_back(static_cast<char>(std::tolower(c)));

    if (lower == "manual") return StartMode::Manual;
    if (lower == "disabled") return StartMode::Disabled;
    return StartMode::Automatic;
}

std::string ServiceRecord::fullArguments() const {
    if (script_path && !script_path->empty()) {
        if (arguments.empty()) return "\"" + script_path->string() + "\"";
        return "\"" + script_path->string() + "\" " + arguments;
    }
    return arguments;
}

void ServiceRecord::touch() { updated_at = util::now(); }

std::string sw::types::generateServiceId() {
    thread_local boost::uuids::random_generator gen;
    auto id = boost::uuids::to_string(gen());
    id.erase(std::remove(id.begin(), id.end(), '-'), id.end());
    return id;
}

void sw::types::to_json(nlohmann::json& j, const ServiceRecord& r) {
    j = {
        {"id", r.id},
        {"display_name", r.display_name},
        {"description", r.description},
        {"executable_path", r.executable_path.string()},
        {"arguments", r.arguments},
        {"working_directory", r.working_directory.string()},
        {"dependencies", r.dependencies},
        {"environment_variables", r.environment_variables},
        {"start_mode", to_string(r.start_mode)},
        {"stop_timeout_ms", r.stop_timeout_ms},
        {"restart_on_exit", {{"enabled", r.restart_on_exit.enabled}, {"exit_code", r.restart_on_exit.exit_code}}},
        {"status", to_string(r.status)},
        {"created_at", util::timestampToString(r.created_at)},
        {"updated_at", util::timestampToString(r.updated_at)}
    };

    if (r.script_path) j["script_path"] = r.script_path->string();
    else j["script_path"] = nullptr;

    if (r.service_account) j["service_account"] = *r.service_account;
    else j["service_account"] = nullptr;
}

void sw::types::from_json(const nlohmann::json& j, ServiceRecord& r) {
    r.id = j.at("id").get<std::string>();
    r.display_name = j.at("display_name").get<std::string>();
    r.description = j.value("description", "");
    r.executable_path = j.at("executable_path").get<std::string>();
    r.arguments = j.value("arguments", "");
    r.working_directory = j.value("working_directory", "");
    r.dependencies = j.value("dependencies", std::vector<std::string>{});
    r.environment_variables = j.value("environment_variables", std::map<std::string, std::string>{});
    r.start_mode = startModeFromString(j.value("start_mode", "Automatic"));
    r.stop_timeout_ms = j.value("stop_timeout_ms", 15000u);
    r.status = statusFromString(j.value("status", "NotInstalled"));

    if (j.contains("restart_on_exit") && j.at("restart_on_exit").is_object()) {
        const auto& roe = j.at("restart_on_exit");
        r.restart_on_exit.enabled = roe.value("enabled", false);
        r.restart_on_exit.exit_code = roe.value("exit_code", 99);
    }

    if (j.contains("script_path") && j.at("script_path").is_string()) r.script_path = j.at("script_path").get<std::string>();
    else r.script_path = std::nullopt;

    if (j.contains("service_account") && j.at("service_account").is_string())
        r.service_account = j.at("service_account").get<std::string>();
    else r.service_account = std::nullopt;

    r.created_at = util::parseTimestampFromString(j.at("created_at").get<std::string>());
    r.updated_at = util::parseTimestampFromString(j.at("updated_at").get<std::string>());
}
