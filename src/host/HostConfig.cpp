#include "host/HostConfig.hpp"
#include "host/Sandbox.hpp"
#include "security/CommandGuard.hpp"
#include "types/ServiceRecord.hpp"

#include <sstream>
#include <pugixml.hpp>
#include <fmt/format.h>

using namespace sw::types;
using namespace sw::security;

namespace {

pugi::xml_node appendText(pugi::xml_node parent, const char* name, const std::string& value) {
    auto node = parent.append_child(name);
    node.append_child(pugi::node_pcdata).set_value(value.c_str());
    return node;
}

}

namespace sw::host {

std::string renderHostConfig(const ServiceRecord& record, const Sandbox& sandbox) {
    pugi::xml_document doc;

    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto service = doc.append_child("service");
    appendText(service, "id", record.id);
    appendText(service, "name", record.display_name);
    appendText(service, "description", record.description);

    if (record.restart_on_exit.enabled) {
        appendText(service, "executable", sandbox.wrapperScript().string());
        appendText(service, "arguments", fmt::format("{} {} {}",
                                                     CommandGuard::quote(record.executable_path.string()),
                                                     record.restart_on_exit.exit_code,
                                                     record.fullArguments()));
    } else {
        appendText(service, "executable", record.executable_path.string());
        appendText(service, "arguments", record.fullArguments());
    }

    appendText(service, "workingdirectory", record.working_directory.string());
    appendText(service, "startmode", to_string(record.start_mode));
    appendText(service, "stoptimeout", fmt::format("{}ms", record.stop_timeout_ms));

    if (record.service_account) {
        auto account = service.append_child("serviceaccount");
        appendText(account, "username", *record.service_account);
    }

    for (const auto& dep : record.dependencies) appendText(service, "depend", dep);

    for (const auto& [name, value] : record.environment_variables) {
        auto env = service.append_child("env");
        env.append_attribute("name") = name.c_str();
        env.append_attribute("value") = value.c_str();
    }

    appendText(service, "logpath", sandbox.logsDirectory().string());

    auto log = service.append_child("log");
    log.append_attribute("mode") = "roll-by-size";
    appendText(log, "sizeThreshold", std::to_string(LOG_ROLL_SIZE_THRESHOLD_KB));
    appendText(log, "keepFiles", std::to_string(LOG_ROLL_KEEP_FILES));

    appendText(service, "stopparentprocessfirst", "true");

    if (record.restart_on_exit.enabled) {
        auto onFailure = service.append_child("onfailure");
        onFailure.append_attribute("action") = "restart";
    }

    std::ostringstream out;
    doc.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
    return out.str();
}

}
