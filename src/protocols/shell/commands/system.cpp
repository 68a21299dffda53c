#include "protocols/shell/commands.hpp"
#include "protocols/shell/Router.hpp"
#include "util/shellArgsHelpers.hpp"

#include <version.h>

namespace sw::shell {

void registerSystemCommands(const std::shared_ptr<Router>& r) {
    const std::weak_ptr<Router> weak = r;

    r->registerCommand("help", "help", "Show this help", [weak](const CommandCall&) {
        const auto router = weak.lock();
        return router ? ok(router->helpText()) : invalid("Router is gone");
    }, {"?"});

    r->registerCommand("version", "version", "Print the servicewarden version", [](const CommandCall& call) {
        if (hasFlag(call, "json")) return okJson({{"version", SW_VERSION}}, "");
        return ok("servicewarden v" + std::string(SW_VERSION));
    });
}

}
