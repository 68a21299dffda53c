#pragma once

#include <memory>

namespace sw::runtime { class Manager; }

namespace sw::shell {

class Router;

void registerSystemCommands(const std::shared_ptr<Router>& r);
void registerServiceCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<runtime::Manager>& manager);

inline void registerAllCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<runtime::Manager>& manager) {
    registerSystemCommands(r);
    registerServiceCommands(r, manager);
}

}
