#pragma once

#include <string>

namespace sw::security {

struct GuardResult {
    bool ok = false;
    std::string reason;

    static GuardResult accepted() { return {true, {}}; }
    static GuardResult rejected(std::string reason) { return {false, std::move(reason)}; }

    explicit operator bool() const { return ok; }
};

}
