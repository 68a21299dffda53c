#pragma once

#include "security/GuardResult.hpp"

#include <string>

namespace sw::security {

// Gates argument strings against chaining and substitution. Rejects, never rewrites.
class CommandGuard {
public:
    [[nodiscard]] static GuardResult validate(const std::string& arguments);

    // Trims surrounding whitespace. Throws std::invalid_argument when validate() rejects.
    [[nodiscard]] static std::string sanitize(const std::string& arguments);

    // Quote a single token for embedding into an argument string
    [[nodiscard]] static std::string quote(const std::string& token);
};

}
