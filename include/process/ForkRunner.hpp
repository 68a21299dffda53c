#pragma once

#include "process/Runner.hpp"

namespace sw::process {

// fork/execv with both output streams captured through pipes. The child gets
// its own process group so a timeout can SIGKILL everything it spawned.
class ForkRunner final : public Runner {
public:
    ProcessResult run(const Invocation& invocation) override;
};

}
