#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sw::process {

struct Invocation {
    std::filesystem::path executable;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> working_directory;
    std::chrono::milliseconds timeout{60000};
};

struct ProcessResult {
    int exit_code{-1};
    std::string stdout_text, stderr_text;
    bool timed_out{false};
    bool launched{false};
    std::string error;  // set when the process could not be launched
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool succeeded() const { return launched && !timed_out && exit_code == 0; }

    // stderr when present, otherwise stdout, otherwise the launch error
    [[nodiscard]] std::string diagnostics() const;
};

class Runner {
public:
    virtual ~Runner() = default;

    // Never throws for a failing child. Launch failures are reported through launched/error.
    virtual ProcessResult run(const Invocation& invocation) = 0;
};

}
