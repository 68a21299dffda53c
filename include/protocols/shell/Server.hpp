#pragma once

#include "concurrency/AsyncService.hpp"

#include <atomic>
#include <filesystem>
#include <memory>

namespace sw::concurrency { class ThreadPool; }

namespace sw::shell {

class Router;

// Serves the command router on a Unix stream socket. Each connection carries
// one request {"args": [...], "cwd": "..."} and gets one reply
// {"ok", "exit_code", "stdout"?, "stderr"?, "data"?}. Requests run on a worker
// pool, so a long start or install does not hold up other clients.
class Server final : public concurrency::AsyncService {
public:
    Server(std::shared_ptr<Router> router, std::filesystem::path socketPath, unsigned int workers);
    ~Server() override;

    // Binds the socket first so a bad path or a second daemon fails here, not in the worker
    void start() override;
    void stop() override;

    [[nodiscard]] const std::filesystem::path& socketPath() const { return socketPath_; }

protected:
    void runLoop() override;

private:
    static constexpr int ACCEPT_POLL_MS = 200;

    std::shared_ptr<Router> router_;
    std::filesystem::path socketPath_;
    unsigned int workers_;
    std::unique_ptr<concurrency::ThreadPool> pool_;
    std::atomic<int> listenFd_{-1};

    void bindListener();
    void closeListener();
};

}
