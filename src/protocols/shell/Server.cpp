#include "protocols/shell/Server.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/SocketIO.hpp"
#include "concurrency/Task.hpp"
#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include <fmt/format.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

using namespace sw::shell;
using namespace sw::logging;
using json = nlohmann::json;

namespace {

sockaddr_un addressOf(const std::filesystem::path& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());
    return addr;
}

bool someoneListening(const std::filesystem::path& path) {
    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;
    const auto addr = addressOf(path);
    const bool connected = ::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return connected;
}

void logPeer(const int fd) {
    ucred c{};
    socklen_t len = sizeof(c);
    if (::getsockopt(fd, SOL_SOCKET, SO_PEERCRED, &c, &len) == 0)
        LogRegistry::shell()->debug("[Server] Request from UID {} (PID {})", c.uid, c.pid);
}

json toReply(const CommandResult& res) {
    json reply{{"ok", res.exit_code == 0}, {"exit_code", res.exit_code}};
    if (!res.stdout_text.empty()) reply["stdout"] = res.stdout_text;
    if (!res.stderr_text.empty()) reply["stderr"] = res.stderr_text;
    if (res.has_data) reply["data"] = res.data;
    return reply;
}

// Owns the accepted descriptor, which is closed even if the pool drops the task unrun
struct ConnectionTask final : sw::concurrency::Task {
    std::shared_ptr<Router> router;
    int fd;

    ConnectionTask(std::shared_ptr<Router> router, const int fd) : router(std::move(router)), fd(fd) {}
    ~ConnectionTask() override { ::close(fd); }

    ConnectionTask(const ConnectionTask&) = delete;
    ConnectionTask& operator=(const ConnectionTask&) = delete;

    void operator()() override {
        json reply;
        try {
            logPeer(fd);
            const auto req = SocketIO::recv_json(fd);
            const auto args = req.value("args", std::vector<std::string>{});
            const std::filesystem::path cwd = req.value("cwd", std::string{});
            reply = toReply(router->execute(args, cwd));
        } catch (const std::exception& e) {
            LogRegistry::shell()->error("[Server] Request failed: {}", e.what());
            reply = {{"ok", false}, {"exit_code", 1}, {"stderr", std::string(e.what()) + "\n"}};
        }

        if (!SocketIO::send_json(fd, reply))
            LogRegistry::shell()->warn("[Server] Client hung up before the reply was sent");
    }
};

}

Server::Server(std::shared_ptr<Router> router, std::filesystem::path socketPath, const unsigned int workers)
    : AsyncService("swctl-server"),
      router_(std::move(router)),
      socketPath_(std::move(socketPath)),
      workers_(workers == 0 ? 1 : workers) {
    if (!router_) throw std::invalid_argument("Server requires a router");
}

Server::~Server() {
    stop();
}

void Server::start() {
    if (isRunning()) return;

    bindListener();
    pool_ = std::make_unique<concurrency::ThreadPool>("swctl-requests", workers_);
    AsyncService::start();

    LogRegistry::shell()->info("[Server] Listening on {} with {} workers", socketPath_.string(), workers_);
}

void Server::stop() {
    AsyncService::stop();

    // Requests already running finish; queued ones are dropped and their clients see EOF
    if (pool_) {
        pool_->stop();
        pool_.reset();
    }
    closeListener();
}

void Server::bindListener() {
    if (socketPath_.native().size() >= sizeof(sockaddr_un::sun_path))
        throw std::runtime_error("Socket path is too long: " + socketPath_.string());

    if (socketPath_.has_parent_path()) std::filesystem::create_directories(socketPath_.parent_path());

    if (someoneListening(socketPath_))
        throw std::runtime_error("Another servicewarden daemon is already listening on " + socketPath_.string());
    ::unlink(socketPath_.c_str());  // stale socket from a daemon that did not shut down cleanly

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) throw std::runtime_error(fmt::format("socket(): {}", std::strerror(errno)));

    const auto addr = addressOf(socketPath_);
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        const int err = errno;
        ::close(fd);
        throw std::runtime_error(fmt::format("bind({}): {}", socketPath_.string(), std::strerror(err)));
    }

    if (::chmod(socketPath_.c_str(), 0660) != 0)
        LogRegistry::shell()->warn("[Server] chmod {} failed: {}", socketPath_.string(), std::strerror(errno));

    if (::listen(fd, 16) != 0) {
        const int err = errno;
        ::close(fd);
        ::unlink(socketPath_.c_str());
        throw std::runtime_error(fmt::format("listen(): {}", std::strerror(err)));
    }

    listenFd_.store(fd);
}

void Server::closeListener() {
    if (const int fd = listenFd_.exchange(-1); fd >= 0) {
        ::close(fd);
        ::unlink(socketPath_.c_str());
    }
}

void Server::runLoop() {
    while (!shouldStop()) {
        pollfd pfd{listenFd_.load(), POLLIN, 0};
        const int n = ::poll(&pfd, 1, ACCEPT_POLL_MS);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(fmt::format("poll(): {}", std::strerror(errno)));
        }
        if (n == 0 || !(pfd.revents & POLLIN)) continue;

        const int cfd = ::accept4(listenFd_.load(), nullptr, nullptr, SOCK_CLOEXEC);
        if (cfd < 0) continue;

        try {
            pool_->submit(std::make_shared<ConnectionTask>(router_, cfd));
        } catch (const std::exception& e) {
            LogRegistry::shell()->error("[Server] Dropping connection: {}", e.what());
        }
    }
}
