#include "protocols/shell/Client.hpp"
#include "protocols/shell/SocketIO.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fmt/format.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace sw::shell;

namespace {

struct Descriptor {
    int fd;
    explicit Descriptor(const int fd) : fd(fd) {}
    ~Descriptor() { if (fd >= 0) ::close(fd); }
    Descriptor(const Descriptor&) = delete;
    Descriptor& operator=(const Descriptor&) = delete;
};

}

Client::Client(std::filesystem::path socketPath) : socketPath_(std::move(socketPath)) {}

CommandResult Client::execute(const std::vector<std::string>& args, const std::filesystem::path& cwd) const {
    const Descriptor s(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (s.fd < 0) throw std::runtime_error(fmt::format("socket(): {}", std::strerror(errno)));

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socketPath_.c_str());
    if (::connect(s.fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0)
        throw DaemonUnavailable(fmt::format("servicewarden daemon is not running ({}: {}). Start it with 'swctl daemon'.",
                                            socketPath_.string(), std::strerror(errno)));

    const nlohmann::json req{{"args", args}, {"cwd", cwd.string()}};
    if (!SocketIO::send_json(s.fd, req)) throw std::runtime_error("Daemon closed the connection");

    const auto reply = SocketIO::recv_json(s.fd);

    CommandResult res;
    res.exit_code = reply.value("exit_code", 1);
    res.stdout_text = reply.value("stdout", std::string{});
    res.stderr_text = reply.value("stderr", std::string{});
    if (reply.contains("data")) {
        res.data = reply.at("data");
        res.has_data = true;
    }
    return res;
}
