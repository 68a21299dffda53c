#include "protocols/shell/SocketIO.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace sw::shell;

namespace {

bool readn(const int fd, void* buf, size_t n) {
    auto* p = static_cast<unsigned char*>(buf);
    while (n) {
        const ssize_t r = ::read(fd, p, n);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) return false;
        p += r;
        n -= static_cast<size_t>(r);
    }
    return true;
}

// MSG_NOSIGNAL: a client that hangs up early must not SIGPIPE the daemon
bool writen(const int fd, const void* buf, size_t n) {
    auto* p = static_cast<const unsigned char*>(buf);
    while (n) {
        const ssize_t w = ::send(fd, p, n, MSG_NOSIGNAL);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        p += w;
        n -= static_cast<size_t>(w);
    }
    return true;
}

}

nlohmann::json SocketIO::recv_json(const int fd) {
    uint32_t be = 0;
    if (!readn(fd, &be, 4)) throw std::runtime_error("EOF reading length");

    const uint32_t len = ntohl(be);
    if (len > MAX_MESSAGE) throw std::runtime_error("Message too large");

    std::string body(len, '\0');
    if (!readn(fd, body.data(), len)) throw std::runtime_error("EOF reading body");

    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed message: ") + e.what());
    }
}

bool SocketIO::send_json(const int fd, const nlohmann::json& j) {
    const auto s = j.dump();
    const uint32_t len = htonl(static_cast<uint32_t>(s.size()));
    return writen(fd, &len, 4) && writen(fd, s.data(), s.size());
}
