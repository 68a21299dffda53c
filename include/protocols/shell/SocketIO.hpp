#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>

namespace sw::shell {

// Framing for the control socket: a 4-byte big-endian length, then that many
// bytes of JSON.
struct SocketIO {
    static constexpr uint32_t MAX_MESSAGE = 1u << 20;

    // Throws std::runtime_error on EOF, oversize frames or malformed JSON
    static nlohmann::json recv_json(int fd);

    // False when the peer went away mid-write
    static bool send_json(int fd, const nlohmann::json& j);
};

}
