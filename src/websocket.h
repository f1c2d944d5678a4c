#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <cstdint>
#include <optional>
#include "constants.h"
#include "http_server.h"
#include "session_transport.h"

namespace cloudrun {

// WebSocket frame opcodes
enum class WSOpcode : uint8_t {
    CONTINUATION = 0x0,
    TEXT = 0x1,
    BINARY = 0x2,
    CLOSE = 0x8,
    PING = 0x9,
    PONG = 0xA
};

// Close status codes we send (RFC 6455 section 7.4.1)
enum class WSCloseCode : uint16_t {
    NORMAL = 1000,
    PROTOCOL_ERROR = 1002,
    MESSAGE_TOO_BIG = 1009
};

struct WSFrame {
    bool fin = true;
    WSOpcode opcode = WSOpcode::TEXT;
    bool masked = false;   // Mask bit as received; clients must set it
    std::string payload;   // Unmasked
};

// Stateless RFC 6455 helpers
class WebSocketManager {
public:
    // Check if request is WebSocket upgrade
    static bool is_websocket_upgrade(const HttpHeaders& headers);

    // Value of Sec-WebSocket-Accept for a client key
    static std::string compute_accept_key(const std::string& sec_key);

    // Perform WebSocket handshake
    static std::string create_handshake_response(const std::string& sec_key);

    // Unmasked server-to-client frame
    static std::vector<uint8_t> create_frame(WSOpcode opcode, const std::string& payload);

    // Masked client-to-server frame, for tests and tooling
    static std::vector<uint8_t> create_masked_frame(WSOpcode opcode, const std::string& payload,
                                                    bool fin = true);

    // Send text frame to client
    static bool send_text(int client_fd, const std::string& message);

    // Send close frame
    static bool send_close(int client_fd, WSCloseCode code = WSCloseCode::NORMAL);

    // Read one frame. False on EOF, I/O error or a payload above max_payload.
    static bool read_frame(int client_fd, WSFrame& frame, size_t max_payload = MAX_MESSAGE_SIZE);

private:
    static std::string base64_encode(const unsigned char* data, size_t len);
};

// SessionTransport over an upgraded socket. Sends are serialised; one thread
// may block in receive_text() while others send.
class WebSocketTransport : public SessionTransport {
public:
    explicit WebSocketTransport(int fd, size_t max_message_size = MAX_MESSAGE_SIZE);

    bool send_text(const std::string& text) override;

    // Reassembles fragmented messages and answers pings on the way
    std::optional<std::string> receive_text() override;

    // Sends a close frame and shuts the socket down; the fd stays owned by the server
    void close() override;

private:
    bool send_frame(WSOpcode opcode, const std::string& payload);
    void close_with(WSCloseCode code);

    int fd_;
    size_t max_message_size_;
    std::mutex send_mutex_;
    std::atomic<bool> closed_{false};
};

} // namespace cloudrun
