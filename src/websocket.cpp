#include "websocket.h"
#include <cerrno>
#include <cstring>
#include <sstream>
#include <unistd.h>
#include <iostream>
#include <sys/socket.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace cloudrun {

namespace {

// read() until len bytes arrived; false on EOF or error
bool read_exact(int fd, void* data, size_t len) {
    char* p = static_cast<char*>(data);
    while (len > 0) {
        ssize_t n = read(fd, p, len);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        p += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

std::string close_payload(WSCloseCode code) {
    uint16_t value = static_cast<uint16_t>(code);
    std::string payload;
    payload += static_cast<char>((value >> 8) & 0xFF);
    payload += static_cast<char>(value & 0xFF);
    return payload;
}

void append_length(std::vector<uint8_t>& frame, uint8_t mask_bit, size_t payload_len) {
    if (payload_len <= 125) {
        frame.push_back(mask_bit | static_cast<uint8_t>(payload_len));
    } else if (payload_len <= 65535) {
        frame.push_back(mask_bit | 126);
        frame.push_back((payload_len >> 8) & 0xFF);
        frame.push_back(payload_len & 0xFF);
    } else {
        frame.push_back(mask_bit | 127);
        for (int i = 7; i >= 0; --i) {
            frame.push_back((static_cast<uint64_t>(payload_len) >> (i * 8)) & 0xFF);
        }
    }
}

} // namespace

std::string WebSocketManager::base64_encode(const unsigned char* data, size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                                  static_cast<int>(len));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

bool WebSocketManager::is_websocket_upgrade(const HttpHeaders& headers) {
    auto upgrade_it = headers.find("Upgrade");
    auto connection_it = headers.find("Connection");

    if (upgrade_it == headers.end() || connection_it == headers.end()) {
        return false;
    }

    // Case-insensitive comparison
    std::string upgrade = upgrade_it->second;
    std::string connection = connection_it->second;

    // Convert to lowercase
    for (auto& c : upgrade) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    for (auto& c : connection) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

    return upgrade == "websocket" && connection.find("upgrade") != std::string::npos;
}

std::string WebSocketManager::compute_accept_key(const std::string& sec_key) {
    // WebSocket magic string
    const std::string magic = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    std::string combined = sec_key + magic;

    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(combined.c_str()), combined.length(), hash);
    return base64_encode(hash, SHA_DIGEST_LENGTH);
}

std::string WebSocketManager::create_handshake_response(const std::string& sec_key) {
    std::ostringstream response;
    response << "HTTP/1.1 101 Switching Protocols\r\n"
             << "Upgrade: websocket\r\n"
             << "Connection: Upgrade\r\n"
             << "Sec-WebSocket-Accept: " << compute_accept_key(sec_key) << "\r\n"
             << "\r\n";

    return response.str();
}

std::vector<uint8_t> WebSocketManager::create_frame(WSOpcode opcode, const std::string& payload) {
    std::vector<uint8_t> frame;
    frame.reserve(payload.size() + 10);

    // First byte: FIN bit + opcode
    frame.push_back(0x80 | static_cast<uint8_t>(opcode));
    append_length(frame, 0x00, payload.size());

    // Payload data
    frame.insert(frame.end(), payload.begin(), payload.end());

    return frame;
}

std::vector<uint8_t> WebSocketManager::create_masked_frame(WSOpcode opcode,
                                                           const std::string& payload,
                                                           bool fin) {
    std::vector<uint8_t> frame;
    frame.reserve(payload.size() + 14);

    frame.push_back((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode));
    append_length(frame, 0x80, payload.size());

    uint8_t mask[4] = {0x37, 0xfa, 0x21, 0x3d};
    if (RAND_bytes(mask, sizeof(mask)) != 1) {
        std::cerr << "[WebSocket] RAND_bytes failed, using fixed mask" << std::endl;
    }
    frame.insert(frame.end(), mask, mask + 4);
    for (size_t i = 0; i < payload.size(); ++i) {
        frame.push_back(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]);
    }
    return frame;
}

bool WebSocketManager::send_text(int client_fd, const std::string& message) {
    auto frame = create_frame(WSOpcode::TEXT, message);
    return send_all(client_fd, frame.data(), frame.size());
}

bool WebSocketManager::send_close(int client_fd, WSCloseCode code) {
    auto frame = create_frame(WSOpcode::CLOSE, close_payload(code));
    return send_all(client_fd, frame.data(), frame.size());
}

bool WebSocketManager::read_frame(int client_fd, WSFrame& frame, size_t max_payload) {
    // Read first 2 bytes
    uint8_t header[2];
    if (!read_exact(client_fd, header, 2)) {
        return false;
    }

    frame.fin = (header[0] & 0x80) != 0;
    frame.opcode = static_cast<WSOpcode>(header[0] & 0x0F);

    // Parse payload length
    bool masked = (header[1] & 0x80) != 0;
    frame.masked = masked;
    uint64_t payload_len = header[1] & 0x7F;

    if (payload_len == 126) {
        uint8_t len_bytes[2];
        if (!read_exact(client_fd, len_bytes, 2)) {
            return false;
        }
        payload_len = (static_cast<uint64_t>(len_bytes[0]) << 8) | len_bytes[1];
    } else if (payload_len == 127) {
        uint8_t len_bytes[8];
        if (!read_exact(client_fd, len_bytes, 8)) {
            return false;
        }
        payload_len = 0;
        for (int i = 0; i < 8; i++) {
            payload_len = (payload_len << 8) | len_bytes[i];
        }
    }

    if (payload_len > max_payload) {
        std::cerr << "[WebSocket] Frame of " << payload_len << " bytes exceeds limit" << std::endl;
        return false;
    }

    // Read masking key if present
    uint8_t mask[4] = {0};
    if (masked && !read_exact(client_fd, mask, 4)) {
        return false;
    }

    // Read payload
    frame.payload.assign(static_cast<size_t>(payload_len), '\0');
    if (payload_len > 0 && !read_exact(client_fd, &frame.payload[0], frame.payload.size())) {
        return false;
    }

    // Unmask if needed
    if (masked) {
        for (size_t i = 0; i < frame.payload.size(); i++) {
            frame.payload[i] = static_cast<char>(static_cast<uint8_t>(frame.payload[i]) ^ mask[i % 4]);
        }
    }
    return true;
}

// ============================================================================
// WebSocketTransport
// ============================================================================

WebSocketTransport::WebSocketTransport(int fd, size_t max_message_size)
    : fd_(fd), max_message_size_(max_message_size) {}

bool WebSocketTransport::send_frame(WSOpcode opcode, const std::string& payload) {
    auto frame = WebSocketManager::create_frame(opcode, payload);
    std::lock_guard<std::mutex> lock(send_mutex_);
    return send_all(fd_, frame.data(), frame.size());
}

bool WebSocketTransport::send_text(const std::string& text) {
    if (closed_) {
        return false;
    }
    return send_frame(WSOpcode::TEXT, text);
}

std::optional<std::string> WebSocketTransport::receive_text() {
    std::string message;
    bool in_message = false;

    while (!closed_) {
        WSFrame frame;
        if (!WebSocketManager::read_frame(fd_, frame, max_message_size_)) {
            return std::nullopt;
        }
        // RFC 6455 section 5.1: the server must fail the connection on an unmasked frame
        if (!frame.masked) {
            std::cerr << "[WebSocket] Unmasked client frame, closing" << std::endl;
            close_with(WSCloseCode::PROTOCOL_ERROR);
            return std::nullopt;
        }

        switch (frame.opcode) {
            case WSOpcode::PING:
                if (!send_frame(WSOpcode::PONG, frame.payload)) {
                    return std::nullopt;
                }
                continue;
            case WSOpcode::PONG:
                continue;
            case WSOpcode::CLOSE:
                close_with(WSCloseCode::NORMAL);
                return std::nullopt;
            case WSOpcode::TEXT:
            case WSOpcode::BINARY:
                if (in_message) {
                    close_with(WSCloseCode::PROTOCOL_ERROR);
                    return std::nullopt;
                }
                in_message = true;
                message = std::move(frame.payload);
                break;
            case WSOpcode::CONTINUATION:
                if (!in_message) {
                    close_with(WSCloseCode::PROTOCOL_ERROR);
                    return std::nullopt;
                }
                message += frame.payload;
                break;
            default:
                close_with(WSCloseCode::PROTOCOL_ERROR);
                return std::nullopt;
        }

        if (message.size() > max_message_size_) {
            close_with(WSCloseCode::MESSAGE_TOO_BIG);
            return std::nullopt;
        }
        if (frame.fin) {
            return message;
        }
    }
    return std::nullopt;
}

void WebSocketTransport::close_with(WSCloseCode code) {
    if (closed_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (!WebSocketManager::send_close(fd_, code)) {
            std::cerr << "[WebSocket] Close frame not delivered" << std::endl;
        }
    }
    // Wakes up a reader blocked in read()
    shutdown(fd_, SHUT_RDWR);
}

void WebSocketTransport::close() {
    close_with(WSCloseCode::NORMAL);
}

} // namespace cloudrun
