#pragma once

#include <optional>
#include <string>

namespace cloudrun {

// Message-oriented bidirectional channel to one caller
class SessionTransport {
public:
    virtual ~SessionTransport() = default;

    // False when the peer is gone
    virtual bool send_text(const std::string& text) = 0;

    // Next text message; nullopt once the peer closed or the connection broke
    virtual std::optional<std::string> receive_text() = 0;

    // Close the channel; unblocks a pending receive_text()
    virtual void close() = 0;
};

} // namespace cloudrun
