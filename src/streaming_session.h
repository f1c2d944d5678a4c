#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "channel.h"
#include "execution_orchestrator.h"
#include "output_event.h"
#include "rate_limiter.h"
#include "session_transport.h"

namespace cloudrun {

struct SessionConfig {
    std::chrono::milliseconds request_timeout{DEFAULT_TIMEOUT_SECONDS * 1000};
    std::chrono::milliseconds followup_window{FOLLOWUP_WINDOW_SECONDS * 1000};
};

// Serves one caller: reads a request, streams the execution's events back in
// sequence order, honours cancel messages, and after a missing dependency was
// reported keeps the channel open for an install-and-rerun follow-up.
class StreamingSession {
public:
    StreamingSession(std::shared_ptr<SessionTransport> transport,
                     ExecutionOrchestrator& orchestrator,
                     SessionConfig config = SessionConfig{},
                     RateLimiter* limiter = nullptr,
                     std::string client_ip = "");
    ~StreamingSession();

    StreamingSession(const StreamingSession&) = delete;
    StreamingSession& operator=(const StreamingSession&) = delete;

    // Blocks until the session is over, then closes the transport
    void run();

    // Cancel the current execution, if any
    void cancel();

    // Output and source of the latest execution, for collaborators
    std::optional<ExecutionSummary> last_execution() const;

    const std::string& id() const { return id_; }

private:
    struct Inbound {
        std::string text;
        std::shared_ptr<CancellationToken> token;
    };

    void read_loop();
    void send_event(const OutputEvent& event);

    // Cancel the running execution, or end the session when none runs
    void handle_cancel_message();
    bool stop_requested() const;

    // True when the channel should stay open for a follow-up request
    bool serve(const Inbound& inbound);

    // Terminal event for a request that never reached the orchestrator
    void reject(const std::string& outcome, const std::string& message);

    std::shared_ptr<SessionTransport> transport_;
    ExecutionOrchestrator& orchestrator_;
    SessionConfig config_;
    RateLimiter* limiter_;
    std::string client_ip_;
    std::string id_;

    EventEmitter events_;
    Channel<Inbound> inbound_;
    std::atomic<bool> peer_gone_{false};

    mutable std::mutex mutex_;
    std::shared_ptr<CancellationToken> current_;   // Token of the running execution only
    bool stop_requested_ = false;                   // Caller sent cancel or stop
    std::optional<ExecutionSummary> last_;

    std::thread reader_;
};

} // namespace cloudrun
