#include "streaming_session.h"
#include "errors.h"
#include "ids.h"
#include <iostream>

namespace cloudrun {

namespace {

// "cancel" / "stop" control messages; anything else is a request
bool is_cancel_message(const Json::Value& json) {
    if (!json.isObject() || !json["action"].isString()) {
        return false;
    }
    const std::string action = json["action"].asString();
    return action == "cancel" || action == "stop";
}

} // namespace

StreamingSession::StreamingSession(std::shared_ptr<SessionTransport> transport,
                                   ExecutionOrchestrator& orchestrator,
                                   SessionConfig config,
                                   RateLimiter* limiter,
                                   std::string client_ip)
    : transport_(std::move(transport)),
      orchestrator_(orchestrator),
      config_(config),
      limiter_(limiter),
      client_ip_(std::move(client_ip)),
      id_(generate_id("sess_")),
      events_([this](const OutputEvent& event) { send_event(event); }) {}

StreamingSession::~StreamingSession() {
    if (reader_.joinable()) {
        transport_->close();
        reader_.join();
    }
}

void StreamingSession::run() {
    std::cout << "[Session] " << id_ << " opened"
              << (client_ip_.empty() ? "" : " from " + client_ip_) << std::endl;

    reader_ = std::thread(&StreamingSession::read_loop, this);

    bool admitted = !limiter_ || limiter_->register_session_start(client_ip_, id_);
    if (!admitted) {
        reject("rate_limited", "Too many concurrent sessions from this address");
    } else {
        auto wait = config_.request_timeout;
        while (true) {
            Inbound inbound;
            auto status = inbound_.pop_for(inbound, wait);
            if (status == Channel<Inbound>::PopStatus::TIMEOUT) {
                if (!last_execution()) {
                    reject("timeout", "No request received");
                }
                break;
            }
            if (status == Channel<Inbound>::PopStatus::CLOSED) {
                if (stop_requested() && !last_execution()) {
                    reject("cancelled", "Cancelled before any request");
                }
                break;
            }
            if (!serve(inbound)) {
                break;
            }
            wait = config_.followup_window;
        }
        if (limiter_) {
            limiter_->register_session_end(client_ip_, id_);
        }
    }

    transport_->close();
    reader_.join();

    std::cout << "[Session] " << id_ << " closed after " << events_.events_emitted()
              << " events" << std::endl;
}

void StreamingSession::read_loop() {
    while (auto text = transport_->receive_text()) {
        Json::Value json;
        try {
            json = parse_json_object(*text);
        } catch (const ValidationError&) {
            // Let serve() report it as a malformed request
        }

        if (is_cancel_message(json)) {
            std::cout << "[Session] " << id_ << " cancel requested" << std::endl;
            handle_cancel_message();
            continue;
        }
        if (json.isObject() && json.isMember("action")) {
            std::cerr << "[Session] " << id_ << " ignoring unknown action" << std::endl;
            continue;
        }

        // Each queued request owns its token; it becomes current_ only once
        // serve() starts it, so a cancel always reaches the running execution
        inbound_.push(Inbound{std::move(*text), std::make_shared<CancellationToken>()});
    }

    // Peer went away (or we closed): nothing left to run for
    peer_gone_ = true;
    cancel();
    inbound_.close();
}

void StreamingSession::send_event(const OutputEvent& event) {
    if (peer_gone_) {
        return;
    }
    if (!transport_->send_text(event.serialize())) {
        std::cerr << "[Session] " << id_ << " peer unreachable, cancelling" << std::endl;
        peer_gone_ = true;
        cancel();
    }
}

void StreamingSession::cancel() {
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token = current_;
    }
    if (token) {
        token->cancel();
    }
}

void StreamingSession::handle_cancel_message() {
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        token = current_;
    }
    if (token) {
        token->cancel();
        return;
    }
    // Idle: between requests or still waiting for the first one
    inbound_.close();
}

bool StreamingSession::stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_requested_;
}

void StreamingSession::reject(const std::string& outcome, const std::string& message) {
    std::cerr << "[Session] " << id_ << " rejected: " << message << std::endl;
    events_.complete(false, std::chrono::milliseconds(0), outcome, -1, "", message);
}

bool StreamingSession::serve(const Inbound& inbound) {
    ExecutionRequest request;
    try {
        request = ExecutionRequest::parse(inbound.text);
    } catch (const ValidationError& e) {
        reject("validation_error", e.what());
        return false;
    }

    if (limiter_ && !limiter_->register_request(client_ip_)) {
        reject("rate_limited", limiter_->check_quota(client_ip_).reason);
        return false;
    }

    std::cout << "[Session] " << id_ << " request: language=" << request.language_id
              << ", code_length=" << request.source_code.size()
              << ", has_stdin=" << (request.stdin_data.empty() ? "no" : "yes")
              << ", files=" << request.extra_files.size()
              << ", packages=" << request.preinstall_packages.size() << std::endl;

    bool stopped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = inbound.token;
        stopped = stop_requested_;
    }
    // A cancel that landed while this request sat in the queue
    if (stopped) {
        inbound.token->cancel();
    }

    ExecutionSummary summary = orchestrator_.execute(request, events_, *inbound.token);
    bool followup = summary.missing_dependency.has_value();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_.reset();
        last_ = std::move(summary);
        stopped = stop_requested_;
    }
    return followup && !stopped && !peer_gone_;
}

std::optional<ExecutionSummary> StreamingSession::last_execution() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_;
}

} // namespace cloudrun
