#pragma once

#include <string>
#include <map>
#include <set>
#include <deque>
#include <mutex>
#include <chrono>

namespace cloudrun {

// Per client IP admission control: concurrent sessions and executions per minute
class RateLimiter {
public:
    struct Config {
        int max_concurrent_sessions;
        int max_requests_per_minute;
        int cleanup_after_minutes;

        Config() :
            max_concurrent_sessions(2),
            max_requests_per_minute(30),
            cleanup_after_minutes(60) {}
    };

    struct QuotaInfo {
        int active_sessions = 0;
        int requests_this_minute = 0;
        int requests_available = 0;
        bool can_submit = false;
        std::string reason;
    };

    explicit RateLimiter(const Config& config = Config());

    // Check if IP can submit another execution right now
    QuotaInfo check_quota(const std::string& ip);

    // Record an execution request; false (nothing recorded) when over the limit
    bool register_request(const std::string& ip);

    // Register a session; false when the IP already has the maximum open
    bool register_session_start(const std::string& ip, const std::string& session_id);

    void register_session_end(const std::string& ip, const std::string& session_id);

    // Executions the IP may still start in the current window
    int get_available_requests(const std::string& ip);

    // Periodic cleanup of idle IPs
    void cleanup_old_entries();

    const Config& config() const { return config_; }

private:
    Config config_;
    mutable std::mutex mutex_;

    struct IpState {
        std::set<std::string> active_sessions;
        std::deque<std::chrono::steady_clock::time_point> requests;
        std::chrono::steady_clock::time_point last_seen;
    };

    std::map<std::string, IpState> ip_states_;

    void cleanup_ip_history(IpState& state, const std::chrono::steady_clock::time_point& now);
    QuotaInfo quota_for(IpState& state, const std::chrono::steady_clock::time_point& now);
};

} // namespace cloudrun
