#include "rate_limiter.h"
#include <algorithm>
#include <iostream>

namespace cloudrun {

RateLimiter::RateLimiter(const Config& config) : config_(config) {}

void RateLimiter::cleanup_ip_history(IpState& state,
                                     const std::chrono::steady_clock::time_point& now) {
    auto window_start = now - std::chrono::minutes(1);
    while (!state.requests.empty() && state.requests.front() < window_start) {
        state.requests.pop_front();
    }
}

RateLimiter::QuotaInfo RateLimiter::quota_for(IpState& state,
                                              const std::chrono::steady_clock::time_point& now) {
    cleanup_ip_history(state, now);

    QuotaInfo info;
    info.active_sessions = static_cast<int>(state.active_sessions.size());
    info.requests_this_minute = static_cast<int>(state.requests.size());
    info.requests_available = std::max(0, config_.max_requests_per_minute -
                                          info.requests_this_minute);
    info.can_submit = info.requests_available > 0;
    if (!info.can_submit) {
        info.reason = "Rate limit exceeded: " + std::to_string(config_.max_requests_per_minute) +
                      " executions per minute";
    }
    return info;
}

RateLimiter::QuotaInfo RateLimiter::check_quota(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    auto& state = ip_states_[ip];
    state.last_seen = now;
    return quota_for(state, now);
}

bool RateLimiter::register_request(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    auto& state = ip_states_[ip];
    state.last_seen = now;

    if (!quota_for(state, now).can_submit) {
        std::cerr << "[RateLimiter] " << ip << " over the per-minute limit" << std::endl;
        return false;
    }
    state.requests.push_back(now);
    return true;
}

bool RateLimiter::register_session_start(const std::string& ip, const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = ip_states_[ip];
    state.last_seen = std::chrono::steady_clock::now();

    if (static_cast<int>(state.active_sessions.size()) >= config_.max_concurrent_sessions) {
        std::cerr << "[RateLimiter] " << ip << " already has "
                  << state.active_sessions.size() << " open sessions" << std::endl;
        return false;
    }
    state.active_sessions.insert(session_id);
    return true;
}

void RateLimiter::register_session_end(const std::string& ip, const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ip_states_.find(ip);
    if (it == ip_states_.end()) {
        return;
    }
    it->second.active_sessions.erase(session_id);
    it->second.last_seen = std::chrono::steady_clock::now();
}

int RateLimiter::get_available_requests(const std::string& ip) {
    return check_quota(ip).requests_available;
}

void RateLimiter::cleanup_old_entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    auto cutoff = now - std::chrono::minutes(config_.cleanup_after_minutes);

    for (auto it = ip_states_.begin(); it != ip_states_.end();) {
        cleanup_ip_history(it->second, now);
        // Keep IPs with open sessions or recent requests
        if (it->second.active_sessions.empty() && it->second.requests.empty() &&
            it->second.last_seen < cutoff) {
            it = ip_states_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace cloudrun
