#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace subscout {
namespace daemon {

struct RateLimitDecision {
    bool allowed = false;
    int remaining = 0;
    double reset_after = 0.0;
    double retry_after = 0.0;
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Sliding-window admission control per client key. One mutex guards all
// keys. Keys whose window has fully expired are swept once more than
// max_keys are tracked, and at most once per window otherwise.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter(int requests, double window_seconds, bool trust_x_forwarded_for, size_t max_keys);

    std::string identify(const std::string& peer_address, const std::string& forwarded_for) const;

    RateLimitDecision hit(const std::string& key);
    RateLimitDecision hit(const std::string& key, Clock::time_point now);

    static HeaderList quotaHeaders(const RateLimitDecision& decision);
    static HeaderList retryHeaders(const RateLimitDecision& decision);

    int requests() const { return requests_; }
    size_t trackedKeys() const;

private:
    using Seconds = std::chrono::duration<double>;

    int requests_;
    Seconds window_;
    bool trust_x_forwarded_for_;
    size_t max_keys_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<Clock::time_point>> entries_;
    Clock::time_point last_sweep_{};

    void sweepLocked(Clock::time_point now);
};

}}
