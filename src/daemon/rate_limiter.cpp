#include "subscout/daemon/rate_limiter.hpp"
#include "subscout/common/hostname.hpp"
#include "subscout/common/logger.hpp"
#include <algorithm>
#include <cmath>

namespace subscout {
namespace daemon {

RateLimiter::RateLimiter(int requests, double window_seconds, bool trust_x_forwarded_for, size_t max_keys)
    : requests_(std::max(1, requests)),
      window_(std::max(1.0, window_seconds)),
      trust_x_forwarded_for_(trust_x_forwarded_for),
      max_keys_(std::max<size_t>(1, max_keys)) {}

std::string RateLimiter::identify(const std::string& peer_address, const std::string& forwarded_for) const {
    if (trust_x_forwarded_for_ && !forwarded_for.empty()) {
        auto first = common::trim(forwarded_for.substr(0, forwarded_for.find(',')));
        if (!first.empty()) {
            return first;
        }
    }
    if (!peer_address.empty()) {
        return peer_address;
    }
    return "unknown";
}

RateLimitDecision RateLimiter::hit(const std::string& key) {
    return hit(key, Clock::now());
}

RateLimitDecision RateLimiter::hit(const std::string& key, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (entries_.size() > max_keys_ || now - last_sweep_ >= window_) {
        sweepLocked(now);
    }

    auto window = std::chrono::duration_cast<Clock::duration>(window_);
    auto window_start = now - window;

    auto& bucket = entries_[key];
    while (!bucket.empty() && bucket.front() <= window_start) {
        bucket.pop_front();
    }

    RateLimitDecision decision;

    if (static_cast<int>(bucket.size()) >= requests_) {
        decision.allowed = false;
        decision.retry_after = bucket.empty()
            ? window_.count()
            : (window_ - Seconds(now - bucket.front())).count();
        decision.reset_after = std::max(0.0, decision.retry_after);
        return decision;
    }

    bucket.push_back(now);
    decision.allowed = true;
    decision.remaining = requests_ - static_cast<int>(bucket.size());
    decision.reset_after = std::max(0.0, (window_ - Seconds(now - bucket.front())).count());
    return decision;
}

void RateLimiter::sweepLocked(Clock::time_point now) {
    auto window_start = now - std::chrono::duration_cast<Clock::duration>(window_);
    size_t before = entries_.size();

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.empty() || it->second.back() <= window_start) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    last_sweep_ = now;

    if (before != entries_.size()) {
        common::Logger::instance().debug("[RateLimiter] Swept idle keys | removed={} | tracked={}",
                                        before - entries_.size(), entries_.size());
    }
}

HeaderList RateLimiter::quotaHeaders(const RateLimitDecision& decision) {
    auto reset = static_cast<long long>(std::ceil(decision.reset_after));
    return {
        {"X-RateLimit-Remaining", std::to_string(std::max(0, decision.remaining))},
        {"X-RateLimit-Reset", std::to_string(std::max(0LL, reset))}
    };
}

HeaderList RateLimiter::retryHeaders(const RateLimitDecision& decision) {
    auto retry = static_cast<long long>(std::ceil(decision.retry_after));
    return {
        {"Retry-After", std::to_string(std::max(0LL, retry))}
    };
}

size_t RateLimiter::trackedKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}}
