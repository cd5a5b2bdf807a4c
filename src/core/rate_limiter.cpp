#include <warden/core/rate_limiter.hpp>
#include <warden/core/utils.hpp>

#include <algorithm>

namespace warden {

KeyedRateLimiter::KeyedRateLimiter(Strategy strategy, int capacity, int rate)
    : strategy_(strategy)
    , capacity_(std::max(1, capacity))
    , rate_(std::max(1, rate)) {}

bool KeyedRateLimiter::try_acquire(const std::string& key) {
    return try_acquire(key, monotonic_ms());
}

bool KeyedRateLimiter::try_acquire(const std::string& key, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        Bucket b;
        b.tokens = capacity_;
        b.window_start_ms = now_ms;
        b.count = 0;
        b.last_seen_ms = now_ms;
        it = buckets_.insert(std::make_pair(key, b)).first;
    }
    Bucket& b = it->second;

    bool admitted = false;
    if (strategy_ == TOKEN_BUCKET) {
        double elapsed = static_cast<double>(std::max<int64_t>(0, now_ms - b.last_seen_ms)) / 1000.0;
        b.tokens = std::min(static_cast<double>(capacity_), b.tokens + elapsed * rate_);
        if (b.tokens >= 1.0) {
            b.tokens -= 1.0;
            admitted = true;
        }
    } else {
        if (now_ms - b.window_start_ms >= static_cast<int64_t>(rate_) * 1000) {
            b.window_start_ms = now_ms;
            b.count = 0;
        }
        if (b.count < capacity_) {
            ++b.count;
            admitted = true;
        }
    }
    b.last_seen_ms = now_ms;
    return admitted;
}

void KeyedRateLimiter::reset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    buckets_.erase(key);
}

void KeyedRateLimiter::cleanup(int64_t max_idle_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = monotonic_ms();
    for (auto it = buckets_.begin(); it != buckets_.end(); ) {
        if (now - it->second.last_seen_ms > max_idle_seconds * 1000) {
            it = buckets_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t KeyedRateLimiter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

} // namespace warden
