/*
 * warden C++17 - KeyedRateLimiter
 *
 * Per-key rate limiting. TOKEN_BUCKET refills `rate` tokens per second up to
 * `capacity`; FIXED_WINDOW admits `capacity` requests per `rate`-second window.
 */
#ifndef warden_CORE_RATE_LIMITER_HPP
#define warden_CORE_RATE_LIMITER_HPP

#include <string>
#include <map>
#include <mutex>
#include <cstdint>

namespace warden {

class KeyedRateLimiter {
public:
    enum Strategy {
        TOKEN_BUCKET,
        FIXED_WINDOW
    };

    KeyedRateLimiter(Strategy strategy, int capacity, int rate);

    bool try_acquire(const std::string& key);
    bool try_acquire(const std::string& key, int64_t now_ms);

    void reset(const std::string& key);

    // Forget keys idle for longer than max_idle_seconds
    void cleanup(int64_t max_idle_seconds);

    size_t size() const;

private:
    struct Bucket {
        double tokens;
        int64_t window_start_ms;
        int count;
        int64_t last_seen_ms;
    };

    Strategy strategy_;
    int capacity_;
    int rate_;
    mutable std::mutex mutex_;
    std::map<std::string, Bucket> buckets_;
};

} // namespace warden

#endif // warden_CORE_RATE_LIMITER_HPP
