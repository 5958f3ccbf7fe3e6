#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace termchat::security {

struct RateLimitPolicy {
    double capacity = 60.0;           // burst allowance
    double refill_per_second = 1.0;   // sustained rate
};

// Per-session token buckets refilled lazily on each call; no timer thread.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    using Key = std::uint64_t;

    enum class Verdict {
        Allowed,
        Throttled,  // first denial of a violation episode: notify the sender once
        Dropped,    // further denials in the same episode
    };

    struct Stats {
        std::size_t buckets = 0;
        std::uint64_t allowed = 0;
        std::uint64_t denied = 0;
    };

    explicit RateLimiter(RateLimitPolicy policy, NowFn now = &Clock::now);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Creates a full bucket. Returns false if one already exists.
    bool add(Key key);
    // Idempotent.
    void remove(Key key);

    bool try_consume(Key key, double cost = 1.0);
    Verdict admit(Key key, double cost = 1.0);

    // Refilled balance without consuming; negative if the key is unknown.
    double tokens(Key key);

    const RateLimitPolicy& policy() const noexcept { return policy_; }
    Stats stats() const;

private:
    struct Bucket {
        std::mutex mu;
        double tokens = 0.0;
        Clock::time_point last_refill;
        bool throttled = false;
    };

    std::shared_ptr<Bucket> find(Key key) const;
    std::shared_ptr<Bucket> find_or_create(Key key);
    void refill(Bucket& bucket, Clock::time_point now) const;

    RateLimitPolicy policy_;
    NowFn now_;

    mutable std::shared_mutex map_mu_;
    std::unordered_map<Key, std::shared_ptr<Bucket>> buckets_;

    mutable std::mutex stats_mu_;
    std::uint64_t allowed_ = 0;
    std::uint64_t denied_ = 0;
};

} // namespace termchat::security
