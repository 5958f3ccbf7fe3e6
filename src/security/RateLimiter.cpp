#include "security/RateLimiter.h"

#include <algorithm>
#include <utility>

namespace termchat::security {

RateLimiter::RateLimiter(RateLimitPolicy policy, NowFn now)
    : policy_(policy), now_(std::move(now)) {}

bool RateLimiter::add(Key key) {
    auto bucket = std::make_shared<Bucket>();
    bucket->tokens = policy_.capacity;
    bucket->last_refill = now_();

    std::unique_lock<std::shared_mutex> lk(map_mu_);
    return buckets_.emplace(key, std::move(bucket)).second;
}

void RateLimiter::remove(Key key) {
    std::unique_lock<std::shared_mutex> lk(map_mu_);
    buckets_.erase(key);
}

std::shared_ptr<RateLimiter::Bucket> RateLimiter::find(Key key) const {
    std::shared_lock<std::shared_mutex> lk(map_mu_);
    auto it = buckets_.find(key);
    return it == buckets_.end() ? nullptr : it->second;
}

std::shared_ptr<RateLimiter::Bucket> RateLimiter::find_or_create(Key key) {
    if (auto bucket = find(key)) return bucket;
    add(key);
    return find(key);
}

void RateLimiter::refill(Bucket& bucket, Clock::time_point now) const {
    if (now <= bucket.last_refill) return;

    const std::chrono::duration<double> elapsed = now - bucket.last_refill;
    bucket.tokens = std::min(policy_.capacity, bucket.tokens + elapsed.count() * policy_.refill_per_second);
    bucket.last_refill = now;
}

RateLimiter::Verdict RateLimiter::admit(Key key, double cost) {
    auto bucket = find_or_create(key);

    Verdict verdict = Verdict::Allowed;
    {
        std::lock_guard<std::mutex> lk(bucket->mu);
        refill(*bucket, now_());

        if (bucket->tokens >= cost) {
            bucket->tokens -= cost;
            bucket->throttled = false;
        } else if (!bucket->throttled) {
            bucket->throttled = true;
            verdict = Verdict::Throttled;
        } else {
            verdict = Verdict::Dropped;
        }
    }

    std::lock_guard<std::mutex> lk(stats_mu_);
    if (verdict == Verdict::Allowed) {
        ++allowed_;
    } else {
        ++denied_;
    }
    return verdict;
}

bool RateLimiter::try_consume(Key key, double cost) {
    return admit(key, cost) == Verdict::Allowed;
}

double RateLimiter::tokens(Key key) {
    auto bucket = find(key);
    if (!bucket) return -1.0;

    std::lock_guard<std::mutex> lk(bucket->mu);
    refill(*bucket, now_());
    return bucket->tokens;
}

RateLimiter::Stats RateLimiter::stats() const {
    Stats stats;
    {
        std::shared_lock<std::shared_mutex> lk(map_mu_);
        stats.buckets = buckets_.size();
    }
    std::lock_guard<std::mutex> lk(stats_mu_);
    stats.allowed = allowed_;
    stats.denied = denied_;
    return stats;
}

} // namespace termchat::security
