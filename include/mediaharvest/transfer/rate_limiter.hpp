#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace mediaharvest::transfer {

// Token bucket shared by every outbound request. Tokens refill continuously
// from elapsed time; the bucket starts full.
class RateLimiter {
public:
    // rate <= 0 disables limiting. capacity <= 0 means max(1, rate).
    explicit RateLimiter(double tokens_per_second, double capacity = 0.0);
    
    // Blocks, polling every 10 ms, until `tokens` are available. Requests larger
    // than the capacity wait for a full bucket and drain it.
    void acquire(double tokens = 1.0);
    bool try_acquire(double tokens = 1.0);
    
    double available_tokens();
    double rate() const { return rate_; }
    double capacity() const { return capacity_; }
    bool unlimited() const { return rate_ <= 0.0; }
    
    static constexpr std::chrono::milliseconds POLL_INTERVAL{10};

private:
    double rate_;
    double capacity_;
    double available_tokens_;
    std::chrono::steady_clock::time_point last_refill_;
    std::mutex mutex_;
    
    void update_tokens();
};

} // namespace mediaharvest::transfer
