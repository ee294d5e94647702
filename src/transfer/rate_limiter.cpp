#include "mediaharvest/transfer/rate_limiter.hpp"
#include "mediaharvest/core/logger.hpp"
#include <algorithm>
#include <thread>

namespace mediaharvest::transfer {

RateLimiter::RateLimiter(double tokens_per_second, double capacity)
    : rate_(tokens_per_second)
    , capacity_(capacity > 0.0 ? capacity : std::max(1.0, tokens_per_second))
    , available_tokens_(capacity_)
    , last_refill_(std::chrono::steady_clock::now())
{
}

void RateLimiter::acquire(double tokens) {
    if (unlimited()) {
        return;
    }
    
    // More than the bucket holds would never be granted.
    if (tokens > capacity_) {
        LOG_WARN("Rate limiter asked for {} tokens, capacity is {}; taking a full bucket", tokens, capacity_);
        tokens = capacity_;
    }
    
    while (!try_acquire(tokens)) {
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

bool RateLimiter::try_acquire(double tokens) {
    if (unlimited()) {
        return true;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    update_tokens();
    
    if (available_tokens_ >= tokens) {
        available_tokens_ -= tokens;
        return true;
    }
    return false;
}

double RateLimiter::available_tokens() {
    std::lock_guard<std::mutex> lock(mutex_);
    update_tokens();
    return available_tokens_;
}

void RateLimiter::update_tokens() {
    auto now = std::chrono::steady_clock::now();
    std::chrono::duration<double> elapsed = now - last_refill_;
    
    if (elapsed.count() > 0.0) {
        available_tokens_ = std::min(capacity_, available_tokens_ + elapsed.count() * rate_);
        last_refill_ = now;
    }
}

} // namespace mediaharvest::transfer
