#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace mediaharvest::transfer {

struct StatsSnapshot {
    uint64_t attempted = 0;
    uint64_t downloaded = 0;
    uint64_t skipped = 0;
    uint64_t failed = 0;
    uint64_t recovered = 0;
    uint64_t bytes_downloaded = 0;
};

// Run-level counters, updated concurrently by workers.
class RunStats {
public:
    void on_attempted() { attempted_.fetch_add(1, std::memory_order_relaxed); }
    void on_downloaded(uint64_t bytes);
    void on_skipped() { skipped_.fetch_add(1, std::memory_order_relaxed); }
    void on_failed() { failed_.fetch_add(1, std::memory_order_relaxed); }
    void on_recovered() { recovered_.fetch_add(1, std::memory_order_relaxed); }
    
    StatsSnapshot snapshot() const;
    std::string summary() const;
    void reset();

private:
    std::atomic<uint64_t> attempted_{0};
    std::atomic<uint64_t> downloaded_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> recovered_{0};
    std::atomic<uint64_t> bytes_downloaded_{0};
};

} // namespace mediaharvest::transfer
