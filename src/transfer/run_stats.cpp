#include "mediaharvest/transfer/run_stats.hpp"
#include "mediaharvest/core/utils.hpp"
#include <sstream>

namespace mediaharvest::transfer {

void RunStats::on_downloaded(uint64_t bytes) {
    downloaded_.fetch_add(1, std::memory_order_relaxed);
    bytes_downloaded_.fetch_add(bytes, std::memory_order_relaxed);
}

StatsSnapshot RunStats::snapshot() const {
    StatsSnapshot stats;
    stats.attempted = attempted_.load();
    stats.downloaded = downloaded_.load();
    stats.skipped = skipped_.load();
    stats.failed = failed_.load();
    stats.recovered = recovered_.load();
    stats.bytes_downloaded = bytes_downloaded_.load();
    return stats;
}

std::string RunStats::summary() const {
    auto stats = snapshot();
    
    std::ostringstream oss;
    oss << "attempted=" << stats.attempted
        << " downloaded=" << stats.downloaded
        << " skipped=" << stats.skipped
        << " failed=" << stats.failed
        << " recovered=" << stats.recovered
        << " bytes=" << core::utils::StringUtils::format_bytes(stats.bytes_downloaded);
    return oss.str();
}

void RunStats::reset() {
    attempted_ = 0;
    downloaded_ = 0;
    skipped_ = 0;
    failed_ = 0;
    recovered_ = 0;
    bytes_downloaded_ = 0;
}

} // namespace mediaharvest::transfer
