#pragma once

#include "mediaharvest/core/error.hpp"
#include "mediaharvest/storage/harvest_settings.hpp"
#include "mediaharvest/transfer/download_task.hpp"
#include "mediaharvest/transfer/run_stats.hpp"
#include "mediaharvest/transfer/worker_pool.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mediaharvest::network {
class HttpClient;
}

namespace mediaharvest::storage {
class DedupIndex;
}

namespace mediaharvest::transfer {
class RateLimiter;
}

namespace mediaharvest::dedup {
class DecisionEngine;
class PartialFingerprintCache;
}

namespace mediaharvest::core {

struct RetryReport {
    size_t sidecars = 0;
    // Sidecars whose target file was already on disk; removed without a request.
    size_t already_present = 0;
    std::vector<transfer::TaskResult> results;
};

// Parses "url<TAB>folder<TAB>name". Folder and name are optional; an empty
// folder means `default_folder`. Blank lines and '#' comments yield nullopt.
std::optional<transfer::DownloadTask> parse_task_line(const std::string& line,
                                                      const std::filesystem::path& default_folder);

Result load_task_file(const std::filesystem::path& file,
                      const std::filesystem::path& default_folder,
                      std::vector<transfer::DownloadTask>& tasks);

/**
 * One harvesting run: owns the index, the shared rate limiter, the
 * fingerprint cache and the worker pool, and wires them into a
 * DecisionEngine.
 *
 * A transport may be injected (tests); otherwise libcurl is used. Either way
 * every request goes through the rate limiter.
 */
class Harvester {
public:
    explicit Harvester(storage::HarvestSettings settings,
                       std::shared_ptr<network::HttpClient> transport = nullptr);
    ~Harvester();
    
    Harvester(const Harvester&) = delete;
    Harvester& operator=(const Harvester&) = delete;
    
    Result initialize();
    bool is_initialized() const { return engine_ != nullptr; }
    
    std::vector<transfer::TaskResult> run(const std::vector<transfer::DownloadTask>& tasks,
                                          const transfer::ResultCallback& on_result = nullptr);
    
    RetryReport retry_failed(const std::filesystem::path& root);
    
    Result checkpoint();
    void shutdown();
    
    transfer::StatsSnapshot stats() const { return stats_->snapshot(); }
    void log_summary() const;
    
    const storage::HarvestSettings& settings() const { return settings_; }
    std::shared_ptr<storage::DedupIndex> index() const { return index_; }
    std::shared_ptr<transfer::RateLimiter> rate_limiter() const { return limiter_; }

private:
    storage::HarvestSettings settings_;
    std::shared_ptr<network::HttpClient> transport_;
    
    std::shared_ptr<storage::DedupIndex> index_;
    std::shared_ptr<transfer::RateLimiter> limiter_;
    std::shared_ptr<transfer::RunStats> stats_;
    std::shared_ptr<dedup::PartialFingerprintCache> fingerprints_;
    std::shared_ptr<dedup::DecisionEngine> engine_;
    std::unique_ptr<transfer::WorkerPool> pool_;
};

} // namespace mediaharvest::core
