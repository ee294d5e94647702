#pragma once

#include "mediaharvest/dedup/fingerprint_cache.hpp"
#include "mediaharvest/dedup/url_normalizer.hpp"
#include "mediaharvest/network/fetcher.hpp"
#include "mediaharvest/network/prober.hpp"
#include "mediaharvest/storage/dedup_index.hpp"
#include "mediaharvest/transfer/download_task.hpp"
#include "mediaharvest/transfer/run_stats.hpp"
#include <memory>

namespace mediaharvest::dedup {

struct EngineSettings {
    bool probe = true;
    bool fingerprint = false;
    size_t fingerprint_bytes = crypto::DEFAULT_FINGERPRINT_BYTES;
    // Skip every identity check and always fetch.
    bool force = false;
};

/**
 * Decides per task whether to skip, link an existing copy, or download.
 *
 * Tiers, first match wins:
 *   1. normalized URL known and a copy survives   -> link, skipped
 *   2. normalized URL known, no copy survives      -> skipped, nothing written
 *   3. probed ETag known with a surviving copy     -> link, skipped
 *   4. probed Content-Length equals an indexed file -> link, skipped
 *   5. remote partial fingerprint matches a file   -> link, skipped
 *   6. full fetch; a duplicate by content hash is deleted and skipped
 *
 * Linking never replaces a file. A file already at the link target is taken
 * as the task's copy as it is, without checking its content or hash. A name
 * held by a download in flight gets a numeric suffix instead.
 *
 * process() never throws.
 */
class DecisionEngine {
public:
    DecisionEngine(std::shared_ptr<storage::DedupIndex> index,
                   std::shared_ptr<network::Prober> prober,
                   std::shared_ptr<network::Fetcher> fetcher,
                   std::shared_ptr<PartialFingerprintCache> fingerprints,
                   std::shared_ptr<transfer::RunStats> stats,
                   EngineSettings settings = {});
    
    transfer::TaskResult process(const transfer::DownloadTask& task);
    
    const EngineSettings& settings() const { return settings_; }
    const UrlNormalizer& normalizer() const { return normalizer_; }

private:
    transfer::TaskResult evaluate(const transfer::DownloadTask& task, const std::string& normalized);
    transfer::TaskResult fetch_fresh(const transfer::DownloadTask& task, const std::string& normalized,
                                     const std::optional<std::string>& fingerprint);
    
    // Puts `existing` at the task's destination (hard link, else copy) and
    // links the task's identifiers to `content_hash`.
    transfer::TaskResult skip_with_link(const transfer::DownloadTask& task,
                                        const std::filesystem::path& existing,
                                        storage::IndexRecord record,
                                        transfer::MatchTier tier);
    
    std::filesystem::path link_target(const transfer::DownloadTask& task,
                                      const std::filesystem::path& existing) const;
    
    void finish(const transfer::DownloadTask& task, const std::string& normalized,
                transfer::TaskResult& result);
    
    std::shared_ptr<storage::DedupIndex> index_;
    std::shared_ptr<network::Prober> prober_;
    std::shared_ptr<network::Fetcher> fetcher_;
    std::shared_ptr<PartialFingerprintCache> fingerprints_;
    std::shared_ptr<transfer::RunStats> stats_;
    EngineSettings settings_;
    UrlNormalizer normalizer_;
};

// Hard link, falling back to a copy. Fails if `target` exists.
core::Result link_or_copy(const std::filesystem::path& existing, const std::filesystem::path& target);

} // namespace mediaharvest::dedup
