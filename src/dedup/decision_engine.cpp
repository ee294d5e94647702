#include "mediaharvest/dedup/decision_engine.hpp"
#include "mediaharvest/core/logger.hpp"
#include "mediaharvest/core/utils.hpp"
#include "mediaharvest/crypto/hash.hpp"
#include "mediaharvest/storage/sidecar.hpp"

namespace mediaharvest::dedup {

using core::ErrorCode;
using core::Result;
using core::utils::FileUtils;
using transfer::DownloadTask;
using transfer::MatchTier;
using transfer::TaskOutcome;
using transfer::TaskResult;

namespace {

std::string display_name(const DownloadTask& task) {
    if (task.name && !task.name->empty()) {
        return *task.name;
    }
    if (task.target_path) {
        return task.target_path->filename().string();
    }
    auto base = network::url_basename(task.url);
    return base.empty() ? "-" : base;
}

bool same_file(const std::filesystem::path& a, const std::filesystem::path& b) {
    return FileUtils::absolute_normal(a) == FileUtils::absolute_normal(b);
}

}

Result link_or_copy(const std::filesystem::path& existing, const std::filesystem::path& target) {
    std::error_code ec;
    if (std::filesystem::exists(target, ec)) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Target already exists: " + target.string());
    }
    
    auto parent = target.parent_path();
    if (!parent.empty() && !FileUtils::create_directories(parent)) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Cannot create folder " + parent.string());
    }
    
    std::filesystem::create_hard_link(existing, target, ec);
    if (!ec) {
        return Result();
    }
    
    LOG_DEBUG("Hard link {} -> {} failed ({}), copying", existing.string(), target.string(), ec.message());
    ec.clear();
    std::filesystem::copy_file(existing, target, std::filesystem::copy_options::none, ec);
    if (ec) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Cannot copy " + existing.string() + ": " + ec.message());
    }
    return Result();
}

DecisionEngine::DecisionEngine(std::shared_ptr<storage::DedupIndex> index,
                               std::shared_ptr<network::Prober> prober,
                               std::shared_ptr<network::Fetcher> fetcher,
                               std::shared_ptr<PartialFingerprintCache> fingerprints,
                               std::shared_ptr<transfer::RunStats> stats,
                               EngineSettings settings)
    : index_(std::move(index))
    , prober_(std::move(prober))
    , fetcher_(std::move(fetcher))
    , fingerprints_(std::move(fingerprints))
    , stats_(std::move(stats))
    , settings_(settings) {
}

TaskResult DecisionEngine::process(const DownloadTask& task) {
    if (stats_) {
        stats_->on_attempted();
    }
    
    std::string normalized = normalizer_.normalize(network::unescape_url(task.url));
    
    TaskResult result;
    try {
        result = evaluate(task, normalized);
    } catch (const std::exception& e) {
        result = TaskResult();
        result.outcome = TaskOutcome::FAILED;
        result.error = Result(ErrorCode::ABORTED, std::string("Unexpected error: ") + e.what());
        LOG_ERROR("Task for {} aborted: {}", task.url, e.what());
    }
    result.url = task.url;
    
    finish(task, normalized, result);
    return result;
}

TaskResult DecisionEngine::evaluate(const DownloadTask& task, const std::string& normalized) {
    std::optional<std::string> remote_fingerprint;
    
    if (!settings_.force) {
        if (auto hash = index_->lookup_by_url(normalized)) {
            if (auto existing = index_->existing_path_for(*hash)) {
                storage::IndexRecord record;
                record.content_hash = *hash;
                return skip_with_link(task, *existing, record, MatchTier::URL);
            }
            
            TaskResult result;
            result.outcome = TaskOutcome::SKIPPED;
            result.tier = MatchTier::URL_NO_FILE;
            return result;
        }
        
        if (settings_.probe) {
            auto probe = prober_->probe(task.url);
            
            if (probe.etag) {
                if (auto hash = index_->lookup_by_etag(*probe.etag)) {
                    if (auto existing = index_->existing_path_for(*hash)) {
                        storage::IndexRecord record;
                        record.content_hash = *hash;
                        record.url = normalized;
                        return skip_with_link(task, *existing, record, MatchTier::ETAG);
                    }
                }
            }
            
            if (probe.content_length) {
                if (auto match = index_->find_by_size(*probe.content_length)) {
                    storage::IndexRecord record;
                    record.content_hash = match->content_hash;
                    record.url = normalized;
                    record.etag = probe.etag;
                    return skip_with_link(task, match->path, record, MatchTier::SIZE);
                }
            }
        }
        
        if (settings_.fingerprint && fingerprints_) {
            if (auto fingerprint = prober_->partial_fingerprint(task.url, settings_.fingerprint_bytes)) {
                remote_fingerprint = crypto::hash_utils::to_hex(*fingerprint);
                if (auto match = fingerprints_->find_match(*index_, *remote_fingerprint)) {
                    storage::IndexRecord record;
                    record.content_hash = match->content_hash;
                    record.url = normalized;
                    record.fingerprint = remote_fingerprint;
                    return skip_with_link(task, match->path, record, MatchTier::FINGERPRINT);
                }
            }
        }
    }
    
    return fetch_fresh(task, normalized, remote_fingerprint);
}

TaskResult DecisionEngine::fetch_fresh(const DownloadTask& task, const std::string& normalized,
                                       const std::optional<std::string>& fingerprint) {
    TaskResult result;
    
    network::FetchRequest request;
    request.url = task.url;
    request.folder = task.folder;
    request.suggested_name = task.name;
    request.target_path = task.target_path;
    
    auto fetch = fetcher_->fetch(request);
    if (!fetch.downloaded()) {
        result.outcome = TaskOutcome::FAILED;
        result.error = fetch.error;
        if (!fetch.sidecar_path.empty()) {
            result.sidecar_path = fetch.sidecar_path;
        }
        return result;
    }
    
    result.bytes_downloaded = fetch.bytes_written;
    result.final_path = fetch.path;
    result.outcome = TaskOutcome::DOWNLOADED;
    
    auto hash = crypto::hash_utils::content_hash_hex(fetch.path);
    if (!hash) {
        LOG_WARN("Downloaded {} but could not hash it; not indexed", fetch.path.string());
        return result;
    }
    
    storage::IndexRecord record;
    record.content_hash = *hash;
    record.path = fetch.path;
    record.url = normalized;
    record.etag = fetch.etag;
    record.fingerprint = fingerprint;
    
    auto commit = index_->commit_download(record);
    if (!commit.result) {
        LOG_WARN("Index update failed for {}: {}", fetch.path.string(), commit.result.describe());
        return result;
    }
    
    if (commit.duplicate) {
        std::error_code ec;
        std::filesystem::remove(fetch.path, ec);
        if (ec) {
            LOG_WARN("Cannot remove duplicate {}: {}", fetch.path.string(), ec.message());
        } else {
            LOG_DEBUG("Removed duplicate {} of {}", fetch.path.string(), commit.canonical_path.string());
        }
        result.outcome = TaskOutcome::SKIPPED;
        result.tier = MatchTier::CONTENT_HASH;
        result.final_path = commit.canonical_path;
    }
    return result;
}

std::filesystem::path DecisionEngine::link_target(const DownloadTask& task,
                                                  const std::filesystem::path& existing) const {
    if (task.target_path) {
        return *task.target_path;
    }
    if (task.name) {
        auto name = FileUtils::sanitize_filename(*task.name);
        if (!name.empty()) {
            return task.folder / (name + existing.extension().string());
        }
    }
    return task.folder / existing.filename();
}

TaskResult DecisionEngine::skip_with_link(const DownloadTask& task,
                                          const std::filesystem::path& existing,
                                          storage::IndexRecord record,
                                          MatchTier tier) {
    TaskResult result;
    result.outcome = TaskOutcome::SKIPPED;
    result.tier = tier;
    result.final_path = existing;
    record.path = existing;
    
    auto target = link_target(task, existing);
    if (!same_file(target, existing)) {
        std::error_code ec;
        if (std::filesystem::exists(target, ec)) {
            result.final_path = target;
        } else {
            // A download in flight may own the name; take a suffix instead.
            const auto& names = fetcher_->reservations();
            auto slot = names->reserve_unique(target);
            if (auto linked = link_or_copy(existing, slot)) {
                result.final_path = slot;
                record.path = slot;
            } else {
                LOG_WARN("Cannot link {} to {}: {}", existing.string(), slot.string(), linked.describe());
            }
            names->release(slot);
        }
    }
    
    auto recorded = index_->record(record);
    if (!recorded) {
        LOG_DEBUG("Match for {} not recorded: {}", task.url, recorded.describe());
    }
    return result;
}

void DecisionEngine::finish(const DownloadTask& task, const std::string& normalized, TaskResult& result) {
    auto name = display_name(task);
    auto host = host_label(task.url);
    
    switch (result.outcome) {
        case TaskOutcome::DOWNLOADED:
            if (stats_) stats_->on_downloaded(result.bytes_downloaded);
            LOG_INFO("[{}] [{}] Downloaded {}", name, host,
                     result.final_path ? result.final_path->filename().string() : "-");
            break;
        case TaskOutcome::SKIPPED:
            if (stats_) stats_->on_skipped();
            LOG_INFO("[{}] [{}] Skipped {} ({})", name, host,
                     result.final_path ? result.final_path->filename().string() : "-",
                     transfer::to_string(result.tier));
            break;
        case TaskOutcome::FAILED:
            if (stats_) stats_->on_failed();
            LOG_WARN("[{}] [{}] Failed {}: {}", name, host,
                     result.sidecar_path ? result.sidecar_path->filename().string() : "-",
                     result.error.describe());
            break;
    }
    LOG_DEBUG("{} -> {} ({})", task.url,
              result.final_path ? result.final_path->string() : std::string("-"),
              transfer::to_string(result.outcome));
    
    if (result.outcome == TaskOutcome::FAILED) {
        auto marked = index_->mark_failed(normalized, result.error.describe());
        if (!marked) {
            LOG_DEBUG("Failure not recorded for {}: {}", normalized, marked.describe());
        }
        return;
    }
    
    auto cleared = index_->clear_failed(normalized);
    if (!cleared) {
        LOG_DEBUG("Failure entry not cleared for {}: {}", normalized, cleared.describe());
    }
    
    if (task.sidecar) {
        storage::remove_sidecar(*task.sidecar);
        if (stats_) stats_->on_recovered();
    }
}

} // namespace mediaharvest::dedup
