#include "mediaharvest/dedup/fingerprint_cache.hpp"
#include "mediaharvest/core/logger.hpp"
#include "mediaharvest/crypto/hash.hpp"

namespace mediaharvest::dedup {

PartialFingerprintCache::PartialFingerprintCache(size_t prefix_bytes)
    : prefix_bytes_(prefix_bytes) {
}

std::optional<std::string> PartialFingerprintCache::local_fingerprint(const std::string& content_hash,
                                                                      const std::filesystem::path& file) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = fingerprints_.find(content_hash);
        if (it != fingerprints_.end()) {
            return it->second;
        }
    }
    
    auto fingerprint = crypto::hash_utils::fingerprint_file(file, prefix_bytes_);
    if (!fingerprint) {
        return std::nullopt;
    }
    
    auto hex = crypto::hash_utils::to_hex(*fingerprint);
    std::lock_guard<std::mutex> lock(mutex_);
    fingerprints_.emplace(content_hash, hex);
    return hex;
}

std::optional<storage::IndexMatch> PartialFingerprintCache::find_match(storage::DedupIndex& index,
                                                                       const std::string& remote_fingerprint) {
    if (auto hash = index.lookup_by_fingerprint(remote_fingerprint)) {
        if (auto path = index.existing_path_for(*hash)) {
            return storage::IndexMatch{*hash, *path};
        }
    }
    
    for (const auto& row : index.snapshot_paths()) {
        auto local = local_fingerprint(row.content_hash, row.path);
        if (!local || *local != remote_fingerprint) {
            continue;
        }
        
        storage::IndexRecord record;
        record.content_hash = row.content_hash;
        record.path = row.path;
        record.fingerprint = remote_fingerprint;
        auto result = index.record(record);
        if (!result) {
            LOG_DEBUG("Fingerprint not persisted: {}", result.describe());
        }
        return row;
    }
    
    return std::nullopt;
}

size_t PartialFingerprintCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fingerprints_.size();
}

void PartialFingerprintCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    fingerprints_.clear();
}

} // namespace mediaharvest::dedup
