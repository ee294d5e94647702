#pragma once

#include "mediaharvest/crypto/crypto_types.hpp"
#include "mediaharvest/storage/dedup_index.hpp"
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mediaharvest::dedup {

// Partial fingerprints of indexed files, computed on first use and kept for
// the lifetime of the cache (one run).
class PartialFingerprintCache {
public:
    explicit PartialFingerprintCache(size_t prefix_bytes = crypto::DEFAULT_FINGERPRINT_BYTES);
    
    std::optional<std::string> local_fingerprint(const std::string& content_hash,
                                                 const std::filesystem::path& file);
    
    // Indexed file whose first bytes hash to `remote_fingerprint`. A match found
    // by scanning is written back to the index.
    std::optional<storage::IndexMatch> find_match(storage::DedupIndex& index,
                                                  const std::string& remote_fingerprint);
    
    size_t prefix_bytes() const { return prefix_bytes_; }
    size_t size() const;
    void clear();

private:
    size_t prefix_bytes_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> fingerprints_;
};

} // namespace mediaharvest::dedup
