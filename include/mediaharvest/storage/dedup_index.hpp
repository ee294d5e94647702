#pragma once

#include "mediaharvest/core/error.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct sqlite3;

namespace mediaharvest::storage {

// Identifiers to link to one content hash in a single transaction.
struct IndexRecord {
    std::string content_hash;
    std::filesystem::path path;
    std::optional<std::string> url;
    std::optional<std::string> etag;
    std::optional<std::string> fingerprint;
};

struct IndexMatch {
    std::string content_hash;
    std::filesystem::path path;
};

struct FailedUrl {
    std::string url;
    std::string reason;
    int attempts = 0;
    std::chrono::system_clock::time_point last_seen;
};

struct CommitResult {
    core::Result result;
    std::filesystem::path canonical_path;
    bool duplicate = false;
};

struct IndexCounts {
    size_t urls = 0;
    size_t etags = 0;
    size_t fingerprints = 0;
    size_t paths = 0;
    size_t hashes = 0;
    size_t failed = 0;
};

using KeyHashPairs = std::vector<std::pair<std::string, std::string>>;

/**
 * Durable content-addressed index: normalized URL, ETag and partial fingerprint
 * each map to a content hash; a content hash maps to the files holding it.
 *
 * All calls serialize on one connection. Every mutating call commits before it
 * returns. When the database cannot be opened or a statement fails, lookups
 * answer "unknown" and mutations return INDEX_UNAVAILABLE.
 */
class DedupIndex {
public:
    explicit DedupIndex(const std::filesystem::path& db_path);
    ~DedupIndex();
    
    DedupIndex(const DedupIndex&) = delete;
    DedupIndex& operator=(const DedupIndex&) = delete;
    
    core::Result initialize();
    bool is_open() const;
    const std::filesystem::path& path() const { return db_path_; }
    
    std::optional<std::string> lookup_by_url(const std::string& normalized_url);
    std::optional<std::string> lookup_by_etag(const std::string& etag);
    std::optional<std::string> lookup_by_fingerprint(const std::string& fingerprint);
    
    // Paths that still exist; rows for missing files are deleted on the way.
    std::vector<std::filesystem::path> paths_for(const std::string& content_hash);
    std::optional<std::filesystem::path> existing_path_for(const std::string& content_hash);
    
    // First indexed file whose on-disk size equals `size`. Heuristic only.
    std::optional<IndexMatch> find_by_size(std::uint64_t size);
    
    std::vector<IndexMatch> snapshot_paths();
    std::vector<std::string> urls_for(const std::string& content_hash);
    
    core::Result record(const IndexRecord& record);
    
    // Like record(), but if another surviving file already holds the hash the
    // identifiers are linked to that file instead and `duplicate` is set.
    CommitResult commit_download(const IndexRecord& record);
    
    // Drops every identifier and path linked to the hash.
    core::Result forget(const std::string& content_hash);
    
    core::Result mark_failed(const std::string& url, const std::string& reason);
    bool is_failed(const std::string& url);
    core::Result clear_failed(const std::string& url);
    size_t clear_all_failed();
    std::optional<FailedUrl> failed_entry(const std::string& url);
    std::vector<FailedUrl> failed_urls();
    size_t failed_count();
    
    KeyHashPairs url_records();
    KeyHashPairs etag_records();
    KeyHashPairs fingerprint_records();
    IndexCounts counts();
    
    core::Result checkpoint();
    void close();

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    mutable std::mutex mutex_;
    
    bool create_tables();
    bool exec(const char* sql);
    
    std::optional<std::string> lookup_locked(const char* sql, const std::string& key);
    std::vector<std::filesystem::path> paths_for_locked(const std::string& content_hash);
    core::Result record_locked(const IndexRecord& record);
    KeyHashPairs pairs_locked(const char* sql);
    size_t count_locked(const char* sql);
};

} // namespace mediaharvest::storage
