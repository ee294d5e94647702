#include "mediaharvest/storage/dedup_index.hpp"
#include "mediaharvest/core/logger.hpp"
#include "mediaharvest/core/utils.hpp"
#include <sqlite3.h>

namespace mediaharvest::storage {

using core::ErrorCode;
using core::Result;
using core::utils::FileUtils;

namespace {

class Statement {
public:
    Statement(sqlite3* db, const char* sql) : stmt_(nullptr) {
        if (db && sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            LOG_WARN("Index statement prepare failed: {}", sqlite3_errmsg(db));
            stmt_ = nullptr;
        }
    }
    
    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }
    
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    
    bool ok() const { return stmt_ != nullptr; }
    
    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    
    void bind(int index, std::int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }
    
    int step() { return sqlite3_step(stmt_); }
    
    std::string text(int column) const {
        auto* value = sqlite3_column_text(stmt_, column);
        return value ? reinterpret_cast<const char*>(value) : "";
    }
    
    std::int64_t int64(int column) const { return sqlite3_column_int64(stmt_, column); }

private:
    sqlite3_stmt* stmt_;
};

// Rolls back unless commit() succeeded.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db), active_(false) {
        active_ = sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) == SQLITE_OK;
    }
    
    ~Transaction() {
        if (active_) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }
    
    bool active() const { return active_; }
    
    bool commit() {
        if (!active_) return false;
        active_ = false;
        if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            return false;
        }
        return true;
    }

private:
    sqlite3* db_;
    bool active_;
};

bool path_exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec) && !ec;
}

std::int64_t now_seconds() {
    return core::utils::TimeUtils::unix_seconds(std::chrono::system_clock::now());
}

}

DedupIndex::DedupIndex(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

DedupIndex::~DedupIndex() {
    close();
}

Result DedupIndex::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (db_) {
        return Result();
    }
    
    auto parent = db_path_.parent_path();
    if (!parent.empty() && !FileUtils::create_directories(parent)) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Cannot create index directory: " + parent.string());
    }
    
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int result = sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr);
    if (result != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Cannot open index: " + message);
    }
    
    sqlite3_busy_timeout(db_, 5000);
    
    // WAL keeps readers off the writer's back; NORMAL sync survives process crashes.
    if (!exec("PRAGMA journal_mode=WAL;") ||
        !exec("PRAGMA synchronous=NORMAL;") ||
        !exec("PRAGMA temp_store=MEMORY;") ||
        !exec("PRAGMA wal_autocheckpoint=200;") ||
        !create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Cannot prepare index schema at " + db_path_.string());
    }
    
    LOG_INFO("Dedup index opened at {}", db_path_.string());
    return Result();
}

bool DedupIndex::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

bool DedupIndex::create_tables() {
    const char* create_url_table = R"(
        CREATE TABLE IF NOT EXISTS url_records (
            url TEXT PRIMARY KEY,
            content_hash TEXT NOT NULL,
            recorded_at INTEGER NOT NULL
        );
    )";
    
    const char* create_etag_table = R"(
        CREATE TABLE IF NOT EXISTS etag_records (
            etag TEXT PRIMARY KEY,
            content_hash TEXT NOT NULL
        );
    )";
    
    const char* create_fingerprint_table = R"(
        CREATE TABLE IF NOT EXISTS fingerprint_records (
            fingerprint TEXT PRIMARY KEY,
            content_hash TEXT NOT NULL
        );
    )";
    
    const char* create_path_table = R"(
        CREATE TABLE IF NOT EXISTS path_records (
            content_hash TEXT NOT NULL,
            path TEXT NOT NULL,
            PRIMARY KEY (content_hash, path)
        );
    )";
    
    const char* create_failed_table = R"(
        CREATE TABLE IF NOT EXISTS failed_urls (
            url TEXT PRIMARY KEY,
            reason TEXT,
            attempts INTEGER NOT NULL DEFAULT 1,
            last_seen INTEGER NOT NULL
        );
    )";
    
    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_path_records_hash ON path_records(content_hash);
        CREATE INDEX IF NOT EXISTS idx_url_records_hash ON url_records(content_hash);
    )";
    
    return exec(create_url_table) &&
           exec(create_etag_table) &&
           exec(create_fingerprint_table) &&
           exec(create_path_table) &&
           exec(create_failed_table) &&
           exec(create_indexes);
}

bool DedupIndex::exec(const char* sql) {
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_WARN("Index statement failed: {}", error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

std::optional<std::string> DedupIndex::lookup_locked(const char* sql, const std::string& key) {
    if (!db_ || key.empty()) {
        return std::nullopt;
    }
    
    Statement stmt(db_, sql);
    if (!stmt.ok()) {
        return std::nullopt;
    }
    
    stmt.bind(1, key);
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return stmt.text(0);
}

std::optional<std::string> DedupIndex::lookup_by_url(const std::string& normalized_url) {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup_locked("SELECT content_hash FROM url_records WHERE url = ?;", normalized_url);
}

std::optional<std::string> DedupIndex::lookup_by_etag(const std::string& etag) {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup_locked("SELECT content_hash FROM etag_records WHERE etag = ?;", etag);
}

std::optional<std::string> DedupIndex::lookup_by_fingerprint(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup_locked("SELECT content_hash FROM fingerprint_records WHERE fingerprint = ?;", fingerprint);
}

std::vector<std::filesystem::path> DedupIndex::paths_for_locked(const std::string& content_hash) {
    std::vector<std::filesystem::path> existing;
    if (!db_) {
        return existing;
    }
    
    std::vector<std::string> missing;
    {
        Statement stmt(db_, "SELECT path FROM path_records WHERE content_hash = ? ORDER BY rowid;");
        if (!stmt.ok()) {
            return existing;
        }
        
        stmt.bind(1, content_hash);
        while (stmt.step() == SQLITE_ROW) {
            std::string path = stmt.text(0);
            if (path_exists(path)) {
                existing.emplace_back(path);
            } else {
                missing.push_back(path);
            }
        }
    }
    
    if (!missing.empty()) {
        Transaction txn(db_);
        if (txn.active()) {
            for (const auto& path : missing) {
                Statement del(db_, "DELETE FROM path_records WHERE content_hash = ? AND path = ?;");
                if (!del.ok()) {
                    continue;
                }
                del.bind(1, content_hash);
                del.bind(2, path);
                del.step();
            }
            if (txn.commit()) {
                LOG_DEBUG("Pruned {} stale path(s) for {}", missing.size(), content_hash);
            }
        }
    }
    
    return existing;
}

std::vector<std::filesystem::path> DedupIndex::paths_for(const std::string& content_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_for_locked(content_hash);
}

std::optional<std::filesystem::path> DedupIndex::existing_path_for(const std::string& content_hash) {
    auto paths = paths_for(content_hash);
    if (paths.empty()) {
        return std::nullopt;
    }
    return paths.front();
}

std::vector<IndexMatch> DedupIndex::snapshot_paths() {
    std::vector<IndexMatch> rows;
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return rows;
    }
    
    Statement stmt(db_, "SELECT content_hash, path FROM path_records ORDER BY rowid;");
    if (!stmt.ok()) {
        return rows;
    }
    
    while (stmt.step() == SQLITE_ROW) {
        rows.push_back(IndexMatch{stmt.text(0), stmt.text(1)});
    }
    return rows;
}

std::vector<std::string> DedupIndex::urls_for(const std::string& content_hash) {
    std::vector<std::string> urls;
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return urls;
    }
    
    Statement stmt(db_, "SELECT url FROM url_records WHERE content_hash = ? ORDER BY recorded_at, url;");
    if (!stmt.ok()) {
        return urls;
    }
    stmt.bind(1, content_hash);
    while (stmt.step() == SQLITE_ROW) {
        urls.push_back(stmt.text(0));
    }
    return urls;
}

std::optional<IndexMatch> DedupIndex::find_by_size(std::uint64_t size) {
    for (auto& row : snapshot_paths()) {
        auto file_size = FileUtils::file_size(row.path);
        if (file_size && *file_size == size) {
            return row;
        }
    }
    return std::nullopt;
}

Result DedupIndex::record_locked(const IndexRecord& record) {
    if (!db_) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Index is not open");
    }
    if (record.content_hash.empty() || record.path.empty()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Record needs a content hash and a path");
    }
    
    Transaction txn(db_);
    if (!txn.active()) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, std::string("Cannot begin transaction: ") + sqlite3_errmsg(db_));
    }
    
    std::string path = FileUtils::absolute_normal(record.path).string();
    
    Statement path_stmt(db_, "INSERT OR IGNORE INTO path_records (content_hash, path) VALUES (?, ?);");
    if (!path_stmt.ok()) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Failed to prepare path insert");
    }
    path_stmt.bind(1, record.content_hash);
    path_stmt.bind(2, path);
    if (path_stmt.step() != SQLITE_DONE) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Failed to insert path record");
    }
    
    if (record.url && !record.url->empty()) {
        Statement stmt(db_, "INSERT OR REPLACE INTO url_records (url, content_hash, recorded_at) VALUES (?, ?, ?);");
        if (!stmt.ok()) {
            return Result(ErrorCode::INDEX_UNAVAILABLE, "Failed to prepare url insert");
        }
        stmt.bind(1, *record.url);
        stmt.bind(2, record.content_hash);
        stmt.bind(3, now_seconds());
        if (stmt.step() != SQLITE_DONE) {
            return Result(ErrorCode::INDEX_UNAVAILABLE, "Failed to insert url record");
        }
    }
    
    if (record.etag && !record.etag->empty()) {
        Statement stmt(db_, "INSERT OR REPLACE INTO etag_records (etag, content_hash) VALUES (?, ?);");
        if (!stmt.ok()) {
            return Result(ErrorCode::INDEX_UNAVAILABLE, "Failed to prepare etag insert");
        }
        stmt.bind(1, *record.etag);
        stmt.bind(2, record.content_hash);
        if (stmt.step() != SQLITE_DONE) {
            return Result(ErrorCode::INDEX_UNAVAILABLE, "Failed to insert etag record");
        }
    }
    
    if (record.fingerprint && !record.fingerprint->empty()) {
        Statement stmt(db_, "INSERT OR REPLACE INTO fingerprint_records (fingerprint, content_hash) VALUES (?, ?);");
        if (!stmt.ok()) {
            return Result(ErrorCode::INDEX_UNAVAILABLE, "Failed to prepare fingerprint insert");
        }
        stmt.bind(1, *record.fingerprint);
        stmt.bind(2, record.content_hash);
        if (stmt.step() != SQLITE_DONE) {
            return Result(ErrorCode::INDEX_UNAVAILABLE, "Failed to insert fingerprint record");
        }
    }
    
    if (!txn.commit()) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, std::string("Commit failed: ") + sqlite3_errmsg(db_));
    }
    return Result();
}

Result DedupIndex::record(const IndexRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = record_locked(record);
    if (!result.success()) {
        LOG_WARN("Index record failed for {}: {}", record.content_hash, result.describe());
    }
    return result;
}

CommitResult DedupIndex::commit_download(const IndexRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    CommitResult commit;
    auto own_path = FileUtils::absolute_normal(record.path);
    
    for (const auto& candidate : paths_for_locked(record.content_hash)) {
        if (FileUtils::absolute_normal(candidate) != own_path) {
            IndexRecord linked = record;
            linked.path = candidate;
            commit.result = record_locked(linked);
            commit.canonical_path = candidate;
            commit.duplicate = true;
            return commit;
        }
    }
    
    commit.result = record_locked(record);
    commit.canonical_path = own_path;
    if (!commit.result.success()) {
        LOG_WARN("Index commit failed for {}: {}", record.content_hash, commit.result.describe());
    }
    return commit;
}

Result DedupIndex::forget(const std::string& content_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Index is not open");
    }
    
    Transaction txn(db_);
    if (!txn.active()) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, std::string("Cannot begin transaction: ") + sqlite3_errmsg(db_));
    }
    
    const char* statements[] = {
        "DELETE FROM url_records WHERE content_hash = ?;",
        "DELETE FROM etag_records WHERE content_hash = ?;",
        "DELETE FROM fingerprint_records WHERE content_hash = ?;",
        "DELETE FROM path_records WHERE content_hash = ?;"
    };
    for (const char* sql : statements) {
        Statement stmt(db_, sql);
        if (!stmt.ok()) {
            return Result(ErrorCode::INDEX_UNAVAILABLE, "Failed to prepare delete");
        }
        stmt.bind(1, content_hash);
        if (stmt.step() != SQLITE_DONE) {
            return Result(ErrorCode::INDEX_UNAVAILABLE, "Failed to delete records");
        }
    }
    
    if (!txn.commit()) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, std::string("Commit failed: ") + sqlite3_errmsg(db_));
    }
    return Result();
}

Result DedupIndex::mark_failed(const std::string& url, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Index is not open");
    }
    
    const char* upsert_sql = R"(
        INSERT INTO failed_urls (url, reason, attempts, last_seen) VALUES (?, ?, 1, ?)
        ON CONFLICT(url) DO UPDATE SET
            reason = excluded.reason,
            attempts = failed_urls.attempts + 1,
            last_seen = excluded.last_seen;
    )";
    
    Statement stmt(db_, upsert_sql);
    if (!stmt.ok()) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Failed to prepare failure upsert");
    }
    stmt.bind(1, url);
    stmt.bind(2, reason);
    stmt.bind(3, now_seconds());
    if (stmt.step() != SQLITE_DONE) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Failed to record failed url");
    }
    return Result();
}

bool DedupIndex::is_failed(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup_locked("SELECT url FROM failed_urls WHERE url = ?;", url).has_value();
}

Result DedupIndex::clear_failed(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Index is not open");
    }
    
    Statement stmt(db_, "DELETE FROM failed_urls WHERE url = ?;");
    if (!stmt.ok()) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Failed to prepare failure delete");
    }
    stmt.bind(1, url);
    if (stmt.step() != SQLITE_DONE) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Failed to clear failed url");
    }
    return Result();
}

size_t DedupIndex::clear_all_failed() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !exec("DELETE FROM failed_urls;")) {
        return 0;
    }
    return static_cast<size_t>(sqlite3_changes(db_));
}

std::optional<FailedUrl> DedupIndex::failed_entry(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }
    
    Statement stmt(db_, "SELECT url, reason, attempts, last_seen FROM failed_urls WHERE url = ?;");
    if (!stmt.ok()) {
        return std::nullopt;
    }
    stmt.bind(1, url);
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    
    FailedUrl entry;
    entry.url = stmt.text(0);
    entry.reason = stmt.text(1);
    entry.attempts = static_cast<int>(stmt.int64(2));
    entry.last_seen = std::chrono::system_clock::time_point(std::chrono::seconds(stmt.int64(3)));
    return entry;
}

std::vector<FailedUrl> DedupIndex::failed_urls() {
    std::vector<FailedUrl> entries;
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return entries;
    }
    
    Statement stmt(db_, "SELECT url, reason, attempts, last_seen FROM failed_urls ORDER BY last_seen DESC;");
    if (!stmt.ok()) {
        return entries;
    }
    
    while (stmt.step() == SQLITE_ROW) {
        FailedUrl entry;
        entry.url = stmt.text(0);
        entry.reason = stmt.text(1);
        entry.attempts = static_cast<int>(stmt.int64(2));
        entry.last_seen = std::chrono::system_clock::time_point(std::chrono::seconds(stmt.int64(3)));
        entries.push_back(std::move(entry));
    }
    return entries;
}

size_t DedupIndex::failed_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_locked("SELECT COUNT(*) FROM failed_urls;");
}

KeyHashPairs DedupIndex::pairs_locked(const char* sql) {
    KeyHashPairs pairs;
    if (!db_) {
        return pairs;
    }
    
    Statement stmt(db_, sql);
    if (!stmt.ok()) {
        return pairs;
    }
    while (stmt.step() == SQLITE_ROW) {
        pairs.emplace_back(stmt.text(0), stmt.text(1));
    }
    return pairs;
}

size_t DedupIndex::count_locked(const char* sql) {
    if (!db_) {
        return 0;
    }
    
    Statement stmt(db_, sql);
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
        return 0;
    }
    return static_cast<size_t>(stmt.int64(0));
}

KeyHashPairs DedupIndex::url_records() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pairs_locked("SELECT url, content_hash FROM url_records ORDER BY url;");
}

KeyHashPairs DedupIndex::etag_records() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pairs_locked("SELECT etag, content_hash FROM etag_records ORDER BY etag;");
}

KeyHashPairs DedupIndex::fingerprint_records() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pairs_locked("SELECT fingerprint, content_hash FROM fingerprint_records ORDER BY fingerprint;");
}

IndexCounts DedupIndex::counts() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    IndexCounts counts;
    counts.urls = count_locked("SELECT COUNT(*) FROM url_records;");
    counts.etags = count_locked("SELECT COUNT(*) FROM etag_records;");
    counts.fingerprints = count_locked("SELECT COUNT(*) FROM fingerprint_records;");
    counts.paths = count_locked("SELECT COUNT(*) FROM path_records;");
    counts.hashes = count_locked("SELECT COUNT(DISTINCT content_hash) FROM path_records;");
    counts.failed = count_locked("SELECT COUNT(*) FROM failed_urls;");
    return counts;
}

Result DedupIndex::checkpoint() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Index is not open");
    }
    
    int log_frames = 0;
    int checkpointed = 0;
    int result = sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_FULL, &log_frames, &checkpointed);
    if (result != SQLITE_OK) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, std::string("Checkpoint failed: ") + sqlite3_errmsg(db_));
    }
    
    LOG_DEBUG("Index checkpoint: {} of {} WAL frames", checkpointed, log_frames);
    return Result();
}

void DedupIndex::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return;
    }
    
    sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_FULL, nullptr, nullptr);
    sqlite3_close(db_);
    db_ = nullptr;
    LOG_INFO("Dedup index closed: {}", db_path_.string());
}

} // namespace mediaharvest::storage
