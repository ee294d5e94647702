#pragma once

#include "mediaharvest/core/error.hpp"
#include "mediaharvest/network/http_client.hpp"
#include "mediaharvest/storage/name_reservations.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace mediaharvest::network {

struct FetchSettings {
    int max_attempts = 3;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::seconds connect_timeout{25};
    std::chrono::seconds read_timeout{25};
    bool use_mirrors = true;
};

struct FetchRequest {
    std::string url;
    std::filesystem::path folder;
    std::optional<std::string> suggested_name;
    std::optional<std::filesystem::path> target_path;
};

enum class FetchOutcome {
    DOWNLOADED,
    FAILED
};

struct FetchResult {
    FetchOutcome outcome = FetchOutcome::FAILED;
    std::filesystem::path path;
    // Empty unless a sidecar was actually written.
    std::filesystem::path sidecar_path;
    uint64_t bytes_written = 0;
    std::optional<std::string> etag;
    std::string content_type;
    core::Result error;
    int attempts = 0;
    
    bool downloaded() const { return outcome == FetchOutcome::DOWNLOADED; }
};

// Filename from a Content-Disposition value; filename*=UTF-8'' wins over filename=.
std::optional<std::string> filename_from_disposition(const std::string& disposition);

// Percent-decoded basename of the URL path, empty if there is none.
std::string url_basename(const std::string& url);
std::string url_extension(const std::string& url);

// Alternate location tried once on the last attempt, if the host has one.
std::optional<std::string> mirror_url_for(const std::string& url);

bool is_html_content_type(const std::string& content_type);

/**
 * Streams one resource to disk. Each call ends with exactly one of: a data
 * file at the returned path, or a `<destination>.failed` sidecar.
 *
 * Bytes go to `<destination>.part` and are hard-linked into place once the
 * body is complete, so a file that appeared at the destination meanwhile is
 * never replaced; the download takes the next free suffix instead.
 * Destination names are reserved while in flight, in a table that linkers
 * share, so concurrent work into one folder never picks the same name.
 */
class Fetcher {
public:
    Fetcher(std::shared_ptr<HttpClient> client, FetchSettings settings = {},
            std::shared_ptr<storage::NameReservations> reservations = nullptr);
    
    FetchResult fetch(const FetchRequest& request);
    
    // Name the file would get before any response header is seen.
    static std::filesystem::path initial_destination(const FetchRequest& request, const std::string& url);
    
    const FetchSettings& settings() const { return settings_; }
    const std::shared_ptr<storage::NameReservations>& reservations() const { return reservations_; }

private:
    struct Attempt {
        core::Result result;
        std::filesystem::path path;
        uint64_t bytes_written = 0;
        std::optional<std::string> etag;
        std::string content_type;
        long status = 0;
    };
    
    Attempt attempt_once(const std::string& url, const FetchRequest& request,
                         const std::filesystem::path& intended);
    
    // Moves the finished `.part` file to `destination` without replacing anything
    // there; `destination` is updated when a suffix had to be taken.
    core::Result publish(const std::filesystem::path& part_path, const std::filesystem::path& requested,
                         std::filesystem::path& destination);
    
    std::shared_ptr<HttpClient> client_;
    FetchSettings settings_;
    std::shared_ptr<storage::NameReservations> reservations_;
};

} // namespace mediaharvest::network
