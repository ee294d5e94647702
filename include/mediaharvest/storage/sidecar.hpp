#pragma once

#include "mediaharvest/core/error.hpp"
#include "mediaharvest/transfer/download_task.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mediaharvest::storage {

class DedupIndex;

inline constexpr const char* SIDECAR_EXTENSION = ".failed";
inline constexpr size_t HTML_SNIFF_BYTES = 2048;

// Failure record kept next to the file it should have produced.
// Line 1 is the URL, line 2 the error, anything after is diagnostics.
struct Sidecar {
    std::filesystem::path sidecar_path;
    std::filesystem::path target_path;
    std::string url;
    std::string error;
    std::vector<std::string> details;
};

std::filesystem::path sidecar_path_for(const std::filesystem::path& destination);
std::filesystem::path target_for_sidecar(const std::filesystem::path& sidecar_path);
bool is_sidecar(const std::filesystem::path& path);

core::Result write_sidecar(const std::filesystem::path& destination,
                           const std::string& url,
                           const std::string& error,
                           const std::vector<std::string>& details = {});

std::optional<Sidecar> read_sidecar(const std::filesystem::path& sidecar_path);

// Removes the sidecar if present. True when nothing is left behind.
bool remove_sidecar(const std::filesystem::path& sidecar_path);

// Recursive, sorted by path.
std::vector<std::filesystem::path> find_sidecars(const std::filesystem::path& root);

// One task per readable sidecar, targeting the original destination.
std::vector<transfer::DownloadTask> tasks_from_sidecars(const std::filesystem::path& root);

// True if the first 2 KiB contain an HTML document or script marker.
bool looks_like_html(const std::filesystem::path& file);

std::vector<std::filesystem::path> find_html_payloads(const std::filesystem::path& root);

struct HtmlScanReport {
    size_t scanned = 0;
    size_t marked = 0;
    // HTML payloads whose source URL is not in the index; left in place.
    std::vector<std::filesystem::path> unresolved;
};

// Replaces HTML payloads with sidecars so the retry pass fetches them again.
// The payload's content hash is dropped from the index.
HtmlScanReport mark_html_payloads(const std::filesystem::path& root, DedupIndex& index);

} // namespace mediaharvest::storage
