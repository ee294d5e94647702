#pragma once

#include "mediaharvest/core/error.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace mediaharvest::transfer {

struct DownloadTask {
    std::string url;
    std::filesystem::path folder;
    std::optional<std::string> name;
    
    // Set by the retry pass: restore exactly this destination.
    std::optional<std::filesystem::path> target_path;
    // Sidecar this task was loaded from; removed once the task no longer fails.
    std::optional<std::filesystem::path> sidecar;
};

enum class TaskOutcome {
    DOWNLOADED,
    SKIPPED,
    FAILED
};

// Which identity check settled the task.
enum class MatchTier {
    NONE,
    URL,
    URL_NO_FILE,
    ETAG,
    SIZE,
    FINGERPRINT,
    CONTENT_HASH,
    EXISTING_FILE
};

struct TaskResult {
    std::string url;
    std::optional<std::filesystem::path> final_path;
    TaskOutcome outcome = TaskOutcome::FAILED;
    MatchTier tier = MatchTier::NONE;
    std::optional<std::filesystem::path> sidecar_path;
    uint64_t bytes_downloaded = 0;
    core::Result error;
};

const char* to_string(TaskOutcome outcome);
const char* to_string(MatchTier tier);

} // namespace mediaharvest::transfer
