#include "mediaharvest/transfer/download_task.hpp"

namespace mediaharvest::transfer {

const char* to_string(TaskOutcome outcome) {
    switch (outcome) {
        case TaskOutcome::DOWNLOADED: return "downloaded";
        case TaskOutcome::SKIPPED: return "skipped";
        case TaskOutcome::FAILED: return "failed";
    }
    return "unknown";
}

const char* to_string(MatchTier tier) {
    switch (tier) {
        case MatchTier::NONE: return "none";
        case MatchTier::URL: return "url";
        case MatchTier::URL_NO_FILE: return "url-no-file";
        case MatchTier::ETAG: return "etag";
        case MatchTier::SIZE: return "size";
        case MatchTier::FINGERPRINT: return "fingerprint";
        case MatchTier::CONTENT_HASH: return "content-hash";
        case MatchTier::EXISTING_FILE: return "existing-file";
    }
    return "unknown";
}

} // namespace mediaharvest::transfer
