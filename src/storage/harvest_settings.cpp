#include "mediaharvest/storage/harvest_settings.hpp"
#include "mediaharvest/core/config.hpp"

namespace mediaharvest::storage {

using core::ErrorCode;
using core::Result;

HarvestSettings HarvestSettings::from_config(const core::Config& config) {
    HarvestSettings settings;
    
    int workers = config.get_int("harvest.workers", static_cast<int>(settings.workers));
    settings.workers = workers > 0 ? static_cast<size_t>(workers) : 0;
    settings.rate = config.get_double("harvest.rate", settings.rate);
    settings.probe = config.get_bool("harvest.probe", settings.probe);
    settings.fingerprint = config.get_bool("harvest.fingerprint", settings.fingerprint);
    
    int fingerprint_bytes = config.get_int("harvest.fingerprint_bytes", static_cast<int>(settings.fingerprint_bytes));
    settings.fingerprint_bytes = fingerprint_bytes > 0 ? static_cast<size_t>(fingerprint_bytes) : 0;
    
    settings.retry_attempts = config.get_int("harvest.retry_attempts", settings.retry_attempts);
    settings.backoff_base = std::chrono::milliseconds(
        config.get_int("harvest.backoff_ms", static_cast<int>(settings.backoff_base.count())));
    settings.force = config.get_bool("harvest.force", settings.force);
    
    settings.output_dir = config.get_string("harvest.output_dir", settings.output_dir.string());
    settings.index_path = config.get_string("index.path", (settings.output_dir / ".media_index.sqlite").string());
    
    settings.user_agent = config.get_string("http.user_agent", settings.user_agent);
    settings.connect_timeout = std::chrono::seconds(
        config.get_int("http.connect_timeout", static_cast<int>(settings.connect_timeout.count())));
    settings.read_timeout = std::chrono::seconds(
        config.get_int("http.read_timeout", static_cast<int>(settings.read_timeout.count())));
    settings.probe_timeout = std::chrono::seconds(
        config.get_int("http.probe_timeout", static_cast<int>(settings.probe_timeout.count())));
    
    return settings;
}

Result HarvestSettings::validate() const {
    if (workers == 0 || workers > 256) {
        return Result(ErrorCode::INVALID_ARGUMENT, "harvest.workers must be between 1 and 256");
    }
    if (rate < 0.0) {
        return Result(ErrorCode::INVALID_ARGUMENT, "harvest.rate must not be negative");
    }
    if (fingerprint && fingerprint_bytes == 0) {
        return Result(ErrorCode::INVALID_ARGUMENT, "harvest.fingerprint_bytes must be positive");
    }
    if (retry_attempts < 1) {
        return Result(ErrorCode::INVALID_ARGUMENT, "harvest.retry_attempts must be at least 1");
    }
    if (backoff_base.count() < 0) {
        return Result(ErrorCode::INVALID_ARGUMENT, "harvest.backoff_ms must not be negative");
    }
    if (index_path.empty()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "index.path must be set");
    }
    if (connect_timeout.count() <= 0 || read_timeout.count() <= 0 || probe_timeout.count() <= 0) {
        return Result(ErrorCode::INVALID_ARGUMENT, "HTTP timeouts must be positive");
    }
    return Result();
}

} // namespace mediaharvest::storage
