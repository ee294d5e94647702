#pragma once

#include "mediaharvest/core/error.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace mediaharvest::core {
class Config;
}

namespace mediaharvest::storage {

struct HarvestSettings {
    size_t workers = 4;
    double rate = 4.0;
    bool probe = true;
    bool fingerprint = false;
    size_t fingerprint_bytes = 65536;
    int retry_attempts = 3;
    std::chrono::milliseconds backoff_base{1000};
    bool force = false;
    
    std::filesystem::path output_dir = "downloads";
    std::filesystem::path index_path = "downloads/.media_index.sqlite";
    
    std::string user_agent = "mediaharvest/1.0";
    std::chrono::seconds connect_timeout{25};
    std::chrono::seconds read_timeout{25};
    std::chrono::seconds probe_timeout{10};
    
    HarvestSettings() = default;
    
    static HarvestSettings from_config(const core::Config& config);
    
    core::Result validate() const;
};

} // namespace mediaharvest::storage
