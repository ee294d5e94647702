#pragma once

#include "mediaharvest/crypto/crypto_types.hpp"
#include "mediaharvest/core/error.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace mediaharvest::crypto {

// Returns false when libsodium cannot be initialized. Safe to call repeatedly.
bool ensure_sodium();

class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();
    
    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;
    
    core::Result initialize();
    core::Result update(std::span<const std::uint8_t> data);
    core::Result finalize(ContentHash& output);
    
    static ContentHash hash(std::span<const std::uint8_t> data);
    
    // Streams the file in 64 KiB blocks; never loads it whole.
    static core::Result hash_file(const std::filesystem::path& file_path, ContentHash& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes);

std::optional<ContentHash> content_hash_from_hex(const std::string& hex_string);

Fingerprint fingerprint(std::span<const std::uint8_t> data);

// Fingerprint of the first `prefix_bytes` of a local file (or the whole file if shorter).
std::optional<Fingerprint> fingerprint_file(const std::filesystem::path& file_path, size_t prefix_bytes);

// Hex content hash of a file, or nullopt if it cannot be read.
std::optional<std::string> content_hash_hex(const std::filesystem::path& file_path);

}

}
