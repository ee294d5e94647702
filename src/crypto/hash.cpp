#include "mediaharvest/crypto/hash.hpp"
#include "mediaharvest/core/logger.hpp"
#include <sodium.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace mediaharvest::crypto {

using core::ErrorCode;
using core::Result;

bool ensure_sodium() {
    static const bool ready = sodium_init() >= 0;
    return ready;
}

struct ContentHasher::Impl {
    crypto_generichash_state state;
};

ContentHasher::ContentHasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

ContentHasher::~ContentHasher() = default;

Result ContentHasher::initialize() {
    if (!ensure_sodium()) {
        return Result(ErrorCode::HASH_FAILED, "libsodium initialization failed");
    }
    
    if (crypto_generichash_init(&impl_->state, nullptr, 0, CONTENT_HASH_SIZE) != 0) {
        return Result(ErrorCode::HASH_FAILED, "Failed to initialize content hasher");
    }
    
    initialized_ = true;
    return Result();
}

Result ContentHasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return Result(ErrorCode::HASH_FAILED, "Hasher not initialized");
    }
    
    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return Result(ErrorCode::HASH_FAILED, "Failed to update hash");
    }
    
    return Result();
}

Result ContentHasher::finalize(ContentHash& output) {
    if (!initialized_) {
        return Result(ErrorCode::HASH_FAILED, "Hasher not initialized");
    }
    
    if (crypto_generichash_final(&impl_->state, output.data(), output.size()) != 0) {
        return Result(ErrorCode::HASH_FAILED, "Failed to finalize hash");
    }
    
    initialized_ = false; // Hasher is consumed
    return Result();
}

ContentHash ContentHasher::hash(std::span<const std::uint8_t> data) {
    ensure_sodium();
    ContentHash result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

Result ContentHasher::hash_file(const std::filesystem::path& file_path, ContentHash& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return Result(ErrorCode::FILE_NOT_FOUND, "Cannot open file for hashing: " + file_path.string());
    }
    
    ContentHasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        return result;
    }
    
    constexpr size_t buffer_size = 65536; // 64KB buffer
    std::vector<std::uint8_t> buffer(buffer_size);
    
    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());
        
        if (bytes_read > 0) {
            result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }
    
    if (file.bad()) {
        return Result(ErrorCode::HASH_FAILED, "Read error while hashing: " + file_path.string());
    }
    
    return hasher.finalize(output);
}

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : bytes) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<ContentHash> content_hash_from_hex(const std::string& hex_string) {
    if (hex_string.length() != CONTENT_HASH_SIZE * 2) {
        return std::nullopt;
    }
    
    ContentHash hash;
    for (size_t i = 0; i < CONTENT_HASH_SIZE; ++i) {
        unsigned value = 0;
        for (size_t j = 0; j < 2; ++j) {
            char c = hex_string[i * 2 + j];
            value <<= 4;
            if (c >= '0' && c <= '9') value |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') value |= static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') value |= static_cast<unsigned>(c - 'A' + 10);
            else return std::nullopt;
        }
        hash[i] = static_cast<std::uint8_t>(value);
    }
    
    return hash;
}

Fingerprint fingerprint(std::span<const std::uint8_t> data) {
    ensure_sodium();
    Fingerprint result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

std::optional<Fingerprint> fingerprint_file(const std::filesystem::path& file_path, size_t prefix_bytes) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    
    std::vector<std::uint8_t> buffer(prefix_bytes);
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(prefix_bytes));
    if (file.bad()) {
        return std::nullopt;
    }
    buffer.resize(static_cast<size_t>(file.gcount()));
    
    return fingerprint(buffer);
}

std::optional<std::string> content_hash_hex(const std::filesystem::path& file_path) {
    ContentHash hash;
    auto result = ContentHasher::hash_file(file_path, hash);
    if (!result.success()) {
        LOG_WARN("Content hash failed for {}: {}", file_path.string(), result.describe());
        return std::nullopt;
    }
    return to_hex(hash);
}

}

}
