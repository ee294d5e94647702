#pragma once

#include <array>
#include <cstdint>
#include <cstddef>

namespace mediaharvest::crypto {

// BLAKE2b-256 over the full file content
constexpr size_t CONTENT_HASH_SIZE = 32;

// SHA-256 over the leading bytes of a resource
constexpr size_t FINGERPRINT_SIZE = 32;

constexpr size_t DEFAULT_FINGERPRINT_BYTES = 65536;

using ContentHash = std::array<std::uint8_t, CONTENT_HASH_SIZE>;
using Fingerprint = std::array<std::uint8_t, FINGERPRINT_SIZE>;

}
