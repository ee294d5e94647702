#pragma once

#include "mediaharvest/crypto/crypto_types.hpp"
#include "mediaharvest/network/http_client.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace mediaharvest::network {

struct ProbeResult {
    std::optional<uint64_t> content_length;
    std::optional<std::string> etag;
    
    bool empty() const { return !content_length && !etag; }
};

struct ProbeSettings {
    std::chrono::seconds probe_timeout{10};
    std::chrono::seconds fingerprint_timeout{20};
};

// Metadata-only hints for the dedup tiers. Failures are never errors here;
// they just mean "no hint".
class Prober {
public:
    explicit Prober(std::shared_ptr<HttpClient> client, ProbeSettings settings = {});
    
    ProbeResult probe(const std::string& url);
    
    // SHA-256 of the first `prefix_bytes` of the remote resource.
    std::optional<crypto::Fingerprint> partial_fingerprint(const std::string& url, size_t prefix_bytes);

private:
    std::shared_ptr<HttpClient> client_;
    ProbeSettings settings_;
};

} // namespace mediaharvest::network
