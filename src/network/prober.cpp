#include "mediaharvest/network/prober.hpp"
#include "mediaharvest/core/logger.hpp"
#include "mediaharvest/crypto/hash.hpp"
#include <algorithm>
#include <vector>

namespace mediaharvest::network {

Prober::Prober(std::shared_ptr<HttpClient> client, ProbeSettings settings)
    : client_(std::move(client))
    , settings_(settings) {
}

ProbeResult Prober::probe(const std::string& url) {
    ProbeResult probe;
    
    HttpRequest request;
    request.url = unescape_url(url);
    request.headers = default_headers_for(request.url);
    request.connect_timeout = settings_.probe_timeout;
    request.read_timeout = settings_.probe_timeout;
    request.total_timeout = settings_.probe_timeout;
    
    auto outcome = client_->head(request);
    if (!outcome.result.success()) {
        LOG_DEBUG("Probe failed for {}: {}", url, outcome.result.describe());
        return probe;
    }
    if (!outcome.head.is_success()) {
        LOG_DEBUG("Probe for {} returned HTTP {}", url, outcome.head.status);
        return probe;
    }
    
    probe.content_length = outcome.head.content_length();
    auto etag = outcome.head.header("etag");
    if (etag && !etag->empty()) {
        probe.etag = etag;
    }
    return probe;
}

std::optional<crypto::Fingerprint> Prober::partial_fingerprint(const std::string& url, size_t prefix_bytes) {
    if (prefix_bytes == 0) {
        return std::nullopt;
    }
    
    HttpRequest request;
    request.url = unescape_url(url);
    request.headers = default_headers_for(request.url);
    request.byte_range = std::pair<uint64_t, uint64_t>(0, prefix_bytes - 1);
    request.connect_timeout = settings_.fingerprint_timeout;
    request.read_timeout = settings_.fingerprint_timeout;
    request.total_timeout = settings_.fingerprint_timeout;
    
    std::vector<uint8_t> buffer;
    buffer.reserve(prefix_bytes);
    
    auto on_headers = [](const HttpResponseHead& head) {
        return head.status == 200 || head.status == 206;
    };
    
    // A server that ignores Range sends the whole body; stop once we have enough.
    auto on_chunk = [&buffer, prefix_bytes](std::span<const uint8_t> chunk) {
        size_t wanted = prefix_bytes - buffer.size();
        size_t take = std::min(wanted, chunk.size());
        buffer.insert(buffer.end(), chunk.begin(), chunk.begin() + take);
        return buffer.size() < prefix_bytes;
    };
    
    auto outcome = client_->get(request, on_headers, on_chunk);
    if (!outcome.result.success()) {
        LOG_DEBUG("Partial fetch failed for {}: {}", url, outcome.result.describe());
        return std::nullopt;
    }
    if (outcome.head.status != 200 && outcome.head.status != 206) {
        LOG_DEBUG("Partial fetch for {} returned HTTP {}", url, outcome.head.status);
        return std::nullopt;
    }
    if (buffer.empty()) {
        return std::nullopt;
    }
    
    return crypto::hash_utils::fingerprint(buffer);
}

} // namespace mediaharvest::network
