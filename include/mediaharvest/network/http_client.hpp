#pragma once

#include "mediaharvest/core/error.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace mediaharvest::network {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    
    // Inclusive byte range, sent as "Range: bytes=first-last".
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;
    
    std::chrono::seconds connect_timeout{25};
    // Transfer is abandoned when no byte arrives for this long.
    std::chrono::seconds read_timeout{25};
    // Zero means no limit on the whole exchange.
    std::chrono::seconds total_timeout{0};
};

struct HttpResponseHead {
    long status = 0;
    // Header names are lowercased; the last occurrence wins.
    std::map<std::string, std::string> headers;
    
    std::optional<std::string> header(const std::string& name) const;
    std::optional<uint64_t> content_length() const;
    bool is_success() const { return status >= 200 && status < 300; }
};

struct HttpOutcome {
    core::Result result;
    HttpResponseHead head;
    uint64_t body_bytes = 0;
    // A handler returned false and the transfer was stopped early.
    bool aborted = false;
};

// Return false to stop the transfer.
using HeadersHandler = std::function<bool(const HttpResponseHead&)>;
using ChunkHandler = std::function<bool(std::span<const uint8_t>)>;

class HttpClient {
public:
    virtual ~HttpClient() = default;
    
    virtual HttpOutcome head(const HttpRequest& request) = 0;
    
    // Streams the body. `on_headers` runs once, before the first chunk, with the
    // final response head after redirects. HTTP error statuses are reported in
    // the head, not as a failed result.
    virtual HttpOutcome get(const HttpRequest& request,
                            const HeadersHandler& on_headers,
                            const ChunkHandler& on_chunk) = 0;
};

// Undoes "&amp;" left over from HTML-escaped listings.
std::string unescape_url(const std::string& url);

// Per-host request headers: reddit's image hosts want a reddit Referer.
std::vector<std::pair<std::string, std::string>> default_headers_for(const std::string& url);

} // namespace mediaharvest::network
