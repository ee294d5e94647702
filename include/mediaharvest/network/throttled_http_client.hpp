#pragma once

#include "mediaharvest/network/http_client.hpp"
#include "mediaharvest/transfer/rate_limiter.hpp"
#include <memory>

namespace mediaharvest::network {

// Takes one token from the shared limiter before every forwarded request.
class ThrottledHttpClient : public HttpClient {
public:
    ThrottledHttpClient(std::shared_ptr<HttpClient> inner,
                        std::shared_ptr<transfer::RateLimiter> limiter);
    
    HttpOutcome head(const HttpRequest& request) override;
    HttpOutcome get(const HttpRequest& request,
                    const HeadersHandler& on_headers,
                    const ChunkHandler& on_chunk) override;

private:
    std::shared_ptr<HttpClient> inner_;
    std::shared_ptr<transfer::RateLimiter> limiter_;
};

} // namespace mediaharvest::network
