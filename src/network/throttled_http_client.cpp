#include "mediaharvest/network/throttled_http_client.hpp"

namespace mediaharvest::network {

ThrottledHttpClient::ThrottledHttpClient(std::shared_ptr<HttpClient> inner,
                                         std::shared_ptr<transfer::RateLimiter> limiter)
    : inner_(std::move(inner))
    , limiter_(std::move(limiter)) {
}

HttpOutcome ThrottledHttpClient::head(const HttpRequest& request) {
    if (limiter_) {
        limiter_->acquire();
    }
    return inner_->head(request);
}

HttpOutcome ThrottledHttpClient::get(const HttpRequest& request,
                                     const HeadersHandler& on_headers,
                                     const ChunkHandler& on_chunk) {
    if (limiter_) {
        limiter_->acquire();
    }
    return inner_->get(request, on_headers, on_chunk);
}

} // namespace mediaharvest::network
