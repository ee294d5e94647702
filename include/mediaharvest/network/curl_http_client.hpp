#pragma once

#include "mediaharvest/network/http_client.hpp"
#include <string>

namespace mediaharvest::network {

// HttpClient over libcurl's easy interface. One easy handle per request, so
// a single instance may be shared by all workers.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent);
    
    HttpOutcome head(const HttpRequest& request) override;
    HttpOutcome get(const HttpRequest& request,
                    const HeadersHandler& on_headers,
                    const ChunkHandler& on_chunk) override;
    
    const std::string& user_agent() const { return user_agent_; }

private:
    std::string user_agent_;
    
    HttpOutcome perform(const HttpRequest& request, bool head_only,
                        const HeadersHandler* on_headers,
                        const ChunkHandler* on_chunk);
};

} // namespace mediaharvest::network
