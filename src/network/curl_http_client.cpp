#include "mediaharvest/network/curl_http_client.hpp"
#include "mediaharvest/core/logger.hpp"
#include "mediaharvest/core/utils.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace mediaharvest::network {

using core::ErrorCode;
using core::Result;
using core::utils::StringUtils;

namespace {

struct TransferState {
    HttpResponseHead head;
    const HeadersHandler* on_headers = nullptr;
    const ChunkHandler* on_chunk = nullptr;
    bool headers_delivered = false;
    bool aborted = false;
    uint64_t body_bytes = 0;
};

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

void ensure_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

bool deliver_headers(TransferState& state) {
    state.headers_delivered = true;
    if (state.on_headers && !(*state.on_headers)(state.head)) {
        state.aborted = true;
        return false;
    }
    return true;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    size_t total = size * nitems;
    std::string line(buffer, total);
    
    // Each response in a redirect chain starts with its own status line.
    if (StringUtils::starts_with(line, "HTTP/")) {
        state->head.headers.clear();
        auto parts = StringUtils::split(StringUtils::trim(line), ' ');
        if (parts.size() >= 2) {
            try {
                state->head.status = std::stol(parts[1]);
            } catch (const std::exception&) {
                state->head.status = 0;
            }
        }
        return total;
    }
    
    auto colon = line.find(':');
    if (colon == std::string::npos) {
        return total;
    }
    
    std::string name = StringUtils::to_lower(StringUtils::trim(line.substr(0, colon)));
    std::string value = StringUtils::trim(line.substr(colon + 1));
    if (!name.empty()) {
        state->head.headers[name] = value;
    }
    return total;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    size_t total = size * nmemb;
    
    if (!state->headers_delivered && !deliver_headers(*state)) {
        return 0;
    }
    
    if (state->on_chunk) {
        std::span<const uint8_t> chunk(reinterpret_cast<const uint8_t*>(ptr), total);
        if (!(*state->on_chunk)(chunk)) {
            state->aborted = true;
            return 0;
        }
    }
    
    state->body_bytes += total;
    return total;
}

}

CurlHttpClient::CurlHttpClient(std::string user_agent)
    : user_agent_(std::move(user_agent)) {
    ensure_global_init();
}

HttpOutcome CurlHttpClient::head(const HttpRequest& request) {
    return perform(request, true, nullptr, nullptr);
}

HttpOutcome CurlHttpClient::get(const HttpRequest& request,
                                const HeadersHandler& on_headers,
                                const ChunkHandler& on_chunk) {
    return perform(request, false, &on_headers, &on_chunk);
}

HttpOutcome CurlHttpClient::perform(const HttpRequest& request, bool head_only,
                                    const HeadersHandler* on_headers,
                                    const ChunkHandler* on_chunk) {
    HttpOutcome outcome;
    
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        outcome.result = Result(ErrorCode::NETWORK_ERROR, "curl_easy_init failed");
        return outcome;
    }
    
    TransferState state;
    if (on_headers && *on_headers) {
        state.on_headers = on_headers;
    }
    if (on_chunk && *on_chunk) {
        state.on_chunk = on_chunk;
    }
    
    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            outcome.result = Result(ErrorCode::NETWORK_ERROR, "Cannot build request headers");
            return outcome;
        }
        header_list.release();
        header_list.reset(appended);
    }
    
    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.connect_timeout.count()));
    
    if (request.read_timeout.count() > 0) {
        curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, static_cast<long>(request.read_timeout.count()));
    }
    if (request.total_timeout.count() > 0) {
        curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(request.total_timeout.count()));
    }
    if (header_list) {
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
    }
    
    std::string range;
    if (request.byte_range) {
        range = std::to_string(request.byte_range->first) + "-" + std::to_string(request.byte_range->second);
        curl_easy_setopt(handle, CURLOPT_RANGE, range.c_str());
    }
    
    if (head_only) {
        curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    }
    
    CURLcode code = curl_easy_perform(handle);
    
    long status = 0;
    if (curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status) == CURLE_OK && status != 0) {
        state.head.status = status;
    }
    
    if (code == CURLE_OK && !head_only && !state.headers_delivered) {
        deliver_headers(state);
    }
    
    outcome.head = std::move(state.head);
    outcome.body_bytes = state.body_bytes;
    outcome.aborted = state.aborted;
    
    if (code == CURLE_OK || (code == CURLE_WRITE_ERROR && state.aborted)) {
        return outcome;
    }
    
    if (code == CURLE_OPERATION_TIMEDOUT) {
        outcome.result = Result(ErrorCode::TIMEOUT, curl_easy_strerror(code));
    } else {
        outcome.result = Result(ErrorCode::NETWORK_ERROR, curl_easy_strerror(code));
    }
    
    LOG_DEBUG("HTTP {} {} failed: {}", head_only ? "HEAD" : "GET", request.url, outcome.result.message);
    return outcome;
}

} // namespace mediaharvest::network
