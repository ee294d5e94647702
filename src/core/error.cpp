#include "mediaharvest/core/error.hpp"

namespace mediaharvest::core {

const char* to_string(ErrorCode error) {
    switch (error) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::NETWORK_ERROR: return "network error";
        case ErrorCode::TIMEOUT: return "timeout";
        case ErrorCode::HTTP_ERROR: return "http error";
        case ErrorCode::HTML_RESPONSE: return "html response";
        case ErrorCode::FILE_WRITE_ERROR: return "file write error";
        case ErrorCode::FILE_NOT_FOUND: return "file not found";
        case ErrorCode::INDEX_UNAVAILABLE: return "index unavailable";
        case ErrorCode::INVALID_ARGUMENT: return "invalid argument";
        case ErrorCode::HASH_FAILED: return "hash failed";
        case ErrorCode::ABORTED: return "aborted";
    }
    return "unknown";
}

std::string Result::describe() const {
    if (message.empty()) {
        return to_string(error);
    }
    return std::string(to_string(error)) + ": " + message;
}

} // namespace mediaharvest::core
