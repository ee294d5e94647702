#pragma once

#include <string>
#include <utility>

namespace mediaharvest::core {

enum class ErrorCode {
    SUCCESS = 0,
    NETWORK_ERROR,
    TIMEOUT,
    HTTP_ERROR,
    HTML_RESPONSE,
    FILE_WRITE_ERROR,
    FILE_NOT_FOUND,
    INDEX_UNAVAILABLE,
    INVALID_ARGUMENT,
    HASH_FAILED,
    ABORTED
};

const char* to_string(ErrorCode error);

struct Result {
    ErrorCode error;
    std::string message;
    
    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }
    
    // Timeouts and connection-level failures; everything else is a content or local error.
    bool is_transient() const {
        return error == ErrorCode::NETWORK_ERROR || error == ErrorCode::TIMEOUT;
    }
    
    std::string describe() const;
};

} // namespace mediaharvest::core
