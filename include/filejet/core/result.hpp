#pragma once

#include <string>

namespace filejet::core {

enum class ErrorCode {
    SUCCESS = 0,
    STORE_UNAVAILABLE,
    SIGNALING_ERROR,
    CONNECTION_FAILURE,
    PROTOCOL_ERROR,
    INVALID_INPUT,
    INVALID_STATE
};

const char* error_code_name(ErrorCode code);

struct Result {
    ErrorCode error;
    std::string message;
    
    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }
};

} // namespace filejet::core
