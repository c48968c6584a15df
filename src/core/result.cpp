#include "filejet/core/result.hpp"

namespace filejet::core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:            return "success";
        case ErrorCode::STORE_UNAVAILABLE:  return "store unavailable";
        case ErrorCode::SIGNALING_ERROR:    return "signaling error";
        case ErrorCode::CONNECTION_FAILURE: return "connection failure";
        case ErrorCode::PROTOCOL_ERROR:     return "protocol error";
        case ErrorCode::INVALID_INPUT:      return "invalid input";
        case ErrorCode::INVALID_STATE:      return "invalid state";
    }
    return "unknown";
}

} // namespace filejet::core
