#include "filejet/signaling/session_id.hpp"
#include "filejet/crypto/random.hpp"
#include <algorithm>
#include <cctype>

namespace filejet::signaling {

bool is_valid_session_id(const std::string& session_id) {
    return session_id.size() == SESSION_ID_LENGTH &&
           std::all_of(session_id.begin(), session_id.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

core::Result validate_session_id(const std::string& session_id) {
    if (!is_valid_session_id(session_id)) {
        return core::Result(core::ErrorCode::INVALID_INPUT,
                            "Please enter a valid 6-digit ID (got '" + session_id + "')");
    }
    return core::Result();
}

std::string generate_session_id() {
    return std::to_string(100000 + crypto::SecureRandom::generate_uniform(900000));
}

} // namespace filejet::signaling
