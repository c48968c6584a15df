#pragma once

#include "filejet/core/result.hpp"
#include <string>

namespace filejet::signaling {

constexpr std::size_t SESSION_ID_LENGTH = 6;

bool is_valid_session_id(const std::string& session_id);
core::Result validate_session_id(const std::string& session_id);

// Random id in [100000, 999999].
std::string generate_session_id();

} // namespace filejet::signaling
