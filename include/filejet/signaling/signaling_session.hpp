#pragma once

#include "filejet/core/result.hpp"
#include "filejet/network/peer_connection.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace filejet::signaling {

enum class SessionRole {
    INITIATOR,
    RESPONDER
};

const char* to_string(SessionRole role);

// The rendezvous document shared by both peers of one connection attempt.
// Each role appends only to its own candidate list.
struct SignalingSession {
    std::optional<std::string> offer;
    std::optional<std::string> answer;
    std::vector<std::string> initiator_candidates;
    std::vector<std::string> responder_candidates;
    std::chrono::system_clock::time_point created_at;
    
    const std::vector<std::string>& candidates(SessionRole role) const {
        return role == SessionRole::INITIATOR ? initiator_candidates : responder_candidates;
    }
    std::vector<std::string>& candidates(SessionRole role) {
        return role == SessionRole::INITIATOR ? initiator_candidates : responder_candidates;
    }
};

// Empty when no document exists under the id.
using SessionSnapshot = std::optional<SignalingSession>;

// Text forms stored in the document: {"type":"offer","sdp":"..."} and
// {"candidate":"...","sdpMid":"..."}.
std::string serialize_description(const network::SessionDescription& description);
core::Result parse_description(const std::string& text, network::SessionDescription& description);

std::string serialize_candidate(const network::IceCandidate& candidate);
core::Result parse_candidate(const std::string& text, network::IceCandidate& candidate);

} // namespace filejet::signaling
