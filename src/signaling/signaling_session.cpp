#include "filejet/signaling/signaling_session.hpp"
#include <nlohmann/json.hpp>

namespace filejet::signaling {

using json = nlohmann::json;

const char* to_string(SessionRole role) {
    return role == SessionRole::INITIATOR ? "initiator" : "responder";
}

std::string serialize_description(const network::SessionDescription& description) {
    json doc = {
        {"type", network::to_string(description.type)},
        {"sdp", description.sdp}
    };
    return doc.dump();
}

core::Result parse_description(const std::string& text, network::SessionDescription& description) {
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR, "Description is not a JSON object");
    }
    
    auto type = doc.find("type");
    auto sdp = doc.find("sdp");
    if (type == doc.end() || !type->is_string() || sdp == doc.end() || !sdp->is_string()) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR, "Description lacks type or sdp");
    }
    
    auto type_name = type->get<std::string>();
    if (type_name == "offer") {
        description.type = network::DescriptionType::OFFER;
    } else if (type_name == "answer") {
        description.type = network::DescriptionType::ANSWER;
    } else {
        return core::Result(core::ErrorCode::SIGNALING_ERROR, "Unknown description type: " + type_name);
    }
    
    description.sdp = sdp->get<std::string>();
    if (description.sdp.empty()) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR, "Description has empty sdp");
    }
    return core::Result();
}

std::string serialize_candidate(const network::IceCandidate& candidate) {
    json doc = {
        {"candidate", candidate.candidate},
        {"sdpMid", candidate.mid}
    };
    return doc.dump();
}

core::Result parse_candidate(const std::string& text, network::IceCandidate& candidate) {
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR, "Candidate is not a JSON object");
    }
    
    auto value = doc.find("candidate");
    if (value == doc.end() || !value->is_string() || value->get<std::string>().empty()) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR, "Candidate lacks candidate string");
    }
    
    candidate.candidate = value->get<std::string>();
    auto mid = doc.find("sdpMid");
    candidate.mid = (mid != doc.end() && mid->is_string()) ? mid->get<std::string>() : "";
    return core::Result();
}

} // namespace filejet::signaling
