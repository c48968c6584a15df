#include <gtest/gtest.h>
#include "filejet/signaling/signaling_session.hpp"
#include <nlohmann/json.hpp>

using namespace filejet::signaling;
using filejet::network::DescriptionType;
using filejet::network::IceCandidate;
using filejet::network::SessionDescription;
using filejet::core::ErrorCode;

TEST(SignalingSessionTest, CandidatesByRole) {
    SignalingSession session;
    session.candidates(SessionRole::INITIATOR).push_back("a");
    session.candidates(SessionRole::RESPONDER).push_back("b");
    session.candidates(SessionRole::RESPONDER).push_back("c");
    
    EXPECT_EQ(session.initiator_candidates.size(), 1u);
    EXPECT_EQ(session.responder_candidates.size(), 2u);
    EXPECT_STREQ(to_string(SessionRole::INITIATOR), "initiator");
    EXPECT_STREQ(to_string(SessionRole::RESPONDER), "responder");
}

TEST(SignalingSessionTest, DescriptionWireForm) {
    SessionDescription offer{DescriptionType::OFFER, "v=0 test"};
    auto text = serialize_description(offer);
    
    auto json = nlohmann::json::parse(text);
    EXPECT_EQ(json["type"], "offer");
    EXPECT_EQ(json["sdp"], "v=0 test");
    
    SessionDescription parsed;
    ASSERT_TRUE(parse_description(R"({"type":"answer","sdp":"v=0 remote"})", parsed).success());
    EXPECT_EQ(parsed.type, DescriptionType::ANSWER);
    EXPECT_EQ(parsed.sdp, "v=0 remote");
}

TEST(SignalingSessionTest, MalformedDescriptions) {
    SessionDescription parsed;
    
    EXPECT_EQ(parse_description("not json", parsed).error, ErrorCode::SIGNALING_ERROR);
    EXPECT_EQ(parse_description("[1,2]", parsed).error, ErrorCode::SIGNALING_ERROR);
    EXPECT_EQ(parse_description(R"({"type":"offer"})", parsed).error, ErrorCode::SIGNALING_ERROR);
    EXPECT_EQ(parse_description(R"({"type":"pranswer","sdp":"x"})", parsed).error, ErrorCode::SIGNALING_ERROR);
    EXPECT_EQ(parse_description(R"({"type":"offer","sdp":""})", parsed).error, ErrorCode::SIGNALING_ERROR);
    EXPECT_EQ(parse_description(R"({"type":1,"sdp":"x"})", parsed).error, ErrorCode::SIGNALING_ERROR);
}

TEST(SignalingSessionTest, CandidateWireForm) {
    IceCandidate candidate{"tcp 127.0.0.1 40000", "0"};
    auto text = serialize_candidate(candidate);
    
    auto json = nlohmann::json::parse(text);
    EXPECT_EQ(json["candidate"], "tcp 127.0.0.1 40000");
    EXPECT_EQ(json["sdpMid"], "0");
    
    IceCandidate parsed;
    ASSERT_TRUE(parse_candidate(text, parsed).success());
    EXPECT_EQ(parsed, candidate);
    
    // sdpMid is optional.
    ASSERT_TRUE(parse_candidate(R"({"candidate":"host"})", parsed).success());
    EXPECT_EQ(parsed.candidate, "host");
    EXPECT_TRUE(parsed.mid.empty());
}

TEST(SignalingSessionTest, MalformedCandidates) {
    IceCandidate parsed;
    EXPECT_FALSE(parse_candidate("{", parsed).success());
    EXPECT_FALSE(parse_candidate(R"({"sdpMid":"0"})", parsed).success());
    EXPECT_FALSE(parse_candidate(R"({"candidate":""})", parsed).success());
    EXPECT_FALSE(parse_candidate(R"({"candidate":5})", parsed).success());
}
