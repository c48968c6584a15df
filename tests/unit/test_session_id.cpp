#include <gtest/gtest.h>
#include "filejet/signaling/session_id.hpp"
#include "filejet/crypto/random.hpp"
#include <set>

using namespace filejet::signaling;
using filejet::core::ErrorCode;

class SessionIdTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(filejet::crypto::SecureRandom::initialize());
    }
};

TEST_F(SessionIdTest, AcceptsSixDigits) {
    EXPECT_TRUE(is_valid_session_id("482913"));
    EXPECT_TRUE(is_valid_session_id("000111"));
    EXPECT_TRUE(validate_session_id("999999").success());
}

TEST_F(SessionIdTest, RejectsWrongLengthOrCharacters) {
    EXPECT_FALSE(is_valid_session_id(""));
    EXPECT_FALSE(is_valid_session_id("12345"));
    EXPECT_FALSE(is_valid_session_id("1234567"));
    EXPECT_FALSE(is_valid_session_id("12a456"));
    EXPECT_FALSE(is_valid_session_id(" 12345"));
    EXPECT_FALSE(is_valid_session_id("-12345"));
    
    auto result = validate_session_id("abc");
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.error, ErrorCode::INVALID_INPUT);
}

TEST_F(SessionIdTest, GeneratedIdsAreInRange) {
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto id = generate_session_id();
        ASSERT_TRUE(is_valid_session_id(id)) << id;
        EXPECT_NE(id[0], '0');
        
        auto value = std::stoi(id);
        EXPECT_GE(value, 100000);
        EXPECT_LE(value, 999999);
        seen.insert(id);
    }
    EXPECT_GT(seen.size(), 150u);
}
