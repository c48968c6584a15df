#include <gtest/gtest.h>
#include "filejet/transfer/transfer_message.hpp"
#include "filejet/transfer/transfer_options.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace filejet::transfer;
using filejet::network::BinaryMessage;
using filejet::network::ChannelMessage;

TEST(TransferMessageTest, MetadataWireForm) {
    auto text = encode_control(MetadataMessage{"report.pdf", 1048576});
    auto json = nlohmann::json::parse(text);
    
    EXPECT_EQ(json["type"], "metadata");
    EXPECT_EQ(json["name"], "report.pdf");
    EXPECT_EQ(json["size"], 1048576);
    
    auto decoded = decode_message(ChannelMessage(text));
    auto* metadata = std::get_if<MetadataMessage>(&decoded);
    ASSERT_NE(metadata, nullptr);
    EXPECT_EQ(metadata->name, "report.pdf");
    EXPECT_EQ(metadata->size, 1048576u);
}

TEST(TransferMessageTest, EofWireForm) {
    EXPECT_EQ(encode_control(EofMessage{}), R"({"type":"eof"})");
    
    auto decoded = decode_message(ChannelMessage(std::string(R"({"type":"eof"})")));
    EXPECT_TRUE(std::holds_alternative<EofMessage>(decoded));
}

TEST(TransferMessageTest, BinaryIsAlwaysAChunk) {
    // Bytes that happen to spell a control message are still file data.
    std::string lookalike = R"({"type":"eof"})";
    BinaryMessage bytes(lookalike.begin(), lookalike.end());
    
    auto decoded = decode_message(ChannelMessage(bytes));
    auto* chunk = std::get_if<ChunkMessage>(&decoded);
    ASSERT_NE(chunk, nullptr);
    EXPECT_EQ(chunk->data, bytes);
    
    auto empty = decode_message(ChannelMessage(BinaryMessage{}));
    EXPECT_TRUE(std::holds_alternative<ChunkMessage>(empty));
}

TEST(TransferMessageTest, UnusualFileNames) {
    std::string name = "na\"me with \\ and \xC3\xA9";
    auto decoded = decode_message(ChannelMessage(encode_control(MetadataMessage{name, 0})));
    ASSERT_TRUE(std::holds_alternative<MetadataMessage>(decoded));
    EXPECT_EQ(std::get<MetadataMessage>(decoded).name, name);
    
    // Invalid UTF-8 is replaced rather than rejected.
    std::string broken = "bad\xFF.bin";
    auto text = encode_control(MetadataMessage{broken, 3});
    EXPECT_NO_THROW(decode_message(ChannelMessage(text)));
}

TEST(TransferMessageTest, MalformedControlMessagesThrow) {
    auto decode_text = [](const std::string& text) { return decode_message(ChannelMessage(text)); };
    
    EXPECT_THROW(decode_text("not json"), std::runtime_error);
    EXPECT_THROW(decode_text("[]"), std::runtime_error);
    EXPECT_THROW(decode_text(R"({"name":"x","size":1})"), std::runtime_error);
    EXPECT_THROW(decode_text(R"({"type":"chunk"})"), std::runtime_error);
    EXPECT_THROW(decode_text(R"({"type":"metadata","size":1})"), std::runtime_error);
    EXPECT_THROW(decode_text(R"({"type":"metadata","name":"x"})"), std::runtime_error);
    EXPECT_THROW(decode_text(R"({"type":"metadata","name":"x","size":-1})"), std::runtime_error);
    EXPECT_THROW(decode_text(R"({"type":"metadata","name":"x","size":"10"})"), std::runtime_error);
    EXPECT_THROW(decode_text(R"({"type":"metadata","name":7,"size":1})"), std::runtime_error);
}

TEST(TransferOptionsTest, Validation) {
    TransferOptions options;
    EXPECT_TRUE(options.validate().success());
    EXPECT_EQ(options.chunk_size, 16384u);
    EXPECT_EQ(options.buffer_threshold, 262144u);
    EXPECT_EQ(options.buffer_low_threshold, 131072u);
    
    TransferOptions zero_chunk;
    zero_chunk.chunk_size = 0;
    EXPECT_FALSE(zero_chunk.validate().success());
    
    TransferOptions inverted;
    inverted.buffer_low_threshold = inverted.buffer_threshold;
    EXPECT_FALSE(inverted.validate().success());
    
    TransferOptions oversized;
    oversized.chunk_size = MAX_CHUNK_SIZE + 1;
    EXPECT_FALSE(oversized.validate().success());
    oversized.chunk_size = MAX_CHUNK_SIZE;
    oversized.buffer_threshold = 4 * MAX_CHUNK_SIZE;
    EXPECT_TRUE(oversized.validate().success());
    
    TransferOptions no_turns;
    no_turns.chunks_per_turn = 0;
    EXPECT_FALSE(no_turns.validate().success());
}

TEST(TransferOptionsTest, ProgressPercent) {
    EXPECT_DOUBLE_EQ(progress_percent(0, 200), 0.0);
    EXPECT_DOUBLE_EQ(progress_percent(50, 200), 25.0);
    EXPECT_DOUBLE_EQ(progress_percent(200, 200), 100.0);
    EXPECT_DOUBLE_EQ(progress_percent(0, 0), 100.0);
    EXPECT_DOUBLE_EQ(progress_percent(300, 200), 100.0);
    
    EXPECT_STREQ(to_string(TransferMode::SENDING), "sending");
}
