#include <gtest/gtest.h>
#include "filejet/transfer/transfer_channel.hpp"
#include "fake_data_channel.hpp"
#include <sstream>

using namespace filejet::transfer;
using filejet::core::ErrorCode;
using filejet::core::Result;
using filejet::network::BinaryMessage;
using filejet::network::ChannelMessage;
using filejet::test_support::FakeDataChannel;

namespace {

class RecordingListener : public TransferListener {
public:
    void on_transfer_started(TransferMode mode, const std::string& file_name, std::uint64_t file_size) override {
        started.push_back(mode);
        last_name = file_name;
        last_size = file_size;
    }
    
    void on_transfer_progress(TransferMode, double percent, std::uint64_t) override {
        progress.push_back(percent);
    }
    
    void on_file_sent(const std::string& file_name, std::uint64_t) override {
        sent.push_back(file_name);
    }
    
    void on_file_received(ReceivedFile file) override {
        received.push_back(std::move(file));
    }
    
    void on_transfer_failed(const Result& error) override {
        failures.push_back(error);
    }
    
    std::vector<TransferMode> started;
    std::string last_name;
    std::uint64_t last_size = 0;
    std::vector<double> progress;
    std::vector<std::string> sent;
    std::vector<ReceivedFile> received;
    std::vector<Result> failures;
};

ChannelMessage text(const std::string& value) {
    return ChannelMessage(value);
}

ChannelMessage bytes(std::size_t size, std::uint8_t fill) {
    return ChannelMessage(BinaryMessage(size, fill));
}

}

class TransferChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel = std::make_shared<FakeDataChannel>();
        transfer = std::make_shared<TransferChannel>(io_context, channel, TransferOptions{}, listener);
        transfer->attach();
    }
    
    void run() {
        io_context.restart();
        io_context.run();
    }
    
    boost::asio::io_context io_context;
    std::shared_ptr<FakeDataChannel> channel;
    RecordingListener listener;
    std::shared_ptr<TransferChannel> transfer;
};

TEST_F(TransferChannelTest, ReceivesAFile) {
    channel->deliver(text(encode_control(MetadataMessage{"notes.txt", 30})));
    EXPECT_EQ(transfer->get_mode(), TransferMode::RECEIVING);
    ASSERT_EQ(listener.started.size(), 1u);
    EXPECT_EQ(listener.started[0], TransferMode::RECEIVING);
    EXPECT_EQ(listener.last_name, "notes.txt");
    EXPECT_EQ(listener.last_size, 30u);
    
    channel->deliver(bytes(10, 'a'));
    channel->deliver(bytes(20, 'b'));
    EXPECT_NEAR(transfer->get_progress(), 100.0, 1e-9);
    
    channel->deliver(text(encode_control(EofMessage{})));
    
    ASSERT_EQ(listener.received.size(), 1u);
    EXPECT_EQ(listener.received[0].name, "notes.txt");
    EXPECT_EQ(listener.received[0].data.size(), 30u);
    EXPECT_EQ(listener.received[0].data[15], 'b');
    EXPECT_EQ(transfer->get_mode(), TransferMode::IDLE);
    EXPECT_DOUBLE_EQ(transfer->get_progress(), 100.0);
    EXPECT_TRUE(listener.failures.empty());
    
    for (std::size_t i = 1; i < listener.progress.size(); ++i) {
        EXPECT_GE(listener.progress[i], listener.progress[i - 1]);
    }
}

TEST_F(TransferChannelTest, ReceivesZeroByteFile) {
    channel->deliver(text(encode_control(MetadataMessage{"empty", 0})));
    EXPECT_DOUBLE_EQ(transfer->get_progress(), 100.0);
    
    channel->deliver(text(encode_control(EofMessage{})));
    ASSERT_EQ(listener.received.size(), 1u);
    EXPECT_TRUE(listener.received[0].data.empty());
}

TEST_F(TransferChannelTest, ChunkBeforeMetadataIsAProtocolError) {
    channel->deliver(bytes(16, 0));
    
    ASSERT_EQ(listener.failures.size(), 1u);
    EXPECT_EQ(listener.failures[0].error, ErrorCode::PROTOCOL_ERROR);
    EXPECT_TRUE(listener.received.empty());
}

TEST_F(TransferChannelTest, ShortEofIsAProtocolError) {
    channel->deliver(text(encode_control(MetadataMessage{"cut.bin", 100})));
    channel->deliver(bytes(40, 1));
    channel->deliver(text(encode_control(EofMessage{})));
    
    ASSERT_EQ(listener.failures.size(), 1u);
    EXPECT_EQ(listener.failures[0].error, ErrorCode::PROTOCOL_ERROR);
    EXPECT_TRUE(listener.received.empty());
    EXPECT_EQ(transfer->get_mode(), TransferMode::IDLE);
}

TEST_F(TransferChannelTest, MalformedControlMessageIsIgnored) {
    channel->deliver(text("{\"type\":\"mystery\"}"));
    channel->deliver(text("garbage"));
    
    EXPECT_TRUE(listener.failures.empty());
    EXPECT_EQ(transfer->get_mode(), TransferMode::IDLE);
}

TEST_F(TransferChannelTest, SendsAFile) {
    auto source = std::make_unique<std::istringstream>(std::string(40000, 'z'));
    ASSERT_TRUE(transfer->send_stream("zzz.txt", std::move(source), 40000).success());
    EXPECT_EQ(transfer->get_mode(), TransferMode::SENDING);
    ASSERT_EQ(listener.started.size(), 1u);
    EXPECT_EQ(listener.started[0], TransferMode::SENDING);
    
    run();
    
    ASSERT_EQ(listener.sent.size(), 1u);
    EXPECT_EQ(listener.sent[0], "zzz.txt");
    EXPECT_EQ(transfer->get_mode(), TransferMode::IDLE);
    EXPECT_DOUBLE_EQ(transfer->get_progress(), 100.0);
    EXPECT_EQ(channel->binary_bytes_sent(), 40000u);
}

TEST_F(TransferChannelTest, OneTransferAtATime) {
    channel->deliver(text(encode_control(MetadataMessage{"incoming", 10})));
    
    auto result = transfer->send_stream("outgoing", std::make_unique<std::istringstream>("abc"), 3);
    EXPECT_EQ(result.error, ErrorCode::INVALID_STATE);
    
    // The receive is unaffected.
    EXPECT_EQ(transfer->get_mode(), TransferMode::RECEIVING);
    EXPECT_EQ(transfer->get_file_name(), "incoming");
    EXPECT_TRUE(listener.failures.empty());
}

TEST_F(TransferChannelTest, MetadataDuringSendIsAProtocolError) {
    auto source = std::make_unique<std::istringstream>(std::string(1024 * 1024, 'x'));
    ASSERT_TRUE(transfer->send_stream("big", std::move(source), 1024 * 1024).success());
    run();
    ASSERT_EQ(transfer->get_mode(), TransferMode::SENDING);
    
    auto sent = channel->sent.size();
    channel->deliver(text(encode_control(MetadataMessage{"crossing", 5})));
    
    ASSERT_EQ(listener.failures.size(), 1u);
    EXPECT_EQ(listener.failures[0].error, ErrorCode::PROTOCOL_ERROR);
    EXPECT_EQ(transfer->get_mode(), TransferMode::IDLE);
    
    // The cancelled sender does not resume on drain.
    channel->drain_all();
    run();
    EXPECT_EQ(channel->sent.size(), sent);
    EXPECT_TRUE(listener.sent.empty());
}

TEST_F(TransferChannelTest, SendRequiresOpenChannel) {
    channel->set_open(false);
    auto result = transfer->send_stream("x", std::make_unique<std::istringstream>("x"), 1);
    EXPECT_EQ(result.error, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(result.message, "Please wait for the connection to be fully established.");
    EXPECT_TRUE(listener.started.empty());
}

TEST_F(TransferChannelTest, FailedStartLeavesChannelIdle) {
    channel->refuse_sends(true);
    auto result = transfer->send_stream("x", std::make_unique<std::istringstream>("x"), 1);
    EXPECT_EQ(result.error, ErrorCode::CONNECTION_FAILURE);
    EXPECT_EQ(transfer->get_mode(), TransferMode::IDLE);
    EXPECT_TRUE(listener.started.empty());
}

TEST_F(TransferChannelTest, RefusedSendEndsTheTransfer) {
    auto source = std::make_unique<std::istringstream>(std::string(100000, 'r'));
    ASSERT_TRUE(transfer->send_stream("refused.bin", std::move(source), 100000).success());
    
    channel->refuse_sends(true);
    run();
    
    ASSERT_EQ(listener.failures.size(), 1u);
    EXPECT_EQ(listener.failures[0].error, ErrorCode::CONNECTION_FAILURE);
    EXPECT_EQ(transfer->get_mode(), TransferMode::IDLE);
    EXPECT_TRUE(listener.sent.empty());
    
    // The channel is free for the next file.
    channel->refuse_sends(false);
    channel->drain_all();
    EXPECT_TRUE(transfer->send_stream("next.txt", std::make_unique<std::istringstream>("ok"), 2).success());
    run();
    ASSERT_EQ(listener.sent.size(), 1u);
    EXPECT_EQ(listener.sent[0], "next.txt");
}

TEST_F(TransferChannelTest, DetachDropsEverything) {
    channel->deliver(text(encode_control(MetadataMessage{"partial", 100})));
    channel->deliver(bytes(50, 1));
    
    transfer->detach();
    EXPECT_EQ(transfer->get_mode(), TransferMode::IDLE);
    EXPECT_DOUBLE_EQ(transfer->get_progress(), 0.0);
    EXPECT_TRUE(transfer->get_file_name().empty());
    
    // Messages after detaching go nowhere.
    channel->deliver(bytes(50, 1));
    channel->deliver(text(encode_control(EofMessage{})));
    EXPECT_TRUE(listener.received.empty());
    EXPECT_TRUE(listener.failures.empty());
}
