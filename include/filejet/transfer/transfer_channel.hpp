#pragma once

#include "filejet/core/result.hpp"
#include "filejet/network/peer_connection.hpp"
#include "filejet/transfer/file_receiver.hpp"
#include "filejet/transfer/file_sender.hpp"
#include "filejet/transfer/transfer_options.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <istream>
#include <memory>
#include <string>

namespace filejet::transfer {

class TransferListener {
public:
    virtual ~TransferListener() = default;
    
    virtual void on_transfer_started(TransferMode mode, const std::string& file_name, std::uint64_t file_size) = 0;
    virtual void on_transfer_progress(TransferMode mode, double percent, std::uint64_t bytes) = 0;
    virtual void on_file_sent(const std::string& file_name, std::uint64_t file_size) = 0;
    virtual void on_file_received(ReceivedFile file) = 0;
    
    // Protocol violations and local send failures. The transfer is over.
    virtual void on_transfer_failed(const core::Result& error) = 0;
};

// The transfer side of one data channel: either peer may send a file, and
// incoming messages are routed to the receiver. One transfer runs at a time.
class TransferChannel : public std::enable_shared_from_this<TransferChannel> {
public:
    TransferChannel(boost::asio::io_context& io_context,
                    std::shared_ptr<network::DataChannel> channel,
                    TransferOptions options,
                    TransferListener& listener);
    ~TransferChannel();
    
    TransferChannel(const TransferChannel&) = delete;
    TransferChannel& operator=(const TransferChannel&) = delete;
    
    // Installs the message handler. Open and close events stay with the owner.
    void attach();
    
    // Stops any send in progress and drops all buffered state.
    void detach();
    
    core::Result send_stream(const std::string& file_name, std::unique_ptr<std::istream> source,
                             std::uint64_t size);
    
    void handle_message(network::ChannelMessage message);
    
    TransferMode get_mode() const { return mode_; }
    double get_progress() const { return progress_; }
    const std::string& get_file_name() const { return file_name_; }
    std::uint64_t get_file_size() const { return file_size_; }
    std::uint64_t get_bytes_transferred() const { return bytes_transferred_; }
    const std::shared_ptr<network::DataChannel>& get_channel() const { return channel_; }

private:
    void handle_metadata(const MetadataMessage& metadata);
    void handle_chunk(ChunkMessage chunk);
    void handle_eof();
    void handle_send_complete(const core::Result& result);
    void fail(const core::Result& error);
    void begin(TransferMode mode, const std::string& file_name, std::uint64_t file_size);
    void report_progress(double percent, std::uint64_t bytes);
    
    boost::asio::io_context& io_context_;
    std::shared_ptr<network::DataChannel> channel_;
    TransferOptions options_;
    TransferListener& listener_;
    
    std::shared_ptr<FileSender> sender_;
    FileReceiver receiver_;
    
    TransferMode mode_;
    double progress_;
    std::string file_name_;
    std::uint64_t file_size_;
    std::uint64_t bytes_transferred_;
    bool attached_;
};

} // namespace filejet::transfer
