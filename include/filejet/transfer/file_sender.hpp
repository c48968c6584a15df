#pragma once

#include "filejet/core/result.hpp"
#include "filejet/network/peer_connection.hpp"
#include "filejet/transfer/transfer_options.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace filejet::transfer {

enum class SenderState {
    IDLE,
    STREAMING,
    WAITING_FOR_DRAIN,
    COMPLETED,
    FAILED,
    CANCELLED
};

const char* to_string(SenderState state);

// Streams one file over a data channel: metadata, binary chunks, eof. Before
// every chunk the channel's buffered amount is checked against the threshold
// and streaming suspends until the channel reports a drain.
class FileSender : public std::enable_shared_from_this<FileSender> {
public:
    using ProgressHandler = std::function<void(double percent, std::uint64_t bytes_sent)>;
    using CompletionHandler = std::function<void(const core::Result&)>;
    
    FileSender(boost::asio::io_context& io_context,
               std::shared_ptr<network::DataChannel> channel,
               TransferOptions options);
    ~FileSender();
    
    FileSender(const FileSender&) = delete;
    FileSender& operator=(const FileSender&) = delete;
    
    // Sends the metadata synchronously, then streams from the event loop.
    core::Result start(std::string name, std::unique_ptr<std::istream> source, std::uint64_t size);
    
    // Stops at the next suspension point without reporting completion.
    void cancel();
    
    void on_progress(ProgressHandler handler) { progress_handler_ = std::move(handler); }
    void on_complete(CompletionHandler handler) { completion_handler_ = std::move(handler); }
    
    SenderState get_state() const { return state_; }
    bool is_active() const;
    const std::string& get_file_name() const { return file_name_; }
    std::uint64_t get_file_size() const { return file_size_; }
    std::uint64_t get_bytes_sent() const { return offset_; }
    std::uint64_t get_chunks_sent() const { return chunks_sent_; }
    std::uint64_t get_drain_waits() const { return drain_waits_; }

private:
    void pump();
    void schedule_pump();
    void wait_for_drain();
    void finish();
    void abort(const std::string& reason);
    void refused(const std::string& what);
    void fail(core::Result result);
    void release_channel();
    
    boost::asio::io_context& io_context_;
    std::shared_ptr<network::DataChannel> channel_;
    TransferOptions options_;
    SenderState state_;
    
    std::string file_name_;
    std::unique_ptr<std::istream> source_;
    std::uint64_t file_size_;
    std::uint64_t offset_;
    std::uint64_t chunks_sent_;
    std::uint64_t drain_waits_;
    std::vector<std::uint8_t> chunk_buffer_;
    
    ProgressHandler progress_handler_;
    CompletionHandler completion_handler_;
};

} // namespace filejet::transfer
