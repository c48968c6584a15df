#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace filejet::network {

using boost::asio::ip::tcp;

constexpr std::size_t FRAME_HEADER_SIZE = 5;
constexpr std::uint32_t MAX_FRAME_PAYLOAD = 16 * 1024 * 1024;

// kind(1) | length(4, big endian) | payload
enum class FrameKind : std::uint8_t {
    TEXT          = 0x01,
    BINARY        = 0x02,
    HELLO         = 0x10,
    HELLO_ACK     = 0x11,
    CHANNEL_OPEN  = 0x12,
    CHANNEL_CLOSE = 0x13
};

std::array<std::uint8_t, FRAME_HEADER_SIZE> encode_frame_header(FrameKind kind, std::uint32_t length);
bool decode_frame_header(std::span<const std::uint8_t> header, FrameKind& kind, std::uint32_t& length);

// A framed TCP stream with a write queue. The queued payload byte count is
// what a data channel reports as its buffered amount.
class TcpLink : public std::enable_shared_from_this<TcpLink> {
public:
    using FrameHandler = std::function<void(FrameKind, std::vector<std::uint8_t>)>;
    using CloseHandler = std::function<void(const boost::system::error_code&)>;
    using DrainHandler = std::function<void(std::size_t previous, std::size_t current)>;
    
    explicit TcpLink(tcp::socket socket);
    ~TcpLink();
    
    TcpLink(const TcpLink&) = delete;
    TcpLink& operator=(const TcpLink&) = delete;
    
    void start();
    
    // Local close; the close handler is not invoked. With flush, queued
    // frames are written first.
    void close(bool flush = false);
    
    bool send_frame(FrameKind kind, std::span<const std::uint8_t> payload);
    bool send_frame(FrameKind kind, const std::string& payload);
    
    void set_frame_handler(FrameHandler handler) { frame_handler_ = std::move(handler); }
    void set_close_handler(CloseHandler handler) { close_handler_ = std::move(handler); }
    void set_drain_handler(DrainHandler handler) { drain_handler_ = std::move(handler); }
    
    bool is_open() const { return open_ && !closing_; }
    std::size_t get_buffered_payload() const { return buffered_payload_; }
    const std::string& get_remote_endpoint() const { return remote_endpoint_; }

private:
    struct QueuedFrame {
        std::vector<std::uint8_t> bytes;
        std::size_t payload_size;
    };
    
    void do_read_header();
    void do_read_payload(FrameKind kind, std::uint32_t length);
    void do_write();
    void handle_frame(FrameKind kind, std::vector<std::uint8_t> payload);
    void handle_error(const boost::system::error_code& error);
    void close_socket();
    
    tcp::socket socket_;
    std::string remote_endpoint_;
    bool open_;
    bool closing_;
    
    std::array<std::uint8_t, FRAME_HEADER_SIZE> read_header_buffer_;
    std::vector<std::uint8_t> read_payload_buffer_;
    
    std::deque<QueuedFrame> write_queue_;
    bool write_in_progress_;
    std::size_t buffered_payload_;
    
    FrameHandler frame_handler_;
    CloseHandler close_handler_;
    DrainHandler drain_handler_;
};

} // namespace filejet::network
