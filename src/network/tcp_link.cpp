#include "filejet/network/tcp_link.hpp"
#include "filejet/core/logger.hpp"
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

namespace filejet::network {

std::array<std::uint8_t, FRAME_HEADER_SIZE> encode_frame_header(FrameKind kind, std::uint32_t length) {
    return {
        static_cast<std::uint8_t>(kind),
        static_cast<std::uint8_t>((length >> 24) & 0xFF),
        static_cast<std::uint8_t>((length >> 16) & 0xFF),
        static_cast<std::uint8_t>((length >> 8) & 0xFF),
        static_cast<std::uint8_t>(length & 0xFF)
    };
}

bool decode_frame_header(std::span<const std::uint8_t> header, FrameKind& kind, std::uint32_t& length) {
    if (header.size() < FRAME_HEADER_SIZE) {
        return false;
    }
    
    switch (header[0]) {
        case static_cast<std::uint8_t>(FrameKind::TEXT):
        case static_cast<std::uint8_t>(FrameKind::BINARY):
        case static_cast<std::uint8_t>(FrameKind::HELLO):
        case static_cast<std::uint8_t>(FrameKind::HELLO_ACK):
        case static_cast<std::uint8_t>(FrameKind::CHANNEL_OPEN):
        case static_cast<std::uint8_t>(FrameKind::CHANNEL_CLOSE):
            kind = static_cast<FrameKind>(header[0]);
            break;
        default:
            return false;
    }
    
    length = (static_cast<std::uint32_t>(header[1]) << 24) |
             (static_cast<std::uint32_t>(header[2]) << 16) |
             (static_cast<std::uint32_t>(header[3]) << 8) |
             static_cast<std::uint32_t>(header[4]);
    return length <= MAX_FRAME_PAYLOAD;
}

TcpLink::TcpLink(tcp::socket socket)
    : socket_(std::move(socket))
    , open_(true)
    , closing_(false)
    , write_in_progress_(false)
    , buffered_payload_(0) {
    
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", ec.message());
    } else {
        remote_endpoint_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }
}

TcpLink::~TcpLink() {
    LOG_DEBUG("Link to {} destroyed", remote_endpoint_);
}

void TcpLink::start() {
    LOG_DEBUG("Reading frames from {}", remote_endpoint_);
    do_read_header();
}

void TcpLink::close(bool flush) {
    if (!open_ || closing_) {
        return;
    }
    
    close_handler_ = nullptr;
    if (flush && (write_in_progress_ || !write_queue_.empty())) {
        closing_ = true;
        return;
    }
    close_socket();
}

void TcpLink::close_socket() {
    if (!open_) {
        return;
    }
    open_ = false;
    closing_ = false;
    
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    
    write_queue_.clear();
    buffered_payload_ = 0;
    LOG_DEBUG("Link to {} closed", remote_endpoint_);
}

bool TcpLink::send_frame(FrameKind kind, std::span<const std::uint8_t> payload) {
    if (!is_open()) {
        LOG_WARN("Attempted to send on closed link to {}", remote_endpoint_);
        return false;
    }
    if (payload.size() > MAX_FRAME_PAYLOAD) {
        LOG_ERROR("Frame of {} bytes exceeds the limit", payload.size());
        return false;
    }
    
    auto header = encode_frame_header(kind, static_cast<std::uint32_t>(payload.size()));
    QueuedFrame frame;
    frame.bytes.reserve(header.size() + payload.size());
    frame.bytes.insert(frame.bytes.end(), header.begin(), header.end());
    frame.bytes.insert(frame.bytes.end(), payload.begin(), payload.end());
    frame.payload_size = payload.size();
    
    buffered_payload_ += frame.payload_size;
    write_queue_.push_back(std::move(frame));
    
    if (!write_in_progress_) {
        do_write();
    }
    return true;
}

bool TcpLink::send_frame(FrameKind kind, const std::string& payload) {
    return send_frame(kind, std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(payload.data()), payload.size()));
}

void TcpLink::do_read_header() {
    if (!open_) {
        return;
    }
    
    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_header_buffer_),
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }
            
            FrameKind kind;
            std::uint32_t length = 0;
            if (!decode_frame_header(read_header_buffer_, kind, length)) {
                LOG_ERROR("Invalid frame header from {}", remote_endpoint_);
                handle_error(boost::asio::error::invalid_argument);
                return;
            }
            
            if (length > 0) {
                do_read_payload(kind, length);
            } else {
                handle_frame(kind, {});
                do_read_header();
            }
        });
}

void TcpLink::do_read_payload(FrameKind kind, std::uint32_t length) {
    read_payload_buffer_.resize(length);
    
    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_payload_buffer_),
        [this, self, kind](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }
            
            handle_frame(kind, std::move(read_payload_buffer_));
            read_payload_buffer_ = {};
            do_read_header();
        });
}

void TcpLink::do_write() {
    if (write_queue_.empty() || write_in_progress_ || !open_) {
        return;
    }
    
    write_in_progress_ = true;
    
    auto self = shared_from_this();
    boost::asio::async_write(socket_,
        boost::asio::buffer(write_queue_.front().bytes),
        [this, self](boost::system::error_code ec, std::size_t) {
            write_in_progress_ = false;
            
            if (ec) {
                handle_error(ec);
                return;
            }
            if (!open_) {
                return;
            }
            
            auto previous = buffered_payload_;
            buffered_payload_ -= write_queue_.front().payload_size;
            write_queue_.pop_front();
            
            if (!write_queue_.empty()) {
                do_write();
            } else if (closing_) {
                close_socket();
                return;
            }
            
            if (auto handler = drain_handler_) {
                handler(previous, buffered_payload_);
            }
        });
}

void TcpLink::handle_frame(FrameKind kind, std::vector<std::uint8_t> payload) {
    if (!open_ || closing_) {
        return;
    }
    
    LOG_TRACE("Frame {:#04x} ({} bytes) from {}", static_cast<int>(kind), payload.size(), remote_endpoint_);
    if (auto handler = frame_handler_) {
        handler(kind, std::move(payload));
    }
}

void TcpLink::handle_error(const boost::system::error_code& error) {
    if (!open_) {
        return;
    }
    
    if (error == boost::asio::error::eof) {
        LOG_INFO("Link to {} closed by peer", remote_endpoint_);
    } else if (error == boost::asio::error::operation_aborted) {
        LOG_DEBUG("Link operation aborted for {}", remote_endpoint_);
    } else {
        LOG_ERROR("Link error with {}: {}", remote_endpoint_, error.message());
    }
    
    auto handler = std::move(close_handler_);
    close_handler_ = nullptr;
    close_socket();
    
    if (handler) {
        handler(error);
    }
}

} // namespace filejet::network
