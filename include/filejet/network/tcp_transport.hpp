#pragma once

#include "filejet/network/peer_connection.hpp"
#include "filejet/network/tcp_link.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace filejet::network {

constexpr std::chrono::seconds DEFAULT_TCP_CONNECT_TIMEOUT{30};

// Data channel carried by a TcpLink. One channel per connection.
class TcpDataChannel : public DataChannel, public std::enable_shared_from_this<TcpDataChannel> {
public:
    explicit TcpDataChannel(std::string label);
    
    const std::string& label() const override { return label_; }
    bool is_open() const override;
    bool send(const std::string& text) override;
    bool send(std::span<const std::uint8_t> data) override;
    std::size_t buffered_amount() const override;
    void close() override;
    
    void bind(std::shared_ptr<TcpLink> link);
    void open();
    void handle_frame(FrameKind kind, std::vector<std::uint8_t> payload);
    void handle_drain(std::size_t previous, std::size_t current);
    void handle_remote_closed();
    
    // Marks the channel closed without telling the peer.
    void detach();

private:
    std::string label_;
    std::shared_ptr<TcpLink> link_;
    bool open_;
    bool closed_;
};

// Direct TCP peer connection. Both sides listen; the answering side dials the
// offerer's candidates and proves it read the offer by echoing the offer's
// random token in a hello frame.
class TcpPeerConnection : public PeerConnection, public std::enable_shared_from_this<TcpPeerConnection> {
public:
    TcpPeerConnection(boost::asio::io_context& io_context, TraversalConfig config,
                      std::chrono::milliseconds connect_timeout = DEFAULT_TCP_CONNECT_TIMEOUT);
    ~TcpPeerConnection() override;
    
    core::Result initialize();
    
    core::Result create_offer(SessionDescription& offer) override;
    core::Result create_answer(SessionDescription& answer) override;
    core::Result set_remote_description(const SessionDescription& description) override;
    core::Result add_remote_candidate(const IceCandidate& candidate) override;
    std::shared_ptr<DataChannel> create_data_channel(const std::string& label) override;
    
    PeerConnectionState state() const override { return state_; }
    SignalingState signaling_state() const override { return signaling_state_; }
    void close() override;
    
    std::uint16_t get_listen_port() const { return listen_port_; }
    const std::string& get_token() const { return token_; }

private:
    void do_accept();
    void handle_inbound_hello(const std::shared_ptr<TcpLink>& link, FrameKind kind,
                              const std::vector<std::uint8_t>& payload);
    void dial(const std::string& host, const std::string& port);
    void handle_outbound_ack(const std::shared_ptr<TcpLink>& link, FrameKind kind);
    void try_adopt_pending();
    void establish(std::shared_ptr<TcpLink> link);
    void handle_frame(FrameKind kind, std::vector<std::uint8_t> payload);
    void handle_link_closed();
    void gather_candidates();
    void start_connect_timer();
    void drop_pending_links();
    void set_state(PeerConnectionState state);
    bool is_closed() const { return state_ == PeerConnectionState::CLOSED; }
    
    boost::asio::io_context& io_context_;
    TraversalConfig config_;
    std::chrono::milliseconds connect_timeout_;
    tcp::acceptor acceptor_;
    tcp::resolver resolver_;
    boost::asio::steady_timer connect_timer_;
    std::uint16_t listen_port_;
    
    std::string token_;
    std::string remote_token_;
    bool is_offerer_;
    bool has_local_description_;
    bool has_remote_description_;
    PeerConnectionState state_;
    SignalingState signaling_state_;
    
    std::shared_ptr<TcpLink> link_;
    std::set<std::shared_ptr<TcpLink>> pending_links_;
    std::shared_ptr<TcpLink> verified_link_;
    std::string verified_answer_token_;
    std::set<std::string> dialed_;
    
    std::shared_ptr<TcpDataChannel> channel_;
};

class TcpConnectionFactory : public PeerConnectionFactory {
public:
    explicit TcpConnectionFactory(boost::asio::io_context& io_context,
                                  std::chrono::milliseconds connect_timeout = DEFAULT_TCP_CONNECT_TIMEOUT);
    
    // Returns nullptr when no listening socket can be opened.
    std::shared_ptr<PeerConnection> create(const TraversalConfig& config) override;

private:
    boost::asio::io_context& io_context_;
    std::chrono::milliseconds connect_timeout_;
};

} // namespace filejet::network
