#pragma once

#include "filejet/network/peer_connection.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace filejet::network {

class LoopbackPeerConnection;

// In-process meeting point for loopback peer connections. Descriptions and
// candidates name endpoints by token; the network resolves tokens to peers.
class LoopbackNetwork {
public:
    explicit LoopbackNetwork(boost::asio::io_context& io_context);
    
    boost::asio::io_context& io_context() { return io_context_; }
    
    std::string register_endpoint(std::weak_ptr<LoopbackPeerConnection> endpoint);
    void unregister_endpoint(const std::string& token);
    std::shared_ptr<LoopbackPeerConnection> find(const std::string& token) const;
    std::size_t endpoint_count() const;

private:
    boost::asio::io_context& io_context_;
    std::unordered_map<std::string, std::weak_ptr<LoopbackPeerConnection>> endpoints_;
    std::uint64_t next_endpoint_;
};

class LoopbackDataChannel : public DataChannel, public std::enable_shared_from_this<LoopbackDataChannel> {
public:
    LoopbackDataChannel(boost::asio::io_context& io_context, std::string label);
    
    const std::string& label() const override { return label_; }
    bool is_open() const override { return open_; }
    bool send(const std::string& text) override;
    bool send(std::span<const std::uint8_t> data) override;
    std::size_t buffered_amount() const override { return buffered_amount_; }
    void close() override;
    
    std::uint64_t messages_sent() const { return messages_sent_; }
    
    void pair_with(const std::shared_ptr<LoopbackDataChannel>& remote) { remote_ = remote; }
    bool is_paired() const { return !remote_.expired(); }
    void open();
    void handle_remote_closed();

private:
    bool enqueue(ChannelMessage message, std::size_t size);
    void deliver(ChannelMessage message);
    
    boost::asio::io_context& io_context_;
    std::string label_;
    bool open_;
    bool closed_;
    std::size_t buffered_amount_;
    std::uint64_t messages_sent_;
    std::weak_ptr<LoopbackDataChannel> remote_;
};

class LoopbackPeerConnection : public PeerConnection, public std::enable_shared_from_this<LoopbackPeerConnection> {
public:
    LoopbackPeerConnection(std::shared_ptr<LoopbackNetwork> network, TraversalConfig config);
    ~LoopbackPeerConnection() override;
    
    void initialize();
    
    core::Result create_offer(SessionDescription& offer) override;
    core::Result create_answer(SessionDescription& answer) override;
    core::Result set_remote_description(const SessionDescription& description) override;
    core::Result add_remote_candidate(const IceCandidate& candidate) override;
    std::shared_ptr<DataChannel> create_data_channel(const std::string& label) override;
    
    PeerConnectionState state() const override { return state_; }
    SignalingState signaling_state() const override { return signaling_state_; }
    void close() override;
    
    const std::string& token() const { return token_; }
    std::size_t applied_candidate_count() const { return applied_candidates_; }
    
    // Drops the link as a transport failure would: FAILED here, DISCONNECTED
    // on the remote side.
    void simulate_failure();
    
    void handle_remote_closed();

private:
    void gather_candidates();
    void try_establish();
    void establish(const std::shared_ptr<LoopbackPeerConnection>& remote);
    void set_state(PeerConnectionState state);
    bool ready_for(const std::string& remote_token) const;
    
    std::shared_ptr<LoopbackNetwork> network_;
    TraversalConfig config_;
    std::string token_;
    std::string remote_token_;
    PeerConnectionState state_;
    SignalingState signaling_state_;
    bool has_local_description_;
    bool has_remote_description_;
    bool remote_reachable_;
    bool established_;
    std::size_t applied_candidates_;
    std::vector<std::shared_ptr<LoopbackDataChannel>> channels_;
    std::weak_ptr<LoopbackPeerConnection> remote_;
};

class LoopbackConnectionFactory : public PeerConnectionFactory {
public:
    explicit LoopbackConnectionFactory(std::shared_ptr<LoopbackNetwork> network);
    
    std::shared_ptr<PeerConnection> create(const TraversalConfig& config) override;
    
    // Most recently created connection, for fault injection in tests.
    std::shared_ptr<LoopbackPeerConnection> last_created() const { return last_created_.lock(); }

private:
    std::shared_ptr<LoopbackNetwork> network_;
    std::weak_ptr<LoopbackPeerConnection> last_created_;
};

} // namespace filejet::network
