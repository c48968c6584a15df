#pragma once

#include "filejet/core/result.hpp"
#include "filejet/network/peer_connection.hpp"
#include "filejet/session/node_config.hpp"
#include "filejet/session/session_observer.hpp"
#include "filejet/signaling/rendezvous_store.hpp"
#include "filejet/signaling/signaling_machine.hpp"
#include "filejet/transfer/transfer_channel.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <functional>
#include <istream>
#include <memory>
#include <string>

namespace filejet::session {

// Owns one connection attempt: the peer connection, its data channel, the
// signaling that bootstraps it and the transfer running over it. Any failure
// ends in a single teardown that releases all of them.
class SessionController : public transfer::TransferListener,
                          public std::enable_shared_from_this<SessionController> {
public:
    using ClosedHandler = std::function<void()>;
    
    SessionController(boost::asio::io_context& io_context,
                      std::shared_ptr<signaling::RendezvousStore> store,
                      std::shared_ptr<network::PeerConnectionFactory> factory,
                      NodeConfig config,
                      signaling::SessionRole role,
                      std::string session_id,
                      SessionObserver& observer);
    ~SessionController() override;
    
    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;
    
    // Initiator: open the channel and publish an offer under the session id.
    core::Result start();
    
    // Responder: answer the offer found in our own document.
    core::Result accept(const signaling::SignalingSession& session);
    
    void handle_snapshot(const signaling::SessionSnapshot& snapshot);
    
    core::Result send_stream(const std::string& file_name, std::unique_ptr<std::istream> source,
                             std::uint64_t size);
    
    // Local, silent teardown. Safe to call repeatedly and from any state.
    void teardown();
    
    // Runs once, after teardown completed.
    void on_closed(ClosedHandler handler) { closed_handler_ = std::move(handler); }
    
    signaling::SessionRole get_role() const { return role_; }
    const std::string& get_session_id() const { return session_id_; }
    ConnectionStatus get_status() const { return status_; }
    bool is_closed() const { return closed_; }
    bool is_channel_open() const;
    transfer::TransferMode get_transfer_mode() const;
    double get_progress() const;
    
    std::shared_ptr<signaling::SignalingMachine> get_signaling() const { return signaling_; }
    std::shared_ptr<network::PeerConnection> get_connection() const { return connection_; }
    std::shared_ptr<network::DataChannel> get_channel() const { return channel_; }
    
    // transfer::TransferListener
    void on_transfer_started(transfer::TransferMode mode, const std::string& file_name,
                             std::uint64_t file_size) override;
    void on_transfer_progress(transfer::TransferMode mode, double percent, std::uint64_t bytes) override;
    void on_file_sent(const std::string& file_name, std::uint64_t file_size) override;
    void on_file_received(transfer::ReceivedFile file) override;
    void on_transfer_failed(const core::Result& error) override;

private:
    core::Result create_connection();
    void attach_channel(std::shared_ptr<network::DataChannel> channel);
    void handle_connection_state(network::PeerConnectionState state);
    void handle_channel_open();
    void handle_signaling_failure(const core::Result& error);
    void handle_signaling_warning(const core::Result& warning);
    
    // Teardown caused by the network or a protocol violation; tells the user.
    void terminate(const core::Result& cause, const Notice& notice);
    void release();
    
    void set_status(ConnectionStatus status);
    void notify(NoticeLevel level, const std::string& title, const std::string& description);
    
    boost::asio::io_context& io_context_;
    std::shared_ptr<signaling::RendezvousStore> store_;
    std::shared_ptr<network::PeerConnectionFactory> factory_;
    NodeConfig config_;
    signaling::SessionRole role_;
    std::string session_id_;
    SessionObserver& observer_;
    
    std::shared_ptr<network::PeerConnection> connection_;
    std::shared_ptr<network::DataChannel> channel_;
    std::shared_ptr<signaling::SignalingMachine> signaling_;
    std::shared_ptr<transfer::TransferChannel> transfer_;
    
    ConnectionStatus status_;
    bool connected_notified_;
    bool closed_;
    ClosedHandler closed_handler_;
};

} // namespace filejet::session
