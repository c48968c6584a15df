#pragma once

#include "filejet/core/result.hpp"
#include "filejet/network/peer_connection.hpp"
#include "filejet/session/node_config.hpp"
#include "filejet/session/session_controller.hpp"
#include "filejet/session/session_observer.hpp"
#include "filejet/signaling/rendezvous_store.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace filejet::session {

// One local peer. It listens on its own session id for offers (responder
// role) and can connect to another id (initiator role); at most one session
// is alive at a time. Session events are mirrored into plain state for the
// user interface and forwarded to an optional observer.
class PeerNode : public SessionObserver {
public:
    PeerNode(boost::asio::io_context& io_context,
             std::shared_ptr<signaling::RendezvousStore> store,
             std::shared_ptr<network::PeerConnectionFactory> factory,
             NodeConfig config);
    ~PeerNode() override;
    
    PeerNode(const PeerNode&) = delete;
    PeerNode& operator=(const PeerNode&) = delete;
    
    // Starts listening for offers. An empty id picks a random one.
    core::Result start(const std::string& local_id = "");
    void stop();
    
    core::Result connect(const std::string& target_id);
    core::Result send_file(const std::filesystem::path& path);
    core::Result send_stream(const std::string& file_name, std::unique_ptr<std::istream> source,
                             std::uint64_t size);
    void disconnect();
    
    void set_observer(SessionObserver* observer) { observer_ = observer; }
    
    const std::string& get_local_id() const { return local_id_; }
    bool is_listening() const { return inbox_.has_value(); }
    ConnectionStatus get_connection_status() const { return status_; }
    transfer::TransferMode get_transfer_mode() const { return mode_; }
    double get_progress() const { return progress_; }
    const std::string& get_file_name() const { return file_name_; }
    std::uint64_t get_file_size() const { return file_size_; }
    const std::optional<transfer::ReceivedFile>& get_received_file() const { return received_file_; }
    std::shared_ptr<SessionController> get_session() const { return session_; }
    
    // SessionObserver
    void on_connection_status(ConnectionStatus status) override;
    void on_transfer_mode(transfer::TransferMode mode) override;
    void on_progress(double percent) override;
    void on_file_info(const std::string& file_name, std::uint64_t file_size) override;
    void on_file_sent(const std::string& file_name, std::uint64_t file_size) override;
    void on_file_received(const transfer::ReceivedFile& file) override;
    void on_notice(const Notice& notice) override;

private:
    void handle_inbox(const signaling::SessionSnapshot& snapshot);
    std::shared_ptr<SessionController> make_session(signaling::SessionRole role, const std::string& session_id);
    core::Result reject(core::Result error, const std::string& title, const std::string& description);
    
    boost::asio::io_context& io_context_;
    std::shared_ptr<signaling::RendezvousStore> store_;
    std::shared_ptr<network::PeerConnectionFactory> factory_;
    NodeConfig config_;
    SessionObserver* observer_;
    
    std::string local_id_;
    std::optional<signaling::RendezvousStore::SubscriptionId> inbox_;
    std::optional<std::chrono::system_clock::time_point> last_offer_;
    std::shared_ptr<SessionController> session_;
    
    ConnectionStatus status_;
    transfer::TransferMode mode_;
    double progress_;
    std::string file_name_;
    std::uint64_t file_size_;
    std::optional<transfer::ReceivedFile> received_file_;
    
    // Handlers registered with the store check this before touching the node.
    std::shared_ptr<bool> alive_;
};

} // namespace filejet::session
