#include "filejet/session/peer_node.hpp"
#include "filejet/core/logger.hpp"
#include "filejet/core/utils.hpp"
#include "filejet/signaling/session_id.hpp"
#include <fstream>

namespace filejet::session {

PeerNode::PeerNode(boost::asio::io_context& io_context,
                   std::shared_ptr<signaling::RendezvousStore> store,
                   std::shared_ptr<network::PeerConnectionFactory> factory,
                   NodeConfig config)
    : io_context_(io_context)
    , store_(std::move(store))
    , factory_(std::move(factory))
    , config_(std::move(config))
    , observer_(nullptr)
    , status_(ConnectionStatus::DISCONNECTED)
    , mode_(transfer::TransferMode::IDLE)
    , progress_(0.0)
    , file_size_(0)
    , alive_(std::make_shared<bool>(true)) {
}

PeerNode::~PeerNode() {
    *alive_ = false;
    observer_ = nullptr;
    stop();
}

core::Result PeerNode::start(const std::string& local_id) {
    if (inbox_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Node already listening on " + local_id_);
    }
    
    auto id = local_id.empty() ? signaling::generate_session_id() : local_id;
    auto valid = signaling::validate_session_id(id);
    if (!valid.success()) {
        return valid;
    }
    
    std::weak_ptr<bool> alive = alive_;
    signaling::RendezvousStore::SubscriptionId subscription = 0;
    auto result = store_->subscribe(id, [this, alive](const signaling::SessionSnapshot& snapshot) {
        auto guard = alive.lock();
        if (guard && *guard) {
            handle_inbox(snapshot);
        }
    }, subscription);
    
    if (!result.success()) {
        LOG_WARN("Cannot listen on session {}: {}", id, result.message);
        return result;
    }
    
    local_id_ = id;
    inbox_ = subscription;
    LOG_INFO("Listening for incoming connections on {}", local_id_);
    return core::Result();
}

void PeerNode::stop() {
    if (inbox_) {
        store_->unsubscribe(*inbox_);
        inbox_.reset();
        LOG_INFO("Stopped listening on {}", local_id_);
    }
    disconnect();
}

core::Result PeerNode::connect(const std::string& target_id) {
    auto valid = signaling::validate_session_id(target_id);
    if (!valid.success()) {
        return reject(valid, "Invalid ID", "Please enter a valid 6-digit ID.");
    }
    if (target_id == local_id_) {
        return reject(core::Result(core::ErrorCode::INVALID_INPUT, "Cannot connect to own session id"),
                      "Invalid ID", "That is your own ID.");
    }
    
    if (session_) {
        LOG_INFO("Replacing session {} with a connection to {}", session_->get_session_id(), target_id);
        disconnect();
    }
    
    auto session = make_session(signaling::SessionRole::INITIATOR, target_id);
    session_ = session;
    
    auto result = session->start();
    if (!result.success()) {
        LOG_ERROR("Failed to connect to {}: {}", target_id, result.message);
        return result;
    }
    return core::Result();
}

core::Result PeerNode::send_file(const std::filesystem::path& path) {
    if (!session_ || !session_->is_channel_open()) {
        return reject(core::Result(core::ErrorCode::INVALID_INPUT, "No open connection"),
                      "Connection Required", "Please wait for the connection to be fully established.");
    }
    
    auto size = core::utils::FileUtils::file_size(path);
    if (!core::utils::FileUtils::is_file(path) || !size) {
        return reject(core::Result(core::ErrorCode::INVALID_INPUT, "File not found: " + path.string()),
                      "Transfer Failed", "File not found.");
    }
    
    auto source = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!source->is_open()) {
        return reject(core::Result(core::ErrorCode::INVALID_INPUT, "Cannot open " + path.string()),
                      "Transfer Failed", "Cannot read the file.");
    }
    
    return send_stream(path.filename().string(), std::move(source), *size);
}

core::Result PeerNode::send_stream(const std::string& file_name, std::unique_ptr<std::istream> source,
                                   std::uint64_t size) {
    if (!session_ || !session_->is_channel_open()) {
        return reject(core::Result(core::ErrorCode::INVALID_INPUT, "No open connection"),
                      "Connection Required", "Please wait for the connection to be fully established.");
    }
    
    auto result = session_->send_stream(file_name, std::move(source), size);
    if (!result.success()) {
        return reject(result, "Transfer Failed", result.message);
    }
    return core::Result();
}

void PeerNode::disconnect() {
    if (!session_) {
        return;
    }
    auto session = std::move(session_);
    session_.reset();
    session->teardown();
}

std::shared_ptr<SessionController> PeerNode::make_session(signaling::SessionRole role, const std::string& session_id) {
    auto session = std::make_shared<SessionController>(io_context_, store_, factory_, config_,
                                                       role, session_id, *this);
    
    std::weak_ptr<bool> alive = alive_;
    std::weak_ptr<SessionController> weak_session = session;
    session->on_closed([this, alive, weak_session]() {
        auto guard = alive.lock();
        if (!guard || !*guard) {
            return;
        }
        if (session_ && session_ == weak_session.lock()) {
            session_.reset();
        }
    });
    
    received_file_.reset();
    return session;
}

void PeerNode::handle_inbox(const signaling::SessionSnapshot& snapshot) {
    if (session_) {
        if (session_->get_role() == signaling::SessionRole::RESPONDER) {
            session_->handle_snapshot(snapshot);
        } else if (snapshot && snapshot->offer && !snapshot->answer) {
            LOG_INFO("Ignoring offer on {} while connected elsewhere", local_id_);
        }
        return;
    }
    
    if (!snapshot || !snapshot->offer || snapshot->answer) {
        return;
    }
    
    if (last_offer_ && *last_offer_ == snapshot->created_at) {
        return;
    }
    last_offer_ = snapshot->created_at;
    
    auto session = make_session(signaling::SessionRole::RESPONDER, local_id_);
    session_ = session;
    
    auto result = session->accept(*snapshot);
    if (!result.success()) {
        LOG_ERROR("Failed to accept offer on {}: {}", local_id_, result.message);
    }
}

core::Result PeerNode::reject(core::Result error, const std::string& title, const std::string& description) {
    LOG_WARN("{}: {}", title, error.message);
    on_notice(Notice{NoticeLevel::WARNING, title, description});
    return error;
}

void PeerNode::on_connection_status(ConnectionStatus status) {
    status_ = status;
    if (observer_) observer_->on_connection_status(status);
}

void PeerNode::on_transfer_mode(transfer::TransferMode mode) {
    mode_ = mode;
    if (observer_) observer_->on_transfer_mode(mode);
}

void PeerNode::on_progress(double percent) {
    progress_ = percent;
    if (observer_) observer_->on_progress(percent);
}

void PeerNode::on_file_info(const std::string& file_name, std::uint64_t file_size) {
    file_name_ = file_name;
    file_size_ = file_size;
    if (observer_) observer_->on_file_info(file_name, file_size);
}

void PeerNode::on_file_sent(const std::string& file_name, std::uint64_t file_size) {
    if (observer_) observer_->on_file_sent(file_name, file_size);
}

void PeerNode::on_file_received(const transfer::ReceivedFile& file) {
    received_file_ = file;
    if (observer_) observer_->on_file_received(file);
}

void PeerNode::on_notice(const Notice& notice) {
    LOG_INFO("[{}] {}: {}", to_string(notice.level), notice.title, notice.description);
    if (observer_) observer_->on_notice(notice);
}

} // namespace filejet::session
