#include "filejet/session/session_controller.hpp"
#include "filejet/core/logger.hpp"

namespace filejet::session {

SessionController::SessionController(boost::asio::io_context& io_context,
                                     std::shared_ptr<signaling::RendezvousStore> store,
                                     std::shared_ptr<network::PeerConnectionFactory> factory,
                                     NodeConfig config,
                                     signaling::SessionRole role,
                                     std::string session_id,
                                     SessionObserver& observer)
    : io_context_(io_context)
    , store_(std::move(store))
    , factory_(std::move(factory))
    , config_(std::move(config))
    , role_(role)
    , session_id_(std::move(session_id))
    , observer_(observer)
    , status_(ConnectionStatus::DISCONNECTED)
    , connected_notified_(false)
    , closed_(false) {
}

SessionController::~SessionController() {
    if (!closed_) {
        release();
    }
}

core::Result SessionController::create_connection() {
    if (connection_ || closed_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Session already started");
    }
    
    connection_ = factory_->create(config_.traversal);
    if (!connection_) {
        return core::Result(core::ErrorCode::CONNECTION_FAILURE, "Failed to create peer connection");
    }
    
    signaling_ = std::make_shared<signaling::SignalingMachine>(store_, connection_, role_, session_id_);
    
    auto weak_self = weak_from_this();
    signaling_->on_failure([weak_self](const core::Result& error) {
        if (auto self = weak_self.lock()) {
            self->handle_signaling_failure(error);
        }
    });
    signaling_->on_warning([weak_self](const core::Result& warning) {
        if (auto self = weak_self.lock()) {
            self->handle_signaling_warning(warning);
        }
    });
    
    connection_->on_local_candidate([weak_self](const network::IceCandidate& candidate) {
        auto self = weak_self.lock();
        if (self && !self->closed_) {
            self->signaling_->publish_local_candidate(candidate);
        }
    });
    connection_->on_state_change([weak_self](network::PeerConnectionState state) {
        if (auto self = weak_self.lock()) {
            self->handle_connection_state(state);
        }
    });
    
    set_status(ConnectionStatus::CONNECTING);
    return core::Result();
}

core::Result SessionController::start() {
    if (role_ != signaling::SessionRole::INITIATOR) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Only the initiator starts a session");
    }
    
    auto result = create_connection();
    if (!result.success()) {
        return result;
    }
    
    LOG_INFO("Connecting to session {}", session_id_);
    attach_channel(connection_->create_data_channel(config_.channel_label));
    
    result = signaling_->start_as_initiator();
    if (!result.success()) {
        terminate(result, Notice{NoticeLevel::ERROR, "Connection Error", "Failed to initiate signaling."});
        return result;
    }
    return core::Result();
}

core::Result SessionController::accept(const signaling::SignalingSession& session) {
    if (role_ != signaling::SessionRole::RESPONDER) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Only the responder accepts an offer");
    }
    
    auto result = create_connection();
    if (!result.success()) {
        return result;
    }
    
    LOG_INFO("Incoming connection on session {}", session_id_);
    
    auto weak_self = weak_from_this();
    auto label = config_.channel_label;
    connection_->on_data_channel([weak_self, label](std::shared_ptr<network::DataChannel> channel) {
        auto self = weak_self.lock();
        if (!self || self->closed_) {
            return;
        }
        if (channel->label() != label || self->channel_) {
            LOG_WARN("Ignoring unexpected data channel '{}'", channel->label());
            return;
        }
        self->attach_channel(std::move(channel));
    });
    
    result = signaling_->start_as_responder(session);
    if (!result.success()) {
        terminate(result, Notice{NoticeLevel::ERROR, "Connection Error", "Failed to answer the offer."});
        return result;
    }
    return core::Result();
}

void SessionController::handle_snapshot(const signaling::SessionSnapshot& snapshot) {
    if (closed_ || !signaling_) {
        return;
    }
    signaling_->handle_snapshot(snapshot);
}

void SessionController::attach_channel(std::shared_ptr<network::DataChannel> channel) {
    channel_ = std::move(channel);
    transfer_ = std::make_shared<transfer::TransferChannel>(io_context_, channel_, config_.transfer, *this);
    transfer_->attach();
    
    auto weak_self = weak_from_this();
    channel_->on_open([weak_self]() {
        if (auto self = weak_self.lock()) {
            self->handle_channel_open();
        }
    });
    channel_->on_closed([weak_self]() {
        if (auto self = weak_self.lock()) {
            self->terminate(core::Result(core::ErrorCode::CONNECTION_FAILURE, "Data channel closed"),
                            Notice{NoticeLevel::ERROR, "Disconnected", "Connection lost."});
        }
    });
    
    if (channel_->is_open()) {
        handle_channel_open();
    }
}

void SessionController::handle_connection_state(network::PeerConnectionState state) {
    if (closed_) {
        return;
    }
    
    LOG_DEBUG("Session {} connection state: {}", session_id_, network::to_string(state));
    
    switch (state) {
        case network::PeerConnectionState::CONNECTED:
            set_status(ConnectionStatus::CONNECTED);
            if (!connected_notified_) {
                connected_notified_ = true;
                notify(NoticeLevel::INFO, "Connected", "P2P connection established!");
            }
            signaling_->settle();
            break;
            
        case network::PeerConnectionState::DISCONNECTED:
        case network::PeerConnectionState::FAILED:
            terminate(core::Result(core::ErrorCode::CONNECTION_FAILURE,
                                   std::string("Connection ") + network::to_string(state)),
                      Notice{NoticeLevel::ERROR, "Disconnected", "Connection lost."});
            break;
            
        default:
            break;
    }
}

void SessionController::handle_channel_open() {
    if (closed_) {
        return;
    }
    LOG_INFO("Data channel '{}' open on session {}", channel_->label(), session_id_);
    set_status(ConnectionStatus::CONNECTED);
}

void SessionController::handle_signaling_failure(const core::Result& error) {
    terminate(error, Notice{NoticeLevel::ERROR, "Connection Error", error.message});
}

void SessionController::handle_signaling_warning(const core::Result& warning) {
    if (closed_) {
        return;
    }
    notify(NoticeLevel::WARNING, "Signaling Warning", warning.message);
}

core::Result SessionController::send_stream(const std::string& file_name, std::unique_ptr<std::istream> source,
                                            std::uint64_t size) {
    if (closed_ || !transfer_ || !channel_->is_open()) {
        return core::Result(core::ErrorCode::INVALID_INPUT,
                            "Please wait for the connection to be fully established.");
    }
    return transfer_->send_stream(file_name, std::move(source), size);
}

bool SessionController::is_channel_open() const {
    return !closed_ && channel_ && channel_->is_open();
}

transfer::TransferMode SessionController::get_transfer_mode() const {
    return transfer_ ? transfer_->get_mode() : transfer::TransferMode::IDLE;
}

double SessionController::get_progress() const {
    return transfer_ ? transfer_->get_progress() : 0.0;
}

void SessionController::on_transfer_started(transfer::TransferMode mode, const std::string& file_name,
                                            std::uint64_t file_size) {
    observer_.on_file_info(file_name, file_size);
    observer_.on_transfer_mode(mode);
    observer_.on_progress(0.0);
}

void SessionController::on_transfer_progress(transfer::TransferMode, double percent, std::uint64_t) {
    observer_.on_progress(percent);
}

void SessionController::on_file_sent(const std::string& file_name, std::uint64_t file_size) {
    observer_.on_transfer_mode(transfer::TransferMode::IDLE);
    observer_.on_file_sent(file_name, file_size);
    notify(NoticeLevel::INFO, "Success", "File sent successfully!");
}

void SessionController::on_file_received(transfer::ReceivedFile file) {
    observer_.on_transfer_mode(transfer::TransferMode::IDLE);
    observer_.on_file_received(file);
    notify(NoticeLevel::INFO, "Received", "File transfer complete!");
}

void SessionController::on_transfer_failed(const core::Result& error) {
    // The metadata already went out, so the peer holds a partial file. Closing
    // the session is the only way both sides drop it.
    terminate(error, Notice{NoticeLevel::ERROR, "Transfer Failed", error.message});
}

void SessionController::terminate(const core::Result& cause, const Notice& notice) {
    if (closed_) {
        return;
    }
    LOG_ERROR("Session {} ending: {} ({})", session_id_, cause.message, core::error_code_name(cause.error));
    
    notify(notice.level, notice.title, notice.description);
    teardown();
}

void SessionController::teardown() {
    if (closed_) {
        return;
    }
    
    // The closed handler usually drops the owner's reference.
    auto self = shared_from_this();
    
    release();
    
    set_status(ConnectionStatus::DISCONNECTED);
    observer_.on_transfer_mode(transfer::TransferMode::IDLE);
    observer_.on_progress(0.0);
    
    LOG_INFO("Session {} closed", session_id_);
    
    if (auto handler = std::move(closed_handler_)) {
        closed_handler_ = nullptr;
        handler();
    }
}

void SessionController::release() {
    closed_ = true;
    
    if (signaling_) {
        signaling_->on_failure(nullptr);
        signaling_->on_warning(nullptr);
        signaling_->abandon();
    }
    if (transfer_) {
        transfer_->detach();
    }
    if (channel_) {
        channel_->reset_handlers();
        channel_->close();
    }
    if (connection_) {
        connection_->reset_handlers();
        connection_->close();
    }
}

void SessionController::set_status(ConnectionStatus status) {
    if (status_ == status) {
        return;
    }
    status_ = status;
    observer_.on_connection_status(status);
}

void SessionController::notify(NoticeLevel level, const std::string& title, const std::string& description) {
    observer_.on_notice(Notice{level, title, description});
}

} // namespace filejet::session
