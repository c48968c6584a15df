#include "filejet/network/loopback_transport.hpp"
#include "filejet/core/logger.hpp"
#include "filejet/core/utils.hpp"

namespace filejet::network {

namespace {
    constexpr const char* LOOPBACK_SDP_PREFIX = "loopback ";
    
    std::string token_from_sdp(const std::string& sdp) {
        if (sdp.rfind(LOOPBACK_SDP_PREFIX, 0) != 0) {
            return "";
        }
        return core::utils::StringUtils::trim(sdp.substr(std::char_traits<char>::length(LOOPBACK_SDP_PREFIX)));
    }
    
    // "candidate:<n> 1 loopback <token> <host> typ host"
    std::string token_from_candidate(const std::string& candidate) {
        auto fields = core::utils::StringUtils::split(candidate, ' ');
        for (std::size_t i = 0; i + 1 < fields.size(); ++i) {
            if (fields[i] == "loopback") {
                return fields[i + 1];
            }
        }
        return "";
    }
}

LoopbackNetwork::LoopbackNetwork(boost::asio::io_context& io_context)
    : io_context_(io_context)
    , next_endpoint_(1) {
}

std::string LoopbackNetwork::register_endpoint(std::weak_ptr<LoopbackPeerConnection> endpoint) {
    auto token = "lo" + std::to_string(next_endpoint_++);
    endpoints_[token] = std::move(endpoint);
    return token;
}

void LoopbackNetwork::unregister_endpoint(const std::string& token) {
    endpoints_.erase(token);
}

std::shared_ptr<LoopbackPeerConnection> LoopbackNetwork::find(const std::string& token) const {
    auto it = endpoints_.find(token);
    if (it == endpoints_.end()) {
        return nullptr;
    }
    return it->second.lock();
}

std::size_t LoopbackNetwork::endpoint_count() const {
    return endpoints_.size();
}

LoopbackDataChannel::LoopbackDataChannel(boost::asio::io_context& io_context, std::string label)
    : io_context_(io_context)
    , label_(std::move(label))
    , open_(false)
    , closed_(false)
    , buffered_amount_(0)
    , messages_sent_(0) {
}

bool LoopbackDataChannel::send(const std::string& text) {
    return enqueue(ChannelMessage(text), text.size());
}

bool LoopbackDataChannel::send(std::span<const std::uint8_t> data) {
    return enqueue(ChannelMessage(BinaryMessage(data.begin(), data.end())), data.size());
}

bool LoopbackDataChannel::enqueue(ChannelMessage message, std::size_t size) {
    if (!open_) {
        LOG_WARN("Send on closed loopback channel '{}'", label_);
        return false;
    }
    
    buffered_amount_ += size;
    messages_sent_++;
    
    // Each message is its own event loop task, so the buffer drains only when
    // the producer yields.
    auto self = shared_from_this();
    boost::asio::post(io_context_, [self, message = std::move(message), size]() mutable {
        auto previous = self->buffered_amount_;
        self->buffered_amount_ -= size;
        
        if (self->open_) {
            if (auto remote = self->remote_.lock()) {
                remote->deliver(std::move(message));
            }
        }
        
        self->notify_if_drained(previous, self->buffered_amount_);
    });
    
    return true;
}

void LoopbackDataChannel::deliver(ChannelMessage message) {
    if (!open_) {
        return;
    }
    notify_message(std::move(message));
}

void LoopbackDataChannel::open() {
    if (open_ || closed_) {
        return;
    }
    open_ = true;
    LOG_DEBUG("Loopback channel '{}' open", label_);
    notify_open();
}

void LoopbackDataChannel::close() {
    if (closed_) {
        return;
    }
    
    bool was_open = open_;
    open_ = false;
    closed_ = true;
    
    auto remote = remote_.lock();
    if (was_open && remote) {
        boost::asio::post(io_context_, [remote]() {
            remote->handle_remote_closed();
        });
    }
}

void LoopbackDataChannel::handle_remote_closed() {
    if (closed_) {
        return;
    }
    open_ = false;
    closed_ = true;
    LOG_DEBUG("Loopback channel '{}' closed by peer", label_);
    notify_closed();
}

LoopbackPeerConnection::LoopbackPeerConnection(std::shared_ptr<LoopbackNetwork> network, TraversalConfig config)
    : network_(std::move(network))
    , config_(std::move(config))
    , state_(PeerConnectionState::NEW)
    , signaling_state_(SignalingState::STABLE)
    , has_local_description_(false)
    , has_remote_description_(false)
    , remote_reachable_(false)
    , established_(false)
    , applied_candidates_(0) {
}

LoopbackPeerConnection::~LoopbackPeerConnection() {
    if (!token_.empty()) {
        network_->unregister_endpoint(token_);
    }
}

void LoopbackPeerConnection::initialize() {
    token_ = network_->register_endpoint(weak_from_this());
    LOG_DEBUG("Loopback endpoint {} created ({} traversal servers ignored)",
              token_, config_.ice_servers.size());
}

core::Result LoopbackPeerConnection::create_offer(SessionDescription& offer) {
    if (signaling_state_ != SignalingState::STABLE || has_local_description_) {
        return core::Result(core::ErrorCode::INVALID_STATE,
                            std::string("Cannot create offer in state ") + to_string(signaling_state_));
    }
    
    offer.type = DescriptionType::OFFER;
    offer.sdp = LOOPBACK_SDP_PREFIX + token_;
    has_local_description_ = true;
    signaling_state_ = SignalingState::HAVE_LOCAL_OFFER;
    
    gather_candidates();
    return core::Result();
}

core::Result LoopbackPeerConnection::create_answer(SessionDescription& answer) {
    if (signaling_state_ != SignalingState::HAVE_REMOTE_OFFER) {
        return core::Result(core::ErrorCode::INVALID_STATE,
                            std::string("Cannot create answer in state ") + to_string(signaling_state_));
    }
    
    answer.type = DescriptionType::ANSWER;
    answer.sdp = LOOPBACK_SDP_PREFIX + token_;
    has_local_description_ = true;
    signaling_state_ = SignalingState::STABLE;
    
    gather_candidates();
    try_establish();
    return core::Result();
}

core::Result LoopbackPeerConnection::set_remote_description(const SessionDescription& description) {
    if (state_ == PeerConnectionState::CLOSED) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Connection closed");
    }
    
    bool expected_offer = signaling_state_ == SignalingState::STABLE && !has_remote_description_ &&
                          !has_local_description_;
    bool expected_answer = signaling_state_ == SignalingState::HAVE_LOCAL_OFFER;
    
    if ((description.type == DescriptionType::OFFER && !expected_offer) ||
        (description.type == DescriptionType::ANSWER && !expected_answer)) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR,
                            std::string("Unexpected remote ") + to_string(description.type) +
                            " in state " + to_string(signaling_state_));
    }
    
    auto remote_token = token_from_sdp(description.sdp);
    if (remote_token.empty() || remote_token == token_) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR, "Malformed loopback description");
    }
    
    remote_token_ = remote_token;
    has_remote_description_ = true;
    signaling_state_ = description.type == DescriptionType::OFFER ?
        SignalingState::HAVE_REMOTE_OFFER : SignalingState::STABLE;
    
    set_state(PeerConnectionState::CONNECTING);
    try_establish();
    return core::Result();
}

core::Result LoopbackPeerConnection::add_remote_candidate(const IceCandidate& candidate) {
    if (!has_remote_description_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Remote description not set");
    }
    
    auto token = token_from_candidate(candidate.candidate);
    if (token.empty()) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR, "Malformed loopback candidate");
    }
    if (token != remote_token_) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR, "Candidate belongs to another endpoint");
    }
    
    applied_candidates_++;
    remote_reachable_ = true;
    try_establish();
    return core::Result();
}

std::shared_ptr<DataChannel> LoopbackPeerConnection::create_data_channel(const std::string& label) {
    auto channel = std::make_shared<LoopbackDataChannel>(network_->io_context(), label);
    channels_.push_back(channel);
    
    if (established_) {
        LOG_WARN("Loopback channel '{}' created after connection was established", label);
    }
    return channel;
}

void LoopbackPeerConnection::close() {
    if (state_ == PeerConnectionState::CLOSED) {
        return;
    }
    
    state_ = PeerConnectionState::CLOSED;
    signaling_state_ = SignalingState::CLOSED;
    
    for (auto& channel : channels_) {
        channel->close();
    }
    channels_.clear();
    
    if (auto remote = remote_.lock()) {
        boost::asio::post(network_->io_context(), [remote]() {
            remote->handle_remote_closed();
        });
    }
    
    network_->unregister_endpoint(token_);
    LOG_DEBUG("Loopback endpoint {} closed", token_);
}

void LoopbackPeerConnection::simulate_failure() {
    if (state_ == PeerConnectionState::CLOSED) {
        return;
    }
    
    for (auto& channel : channels_) {
        channel->close();
    }
    if (auto remote = remote_.lock()) {
        boost::asio::post(network_->io_context(), [remote]() {
            remote->handle_remote_closed();
        });
    }
    set_state(PeerConnectionState::FAILED);
}

void LoopbackPeerConnection::handle_remote_closed() {
    if (state_ == PeerConnectionState::CLOSED || state_ == PeerConnectionState::FAILED ||
        state_ == PeerConnectionState::DISCONNECTED) {
        return;
    }
    set_state(PeerConnectionState::DISCONNECTED);
}

void LoopbackPeerConnection::gather_candidates() {
    auto self = shared_from_this();
    boost::asio::post(network_->io_context(), [self]() {
        if (self->state_ == PeerConnectionState::CLOSED) {
            return;
        }
        
        auto hosts = self->config_.advertised_hosts;
        if (hosts.empty()) {
            hosts.push_back("127.0.0.1");
        }
        
        for (std::size_t i = 0; i < hosts.size(); ++i) {
            IceCandidate candidate{
                "candidate:" + std::to_string(i + 1) + " 1 loopback " + self->token_ + " " +
                    hosts[i] + " typ host",
                "0"
            };
            self->notify_local_candidate(candidate);
            if (self->state_ == PeerConnectionState::CLOSED) {
                return;
            }
        }
    });
}

bool LoopbackPeerConnection::ready_for(const std::string& remote_token) const {
    return state_ != PeerConnectionState::CLOSED && has_local_description_ &&
           has_remote_description_ && remote_reachable_ && remote_token_ == remote_token;
}

void LoopbackPeerConnection::try_establish() {
    if (established_ || !ready_for(remote_token_)) {
        return;
    }
    
    auto remote = network_->find(remote_token_);
    if (!remote || !remote->ready_for(token_)) {
        return;
    }
    
    auto self = shared_from_this();
    established_ = true;
    remote->established_ = true;
    boost::asio::post(network_->io_context(), [self, remote]() {
        self->establish(remote);
    });
}

void LoopbackPeerConnection::establish(const std::shared_ptr<LoopbackPeerConnection>& remote) {
    if (state_ == PeerConnectionState::CLOSED || remote->state_ == PeerConnectionState::CLOSED) {
        return;
    }
    
    remote_ = remote;
    remote->remote_ = weak_from_this();
    
    // Announce counterparts of every unpaired channel before anything opens so
    // the receiving side can attach its listeners first.
    std::vector<std::pair<std::shared_ptr<LoopbackDataChannel>, std::shared_ptr<LoopbackDataChannel>>> pairs;
    auto pair_side = [&pairs](LoopbackPeerConnection& local, LoopbackPeerConnection& other) {
        std::vector<std::shared_ptr<LoopbackDataChannel>> created;
        for (auto& channel : local.channels_) {
            if (channel->is_paired()) {
                continue;
            }
            auto counterpart = std::make_shared<LoopbackDataChannel>(
                local.network_->io_context(), channel->label());
            channel->pair_with(counterpart);
            counterpart->pair_with(channel);
            created.push_back(counterpart);
            pairs.emplace_back(channel, counterpart);
        }
        for (auto& counterpart : created) {
            other.channels_.push_back(counterpart);
        }
        return created;
    };
    
    auto to_remote = pair_side(*this, *remote);
    auto to_local = pair_side(*remote, *this);
    
    for (auto& channel : to_remote) {
        remote->notify_data_channel(channel);
    }
    for (auto& channel : to_local) {
        notify_data_channel(channel);
    }
    
    set_state(PeerConnectionState::CONNECTED);
    remote->set_state(PeerConnectionState::CONNECTED);
    
    for (auto& [local_channel, remote_channel] : pairs) {
        local_channel->open();
        remote_channel->open();
    }
    
    LOG_INFO("Loopback endpoints {} and {} connected", token_, remote->token_);
}

void LoopbackPeerConnection::set_state(PeerConnectionState state) {
    if (state_ == state || state_ == PeerConnectionState::CLOSED) {
        return;
    }
    state_ = state;
    LOG_DEBUG("Loopback endpoint {} state: {}", token_, to_string(state));
    notify_state_change(state);
}

LoopbackConnectionFactory::LoopbackConnectionFactory(std::shared_ptr<LoopbackNetwork> network)
    : network_(std::move(network)) {
}

std::shared_ptr<PeerConnection> LoopbackConnectionFactory::create(const TraversalConfig& config) {
    auto connection = std::make_shared<LoopbackPeerConnection>(network_, config);
    connection->initialize();
    last_created_ = connection;
    return connection;
}

} // namespace filejet::network
