#include "filejet/network/tcp_transport.hpp"
#include "filejet/core/logger.hpp"
#include "filejet/core/utils.hpp"
#include "filejet/crypto/random.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace filejet::network {

namespace {
    constexpr const char* TCP_SDP_PREFIX = "filejet-tcp ";
    constexpr std::size_t TOKEN_BYTES = 16;
    
    std::string token_from_sdp(const std::string& sdp) {
        if (sdp.rfind(TCP_SDP_PREFIX, 0) != 0) {
            return "";
        }
        return core::utils::StringUtils::trim(sdp.substr(std::char_traits<char>::length(TCP_SDP_PREFIX)));
    }
    
    // "tcp <host> <port>"
    bool parse_candidate(const std::string& candidate, std::string& host, std::string& port) {
        auto fields = core::utils::StringUtils::split_list(candidate, ' ');
        if (fields.size() != 3 || fields[0] != "tcp") {
            return false;
        }
        if (fields[2].empty() || fields[2].size() > 5 ||
            !std::all_of(fields[2].begin(), fields[2].end(), [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        auto number = std::stoul(fields[2]);
        if (number == 0 || number > 65535) {
            return false;
        }
        host = fields[1];
        port = fields[2];
        return true;
    }
    
    std::string payload_text(const std::vector<std::uint8_t>& payload) {
        return std::string(payload.begin(), payload.end());
    }
}

TcpDataChannel::TcpDataChannel(std::string label)
    : label_(std::move(label))
    , open_(false)
    , closed_(false) {
}

bool TcpDataChannel::is_open() const {
    return open_ && link_ && link_->is_open();
}

bool TcpDataChannel::send(const std::string& text) {
    if (!is_open()) {
        LOG_WARN("Send on closed channel '{}'", label_);
        return false;
    }
    return link_->send_frame(FrameKind::TEXT, text);
}

bool TcpDataChannel::send(std::span<const std::uint8_t> data) {
    if (!is_open()) {
        LOG_WARN("Send on closed channel '{}'", label_);
        return false;
    }
    return link_->send_frame(FrameKind::BINARY, data);
}

std::size_t TcpDataChannel::buffered_amount() const {
    return link_ ? link_->get_buffered_payload() : 0;
}

void TcpDataChannel::close() {
    if (closed_) {
        return;
    }
    
    bool was_open = is_open();
    open_ = false;
    closed_ = true;
    
    if (was_open) {
        link_->send_frame(FrameKind::CHANNEL_CLOSE, std::string());
    }
}

void TcpDataChannel::bind(std::shared_ptr<TcpLink> link) {
    link_ = std::move(link);
}

void TcpDataChannel::open() {
    if (open_ || closed_ || !link_) {
        return;
    }
    open_ = true;
    LOG_DEBUG("Channel '{}' open to {}", label_, link_->get_remote_endpoint());
    notify_open();
}

void TcpDataChannel::handle_frame(FrameKind kind, std::vector<std::uint8_t> payload) {
    switch (kind) {
        case FrameKind::TEXT:
            if (open_) {
                notify_message(ChannelMessage(payload_text(payload)));
            }
            break;
        case FrameKind::BINARY:
            if (open_) {
                notify_message(ChannelMessage(std::move(payload)));
            }
            break;
        case FrameKind::CHANNEL_CLOSE:
            handle_remote_closed();
            break;
        default:
            break;
    }
}

void TcpDataChannel::handle_drain(std::size_t previous, std::size_t current) {
    if (!closed_) {
        notify_if_drained(previous, current);
    }
}

void TcpDataChannel::handle_remote_closed() {
    if (closed_) {
        return;
    }
    open_ = false;
    closed_ = true;
    LOG_DEBUG("Channel '{}' closed by peer", label_);
    notify_closed();
}

void TcpDataChannel::detach() {
    open_ = false;
    closed_ = true;
}

TcpPeerConnection::TcpPeerConnection(boost::asio::io_context& io_context, TraversalConfig config,
                                     std::chrono::milliseconds connect_timeout)
    : io_context_(io_context)
    , config_(std::move(config))
    , connect_timeout_(connect_timeout)
    , acceptor_(io_context)
    , resolver_(io_context)
    , connect_timer_(io_context)
    , listen_port_(0)
    , is_offerer_(false)
    , has_local_description_(false)
    , has_remote_description_(false)
    , state_(PeerConnectionState::NEW)
    , signaling_state_(SignalingState::STABLE) {
}

TcpPeerConnection::~TcpPeerConnection() {
    close();
}

core::Result TcpPeerConnection::initialize() {
    try {
        token_ = crypto::SecureRandom::generate_hex(TOKEN_BYTES);
    } catch (const std::runtime_error& e) {
        return core::Result(core::ErrorCode::CONNECTION_FAILURE, e.what());
    }
    
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(config_.bind_address, ec);
    if (ec) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Invalid bind address " + config_.bind_address);
    }
    
    tcp::endpoint endpoint(address, 0);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        return core::Result(core::ErrorCode::CONNECTION_FAILURE, "Failed to listen: " + ec.message());
    }
    
    listen_port_ = acceptor_.local_endpoint().port();
    LOG_DEBUG("TCP peer listening on {}:{} ({} traversal servers unused)",
              config_.bind_address, listen_port_, config_.ice_servers.size());
    
    do_accept();
    return core::Result();
}

core::Result TcpPeerConnection::create_offer(SessionDescription& offer) {
    if (signaling_state_ != SignalingState::STABLE || has_local_description_ || has_remote_description_) {
        return core::Result(core::ErrorCode::INVALID_STATE,
                            std::string("Cannot create offer in state ") + to_string(signaling_state_));
    }
    
    offer.type = DescriptionType::OFFER;
    offer.sdp = TCP_SDP_PREFIX + token_;
    is_offerer_ = true;
    has_local_description_ = true;
    signaling_state_ = SignalingState::HAVE_LOCAL_OFFER;
    
    gather_candidates();
    return core::Result();
}

core::Result TcpPeerConnection::create_answer(SessionDescription& answer) {
    if (signaling_state_ != SignalingState::HAVE_REMOTE_OFFER) {
        return core::Result(core::ErrorCode::INVALID_STATE,
                            std::string("Cannot create answer in state ") + to_string(signaling_state_));
    }
    
    answer.type = DescriptionType::ANSWER;
    answer.sdp = TCP_SDP_PREFIX + token_;
    has_local_description_ = true;
    signaling_state_ = SignalingState::STABLE;
    
    gather_candidates();
    return core::Result();
}

core::Result TcpPeerConnection::set_remote_description(const SessionDescription& description) {
    if (is_closed()) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Connection closed");
    }
    
    bool expected_offer = signaling_state_ == SignalingState::STABLE && !has_local_description_ &&
                          !has_remote_description_;
    bool expected_answer = signaling_state_ == SignalingState::HAVE_LOCAL_OFFER;
    
    if ((description.type == DescriptionType::OFFER && !expected_offer) ||
        (description.type == DescriptionType::ANSWER && !expected_answer)) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR,
                            std::string("Unexpected remote ") + to_string(description.type) +
                            " in state " + to_string(signaling_state_));
    }
    
    auto remote_token = token_from_sdp(description.sdp);
    if (remote_token.size() != TOKEN_BYTES * 2 || remote_token == token_) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR, "Malformed TCP description");
    }
    
    remote_token_ = remote_token;
    has_remote_description_ = true;
    signaling_state_ = description.type == DescriptionType::OFFER ?
        SignalingState::HAVE_REMOTE_OFFER : SignalingState::STABLE;
    
    if (state_ == PeerConnectionState::NEW) {
        set_state(PeerConnectionState::CONNECTING);
        start_connect_timer();
    }
    
    if (description.type == DescriptionType::ANSWER) {
        try_adopt_pending();
    }
    return core::Result();
}

core::Result TcpPeerConnection::add_remote_candidate(const IceCandidate& candidate) {
    if (!has_remote_description_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Remote description not set");
    }
    
    std::string host;
    std::string port;
    if (!parse_candidate(candidate.candidate, host, port)) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR, "Malformed TCP candidate '" + candidate.candidate + "'");
    }
    
    // The offerer only listens.
    if (is_offerer_ || link_ || is_closed()) {
        return core::Result();
    }
    
    if (dialed_.insert(host + ":" + port).second) {
        dial(host, port);
    }
    return core::Result();
}

std::shared_ptr<DataChannel> TcpPeerConnection::create_data_channel(const std::string& label) {
    if (channel_) {
        LOG_WARN("TCP connection carries a single channel; '{}' replaces '{}'", label, channel_->label());
    }
    
    channel_ = std::make_shared<TcpDataChannel>(label);
    if (link_) {
        link_->send_frame(FrameKind::CHANNEL_OPEN, label);
        channel_->bind(link_);
        channel_->open();
    }
    return channel_;
}

void TcpPeerConnection::close() {
    if (is_closed()) {
        return;
    }
    
    state_ = PeerConnectionState::CLOSED;
    signaling_state_ = SignalingState::CLOSED;
    
    boost::system::error_code ec;
    connect_timer_.cancel();
    acceptor_.close(ec);
    resolver_.cancel();
    drop_pending_links();
    
    if (channel_) {
        channel_->close();
        channel_->detach();
    }
    if (link_) {
        link_->set_frame_handler(nullptr);
        link_->set_drain_handler(nullptr);
        link_->close(true);
    }
    
    LOG_DEBUG("TCP peer on port {} closed", listen_port_);
}

void TcpPeerConnection::do_accept() {
    auto weak_self = weak_from_this();
    acceptor_.async_accept([weak_self](boost::system::error_code ec, tcp::socket socket) {
        auto self = weak_self.lock();
        if (!self || self->is_closed() || !self->acceptor_.is_open()) {
            return;
        }
        
        if (ec) {
            LOG_WARN("Accept failed: {}", ec.message());
        } else {
            auto link = std::make_shared<TcpLink>(std::move(socket));
            std::weak_ptr<TcpLink> weak_link = link;
            
            link->set_frame_handler([weak_self, weak_link](FrameKind kind, std::vector<std::uint8_t> payload) {
                auto self = weak_self.lock();
                auto link = weak_link.lock();
                if (self && link) {
                    self->handle_inbound_hello(link, kind, payload);
                }
            });
            link->set_close_handler([weak_self, weak_link](const boost::system::error_code&) {
                auto self = weak_self.lock();
                auto link = weak_link.lock();
                if (self && link) {
                    self->pending_links_.erase(link);
                    if (self->verified_link_ == link) {
                        self->verified_link_.reset();
                    }
                }
            });
            
            self->pending_links_.insert(link);
            link->start();
        }
        
        self->do_accept();
    });
}

void TcpPeerConnection::handle_inbound_hello(const std::shared_ptr<TcpLink>& link, FrameKind kind,
                                             const std::vector<std::uint8_t>& payload) {
    auto reject = [this, &link](const char* reason) {
        LOG_WARN("Rejecting connection from {}: {}", link->get_remote_endpoint(), reason);
        pending_links_.erase(link);
        link->close();
    };
    
    if (kind != FrameKind::HELLO) {
        reject("expected hello");
        return;
    }
    
    auto tokens = core::utils::StringUtils::split_list(payload_text(payload), ' ');
    if (tokens.size() != 2 || !is_offerer_ || tokens[0] != token_) {
        reject("token mismatch");
        return;
    }
    if (link_ || verified_link_) {
        reject("already connected");
        return;
    }
    
    verified_link_ = link;
    verified_answer_token_ = tokens[1];
    try_adopt_pending();
}

void TcpPeerConnection::try_adopt_pending() {
    if (!verified_link_ || !has_remote_description_ || link_ || is_closed()) {
        return;
    }
    
    auto link = std::move(verified_link_);
    verified_link_.reset();
    
    if (verified_answer_token_ != remote_token_) {
        LOG_WARN("Hello from {} does not match the answer", link->get_remote_endpoint());
        pending_links_.erase(link);
        link->close();
        return;
    }
    
    link->send_frame(FrameKind::HELLO_ACK, token_);
    establish(std::move(link));
}

void TcpPeerConnection::dial(const std::string& host, const std::string& port) {
    LOG_DEBUG("Dialing {}:{}", host, port);
    
    auto weak_self = weak_from_this();
    resolver_.async_resolve(host, port,
        [weak_self, host, port](boost::system::error_code ec, tcp::resolver::results_type results) {
            auto self = weak_self.lock();
            if (!self || self->is_closed() || self->link_) {
                return;
            }
            if (ec) {
                LOG_WARN("Cannot resolve {}:{}: {}", host, port, ec.message());
                return;
            }
            
            auto socket = std::make_shared<tcp::socket>(self->io_context_);
            boost::asio::async_connect(*socket, results,
                [weak_self, socket, host, port](boost::system::error_code ec, const tcp::endpoint&) {
                    auto self = weak_self.lock();
                    if (!self || self->is_closed() || self->link_) {
                        return;
                    }
                    if (ec) {
                        LOG_DEBUG("Dial to {}:{} failed: {}", host, port, ec.message());
                        return;
                    }
                    
                    auto link = std::make_shared<TcpLink>(std::move(*socket));
                    std::weak_ptr<TcpLink> weak_link = link;
                    
                    link->set_frame_handler([weak_self, weak_link](FrameKind kind, std::vector<std::uint8_t>) {
                        auto self = weak_self.lock();
                        auto link = weak_link.lock();
                        if (self && link) {
                            self->handle_outbound_ack(link, kind);
                        }
                    });
                    link->set_close_handler([weak_self, weak_link](const boost::system::error_code&) {
                        auto self = weak_self.lock();
                        auto link = weak_link.lock();
                        if (self && link) {
                            self->pending_links_.erase(link);
                        }
                    });
                    
                    self->pending_links_.insert(link);
                    link->start();
                    link->send_frame(FrameKind::HELLO, self->remote_token_ + " " + self->token_);
                });
        });
}

void TcpPeerConnection::handle_outbound_ack(const std::shared_ptr<TcpLink>& link, FrameKind kind) {
    pending_links_.erase(link);
    
    if (kind != FrameKind::HELLO_ACK || link_ || is_closed()) {
        link->close();
        return;
    }
    establish(link);
}

void TcpPeerConnection::establish(std::shared_ptr<TcpLink> link) {
    connect_timer_.cancel();
    pending_links_.erase(link);
    drop_pending_links();
    
    boost::system::error_code ec;
    acceptor_.close(ec);
    
    link_ = std::move(link);
    
    auto weak_self = weak_from_this();
    link_->set_frame_handler([weak_self](FrameKind kind, std::vector<std::uint8_t> payload) {
        if (auto self = weak_self.lock()) {
            self->handle_frame(kind, std::move(payload));
        }
    });
    link_->set_close_handler([weak_self](const boost::system::error_code&) {
        if (auto self = weak_self.lock()) {
            self->handle_link_closed();
        }
    });
    link_->set_drain_handler([weak_self](std::size_t previous, std::size_t current) {
        auto self = weak_self.lock();
        if (self && self->channel_) {
            self->channel_->handle_drain(previous, current);
        }
    });
    
    LOG_INFO("TCP peer connected to {}", link_->get_remote_endpoint());
    set_state(PeerConnectionState::CONNECTED);
    if (is_closed()) {
        return;
    }
    
    if (channel_) {
        link_->send_frame(FrameKind::CHANNEL_OPEN, channel_->label());
        channel_->bind(link_);
        channel_->open();
    }
}

void TcpPeerConnection::handle_frame(FrameKind kind, std::vector<std::uint8_t> payload) {
    switch (kind) {
        case FrameKind::CHANNEL_OPEN: {
            auto label = payload_text(payload);
            if (channel_) {
                LOG_WARN("Ignoring second channel '{}' from peer", label);
                return;
            }
            channel_ = std::make_shared<TcpDataChannel>(label);
            channel_->bind(link_);
            notify_data_channel(channel_);
            if (channel_ && !is_closed()) {
                channel_->open();
            }
            break;
        }
        case FrameKind::TEXT:
        case FrameKind::BINARY:
        case FrameKind::CHANNEL_CLOSE:
            if (channel_) {
                channel_->handle_frame(kind, std::move(payload));
            }
            break;
        default:
            LOG_DEBUG("Ignoring frame {:#04x} on established link", static_cast<int>(kind));
            break;
    }
}

void TcpPeerConnection::handle_link_closed() {
    if (is_closed()) {
        return;
    }
    
    // Keep ourselves alive through the notifications.
    auto self = shared_from_this();
    if (channel_) {
        channel_->handle_remote_closed();
    }
    set_state(PeerConnectionState::DISCONNECTED);
}

void TcpPeerConnection::gather_candidates() {
    auto weak_self = weak_from_this();
    boost::asio::post(io_context_, [weak_self]() {
        auto self = weak_self.lock();
        if (!self || self->is_closed()) {
            return;
        }
        
        auto hosts = self->config_.advertised_hosts;
        if (hosts.empty()) {
            hosts.push_back("127.0.0.1");
        }
        
        for (const auto& host : hosts) {
            self->notify_local_candidate(IceCandidate{
                "tcp " + host + " " + std::to_string(self->listen_port_), "0"});
            if (self->is_closed()) {
                return;
            }
        }
    });
}

void TcpPeerConnection::start_connect_timer() {
    auto weak_self = weak_from_this();
    connect_timer_.expires_after(connect_timeout_);
    connect_timer_.async_wait([weak_self](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        auto self = weak_self.lock();
        if (!self || self->state_ != PeerConnectionState::CONNECTING) {
            return;
        }
        LOG_WARN("TCP connection attempt timed out");
        self->drop_pending_links();
        self->set_state(PeerConnectionState::FAILED);
    });
}

void TcpPeerConnection::drop_pending_links() {
    auto pending = std::move(pending_links_);
    pending_links_.clear();
    for (auto& link : pending) {
        link->close();
    }
    if (verified_link_) {
        verified_link_->close();
        verified_link_.reset();
    }
}

void TcpPeerConnection::set_state(PeerConnectionState state) {
    if (state_ == state || is_closed()) {
        return;
    }
    state_ = state;
    LOG_DEBUG("TCP peer on port {} state: {}", listen_port_, to_string(state));
    notify_state_change(state);
}

TcpConnectionFactory::TcpConnectionFactory(boost::asio::io_context& io_context,
                                           std::chrono::milliseconds connect_timeout)
    : io_context_(io_context)
    , connect_timeout_(connect_timeout) {
}

std::shared_ptr<PeerConnection> TcpConnectionFactory::create(const TraversalConfig& config) {
    auto connection = std::make_shared<TcpPeerConnection>(io_context_, config, connect_timeout_);
    auto result = connection->initialize();
    if (!result.success()) {
        LOG_ERROR("Failed to create TCP peer connection: {}", result.message);
        return nullptr;
    }
    return connection;
}

} // namespace filejet::network
