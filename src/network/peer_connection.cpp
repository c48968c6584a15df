#include "filejet/network/peer_connection.hpp"

namespace filejet::network {

const char* to_string(PeerConnectionState state) {
    switch (state) {
        case PeerConnectionState::NEW:          return "new";
        case PeerConnectionState::CONNECTING:   return "connecting";
        case PeerConnectionState::CONNECTED:    return "connected";
        case PeerConnectionState::DISCONNECTED: return "disconnected";
        case PeerConnectionState::FAILED:       return "failed";
        case PeerConnectionState::CLOSED:       return "closed";
    }
    return "unknown";
}

const char* to_string(SignalingState state) {
    switch (state) {
        case SignalingState::STABLE:            return "stable";
        case SignalingState::HAVE_LOCAL_OFFER:  return "have-local-offer";
        case SignalingState::HAVE_REMOTE_OFFER: return "have-remote-offer";
        case SignalingState::CLOSED:            return "closed";
    }
    return "unknown";
}

const char* to_string(DescriptionType type) {
    return type == DescriptionType::OFFER ? "offer" : "answer";
}

void DataChannel::reset_handlers() {
    open_handler_ = nullptr;
    close_handler_ = nullptr;
    message_handler_ = nullptr;
    buffered_amount_low_handler_ = nullptr;
}

// Handlers are copied before the call so that they may replace themselves.
void DataChannel::notify_open() {
    if (auto handler = open_handler_) {
        handler();
    }
}

void DataChannel::notify_closed() {
    if (auto handler = close_handler_) {
        handler();
    }
}

void DataChannel::notify_message(ChannelMessage message) {
    if (auto handler = message_handler_) {
        handler(std::move(message));
    }
}

void DataChannel::notify_buffered_amount_low() {
    if (auto handler = buffered_amount_low_handler_) {
        handler();
    }
}

void DataChannel::notify_if_drained(std::size_t previous_amount, std::size_t current_amount) {
    if (previous_amount > buffered_amount_low_threshold_ &&
        current_amount <= buffered_amount_low_threshold_) {
        notify_buffered_amount_low();
    }
}

void PeerConnection::reset_handlers() {
    local_candidate_handler_ = nullptr;
    state_change_handler_ = nullptr;
    data_channel_handler_ = nullptr;
}

void PeerConnection::notify_local_candidate(const IceCandidate& candidate) {
    if (auto handler = local_candidate_handler_) {
        handler(candidate);
    }
}

void PeerConnection::notify_state_change(PeerConnectionState state) {
    if (auto handler = state_change_handler_) {
        handler(state);
    }
}

void PeerConnection::notify_data_channel(std::shared_ptr<DataChannel> channel) {
    if (auto handler = data_channel_handler_) {
        handler(std::move(channel));
    }
}

} // namespace filejet::network
