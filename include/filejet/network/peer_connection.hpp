#pragma once

#include "filejet/core/result.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace filejet::network {

enum class PeerConnectionState {
    NEW,
    CONNECTING,
    CONNECTED,
    DISCONNECTED,
    FAILED,
    CLOSED
};

enum class SignalingState {
    STABLE,
    HAVE_LOCAL_OFFER,
    HAVE_REMOTE_OFFER,
    CLOSED
};

enum class DescriptionType {
    OFFER,
    ANSWER
};

const char* to_string(PeerConnectionState state);
const char* to_string(SignalingState state);
const char* to_string(DescriptionType type);

struct SessionDescription {
    DescriptionType type = DescriptionType::OFFER;
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    std::string mid;
    
    bool operator==(const IceCandidate& other) const {
        return candidate == other.candidate && mid == other.mid;
    }
};

// Injected network traversal settings. ice_servers is handed to substrates
// that perform NAT traversal; the direct substrates only log it.
struct TraversalConfig {
    std::vector<std::string> ice_servers;
    std::string bind_address = "0.0.0.0";
    std::vector<std::string> advertised_hosts{"127.0.0.1"};
};

using BinaryMessage = std::vector<std::uint8_t>;

// Text payloads carry control messages, binary payloads carry file bytes.
using ChannelMessage = std::variant<std::string, BinaryMessage>;

// Ordered, reliable, bidirectional message channel. Handlers fire on the
// owning event loop for transport-initiated events; a local close() does not
// invoke the close handler.
class DataChannel {
public:
    using OpenHandler = std::function<void()>;
    using CloseHandler = std::function<void()>;
    using MessageHandler = std::function<void(ChannelMessage)>;
    using BufferedAmountLowHandler = std::function<void()>;
    
    virtual ~DataChannel() = default;
    
    virtual const std::string& label() const = 0;
    virtual bool is_open() const = 0;
    virtual bool send(const std::string& text) = 0;
    virtual bool send(std::span<const std::uint8_t> data) = 0;
    virtual std::size_t buffered_amount() const = 0;
    virtual void close() = 0;
    
    void set_buffered_amount_low_threshold(std::size_t threshold) { buffered_amount_low_threshold_ = threshold; }
    std::size_t buffered_amount_low_threshold() const { return buffered_amount_low_threshold_; }
    
    void on_open(OpenHandler handler) { open_handler_ = std::move(handler); }
    void on_closed(CloseHandler handler) { close_handler_ = std::move(handler); }
    void on_message(MessageHandler handler) { message_handler_ = std::move(handler); }
    void on_buffered_amount_low(BufferedAmountLowHandler handler) { buffered_amount_low_handler_ = std::move(handler); }
    
    void reset_handlers();

protected:
    void notify_open();
    void notify_closed();
    void notify_message(ChannelMessage message);
    void notify_buffered_amount_low();
    
    // Fires the low handler when a drain crosses the threshold downwards.
    void notify_if_drained(std::size_t previous_amount, std::size_t current_amount);

private:
    std::size_t buffered_amount_low_threshold_ = 0;
    OpenHandler open_handler_;
    CloseHandler close_handler_;
    MessageHandler message_handler_;
    BufferedAmountLowHandler buffered_amount_low_handler_;
};

class PeerConnection {
public:
    using LocalCandidateHandler = std::function<void(const IceCandidate&)>;
    using StateChangeHandler = std::function<void(PeerConnectionState)>;
    using DataChannelHandler = std::function<void(std::shared_ptr<DataChannel>)>;
    
    virtual ~PeerConnection() = default;
    
    // Generates a description and installs it as the local description.
    // Local candidates are reported asynchronously afterwards.
    virtual core::Result create_offer(SessionDescription& offer) = 0;
    virtual core::Result create_answer(SessionDescription& answer) = 0;
    
    virtual core::Result set_remote_description(const SessionDescription& description) = 0;
    virtual core::Result add_remote_candidate(const IceCandidate& candidate) = 0;
    
    virtual std::shared_ptr<DataChannel> create_data_channel(const std::string& label) = 0;
    
    virtual PeerConnectionState state() const = 0;
    virtual SignalingState signaling_state() const = 0;
    
    // Idempotent. Does not invoke the state change handler.
    virtual void close() = 0;
    
    void on_local_candidate(LocalCandidateHandler handler) { local_candidate_handler_ = std::move(handler); }
    void on_state_change(StateChangeHandler handler) { state_change_handler_ = std::move(handler); }
    void on_data_channel(DataChannelHandler handler) { data_channel_handler_ = std::move(handler); }
    
    void reset_handlers();

protected:
    void notify_local_candidate(const IceCandidate& candidate);
    void notify_state_change(PeerConnectionState state);
    void notify_data_channel(std::shared_ptr<DataChannel> channel);

private:
    LocalCandidateHandler local_candidate_handler_;
    StateChangeHandler state_change_handler_;
    DataChannelHandler data_channel_handler_;
};

class PeerConnectionFactory {
public:
    virtual ~PeerConnectionFactory() = default;
    virtual std::shared_ptr<PeerConnection> create(const TraversalConfig& config) = 0;
};

} // namespace filejet::network
