#pragma once

#include "filejet/signaling/rendezvous_store.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <map>
#include <memory>
#include <unordered_map>

namespace filejet::signaling {

// In-process store. Shared by every node running on the same event loop.
class MemoryRendezvousStore : public RendezvousStore, public std::enable_shared_from_this<MemoryRendezvousStore> {
public:
    explicit MemoryRendezvousStore(boost::asio::io_context& io_context);
    
    void create_session(const std::string& session_id, const std::string& offer,
                        CompletionHandler handler) override;
    void set_answer(const std::string& session_id, const std::string& answer,
                    CompletionHandler handler) override;
    void append_candidate(const std::string& session_id, SessionRole role,
                          const std::string& candidate, CompletionHandler handler) override;
    void delete_session(const std::string& session_id, CompletionHandler handler) override;
    void get_session(const std::string& session_id, ReadHandler handler) override;
    
    core::Result subscribe(const std::string& session_id, SnapshotHandler handler,
                           SubscriptionId& subscription) override;
    void unsubscribe(SubscriptionId subscription) override;
    
    // Fault injection: while unavailable every operation fails.
    void set_available(bool available) { available_ = available; }
    
    bool has_session(const std::string& session_id) const;
    SessionSnapshot peek(const std::string& session_id) const;
    std::size_t subscription_count() const { return subscriptions_.size(); }
    std::uint64_t write_count() const { return write_count_; }

private:
    struct Subscription {
        std::string session_id;
        SnapshotHandler handler;
    };
    
    void complete(CompletionHandler handler, core::Result result);
    void publish(const std::string& session_id);
    void deliver(SubscriptionId subscription, SessionSnapshot snapshot);
    core::Result unavailable() const;
    
    boost::asio::io_context& io_context_;
    std::unordered_map<std::string, SignalingSession> sessions_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId next_subscription_;
    std::uint64_t write_count_;
    bool available_;
};

} // namespace filejet::signaling
