#include "filejet/signaling/memory_rendezvous_store.hpp"
#include "filejet/core/logger.hpp"
#include <algorithm>

namespace filejet::signaling {

MemoryRendezvousStore::MemoryRendezvousStore(boost::asio::io_context& io_context)
    : io_context_(io_context)
    , next_subscription_(1)
    , write_count_(0)
    , available_(true) {
}

core::Result MemoryRendezvousStore::unavailable() const {
    return core::Result(core::ErrorCode::STORE_UNAVAILABLE, "Rendezvous store is unavailable");
}

void MemoryRendezvousStore::create_session(const std::string& session_id, const std::string& offer,
                                           CompletionHandler handler) {
    if (!available_) {
        complete(std::move(handler), unavailable());
        return;
    }
    
    SignalingSession session;
    session.offer = offer;
    session.created_at = std::chrono::system_clock::now();
    sessions_[session_id] = std::move(session);
    write_count_++;
    
    LOG_DEBUG("Memory store: created session {}", session_id);
    publish(session_id);
    complete(std::move(handler), core::Result());
}

void MemoryRendezvousStore::set_answer(const std::string& session_id, const std::string& answer,
                                       CompletionHandler handler) {
    if (!available_) {
        complete(std::move(handler), unavailable());
        return;
    }
    
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        complete(std::move(handler), core::Result(core::ErrorCode::STORE_UNAVAILABLE,
                                                  "No session document for " + session_id));
        return;
    }
    
    it->second.answer = answer;
    write_count_++;
    publish(session_id);
    complete(std::move(handler), core::Result());
}

void MemoryRendezvousStore::append_candidate(const std::string& session_id, SessionRole role,
                                             const std::string& candidate, CompletionHandler handler) {
    if (!available_) {
        complete(std::move(handler), unavailable());
        return;
    }
    
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        complete(std::move(handler), core::Result(core::ErrorCode::STORE_UNAVAILABLE,
                                                  "No session document for " + session_id));
        return;
    }
    
    auto& candidates = it->second.candidates(role);
    if (std::find(candidates.begin(), candidates.end(), candidate) == candidates.end()) {
        candidates.push_back(candidate);
        write_count_++;
        publish(session_id);
    }
    complete(std::move(handler), core::Result());
}

void MemoryRendezvousStore::delete_session(const std::string& session_id, CompletionHandler handler) {
    if (!available_) {
        complete(std::move(handler), unavailable());
        return;
    }
    
    if (sessions_.erase(session_id) > 0) {
        write_count_++;
        LOG_DEBUG("Memory store: deleted session {}", session_id);
        publish(session_id);
    }
    complete(std::move(handler), core::Result());
}

void MemoryRendezvousStore::get_session(const std::string& session_id, ReadHandler handler) {
    if (!handler) {
        return;
    }
    
    core::Result result = available_ ? core::Result() : unavailable();
    SessionSnapshot snapshot = available_ ? peek(session_id) : std::nullopt;
    boost::asio::post(io_context_, [handler = std::move(handler), result, snapshot = std::move(snapshot)]() {
        handler(result, snapshot);
    });
}

core::Result MemoryRendezvousStore::subscribe(const std::string& session_id, SnapshotHandler handler,
                                              SubscriptionId& subscription) {
    if (!available_) {
        return unavailable();
    }
    
    subscription = next_subscription_++;
    subscriptions_[subscription] = Subscription{session_id, std::move(handler)};
    
    if (auto snapshot = peek(session_id)) {
        deliver(subscription, std::move(snapshot));
    }
    return core::Result();
}

void MemoryRendezvousStore::unsubscribe(SubscriptionId subscription) {
    subscriptions_.erase(subscription);
}

bool MemoryRendezvousStore::has_session(const std::string& session_id) const {
    return sessions_.find(session_id) != sessions_.end();
}

SessionSnapshot MemoryRendezvousStore::peek(const std::string& session_id) const {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryRendezvousStore::complete(CompletionHandler handler, core::Result result) {
    if (!handler) {
        return;
    }
    boost::asio::post(io_context_, [handler = std::move(handler), result = std::move(result)]() {
        handler(result);
    });
}

void MemoryRendezvousStore::publish(const std::string& session_id) {
    auto snapshot = peek(session_id);
    for (const auto& [id, subscription] : subscriptions_) {
        if (subscription.session_id == session_id) {
            deliver(id, snapshot);
        }
    }
}

void MemoryRendezvousStore::deliver(SubscriptionId subscription, SessionSnapshot snapshot) {
    // Looked up again at delivery time: the subscriber may have gone away.
    auto weak_self = weak_from_this();
    boost::asio::post(io_context_, [weak_self, subscription, snapshot = std::move(snapshot)]() {
        auto self = weak_self.lock();
        if (!self) {
            return;
        }
        auto it = self->subscriptions_.find(subscription);
        if (it == self->subscriptions_.end()) {
            return;
        }
        auto handler = it->second.handler;
        handler(snapshot);
    });
}

} // namespace filejet::signaling
