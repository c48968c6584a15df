#include "filejet/signaling/signaling_machine.hpp"
#include "filejet/core/logger.hpp"

namespace filejet::signaling {

const char* to_string(SignalingPhase phase) {
    switch (phase) {
        case SignalingPhase::IDLE:               return "idle";
        case SignalingPhase::OFFER_SENT:         return "offer-sent";
        case SignalingPhase::OFFER_RECEIVED:     return "offer-received";
        case SignalingPhase::ANSWER_EXCHANGED:   return "answer-exchanged";
        case SignalingPhase::CANDIDATES_FLOWING: return "candidates-flowing";
        case SignalingPhase::SETTLED:            return "settled";
        case SignalingPhase::ABANDONED:          return "abandoned";
    }
    return "unknown";
}

bool CandidateTracker::mark_applied(const std::string& serialized) {
    return applied_.insert(serialized).second;
}

bool CandidateTracker::is_applied(const std::string& serialized) const {
    return applied_.count(serialized) > 0;
}

SignalingMachine::SignalingMachine(std::shared_ptr<RendezvousStore> store,
                                   std::shared_ptr<network::PeerConnection> connection,
                                   SessionRole role,
                                   std::string session_id)
    : store_(std::move(store))
    , connection_(std::move(connection))
    , role_(role)
    , session_id_(std::move(session_id))
    , phase_(SignalingPhase::IDLE)
    , document_ready_(false)
    , remote_description_set_(false) {
}

core::Result SignalingMachine::start_as_initiator() {
    if (role_ != SessionRole::INITIATOR || phase_ != SignalingPhase::IDLE) {
        return core::Result(core::ErrorCode::INVALID_STATE,
                            std::string("Cannot start initiator in phase ") + to_string(phase_));
    }
    
    network::SessionDescription offer;
    auto result = connection_->create_offer(offer);
    if (!result.success()) {
        return result;
    }
    
    phase_ = SignalingPhase::OFFER_SENT;
    LOG_INFO("Publishing offer to session {}", session_id_);
    
    auto weak_self = weak_from_this();
    store_->create_session(session_id_, serialize_description(offer), [weak_self](const core::Result& result) {
        if (auto self = weak_self.lock()) {
            self->handle_document_created(result);
        }
    });
    
    return core::Result();
}

void SignalingMachine::handle_document_created(const core::Result& result) {
    if (is_finished()) {
        return;
    }
    
    if (!result.success()) {
        fail(core::Result(core::ErrorCode::STORE_UNAVAILABLE,
                          "Failed to publish offer: " + result.message));
        return;
    }
    
    document_ready_ = true;
    
    auto weak_self = weak_from_this();
    RendezvousStore::SubscriptionId subscription = 0;
    auto subscribed = store_->subscribe(session_id_, [weak_self](const SessionSnapshot& snapshot) {
        if (auto self = weak_self.lock()) {
            self->handle_snapshot(snapshot);
        }
    }, subscription);
    
    if (!subscribed.success()) {
        fail(core::Result(core::ErrorCode::STORE_UNAVAILABLE,
                          "Failed to watch session: " + subscribed.message));
        return;
    }
    
    subscription_ = subscription;
    flush_pending_candidates();
}

core::Result SignalingMachine::start_as_responder(const SignalingSession& session) {
    if (role_ != SessionRole::RESPONDER || phase_ != SignalingPhase::IDLE) {
        return core::Result(core::ErrorCode::INVALID_STATE,
                            std::string("Cannot start responder in phase ") + to_string(phase_));
    }
    if (!session.offer) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR, "Session has no offer");
    }
    
    phase_ = SignalingPhase::OFFER_RECEIVED;
    document_created_at_ = session.created_at;
    
    network::SessionDescription offer;
    auto result = parse_description(*session.offer, offer);
    if (!result.success()) {
        return result;
    }
    if (offer.type != network::DescriptionType::OFFER) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR,
                            std::string("Expected offer, got ") + network::to_string(offer.type));
    }
    
    result = connection_->set_remote_description(offer);
    if (!result.success()) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR, "Offer rejected: " + result.message);
    }
    remote_description_set_ = true;
    
    network::SessionDescription answer;
    result = connection_->create_answer(answer);
    if (!result.success()) {
        return core::Result(core::ErrorCode::SIGNALING_ERROR, "Failed to create answer: " + result.message);
    }
    
    phase_ = SignalingPhase::ANSWER_EXCHANGED;
    document_ready_ = true;
    LOG_INFO("Answering offer on session {}", session_id_);
    
    auto weak_self = weak_from_this();
    store_->set_answer(session_id_, serialize_description(answer), [weak_self](const core::Result& result) {
        auto self = weak_self.lock();
        if (self && !result.success()) {
            // Without the answer the initiator can never connect.
            self->fail(core::Result(core::ErrorCode::STORE_UNAVAILABLE,
                                    "Failed to publish answer: " + result.message));
        }
    });
    
    apply_candidates(session.candidates(remote_role()));
    flush_pending_candidates();
    return core::Result();
}

void SignalingMachine::handle_snapshot(const SessionSnapshot& snapshot) {
    if (phase_ == SignalingPhase::IDLE || phase_ == SignalingPhase::ABANDONED) {
        return;
    }
    
    if (!snapshot) {
        LOG_DEBUG("Session {} document is gone", session_id_);
        return;
    }
    
    // A newer document under our id belongs to another attempt.
    if (document_created_at_ && snapshot->created_at != *document_created_at_) {
        LOG_DEBUG("Ignoring snapshot of a different attempt on session {}", session_id_);
        return;
    }
    
    if (role_ == SessionRole::INITIATOR && snapshot->answer &&
        connection_->signaling_state() != network::SignalingState::STABLE) {
        apply_answer(*snapshot->answer);
        if (is_finished()) {
            return;
        }
    }
    
    if (remote_description_set_) {
        apply_candidates(snapshot->candidates(remote_role()));
    }
}

void SignalingMachine::apply_answer(const std::string& answer_text) {
    network::SessionDescription answer;
    auto result = parse_description(answer_text, answer);
    if (!result.success()) {
        fail(result);
        return;
    }
    if (answer.type != network::DescriptionType::ANSWER) {
        fail(core::Result(core::ErrorCode::SIGNALING_ERROR,
                          std::string("Expected answer, got ") + network::to_string(answer.type)));
        return;
    }
    
    result = connection_->set_remote_description(answer);
    if (!result.success()) {
        fail(core::Result(core::ErrorCode::SIGNALING_ERROR, "Answer rejected: " + result.message));
        return;
    }
    
    remote_description_set_ = true;
    if (phase_ == SignalingPhase::OFFER_SENT) {
        phase_ = SignalingPhase::ANSWER_EXCHANGED;
    }
    LOG_INFO("Applied answer from session {}", session_id_);
}

void SignalingMachine::apply_candidates(const std::vector<std::string>& candidates) {
    for (const auto& serialized : candidates) {
        if (!applied_.mark_applied(serialized)) {
            continue;
        }
        
        network::IceCandidate candidate;
        auto result = parse_candidate(serialized, candidate);
        if (result.success()) {
            result = connection_->add_remote_candidate(candidate);
        }
        
        if (!result.success()) {
            LOG_WARN("Ignoring remote candidate on session {}: {}", session_id_, result.message);
            continue;
        }
        
        LOG_DEBUG("Applied remote candidate {} on session {}", candidate.candidate, session_id_);
        if (phase_ == SignalingPhase::ANSWER_EXCHANGED) {
            phase_ = SignalingPhase::CANDIDATES_FLOWING;
        }
    }
}

void SignalingMachine::publish_local_candidate(const network::IceCandidate& candidate) {
    if (is_finished()) {
        return;
    }
    
    auto serialized = serialize_candidate(candidate);
    if (!document_ready_) {
        pending_candidates_.push_back(std::move(serialized));
        return;
    }
    send_candidate(serialized);
}

void SignalingMachine::flush_pending_candidates() {
    auto pending = std::move(pending_candidates_);
    pending_candidates_.clear();
    for (const auto& serialized : pending) {
        send_candidate(serialized);
    }
}

void SignalingMachine::send_candidate(const std::string& serialized) {
    auto weak_self = weak_from_this();
    store_->append_candidate(session_id_, role_, serialized, [weak_self](const core::Result& result) {
        auto self = weak_self.lock();
        if (self && !result.success() && !self->is_finished()) {
            self->warn(core::Result(result.error, "Failed to publish candidate: " + result.message));
        }
    });
}

void SignalingMachine::settle() {
    if (is_finished()) {
        return;
    }
    
    phase_ = SignalingPhase::SETTLED;
    pending_candidates_.clear();
    
    if (subscription_) {
        store_->unsubscribe(*subscription_);
        subscription_.reset();
    }
    
    // The responder keeps no subscription of its own; the initiator retires
    // the document it created.
    if (role_ == SessionRole::INITIATOR) {
        delete_document();
    }
    LOG_INFO("Signaling on session {} settled", session_id_);
}

void SignalingMachine::abandon() {
    if (phase_ == SignalingPhase::ABANDONED) {
        return;
    }
    
    auto previous = phase_;
    phase_ = SignalingPhase::ABANDONED;
    pending_candidates_.clear();
    
    if (subscription_) {
        store_->unsubscribe(*subscription_);
        subscription_.reset();
    }
    
    if (previous != SignalingPhase::IDLE && previous != SignalingPhase::SETTLED) {
        delete_document();
    }
    LOG_INFO("Signaling on session {} abandoned in phase {}", session_id_, to_string(previous));
}

void SignalingMachine::delete_document() {
    auto session_id = session_id_;
    store_->delete_session(session_id, [session_id](const core::Result& result) {
        if (!result.success()) {
            LOG_WARN("Failed to delete session {}: {}", session_id, result.message);
        }
    });
}

void SignalingMachine::fail(core::Result result) {
    if (is_finished()) {
        return;
    }
    
    LOG_ERROR("Signaling on session {} failed: {}", session_id_, result.message);
    if (auto handler = failure_handler_) {
        handler(result);
    }
    
    // The owner normally abandons from its handler.
    abandon();
}

void SignalingMachine::warn(const core::Result& result) {
    LOG_WARN("Session {}: {}", session_id_, result.message);
    if (auto handler = warning_handler_) {
        handler(result);
    }
}

bool SignalingMachine::is_finished() const {
    return phase_ == SignalingPhase::SETTLED || phase_ == SignalingPhase::ABANDONED;
}

} // namespace filejet::signaling
