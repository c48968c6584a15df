#pragma once

#include "filejet/core/result.hpp"
#include "filejet/network/peer_connection.hpp"
#include "filejet/signaling/rendezvous_store.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace filejet::signaling {

enum class SignalingPhase {
    IDLE,
    OFFER_SENT,
    OFFER_RECEIVED,
    ANSWER_EXCHANGED,
    CANDIDATES_FLOWING,
    SETTLED,
    ABANDONED
};

const char* to_string(SignalingPhase phase);

// Remembers which remote candidates were handed to the connection, keyed by
// their serialized form.
class CandidateTracker {
public:
    // True the first time a candidate is seen.
    bool mark_applied(const std::string& serialized);
    bool is_applied(const std::string& serialized) const;
    std::size_t size() const { return applied_.size(); }
    void clear() { applied_.clear(); }

private:
    std::unordered_set<std::string> applied_;
};

// Drives one connection attempt through the rendezvous document: offer and
// answer exchange plus candidate accumulation in both directions. The
// initiator owns a subscription on the target's document; the responder is
// fed snapshots of its own document by whoever listens on it.
class SignalingMachine : public std::enable_shared_from_this<SignalingMachine> {
public:
    using FailureHandler = std::function<void(const core::Result&)>;
    using WarningHandler = std::function<void(const core::Result&)>;
    
    SignalingMachine(std::shared_ptr<RendezvousStore> store,
                     std::shared_ptr<network::PeerConnection> connection,
                     SessionRole role,
                     std::string session_id);
    
    // Initiator: create the offer, publish the document and subscribe to it.
    core::Result start_as_initiator();
    
    // Responder: apply the offer found in the document and publish an answer.
    core::Result start_as_responder(const SignalingSession& session);
    
    void handle_snapshot(const SessionSnapshot& snapshot);
    void publish_local_candidate(const network::IceCandidate& candidate);
    
    // The connection is up: stop listening and retire the document.
    void settle();
    
    // Idempotent. Stops listening and removes the document of an unfinished attempt.
    void abandon();
    
    // Unrecoverable signaling problems (malformed descriptions, store failure
    // while publishing the offer).
    void on_failure(FailureHandler handler) { failure_handler_ = std::move(handler); }
    
    // Store problems that do not end the attempt.
    void on_warning(WarningHandler handler) { warning_handler_ = std::move(handler); }
    
    SignalingPhase get_phase() const { return phase_; }
    SessionRole get_role() const { return role_; }
    const std::string& get_session_id() const { return session_id_; }
    std::size_t get_applied_candidate_count() const { return applied_.size(); }
    std::size_t get_pending_candidate_count() const { return pending_candidates_.size(); }
    bool is_subscribed() const { return subscription_.has_value(); }
    
    // Creation time of the document this attempt answers (responder only).
    std::optional<std::chrono::system_clock::time_point> get_document_created_at() const {
        return document_created_at_;
    }

private:
    void handle_document_created(const core::Result& result);
    void apply_answer(const std::string& answer_text);
    void apply_candidates(const std::vector<std::string>& candidates);
    void flush_pending_candidates();
    void send_candidate(const std::string& serialized);
    void delete_document();
    void fail(core::Result result);
    void warn(const core::Result& result);
    bool is_finished() const;
    
    SessionRole remote_role() const {
        return role_ == SessionRole::INITIATOR ? SessionRole::RESPONDER : SessionRole::INITIATOR;
    }
    
    std::shared_ptr<RendezvousStore> store_;
    std::shared_ptr<network::PeerConnection> connection_;
    SessionRole role_;
    std::string session_id_;
    SignalingPhase phase_;
    
    bool document_ready_;
    bool remote_description_set_;
    std::vector<std::string> pending_candidates_;
    CandidateTracker applied_;
    std::optional<RendezvousStore::SubscriptionId> subscription_;
    std::optional<std::chrono::system_clock::time_point> document_created_at_;
    
    FailureHandler failure_handler_;
    WarningHandler warning_handler_;
};

} // namespace filejet::signaling
