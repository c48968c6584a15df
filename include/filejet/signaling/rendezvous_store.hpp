#pragma once

#include "filejet/core/result.hpp"
#include "filejet/signaling/signaling_session.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace filejet::signaling {

// Shared document store keyed by session id. Completions and snapshots are
// delivered on the store's event loop, never from inside the calling
// function. Every operation may fail with STORE_UNAVAILABLE.
class RendezvousStore {
public:
    using CompletionHandler = std::function<void(const core::Result&)>;
    using SnapshotHandler = std::function<void(const SessionSnapshot&)>;
    using ReadHandler = std::function<void(const core::Result&, const SessionSnapshot&)>;
    using SubscriptionId = std::uint64_t;
    
    virtual ~RendezvousStore() = default;
    
    // Replaces any existing document under the id.
    virtual void create_session(const std::string& session_id, const std::string& offer,
                                CompletionHandler handler) = 0;
    virtual void set_answer(const std::string& session_id, const std::string& answer,
                            CompletionHandler handler) = 0;
    
    // Atomic set union into the role's candidate list.
    virtual void append_candidate(const std::string& session_id, SessionRole role,
                                  const std::string& candidate, CompletionHandler handler) = 0;
    
    // Succeeds when the document is already absent.
    virtual void delete_session(const std::string& session_id, CompletionHandler handler) = 0;
    
    virtual void get_session(const std::string& session_id, ReadHandler handler) = 0;
    
    // The handler receives the full document after every change, and once
    // right after subscribing when the document exists. A deleted document is
    // reported as an empty snapshot.
    virtual core::Result subscribe(const std::string& session_id, SnapshotHandler handler,
                                   SubscriptionId& subscription) = 0;
    virtual void unsubscribe(SubscriptionId subscription) = 0;
};

} // namespace filejet::signaling
