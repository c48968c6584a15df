#pragma once

#include "filejet/signaling/rendezvous_store.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>

struct sqlite3;

namespace filejet::signaling {

// Rendezvous documents in an SQLite database that several processes may open
// at once. Change notification is emulated by polling a per-document
// revision on the event loop.
class SqliteRendezvousStore : public RendezvousStore, public std::enable_shared_from_this<SqliteRendezvousStore> {
public:
    SqliteRendezvousStore(boost::asio::io_context& io_context,
                          const std::filesystem::path& db_path,
                          std::chrono::milliseconds poll_interval = std::chrono::milliseconds(200));
    ~SqliteRendezvousStore() override;
    
    SqliteRendezvousStore(const SqliteRendezvousStore&) = delete;
    SqliteRendezvousStore& operator=(const SqliteRendezvousStore&) = delete;
    
    bool initialize();
    
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
    
    // Stops the poll timer; pending subscriptions receive nothing further.
    void close();
    
    // Runs one poll pass immediately.
    void poll_now();

private:
    // (created_at, version) identifies one revision of one document instance.
    using Revision = std::pair<std::int64_t, std::int64_t>;
    
    struct Subscription {
        std::string session_id;
        SnapshotHandler handler;
        std::optional<Revision> last_seen;
    };
    
    bool create_tables();
    core::Result exec(const char* sql);
    core::Result write_session(const std::string& session_id, const std::string& offer);
    core::Result update_answer(const std::string& session_id, const std::string& answer);
    core::Result insert_candidate(const std::string& session_id, SessionRole role, const std::string& candidate);
    core::Result remove_session(const std::string& session_id);
    core::Result read_revision(const std::string& session_id, std::optional<Revision>& revision);
    core::Result read_session(const std::string& session_id, SessionSnapshot& snapshot,
                              std::optional<Revision>& revision);
    
    void complete(CompletionHandler handler, core::Result result);
    void schedule_poll();
    void poll();
    core::Result not_open() const;
    
    boost::asio::io_context& io_context_;
    std::filesystem::path db_path_;
    std::chrono::milliseconds poll_interval_;
    sqlite3* db_;
    boost::asio::steady_timer poll_timer_;
    bool polling_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId next_subscription_;
};

} // namespace filejet::signaling
