#include "filejet/signaling/sqlite_rendezvous_store.hpp"
#include "filejet/core/logger.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <vector>

namespace filejet::signaling {

namespace {
    std::int64_t now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
    
    core::Result sqlite_error(sqlite3* db, const std::string& what) {
        return core::Result(core::ErrorCode::STORE_UNAVAILABLE,
                            what + ": " + (db ? sqlite3_errmsg(db) : "database not open"));
    }
    
    class Statement {
    public:
        Statement(sqlite3* db, const char* sql) : stmt_(nullptr) {
            prepared_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) == SQLITE_OK;
        }
        ~Statement() {
            if (stmt_) {
                sqlite3_finalize(stmt_);
            }
        }
        
        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;
        
        bool ok() const { return prepared_; }
        sqlite3_stmt* get() const { return stmt_; }
        
        void bind(int index, const std::string& value) {
            sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        }
        void bind(int index, std::int64_t value) {
            sqlite3_bind_int64(stmt_, index, value);
        }
        
        int step() { return sqlite3_step(stmt_); }
        
        std::optional<std::string> column_text(int index) const {
            if (sqlite3_column_type(stmt_, index) == SQLITE_NULL) {
                return std::nullopt;
            }
            auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
            return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
        }
        std::int64_t column_int(int index) const {
            return sqlite3_column_int64(stmt_, index);
        }
        
    private:
        sqlite3_stmt* stmt_;
        bool prepared_;
    };
    
    // Rolls back unless committed.
    class Transaction {
    public:
        Transaction(sqlite3* db, const char* begin_sql) : db_(db), active_(false) {
            active_ = sqlite3_exec(db_, begin_sql, nullptr, nullptr, nullptr) == SQLITE_OK;
        }
        ~Transaction() {
            if (active_) {
                sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            }
        }
        
        bool active() const { return active_; }
        
        bool commit() {
            if (!active_) return false;
            bool ok = sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) == SQLITE_OK;
            active_ = !ok;
            return ok;
        }
        
    private:
        sqlite3* db_;
        bool active_;
    };
}

SqliteRendezvousStore::SqliteRendezvousStore(boost::asio::io_context& io_context,
                                             const std::filesystem::path& db_path,
                                             std::chrono::milliseconds poll_interval)
    : io_context_(io_context)
    , db_path_(db_path)
    , poll_interval_(poll_interval)
    , db_(nullptr)
    , poll_timer_(io_context)
    , polling_(false)
    , next_subscription_(1) {
}

SqliteRendezvousStore::~SqliteRendezvousStore() {
    close();
}

bool SqliteRendezvousStore::initialize() {
    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open rendezvous database {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }
    
    // Peers in other processes write to the same file.
    sqlite3_busy_timeout(db_, 2000);
    exec("PRAGMA journal_mode=WAL;");
    
    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    
    LOG_INFO("Rendezvous database ready at {}", db_path_.string());
    return true;
}

void SqliteRendezvousStore::close() {
    polling_ = false;
    poll_timer_.cancel();
    subscriptions_.clear();
    
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteRendezvousStore::create_tables() {
    const char* create_sessions_table = R"(
        CREATE TABLE IF NOT EXISTS signaling_sessions (
            session_id TEXT PRIMARY KEY,
            offer TEXT,
            answer TEXT,
            created_at INTEGER NOT NULL,
            version INTEGER NOT NULL DEFAULT 1
        );
    )";
    
    const char* create_candidates_table = R"(
        CREATE TABLE IF NOT EXISTS signaling_candidates (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL,
            role INTEGER NOT NULL,
            candidate TEXT NOT NULL,
            UNIQUE (session_id, role, candidate)
        );
    )";
    
    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_candidates_session ON signaling_candidates(session_id);
    )";
    
    for (const char* sql : {create_sessions_table, create_candidates_table, create_indexes}) {
        auto result = exec(sql);
        if (!result.success()) {
            LOG_ERROR("Failed to create rendezvous tables: {}", result.message);
            return false;
        }
    }
    return true;
}

core::Result SqliteRendezvousStore::exec(const char* sql) {
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        std::string message = error_msg ? error_msg : "unknown error";
        sqlite3_free(error_msg);
        return core::Result(core::ErrorCode::STORE_UNAVAILABLE, message);
    }
    return core::Result();
}

core::Result SqliteRendezvousStore::not_open() const {
    return core::Result(core::ErrorCode::STORE_UNAVAILABLE, "Rendezvous database is not open");
}

void SqliteRendezvousStore::create_session(const std::string& session_id, const std::string& offer,
                                           CompletionHandler handler) {
    complete(std::move(handler), write_session(session_id, offer));
}

void SqliteRendezvousStore::set_answer(const std::string& session_id, const std::string& answer,
                                       CompletionHandler handler) {
    complete(std::move(handler), update_answer(session_id, answer));
}

void SqliteRendezvousStore::append_candidate(const std::string& session_id, SessionRole role,
                                             const std::string& candidate, CompletionHandler handler) {
    complete(std::move(handler), insert_candidate(session_id, role, candidate));
}

void SqliteRendezvousStore::delete_session(const std::string& session_id, CompletionHandler handler) {
    complete(std::move(handler), remove_session(session_id));
}

void SqliteRendezvousStore::get_session(const std::string& session_id, ReadHandler handler) {
    if (!handler) {
        return;
    }
    
    SessionSnapshot snapshot;
    std::optional<Revision> revision;
    auto result = read_session(session_id, snapshot, revision);
    boost::asio::post(io_context_, [handler = std::move(handler), result, snapshot = std::move(snapshot)]() {
        handler(result, snapshot);
    });
}

core::Result SqliteRendezvousStore::write_session(const std::string& session_id, const std::string& offer) {
    if (!db_) return not_open();
    
    Transaction transaction(db_, "BEGIN IMMEDIATE;");
    if (!transaction.active()) {
        return sqlite_error(db_, "Failed to begin transaction");
    }
    
    // A replacement document must never reuse the previous revision.
    std::int64_t created_at = now_ms();
    {
        Statement select(db_, "SELECT created_at FROM signaling_sessions WHERE session_id = ?;");
        if (!select.ok()) return sqlite_error(db_, "Failed to prepare session lookup");
        select.bind(1, session_id);
        if (select.step() == SQLITE_ROW) {
            created_at = std::max(created_at, select.column_int(0) + 1);
        }
    }
    
    {
        Statement clear(db_, "DELETE FROM signaling_candidates WHERE session_id = ?;");
        if (!clear.ok()) return sqlite_error(db_, "Failed to prepare candidate cleanup");
        clear.bind(1, session_id);
        if (clear.step() != SQLITE_DONE) return sqlite_error(db_, "Failed to clear candidates");
    }
    
    {
        Statement insert(db_, R"(
            INSERT OR REPLACE INTO signaling_sessions (session_id, offer, answer, created_at, version)
            VALUES (?, ?, NULL, ?, 1);
        )");
        if (!insert.ok()) return sqlite_error(db_, "Failed to prepare session insert");
        insert.bind(1, session_id);
        insert.bind(2, offer);
        insert.bind(3, created_at);
        if (insert.step() != SQLITE_DONE) return sqlite_error(db_, "Failed to write session");
    }
    
    if (!transaction.commit()) {
        return sqlite_error(db_, "Failed to commit session");
    }
    
    LOG_DEBUG("SQLite store: created session {}", session_id);
    return core::Result();
}

core::Result SqliteRendezvousStore::update_answer(const std::string& session_id, const std::string& answer) {
    if (!db_) return not_open();
    
    Statement update(db_, "UPDATE signaling_sessions SET answer = ?, version = version + 1 WHERE session_id = ?;");
    if (!update.ok()) return sqlite_error(db_, "Failed to prepare answer update");
    update.bind(1, answer);
    update.bind(2, session_id);
    if (update.step() != SQLITE_DONE) {
        return sqlite_error(db_, "Failed to write answer");
    }
    
    if (sqlite3_changes(db_) == 0) {
        return core::Result(core::ErrorCode::STORE_UNAVAILABLE, "No session document for " + session_id);
    }
    return core::Result();
}

core::Result SqliteRendezvousStore::insert_candidate(const std::string& session_id, SessionRole role,
                                                     const std::string& candidate) {
    if (!db_) return not_open();
    
    Transaction transaction(db_, "BEGIN IMMEDIATE;");
    if (!transaction.active()) {
        return sqlite_error(db_, "Failed to begin transaction");
    }
    
    {
        Statement exists(db_, "SELECT 1 FROM signaling_sessions WHERE session_id = ?;");
        if (!exists.ok()) return sqlite_error(db_, "Failed to prepare session lookup");
        exists.bind(1, session_id);
        if (exists.step() != SQLITE_ROW) {
            return core::Result(core::ErrorCode::STORE_UNAVAILABLE, "No session document for " + session_id);
        }
    }
    
    {
        Statement insert(db_, R"(
            INSERT OR IGNORE INTO signaling_candidates (session_id, role, candidate) VALUES (?, ?, ?);
        )");
        if (!insert.ok()) return sqlite_error(db_, "Failed to prepare candidate insert");
        insert.bind(1, session_id);
        insert.bind(2, static_cast<std::int64_t>(role));
        insert.bind(3, candidate);
        if (insert.step() != SQLITE_DONE) return sqlite_error(db_, "Failed to append candidate");
    }
    
    if (sqlite3_changes(db_) > 0) {
        Statement bump(db_, "UPDATE signaling_sessions SET version = version + 1 WHERE session_id = ?;");
        if (!bump.ok()) return sqlite_error(db_, "Failed to prepare revision update");
        bump.bind(1, session_id);
        if (bump.step() != SQLITE_DONE) return sqlite_error(db_, "Failed to update revision");
    }
    
    if (!transaction.commit()) {
        return sqlite_error(db_, "Failed to commit candidate");
    }
    return core::Result();
}

core::Result SqliteRendezvousStore::remove_session(const std::string& session_id) {
    if (!db_) return not_open();
    
    Transaction transaction(db_, "BEGIN IMMEDIATE;");
    if (!transaction.active()) {
        return sqlite_error(db_, "Failed to begin transaction");
    }
    
    for (const char* sql : {"DELETE FROM signaling_candidates WHERE session_id = ?;",
                            "DELETE FROM signaling_sessions WHERE session_id = ?;"}) {
        Statement remove(db_, sql);
        if (!remove.ok()) return sqlite_error(db_, "Failed to prepare delete");
        remove.bind(1, session_id);
        if (remove.step() != SQLITE_DONE) return sqlite_error(db_, "Failed to delete session");
    }
    
    if (!transaction.commit()) {
        return sqlite_error(db_, "Failed to commit delete");
    }
    
    LOG_DEBUG("SQLite store: deleted session {}", session_id);
    return core::Result();
}

core::Result SqliteRendezvousStore::read_revision(const std::string& session_id, std::optional<Revision>& revision) {
    if (!db_) return not_open();
    
    Statement select(db_, "SELECT created_at, version FROM signaling_sessions WHERE session_id = ?;");
    if (!select.ok()) return sqlite_error(db_, "Failed to prepare revision lookup");
    select.bind(1, session_id);
    
    int step = select.step();
    if (step == SQLITE_ROW) {
        revision = Revision{select.column_int(0), select.column_int(1)};
    } else if (step == SQLITE_DONE) {
        revision.reset();
    } else {
        return sqlite_error(db_, "Failed to read revision");
    }
    return core::Result();
}

core::Result SqliteRendezvousStore::read_session(const std::string& session_id, SessionSnapshot& snapshot,
                                                 std::optional<Revision>& revision) {
    if (!db_) return not_open();
    
    // One read transaction so the document and its candidates agree.
    Transaction transaction(db_, "BEGIN;");
    if (!transaction.active()) {
        return sqlite_error(db_, "Failed to begin read");
    }
    
    SignalingSession session;
    {
        Statement select(db_, R"(
            SELECT offer, answer, created_at, version FROM signaling_sessions WHERE session_id = ?;
        )");
        if (!select.ok()) return sqlite_error(db_, "Failed to prepare session read");
        select.bind(1, session_id);
        
        int step = select.step();
        if (step == SQLITE_DONE) {
            snapshot.reset();
            revision.reset();
            transaction.commit();
            return core::Result();
        }
        if (step != SQLITE_ROW) {
            return sqlite_error(db_, "Failed to read session");
        }
        
        session.offer = select.column_text(0);
        session.answer = select.column_text(1);
        auto created_at = select.column_int(2);
        session.created_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(created_at));
        revision = Revision{created_at, select.column_int(3)};
    }
    
    {
        Statement candidates(db_, R"(
            SELECT role, candidate FROM signaling_candidates WHERE session_id = ? ORDER BY seq;
        )");
        if (!candidates.ok()) return sqlite_error(db_, "Failed to prepare candidate read");
        candidates.bind(1, session_id);
        
        int step;
        while ((step = candidates.step()) == SQLITE_ROW) {
            auto role = static_cast<SessionRole>(candidates.column_int(0));
            if (auto text = candidates.column_text(1)) {
                session.candidates(role).push_back(std::move(*text));
            }
        }
        if (step != SQLITE_DONE) {
            return sqlite_error(db_, "Failed to read candidates");
        }
    }
    
    transaction.commit();
    snapshot = std::move(session);
    return core::Result();
}

core::Result SqliteRendezvousStore::subscribe(const std::string& session_id, SnapshotHandler handler,
                                              SubscriptionId& subscription) {
    if (!db_) return not_open();
    
    subscription = next_subscription_++;
    subscriptions_[subscription] = Subscription{session_id, std::move(handler), std::nullopt};
    
    // First delivery happens on the loop, not inside subscribe().
    auto weak_self = weak_from_this();
    boost::asio::post(io_context_, [weak_self]() {
        if (auto self = weak_self.lock()) {
            self->poll();
        }
    });
    
    if (!polling_) {
        polling_ = true;
        schedule_poll();
    }
    return core::Result();
}

void SqliteRendezvousStore::unsubscribe(SubscriptionId subscription) {
    subscriptions_.erase(subscription);
    if (subscriptions_.empty()) {
        polling_ = false;
        poll_timer_.cancel();
    }
}

void SqliteRendezvousStore::poll_now() {
    poll();
}

void SqliteRendezvousStore::complete(CompletionHandler handler, core::Result result) {
    if (!result.success()) {
        LOG_DEBUG("SQLite store operation failed: {}", result.message);
    }
    if (!handler) {
        return;
    }
    boost::asio::post(io_context_, [handler = std::move(handler), result = std::move(result)]() {
        handler(result);
    });
}

void SqliteRendezvousStore::schedule_poll() {
    if (!polling_) {
        return;
    }
    
    auto weak_self = weak_from_this();
    poll_timer_.expires_after(poll_interval_);
    poll_timer_.async_wait([weak_self](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (auto self = weak_self.lock()) {
            self->poll();
            self->schedule_poll();
        }
    });
}

void SqliteRendezvousStore::poll() {
    if (!db_) {
        return;
    }
    
    std::vector<SubscriptionId> ids;
    ids.reserve(subscriptions_.size());
    for (const auto& [id, subscription] : subscriptions_) {
        ids.push_back(id);
    }
    
    for (auto id : ids) {
        // A handler may have unsubscribed this or any later subscription.
        auto it = subscriptions_.find(id);
        if (it == subscriptions_.end()) {
            continue;
        }
        
        std::optional<Revision> revision;
        auto result = read_revision(it->second.session_id, revision);
        if (!result.success()) {
            LOG_WARN("Rendezvous poll for {} failed: {}", it->second.session_id, result.message);
            continue;
        }
        
        if (revision == it->second.last_seen) {
            continue;
        }
        
        SessionSnapshot snapshot;
        result = read_session(it->second.session_id, snapshot, revision);
        if (!result.success()) {
            LOG_WARN("Rendezvous read for {} failed: {}", it->second.session_id, result.message);
            continue;
        }
        
        bool was_present = it->second.last_seen.has_value();
        it->second.last_seen = revision;
        if (!snapshot && !was_present) {
            continue;
        }
        
        auto handler = it->second.handler;
        handler(snapshot);
    }
}

} // namespace filejet::signaling
