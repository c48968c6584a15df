#include <gtest/gtest.h>
#include "filejet/signaling/sqlite_rendezvous_store.hpp"
#include <filesystem>
#include <vector>

using namespace filejet::signaling;
using filejet::core::ErrorCode;
using filejet::core::Result;

class SqliteRendezvousStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path = std::filesystem::temp_directory_path() /
                  ("filejet_store_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                   "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".db");
        remove_database();
        
        store = make_store();
        ASSERT_TRUE(store);
    }
    
    void TearDown() override {
        if (store) {
            store->close();
        }
        if (other) {
            other->close();
        }
        remove_database();
    }
    
    std::shared_ptr<SqliteRendezvousStore> make_store() {
        auto created = std::make_shared<SqliteRendezvousStore>(io_context, db_path, std::chrono::milliseconds(20));
        if (!created->initialize()) {
            return nullptr;
        }
        return created;
    }
    
    void remove_database() {
        for (const char* suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(db_path.string() + suffix);
        }
    }
    
    // Ready handlers only; the poll timer stays pending.
    void drain() {
        io_context.restart();
        io_context.poll();
    }
    
    Result wait_for(std::function<void(RendezvousStore::CompletionHandler)> operation) {
        Result outcome(ErrorCode::INVALID_STATE, "not completed");
        operation([&outcome](const Result& result) { outcome = result; });
        drain();
        return outcome;
    }
    
    SessionSnapshot read(SqliteRendezvousStore& source, const std::string& session_id) {
        SessionSnapshot snapshot;
        source.get_session(session_id, [&](const Result& result, const SessionSnapshot& value) {
            EXPECT_TRUE(result.success()) << result.message;
            snapshot = value;
        });
        drain();
        return snapshot;
    }
    
    boost::asio::io_context io_context;
    std::filesystem::path db_path;
    std::shared_ptr<SqliteRendezvousStore> store;
    std::shared_ptr<SqliteRendezvousStore> other;
};

TEST_F(SqliteRendezvousStoreTest, CreateAnswerAndCandidates) {
    ASSERT_TRUE(wait_for([&](auto h) { store->create_session("482913", "offer", h); }).success());
    ASSERT_TRUE(wait_for([&](auto h) { store->set_answer("482913", "answer", h); }).success());
    ASSERT_TRUE(wait_for([&](auto h) { store->append_candidate("482913", SessionRole::INITIATOR, "i1", h); }).success());
    ASSERT_TRUE(wait_for([&](auto h) { store->append_candidate("482913", SessionRole::RESPONDER, "r1", h); }).success());
    ASSERT_TRUE(wait_for([&](auto h) { store->append_candidate("482913", SessionRole::RESPONDER, "r2", h); }).success());
    
    auto snapshot = read(*store, "482913");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->offer, "offer");
    EXPECT_EQ(snapshot->answer, "answer");
    EXPECT_EQ(snapshot->initiator_candidates, (std::vector<std::string>{"i1"}));
    EXPECT_EQ(snapshot->responder_candidates, (std::vector<std::string>{"r1", "r2"}));
}

TEST_F(SqliteRendezvousStoreTest, DuplicateCandidatesAreIgnored) {
    wait_for([&](auto h) { store->create_session("111111", "offer", h); });
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(wait_for([&](auto h) {
            store->append_candidate("111111", SessionRole::INITIATOR, "dup", h);
        }).success());
    }
    
    auto snapshot = read(*store, "111111");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->initiator_candidates.size(), 1u);
}

TEST_F(SqliteRendezvousStoreTest, MissingDocument) {
    EXPECT_FALSE(read(*store, "999999").has_value());
    
    EXPECT_EQ(wait_for([&](auto h) { store->set_answer("999999", "a", h); }).error, ErrorCode::STORE_UNAVAILABLE);
    EXPECT_EQ(wait_for([&](auto h) {
        store->append_candidate("999999", SessionRole::RESPONDER, "c", h);
    }).error, ErrorCode::STORE_UNAVAILABLE);
    EXPECT_TRUE(wait_for([&](auto h) { store->delete_session("999999", h); }).success());
}

TEST_F(SqliteRendezvousStoreTest, ReplacementStartsFresh) {
    wait_for([&](auto h) { store->create_session("222222", "first", h); });
    wait_for([&](auto h) { store->append_candidate("222222", SessionRole::INITIATOR, "old", h); });
    auto first = read(*store, "222222");
    
    wait_for([&](auto h) { store->create_session("222222", "second", h); });
    auto second = read(*store, "222222");
    
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->offer, "second");
    EXPECT_TRUE(second->initiator_candidates.empty());
    EXPECT_GT(second->created_at, first->created_at);
}

TEST_F(SqliteRendezvousStoreTest, SubscriptionReportsChangesOnce) {
    std::vector<SessionSnapshot> seen;
    RendezvousStore::SubscriptionId subscription = 0;
    ASSERT_TRUE(store->subscribe("333333", [&](const SessionSnapshot& snapshot) {
        seen.push_back(snapshot);
    }, subscription).success());
    
    // Nothing delivered inside subscribe(), and nothing for an absent document.
    EXPECT_TRUE(seen.empty());
    drain();
    EXPECT_TRUE(seen.empty());
    
    wait_for([&](auto h) { store->create_session("333333", "offer", h); });
    store->poll_now();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0]->offer, "offer");
    
    // Unchanged document: no redelivery.
    store->poll_now();
    EXPECT_EQ(seen.size(), 1u);
    
    wait_for([&](auto h) { store->append_candidate("333333", SessionRole::RESPONDER, "r1", h); });
    store->poll_now();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1]->responder_candidates.size(), 1u);
    
    wait_for([&](auto h) { store->delete_session("333333", h); });
    store->poll_now();
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_FALSE(seen[2].has_value());
    
    store->unsubscribe(subscription);
    wait_for([&](auto h) { store->create_session("333333", "again", h); });
    store->poll_now();
    EXPECT_EQ(seen.size(), 3u);
}

TEST_F(SqliteRendezvousStoreTest, TwoStoresShareOneDatabase) {
    other = make_store();
    ASSERT_TRUE(other);
    
    std::vector<SessionSnapshot> seen;
    RendezvousStore::SubscriptionId subscription = 0;
    ASSERT_TRUE(other->subscribe("444444", [&](const SessionSnapshot& snapshot) {
        seen.push_back(snapshot);
    }, subscription).success());
    drain();
    
    wait_for([&](auto h) { store->create_session("444444", "offer-from-a", h); });
    other->poll_now();
    
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0]->offer, "offer-from-a");
    
    wait_for([&](auto h) { other->set_answer("444444", "answer-from-b", h); });
    auto snapshot = read(*store, "444444");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->answer, "answer-from-b");
}

TEST_F(SqliteRendezvousStoreTest, ClosedStoreIsUnavailable) {
    store->close();
    
    EXPECT_EQ(wait_for([&](auto h) { store->create_session("555555", "offer", h); }).error,
              ErrorCode::STORE_UNAVAILABLE);
    
    RendezvousStore::SubscriptionId subscription = 0;
    EXPECT_EQ(store->subscribe("555555", [](const SessionSnapshot&) {}, subscription).error,
              ErrorCode::STORE_UNAVAILABLE);
}

TEST_F(SqliteRendezvousStoreTest, UnopenableDatabase) {
    auto broken = std::make_shared<SqliteRendezvousStore>(
        io_context, std::filesystem::path("/nonexistent-dir/filejet/store.db"));
    EXPECT_FALSE(broken->initialize());
}
