#include <gtest/gtest.h>
#include "filejet/signaling/memory_rendezvous_store.hpp"
#include <vector>

using namespace filejet::signaling;
using filejet::core::ErrorCode;
using filejet::core::Result;

class MemoryRendezvousStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<MemoryRendezvousStore>(io_context);
    }
    
    void run() {
        io_context.restart();
        io_context.run();
    }
    
    // Runs the loop until the completion for a single write arrives.
    Result wait_for(std::function<void(RendezvousStore::CompletionHandler)> operation) {
        Result outcome(ErrorCode::INVALID_STATE, "not completed");
        operation([&outcome](const Result& result) { outcome = result; });
        run();
        return outcome;
    }
    
    boost::asio::io_context io_context;
    std::shared_ptr<MemoryRendezvousStore> store;
};

TEST_F(MemoryRendezvousStoreTest, CreateReadDelete) {
    auto created = wait_for([&](auto handler) { store->create_session("482913", "offer-text", handler); });
    ASSERT_TRUE(created.success());
    
    Result read_result;
    SessionSnapshot snapshot;
    store->get_session("482913", [&](const Result& result, const SessionSnapshot& value) {
        read_result = result;
        snapshot = value;
    });
    run();
    
    ASSERT_TRUE(read_result.success());
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->offer, "offer-text");
    EXPECT_FALSE(snapshot->answer.has_value());
    
    EXPECT_TRUE(wait_for([&](auto handler) { store->delete_session("482913", handler); }).success());
    EXPECT_FALSE(store->has_session("482913"));
    
    // Deleting an absent document still succeeds.
    EXPECT_TRUE(wait_for([&](auto handler) { store->delete_session("482913", handler); }).success());
}

TEST_F(MemoryRendezvousStoreTest, CompletionIsNeverSynchronous) {
    bool completed = false;
    store->create_session("111111", "offer", [&](const Result&) { completed = true; });
    EXPECT_FALSE(completed);
    run();
    EXPECT_TRUE(completed);
}

TEST_F(MemoryRendezvousStoreTest, CreateReplacesPreviousDocument) {
    wait_for([&](auto handler) { store->create_session("111111", "first", handler); });
    wait_for([&](auto handler) { store->append_candidate("111111", SessionRole::INITIATOR, "c1", handler); });
    wait_for([&](auto handler) { store->set_answer("111111", "answer", handler); });
    
    wait_for([&](auto handler) { store->create_session("111111", "second", handler); });
    
    auto snapshot = store->peek("111111");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->offer, "second");
    EXPECT_FALSE(snapshot->answer.has_value());
    EXPECT_TRUE(snapshot->initiator_candidates.empty());
}

TEST_F(MemoryRendezvousStoreTest, AppendIsSetUnion) {
    wait_for([&](auto handler) { store->create_session("222222", "offer", handler); });
    
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(wait_for([&](auto handler) {
            store->append_candidate("222222", SessionRole::RESPONDER, "same", handler);
        }).success());
    }
    wait_for([&](auto handler) { store->append_candidate("222222", SessionRole::RESPONDER, "other", handler); });
    wait_for([&](auto handler) { store->append_candidate("222222", SessionRole::INITIATOR, "same", handler); });
    
    auto snapshot = store->peek("222222");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->responder_candidates, (std::vector<std::string>{"same", "other"}));
    EXPECT_EQ(snapshot->initiator_candidates, (std::vector<std::string>{"same"}));
}

TEST_F(MemoryRendezvousStoreTest, WritesToMissingDocumentFail) {
    auto answer = wait_for([&](auto handler) { store->set_answer("333333", "answer", handler); });
    EXPECT_EQ(answer.error, ErrorCode::STORE_UNAVAILABLE);
    
    auto candidate = wait_for([&](auto handler) {
        store->append_candidate("333333", SessionRole::INITIATOR, "c", handler);
    });
    EXPECT_EQ(candidate.error, ErrorCode::STORE_UNAVAILABLE);
}

TEST_F(MemoryRendezvousStoreTest, SubscriptionSeesEveryChange) {
    wait_for([&](auto handler) { store->create_session("444444", "offer", handler); });
    
    std::vector<SessionSnapshot> seen;
    RendezvousStore::SubscriptionId subscription = 0;
    ASSERT_TRUE(store->subscribe("444444", [&](const SessionSnapshot& snapshot) {
        seen.push_back(snapshot);
    }, subscription).success());
    EXPECT_EQ(store->subscription_count(), 1u);
    
    run();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0]->offer, "offer");
    
    wait_for([&](auto handler) { store->set_answer("444444", "answer", handler); });
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1]->answer, "answer");
    
    wait_for([&](auto handler) { store->delete_session("444444", handler); });
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_FALSE(seen[2].has_value());
    
    store->unsubscribe(subscription);
    EXPECT_EQ(store->subscription_count(), 0u);
    
    wait_for([&](auto handler) { store->create_session("444444", "again", handler); });
    EXPECT_EQ(seen.size(), 3u);
}

TEST_F(MemoryRendezvousStoreTest, SubscribeToAbsentDocumentWaits) {
    int calls = 0;
    RendezvousStore::SubscriptionId subscription = 0;
    store->subscribe("555555", [&](const SessionSnapshot& snapshot) {
        calls++;
        EXPECT_TRUE(snapshot.has_value());
    }, subscription);
    
    run();
    EXPECT_EQ(calls, 0);
    
    wait_for([&](auto handler) { store->create_session("555555", "offer", handler); });
    EXPECT_EQ(calls, 1);
}

TEST_F(MemoryRendezvousStoreTest, UnsubscribeDropsQueuedDeliveries) {
    wait_for([&](auto handler) { store->create_session("666666", "offer", handler); });
    
    int calls = 0;
    RendezvousStore::SubscriptionId subscription = 0;
    store->subscribe("666666", [&](const SessionSnapshot&) { calls++; }, subscription);
    store->unsubscribe(subscription);
    
    run();
    EXPECT_EQ(calls, 0);
}

TEST_F(MemoryRendezvousStoreTest, UnavailableStoreFailsEverything) {
    store->set_available(false);
    
    auto created = wait_for([&](auto handler) { store->create_session("777777", "offer", handler); });
    EXPECT_EQ(created.error, ErrorCode::STORE_UNAVAILABLE);
    
    RendezvousStore::SubscriptionId subscription = 0;
    auto subscribed = store->subscribe("777777", [](const SessionSnapshot&) {}, subscription);
    EXPECT_EQ(subscribed.error, ErrorCode::STORE_UNAVAILABLE);
    
    Result read_result;
    store->get_session("777777", [&](const Result& result, const SessionSnapshot&) { read_result = result; });
    run();
    EXPECT_EQ(read_result.error, ErrorCode::STORE_UNAVAILABLE);
    
    store->set_available(true);
    EXPECT_TRUE(wait_for([&](auto handler) { store->create_session("777777", "offer", handler); }).success());
}
