#include <gtest/gtest.h>
#include "store/memory_store.h"
#include "utils/errors.h"

#include <atomic>
#include <thread>
#include <vector>

using namespace shroud;
using namespace shroud::store;

class MemoryStoreTest : public ::testing::Test {
protected:
    MemoryStore store_;
};

TEST_F(MemoryStoreTest, SetAndGet) {
    EXPECT_FALSE(store_.get("missing").has_value());
    store_.set("k", "v", std::nullopt);
    EXPECT_EQ(store_.get("k"), "v");
    store_.set("k", "v2", std::nullopt);
    EXPECT_EQ(store_.get("k"), "v2");
}

TEST_F(MemoryStoreTest, TtlExpiresKey) {
    store_.set("short", "v", std::chrono::seconds(1));
    EXPECT_TRUE(store_.get("short").has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    EXPECT_FALSE(store_.get("short").has_value());
}

TEST_F(MemoryStoreTest, IncrementCounters) {
    EXPECT_EQ(store_.incr("c"), 1);
    EXPECT_EQ(store_.incrBy("c", 10), 11);
    EXPECT_EQ(store_.incrBy("c", -3), 8);
    EXPECT_EQ(store_.get("c"), "8");
}

TEST_F(MemoryStoreTest, IncrementNonIntegerThrows) {
    store_.set("text", "hello", std::nullopt);
    EXPECT_THROW(store_.incr("text"), utils::StoreError);
}

TEST_F(MemoryStoreTest, ExpireOnlyExistingKeys) {
    EXPECT_FALSE(store_.expire("nope", std::chrono::seconds(5)));
    store_.set("k", "v", std::nullopt);
    EXPECT_TRUE(store_.expire("k", std::chrono::seconds(5)));
}

TEST_F(MemoryStoreTest, WindowedIncrementStartsTtlOnce) {
    EXPECT_EQ(store_.incrementWindowed("w", 25, std::chrono::seconds(1)), 25);
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    // A later increment must not push the window out
    EXPECT_EQ(store_.incrementWindowed("w", 25, std::chrono::seconds(1)), 50);
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    EXPECT_FALSE(store_.get("w").has_value());
}

TEST_F(MemoryStoreTest, WindowedIncrementIsAtomic) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 100; ++i) {
                store_.incrementWindowed("shared", 2, std::chrono::seconds(60));
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(store_.get("shared"), "1600");
}

TEST_F(MemoryStoreTest, HashFields) {
    EXPECT_FALSE(store_.hget("h", "requests").has_value());
    EXPECT_EQ(store_.hincrby("h", "requests", 1), 1);
    EXPECT_EQ(store_.hincrby("h", "requests", 1), 2);
    EXPECT_EQ(store_.hincrby("h", "entities", 5), 5);
    EXPECT_EQ(store_.hget("h", "requests"), "2");
    EXPECT_EQ(store_.hget("h", "entities"), "5");
}

TEST_F(MemoryStoreTest, WrongTypeThrows) {
    store_.set("str", "1", std::nullopt);
    store_.hincrby("hash", "f", 1);
    EXPECT_THROW(store_.hincrby("str", "f", 1), utils::StoreError);
    EXPECT_THROW(store_.hget("str", "f"), utils::StoreError);
    EXPECT_THROW(store_.get("hash"), utils::StoreError);
    EXPECT_THROW(store_.incr("hash"), utils::StoreError);
}

TEST_F(MemoryStoreTest, Delete) {
    store_.set("k", "v", std::nullopt);
    EXPECT_EQ(store_.del("k"), 1);
    EXPECT_EQ(store_.del("k"), 0);
    EXPECT_FALSE(store_.get("k").has_value());
}

TEST(MemoryStoreEvictionTest, EvictsOldestInserted) {
    MemoryStore store(3);
    store.set("a", "1", std::nullopt);
    store.set("b", "2", std::nullopt);
    store.set("c", "3", std::nullopt);
    store.set("a", "updated", std::nullopt);  // update does not re-insert
    store.set("d", "4", std::nullopt);

    EXPECT_EQ(store.size(), 3u);
    EXPECT_FALSE(store.get("a").has_value());
    EXPECT_EQ(store.get("b"), "2");
    EXPECT_EQ(store.get("d"), "4");
}

TEST(MemoryStoreEvictionTest, CloseClearsEverything) {
    MemoryStore store;
    store.set("a", "1", std::nullopt);
    store.close();
    EXPECT_EQ(store.size(), 0u);
}
