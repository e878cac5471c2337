#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

struct Entry {
    int value;
    std::string name;

    Entry(int v = 0, const std::string& n = "") : value(v), name(n) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, Entry> map;
};

TEST_F(ThreadSafeMapTest, InsertAndFind) {
    map.insert("expire-r1", std::make_shared<Entry>(42, "reservation.expire"));

    auto found = map.find("expire-r1");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->value, 42);
    EXPECT_EQ(found->name, "reservation.expire");
}

TEST_F(ThreadSafeMapTest, FindMissing_ReturnsNull) {
    EXPECT_EQ(map.find("nope"), nullptr);
    EXPECT_FALSE(map.contains("nope"));
}

TEST_F(ThreadSafeMapTest, InsertIfAbsent_KeepsFirstValue) {
    EXPECT_TRUE(map.insertIfAbsent("k", std::make_shared<Entry>(1, "first")));
    EXPECT_FALSE(map.insertIfAbsent("k", std::make_shared<Entry>(2, "second")));

    auto found = map.find("k");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->value, 1);
}

TEST_F(ThreadSafeMapTest, Erase_IsIdempotent) {
    map.insert("k", std::make_shared<Entry>(1));

    EXPECT_TRUE(map.erase("k"));
    EXPECT_FALSE(map.erase("k"));
    EXPECT_EQ(map.size(), 0u);
}

TEST_F(ThreadSafeMapTest, Keys_ListsAllEntries) {
    map.insert("a", std::make_shared<Entry>(1));
    map.insert("b", std::make_shared<Entry>(2));

    auto keys = map.keys();
    std::sort(keys.begin(), keys.end());
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "a");
    EXPECT_EQ(keys[1], "b");
}

// Только один из конкурирующих писателей выигрывает insertIfAbsent
TEST_F(ThreadSafeMapTest, ConcurrentInsertIfAbsent_SingleWinner) {
    std::atomic<int> winners(0);
    std::vector<std::thread> threads;

    for (int writer = 0; writer < 8; ++writer) {
        threads.emplace_back([this, writer, &winners]() {
            if (map.insertIfAbsent("shared", std::make_shared<Entry>(writer))) {
                ++winners;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, ConcurrentReadWrite_NoDataCorruption) {
    const std::string key = "shared_key";
    map.insert(key, std::make_shared<Entry>(0, "initial"));

    std::vector<std::thread> threads;
    std::atomic<int> readCount(0);

    for (int writer = 0; writer < 4; ++writer) {
        threads.emplace_back([this, &key, writer]() {
            for (int i = 0; i < 50; ++i) {
                map.insert(key, std::make_shared<Entry>(writer * 100 + i, "data"));
            }
        });
    }

    for (int reader = 0; reader < 4; ++reader) {
        threads.emplace_back([this, &key, &readCount]() {
            for (int i = 0; i < 100; ++i) {
                auto found = map.find(key);
                ASSERT_NE(found, nullptr);
                readCount++;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(readCount, 400);
}
