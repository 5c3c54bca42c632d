#include <gtest/gtest.h>
#include "../../src/load/key_partitioner.h"

#include <thread>
#include <vector>

using namespace KvLoad;

TEST(KeyPartitionerTest, HandsOutRangeInOrder) {
    KeyPartitioner partitioner({10, 13});
    EXPECT_EQ(partitioner.NextKey().value_or(-1), 10);
    EXPECT_EQ(partitioner.NextKey().value_or(-1), 11);
    EXPECT_EQ(partitioner.NextKey().value_or(-1), 12);
    EXPECT_FALSE(partitioner.NextKey().has_value());
    EXPECT_FALSE(partitioner.NextKey().has_value());
}

TEST(KeyPartitionerTest, EmptyRangeYieldsNothing) {
    KeyPartitioner partitioner({5, 5});
    EXPECT_FALSE(partitioner.NextKey().has_value());
}

TEST(KeyPartitionerTest, ConcurrentClaimsCoverRangeExactlyOnce) {
    constexpr int64_t kStart = 1000;
    constexpr int64_t kEnd = 21000;
    constexpr int kThreads = 8;
    KeyPartitioner partitioner({kStart, kEnd});

    std::vector<std::vector<int64_t>> claimed(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            while (auto key = partitioner.NextKey()) {
                claimed[t].push_back(*key);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::vector<int> hits(kEnd - kStart, 0);
    for (const auto& keys : claimed) {
        for (size_t i = 1; i < keys.size(); ++i) {
            EXPECT_LT(keys[i - 1], keys[i]) << "claims of one worker must increase";
        }
        for (int64_t key : keys) {
            ASSERT_GE(key, kStart);
            ASSERT_LT(key, kEnd);
            ++hits[key - kStart];
        }
    }
    for (size_t i = 0; i < hits.size(); ++i) {
        ASSERT_EQ(hits[i], 1) << "key " << kStart + static_cast<int64_t>(i);
    }
    EXPECT_FALSE(partitioner.NextKey().has_value());
}
