#include <gtest/gtest.h>
#include <iostream>
#include <string>
#include <vector>

#include "sketchkit/filter/cuckoo_filter.hpp"

using sketchkit::filter::CuckooFilter;

TEST(CuckooFilterTest, AddContainsRemove) {
    CuckooFilter filter(100, 4);
    ASSERT_TRUE(filter.Add("hello"));
    ASSERT_TRUE(filter.Contains("hello"));
    ASSERT_EQ(filter.count(), 1);
    ASSERT_TRUE(filter.Remove("hello"));
    ASSERT_FALSE(filter.Contains("hello"));
    ASSERT_FALSE(filter.Remove("hello"));
    ASSERT_EQ(filter.count(), 0);
}

TEST(CuckooFilterTest, NinetyPercentLoad) {
    CuckooFilter filter(100, 4);
    for (int i = 0; i < 90; i++) {
        ASSERT_TRUE(filter.Add("item-" + std::to_string(i)));
    }
    for (int i = 0; i < 90; i++) {
        ASSERT_TRUE(filter.Contains("item-" + std::to_string(i)));
    }
    auto info = filter.GetInfo();
    std::cout << "size " << info.size << " load factor " << info.load_factor << std::endl;
    ASSERT_EQ(info.count, 90);
    ASSERT_EQ(info.failed_inserts, 0);
    ASSERT_DOUBLE_EQ(info.load_factor, 90.0 / (info.size * 4));
}

TEST(CuckooFilterTest, RemoveKeepsOthers) {
    // 32 位指纹，指纹碰撞可忽略
    CuckooFilter filter(1000, 4, 32);
    for (int i = 0; i < 800; i++) {
        ASSERT_TRUE(filter.Add(std::to_string(i)));
    }
    for (int i = 0; i < 800; i += 2) {
        ASSERT_TRUE(filter.Remove(std::to_string(i)));
    }
    for (int i = 0; i < 800; i++) {
        ASSERT_EQ(filter.Contains(std::to_string(i)), i % 2 == 1) << i;
    }
    ASSERT_EQ(filter.count(), 400);
}

TEST(CuckooFilterTest, OverflowIsReported) {
    CuckooFilter filter(16, 2, 16, 20);
    std::vector<std::string> added;
    size_t failed = 0;
    for (int i = 0; i < 200; i++) {
        std::string key = "k" + std::to_string(i);
        if (filter.Add(key)) {
            added.emplace_back(key);
        } else {
            failed++;
        }
    }
    auto info = filter.GetInfo();
    std::cout << "added " << added.size() << " failed " << failed << std::endl;
    ASSERT_GT(failed, 0);
    ASSERT_EQ(info.failed_inserts, failed);
    ASSERT_EQ(info.count, added.size());
    ASSERT_LE(info.count, info.total_slots);
    // 失败的插入会回滚，已成功插入的元素都还在
    for (auto& key : added) {
        ASSERT_TRUE(filter.Contains(key)) << key;
    }
}

TEST(CuckooFilterTest, Deterministic) {
    CuckooFilter a(64, 4, 8, 100, 9);
    CuckooFilter b(64, 4, 8, 100, 9);
    for (int i = 0; i < 300; i++) {
        std::string key = std::to_string(i);
        ASSERT_EQ(a.Add(key), b.Add(key));
    }
    ASSERT_EQ(a.count(), b.count());
}

TEST(CuckooFilterTest, InfoAndReset) {
    ASSERT_THROW(CuckooFilter(0), sketchkit::ConfigurationError);
    ASSERT_THROW(CuckooFilter(100, 0), sketchkit::ConfigurationError);
    ASSERT_THROW(CuckooFilter(100, 4, 0), sketchkit::ConfigurationError);
    ASSERT_THROW(CuckooFilter(100, 4, 33), sketchkit::ConfigurationError);

    CuckooFilter filter(100, 4, 8);
    // ceil(100 / 4 * 1.05) = 27，取 2 的幂
    ASSERT_EQ(filter.size(), 32);
    for (int i = 0; i < 50; i++) {
        filter.Add(std::to_string(i));
    }
    auto info = filter.GetInfo();
    ASSERT_EQ(info.total_slots, 128);
    ASSERT_EQ(info.fingerprint_size, 8);
    ASSERT_NEAR(info.estimated_false_positive_rate, 2.0 * 4 * (50.0 / 128) / 256, 1e-12);

    auto described = filter.Describe();
    ASSERT_EQ(std::get<uint64_t>(described.at("count")), 50);
    ASSERT_EQ(std::get<std::string>(described.at("hash_function")), "xxh64");

    filter.Reset();
    ASSERT_EQ(filter.count(), 0);
    ASSERT_FALSE(filter.Contains("1"));
}
