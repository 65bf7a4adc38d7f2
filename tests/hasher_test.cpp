#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <unordered_set>

#include "sketchkit/utils/error.hpp"
#include "sketchkit/utils/hasher.hpp"

using namespace sketchkit::utils;

TEST(HasherTest, XXH64) {
    XXH64Hasher hasher;
    ASSERT_EQ(hasher.Hash("", 0), 0xEF46DB3751D8E999ULL);
    ASSERT_EQ(hasher.name(), "xxh64");

    // 覆盖 32 字节分块、8 字节、4 字节和单字节尾部
    std::string long_key(77, 'k');
    ASSERT_EQ(hasher.Hash(long_key, 5), hasher.Hash(long_key, 5));
    ASSERT_NE(hasher.Hash(long_key, 5), hasher.Hash(long_key, 6));
    ASSERT_NE(hasher.Hash(long_key, 5), hasher.Hash(long_key.substr(1), 5));
}

TEST(HasherTest, FNV1a) {
    FNV1aHasher hasher;
    ASSERT_EQ(hasher.name(), "fnv1a");
    ASSERT_EQ(hasher.Hash("abc", 1), hasher.Hash("abc", 1));
    ASSERT_NE(hasher.Hash("abc", 1), hasher.Hash("abc", 2));
    ASSERT_NE(hasher.Hash("abc", 1), hasher.Hash("abd", 1));
}

TEST(HasherTest, Distribution) {
    auto hasher = DefaultHasher();
    std::unordered_set<uint64_t> seen;
    size_t buckets[16] = {0};
    for (int i = 0; i < 16000; i++) {
        uint64_t h = hasher->Hash(std::to_string(i), 0);
        seen.insert(h);
        buckets[h & 15]++;
    }
    ASSERT_EQ(seen.size(), 16000);
    for (size_t count : buckets) {
        ASSERT_GT(count, 800);
        ASSERT_LT(count, 1200);
    }
}

TEST(HasherTest, FNV1aLowBits) {
    // 低位取桶：公共前缀 + 递增数字也要均匀
    FNV1aHasher hasher;
    size_t buckets[64] = {0};
    for (int i = 0; i < 64000; i++) {
        buckets[hasher.Hash("k" + std::to_string(i), 0) & 63]++;
    }
    for (size_t count : buckets) {
        ASSERT_GT(count, 800);
        ASSERT_LT(count, 1200);
    }
}

TEST(HasherTest, MakeHasher) {
    ASSERT_EQ(MakeHasher("xxh64")->name(), "xxh64");
    ASSERT_EQ(MakeHasher("fnv1a")->name(), "fnv1a");
    ASSERT_THROW(MakeHasher("md5"), sketchkit::ConfigurationError);
    ASSERT_EQ(DefaultHasher().get(), DefaultHasher().get());
}

TEST(HasherTest, DoubleHash) {
    auto fnv = MakeHasher("fnv1a");
    for (size_t range : {1, 2, 7, 1000, 9586}) {
        for (int i = 0; i < 200; i++) {
            std::string key = "key" + std::to_string(i);
            auto pair = DoubleHash(*DefaultHasher(), key, range);
            ASSERT_LT(pair.h1, range);
            ASSERT_GE(pair.h2, 1);
            ASSERT_LE(pair.h2, range == 1 ? 1 : range - 1);
            for (size_t j = 0; j < 10; j++) {
                ASSERT_LT(pair.Nth(j, range), range);
            }
            // 主哈希也是 fnv1a 时两路仍然不同
            auto same_family = DoubleHash(*fnv, key, range);
            ASSERT_LT(same_family.h1, range);
            ASSERT_GE(same_family.h2, 1);
        }
    }
    auto pair = DoubleHash(*DefaultHasher(), "x", 1000);
    ASSERT_EQ(pair.Nth(0, 1000), pair.h1);
    ASSERT_EQ(pair.Nth(1, 1000), (pair.h1 + pair.h2) % 1000);
}
