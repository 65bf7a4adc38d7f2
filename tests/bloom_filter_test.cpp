#include <gtest/gtest.h>
#include <iostream>
#include <string>
#include "sketchkit/filter/bloom_filter.hpp"

using sketchkit::filter::BloomFilter;

TEST(BloomFilterTest, Function) {
    const int n = 1000;
    BloomFilter bloom_filter(n, 0.01);
    std::cout << bloom_filter.length() << " length " << bloom_filter.hash_num() << " hashes" << std::endl;
    // m = ceil(-1000 * ln(0.01) / ln(2)^2) = 9586, k = round(9.586 * ln 2) = 7
    ASSERT_EQ(bloom_filter.length(), 9586);
    ASSERT_EQ(bloom_filter.hash_num(), 7);

    for (int i = 0; i < n; i++) {
        bloom_filter.Add("member-" + std::to_string(i));
    }
    for (int i = 0; i < n; i++) {
        ASSERT_EQ(bloom_filter.Contains("member-" + std::to_string(i)), true);
    }
    const int probes = 100000;
    size_t cnt = 0;
    for (int i = 0; i < probes; i++) {
        cnt += bloom_filter.Contains("absent-" + std::to_string(i));
    }
    double rate = double(cnt) / probes;
    std::cout << " probes " << probes << " cnt " << cnt << std::endl;
    std::cout << "error rate " << rate << std::endl;
    ASSERT_LT(rate, 0.03);
}

TEST(BloomFilterTest, InvalidConfiguration) {
    ASSERT_THROW(BloomFilter(0, 0.01), sketchkit::ConfigurationError);
    ASSERT_THROW(BloomFilter(100, 0.0), sketchkit::ConfigurationError);
    ASSERT_THROW(BloomFilter(100, 1.0), sketchkit::ConfigurationError);
    ASSERT_THROW(BloomFilter(100, 0.01, nullptr), sketchkit::ConfigurationError);
}

TEST(BloomFilterTest, UnionAndIntersection) {
    BloomFilter a(500, 0.01);
    BloomFilter b(500, 0.01);
    for (int i = 0; i < 200; i++) {
        a.Add("a" + std::to_string(i));
        b.Add("b" + std::to_string(i));
    }
    a.Add("shared");
    b.Add("shared");

    auto u = a.Union(b);
    for (int i = 0; i < 200; i++) {
        ASSERT_TRUE(u.Contains("a" + std::to_string(i)));
        ASSERT_TRUE(u.Contains("b" + std::to_string(i)));
    }
    ASSERT_EQ(u.count(), 201);

    auto x = a.Intersection(b);
    ASSERT_TRUE(x.Contains("shared"));
    ASSERT_EQ(x.count(), 201);
    ASSERT_LE(x.GetInfo().bit_array_fill_ratio, a.GetInfo().bit_array_fill_ratio);

    // 原过滤器不受影响
    ASSERT_FALSE(a.Contains("b0") && a.Contains("b1") && a.Contains("b2"));

    BloomFilter other(1000, 0.01);
    ASSERT_THROW(a.Union(other), sketchkit::IncompatibleStructureError);
    ASSERT_THROW(a.Intersection(other), sketchkit::IncompatibleStructureError);
}

TEST(BloomFilterTest, InfoAndReset) {
    BloomFilter bloom_filter(100, 0.01);
    auto info = bloom_filter.GetInfo();
    ASSERT_EQ(info.count, 0);
    ASSERT_DOUBLE_EQ(info.bit_array_fill_ratio, 0.0);
    ASSERT_DOUBLE_EQ(info.estimated_false_positive_rate, 0.0);
    ASSERT_EQ(info.hash_function, "xxh64");
    ASSERT_FALSE(info.overloaded);

    for (int i = 0; i < 100; i++) {
        bloom_filter.Add(std::to_string(i));
    }
    info = bloom_filter.GetInfo();
    ASSERT_EQ(info.count, 100);
    ASSERT_GT(info.bit_array_fill_ratio, 0.0);
    ASSERT_NEAR(info.estimated_false_positive_rate, 0.01, 0.005);
    ASSERT_FALSE(info.overloaded);

    // 超过容量后估计误判率上升，并标记超载
    for (int i = 100; i < 400; i++) {
        bloom_filter.Add(std::to_string(i));
    }
    info = bloom_filter.GetInfo();
    ASSERT_TRUE(info.overloaded);
    ASSERT_GT(info.estimated_false_positive_rate, 0.1);

    auto described = bloom_filter.Describe();
    ASSERT_EQ(std::get<uint64_t>(described.at("count")), 400);
    ASSERT_EQ(std::get<bool>(described.at("overloaded")), true);

    bloom_filter.Reset();
    ASSERT_EQ(bloom_filter.count(), 0);
    ASSERT_DOUBLE_EQ(bloom_filter.GetInfo().bit_array_fill_ratio, 0.0);
    ASSERT_FALSE(bloom_filter.Contains("0"));
}

TEST(BloomFilterTest, CustomHasher) {
    BloomFilter bloom_filter(1000, 0.01, sketchkit::utils::MakeHasher("fnv1a"));
    for (int i = 0; i < 1000; i++) {
        bloom_filter.Add(std::to_string(i));
    }
    for (int i = 0; i < 1000; i++) {
        ASSERT_TRUE(bloom_filter.Contains(std::to_string(i)));
    }
    ASSERT_EQ(bloom_filter.GetInfo().hash_function, "fnv1a");

    BloomFilter default_filter(1000, 0.01);
    ASSERT_THROW(bloom_filter.Union(default_filter), sketchkit::IncompatibleStructureError);
}
