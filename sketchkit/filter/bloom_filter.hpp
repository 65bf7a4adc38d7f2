/**
 * @file bloom_filter.hpp
 * @brief 布隆过滤器实现 - 概率性数据结构
 *
 * 布隆过滤器是一种空间效率极高的概率性数据结构，用于判断元素是否可能存在。
 * 它有以下特性：
 * - 空间效率高：使用位数组存储
 * - 查询速度快：O(k) 时间复杂度，k 为哈希函数数量
 * - 可能存在假阳性（false positive）：可能误判存在，不会漏判
 * - 不支持删除：需要删除请使用 CuckooFilter
 *
 * @section bloom_filter_structure 布隆过滤器结构
 * ┌─────────────────────────────────────────────────────────────────┐
 * │                    布隆过滤器内部结构                            │
 * ├─────────────────────────────────────────────────────────────────┤
 * │                                                                 │
 * │   [capacity] [p] [m bits] [k] [count]                           │
 * │                                                                 │
 * │   bits_: boost::dynamic_bitset<uint64_t>，共 m 位                │
 * │                                                                 │
 * └─────────────────────────────────────────────────────────────────┘
 *
 * @section hash_functions 哈希函数
 *
 * 不使用 k 个独立哈希，而是双重哈希：
 * - h1 = 主哈希（默认 xxh64），h2 = fnv1a
 * - 第 i 个位置 = (h1 + i * h2) mod m
 */

#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <boost/dynamic_bitset.hpp>

#include "sketchkit/sketch.hpp"
#include "sketchkit/utils/error.hpp"
#include "sketchkit/utils/hasher.hpp"

namespace sketchkit {
namespace filter {

/**
 * @brief 布隆过滤器类
 *
 * 使用示例：
 * @code
 * BloomFilter bf(10000, 0.01);  // 预期10000个元素，1%误判率
 * bf.Add("key1");
 * bf.Add("key2");
 * bool exists = bf.Contains("key1");  // true
 * bool exists = bf.Contains("key3");  // 可能是 false（真阴性）或 true（假阳性）
 * @endcode
 */
class BloomFilter : public Sketch {
public:
    struct Info {
        size_t size;                          ///< 位数组长度 m
        size_t hash_count;                    ///< 哈希函数数量 k
        size_t capacity;                      ///< 设计容量
        size_t count;                         ///< 插入次数（不去重）
        double bit_array_fill_ratio;          ///< 已置位比例
        double estimated_false_positive_rate; ///< (1 - e^(-kn/m))^k
        size_t memory_usage_bytes;
        std::string hash_function;
        bool overloaded;                      ///< 插入次数超过设计容量
    };

    /**
     * @brief 构造布隆过滤器
     * @param capacity 预期插入的元素数量
     * @param false_positive_rate 期望的最大误判率 (0 < p < 1)，默认 0.01 (1%)
     * @param hasher 主哈希函数，默认 xxh64
     * @throw ConfigurationError capacity 为 0 或 p 不在 (0, 1)
     *
     * 计算公式：
     * - m = ceil(-n * ln(p) / (ln(2)^2))
     * - k = max(1, round(m / n * ln(2)))
     */
    explicit BloomFilter(size_t capacity, double false_positive_rate = 0.01,
                         utils::HasherPtr hasher = utils::DefaultHasher())
        : capacity_(capacity), false_positive_rate_(false_positive_rate), hasher_(std::move(hasher)) {
        if (capacity_ == 0) {
            throw ConfigurationError("bloom filter capacity must be positive");
        }
        if (!(false_positive_rate_ > 0.0 && false_positive_rate_ < 1.0)) {
            throw ConfigurationError("bloom filter false positive rate must be in (0, 1)");
        }
        if (!hasher_) {
            throw ConfigurationError("bloom filter requires a hash function");
        }
        length_ = CalcLength(capacity_, false_positive_rate_);
        hash_num_ = CalcHashNum(length_, capacity_);
        bits_.resize(length_);
    }

    SketchType type() const override { return SketchType::kBloomFilter; }

    /**
     * @brief 插入元素
     * @note 多次插入同一个元素是安全的，但插入计数会重复累加
     */
    void Add(std::string_view item) {
        auto hashes = utils::DoubleHash(*hasher_, item, length_);
        for (size_t i = 0; i < hash_num_; ++i) {
            bits_.set(hashes.Nth(i, length_));
        }
        ++count_;
    }

    /**
     * @brief 检查元素是否存在
     * @return true 表示元素可能存在，false 表示元素一定不存在
     *
     * @section false_positive 假阳性说明
     *
     * 如果元素插入过，Contains 一定返回 true。
     * 如果元素没插入过，Contains 很可能返回 false（但有误判可能）。
     * 插入数超过 capacity 后误判率会明显高于构造时的 p。
     */
    bool Contains(std::string_view item) const {
        auto hashes = utils::DoubleHash(*hasher_, item, length_);
        for (size_t i = 0; i < hash_num_; ++i) {
            if (!bits_.test(hashes.Nth(i, length_))) {
                return false;  // 一定不存在
            }
        }
        return true;  // 可能存在（可能是假阳性）
    }

    /**
     * @brief 并集：位数组按位或
     * @throw IncompatibleStructureError m、k 或哈希函数不同
     * @note 插入计数取两者最大值，只是近似
     */
    BloomFilter Union(const BloomFilter& other) const {
        CheckCompatible(other, "union");
        BloomFilter result(*this);
        result.bits_ |= other.bits_;
        result.count_ = std::max(count_, other.count_);
        return result;
    }

    /**
     * @brief 交集：位数组按位与
     * @throw IncompatibleStructureError m、k 或哈希函数不同
     * @note 插入计数取两者最小值；结果的误判率高于真实交集单独构建的过滤器
     */
    BloomFilter Intersection(const BloomFilter& other) const {
        CheckCompatible(other, "intersection");
        BloomFilter result(*this);
        result.bits_ &= other.bits_;
        result.count_ = std::min(count_, other.count_);
        return result;
    }

    void Reset() override {
        bits_.reset();
        count_ = 0;
    }

    Info GetInfo() const {
        Info info;
        info.size = length_;
        info.hash_count = hash_num_;
        info.capacity = capacity_;
        info.count = count_;
        info.bit_array_fill_ratio = static_cast<double>(bits_.count()) / static_cast<double>(length_);
        info.estimated_false_positive_rate = EstimatedFalsePositiveRate();
        info.memory_usage_bytes = bits_.num_blocks() * sizeof(uint64_t);
        info.hash_function = hasher_->name();
        info.overloaded = count_ > capacity_;
        return info;
    }

    InfoMap Describe() const override {
        auto info = GetInfo();
        InfoMap map;
        map["size"] = static_cast<uint64_t>(info.size);
        map["hash_count"] = static_cast<uint64_t>(info.hash_count);
        map["capacity"] = static_cast<uint64_t>(info.capacity);
        map["count"] = static_cast<uint64_t>(info.count);
        map["bit_array_fill_ratio"] = info.bit_array_fill_ratio;
        map["estimated_false_positive_rate"] = info.estimated_false_positive_rate;
        map["memory_usage_bytes"] = static_cast<uint64_t>(info.memory_usage_bytes);
        map["hash_function"] = info.hash_function;
        map["overloaded"] = info.overloaded;
        return map;
    }

    /// @brief 按当前插入数估计的误判率
    double EstimatedFalsePositiveRate() const {
        double k = static_cast<double>(hash_num_);
        double n = static_cast<double>(count_);
        double m = static_cast<double>(length_);
        return std::pow(1.0 - std::exp(-k * n / m), k);
    }

    /// @brief 获取位数组长度
    size_t length() const { return length_; }

    size_t hash_num() const { return hash_num_; }

    size_t capacity() const { return capacity_; }

    double false_positive_rate() const { return false_positive_rate_; }

    /// @brief 插入次数
    size_t count() const { return count_; }

private:
    void CheckCompatible(const BloomFilter& other, const char* op) const {
        if (length_ != other.length_ || hash_num_ != other.hash_num_) {
            throw IncompatibleStructureError(std::string("bloom filters must have the same size and hash count for ") + op);
        }
        if (hasher_->name() != other.hasher_->name()) {
            throw IncompatibleStructureError(std::string("bloom filters must share the hash function for ") + op);
        }
    }

    /**
     * @brief 根据元素数量和误判率计算位数组长度
     *
     * 数学推导：
     * m = -n * ln(p) / (ln(2))^2
     *
     * 当 p = 0.01 时，每个元素需要约 9.6 位
     */
    static size_t CalcLength(size_t n, double p) {
        double ln2 = std::log(2.0);
        double m = std::ceil(-static_cast<double>(n) * std::log(p) / (ln2 * ln2));
        return std::max<size_t>(1, static_cast<size_t>(m));
    }

    static size_t CalcHashNum(size_t m, size_t n) {
        double k = std::round(static_cast<double>(m) / static_cast<double>(n) * std::log(2.0));
        return std::max<size_t>(1, static_cast<size_t>(k));
    }

private:
    size_t capacity_;                           ///< 设计容量
    double false_positive_rate_;                ///< 目标误判率
    utils::HasherPtr hasher_;                   ///< 主哈希函数
    size_t length_{0};                          ///< 位数组长度
    size_t hash_num_{0};                        ///< 哈希函数数量
    size_t count_{0};                           ///< 插入次数
    boost::dynamic_bitset<uint64_t> bits_;      ///< 位数组
};

}  // namespace filter
}  // namespace sketchkit
