/**
 * @file cuckoo_filter.hpp
 * @brief Cuckoo 过滤器 - 支持删除的近似集合
 *
 * 只存储元素的指纹（fingerprint），每个指纹有两个候选桶：
 * - i1 = hash(item) mod size
 * - i2 = (i1 XOR hash(fingerprint)) mod size
 *
 * 桶数取 2 的幂，XOR 映射在 [0, size) 上是对合的：
 * 由任一候选桶和指纹都能算出另一个候选桶，重定位后的指纹依然能被找到。
 *
 * @section kick 踢出（relocation）
 * ┌─────────────────────────────────────────────────────────────────┐
 * │  两个候选桶都满：                                                 │
 * │    1. 随机选一个桶，随机踢出其中一个指纹 victim                     │
 * │    2. 把 victim 放到它的另一个候选桶                               │
 * │    3. 还是满就继续踢，最多 max_relocations 次                      │
 * │  次数用完：按原路径回滚，Add 返回 false                            │
 * └─────────────────────────────────────────────────────────────────┘
 *
 * 回滚保证失败的插入不会改变过滤器内容，已插入的元素永远不会被漏判，
 * 任何桶也不会超过 bucket_size 个指纹。
 */

#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sketchkit/sketch.hpp"
#include "sketchkit/utils/error.hpp"
#include "sketchkit/utils/hasher.hpp"
#include "sketchkit/utils/random.hpp"

namespace sketchkit {
namespace filter {

class CuckooFilter : public Sketch {
public:
    static constexpr size_t kMaxFingerprintBits = 32;

    struct Info {
        size_t size;                          ///< 桶数
        size_t bucket_size;                   ///< 每桶槽位数
        size_t fingerprint_size;              ///< 指纹位数
        size_t count;                         ///< 存活指纹数
        size_t total_slots;
        double load_factor;                   ///< count / total_slots
        double estimated_false_positive_rate; ///< 约 2 * bucket_size * load / 2^f
        uint64_t failed_inserts;              ///< 重定位次数用尽的插入次数
        size_t memory_usage_bytes;
        std::string hash_function;
    };

    /**
     * @param capacity 预期元素数
     * @param bucket_size 每个桶的槽位数，默认 4
     * @param fingerprint_size 指纹位数，[1, 32]
     * @param max_relocations 单次插入最多踢出次数
     * @param seed 踢出时随机选择的种子
     * @throw ConfigurationError 参数非法
     */
    explicit CuckooFilter(size_t capacity, size_t bucket_size = 4, size_t fingerprint_size = 8,
                          size_t max_relocations = 500, uint64_t seed = 0,
                          utils::HasherPtr hasher = utils::DefaultHasher())
        : capacity_(capacity), bucket_size_(bucket_size), fingerprint_size_(fingerprint_size),
          max_relocations_(max_relocations), seed_(seed), hasher_(std::move(hasher)), rng_(seed) {
        if (capacity_ == 0) {
            throw ConfigurationError("cuckoo filter capacity must be positive");
        }
        if (bucket_size_ == 0) {
            throw ConfigurationError("cuckoo filter bucket size must be positive");
        }
        if (fingerprint_size_ == 0 || fingerprint_size_ > kMaxFingerprintBits) {
            throw ConfigurationError("cuckoo filter fingerprint size must be between 1 and 32 bits");
        }
        if (!hasher_) {
            throw ConfigurationError("cuckoo filter requires a hash function");
        }
        size_ = CalcSize(capacity_, bucket_size_);
        fingerprint_mask_ = fingerprint_size_ == kMaxFingerprintBits
            ? 0xffffffffu
            : static_cast<uint32_t>((uint64_t{1} << fingerprint_size_) - 1);
        table_.assign(size_ * bucket_size_, kEmpty);
    }

    SketchType type() const override { return SketchType::kCuckooFilter; }

    /**
     * @brief 插入元素
     * @return true 插入成功；false 重定位次数用尽，过滤器内容不变
     */
    bool Add(std::string_view item) {
        uint32_t fp;
        size_t i1, i2;
        Locate(item, fp, i1, i2);
        if (InsertIntoBucket(i1, fp) || InsertIntoBucket(i2, fp)) {
            ++count_;
            return true;
        }

        struct Kick {
            size_t bucket;
            size_t slot;
        };
        std::vector<Kick> path;
        path.reserve(std::min<size_t>(max_relocations_, 64));

        uint32_t victim = fp;
        size_t i = rng_.Index(2) == 0 ? i1 : i2;
        for (size_t n = 0; n < max_relocations_; ++n) {
            size_t slot = rng_.Index(bucket_size_);
            std::swap(table_[i * bucket_size_ + slot], victim);
            path.push_back({i, slot});
            i = AltIndex(i, victim);
            if (InsertIntoBucket(i, victim)) {
                ++count_;
                return true;
            }
        }

        // 回滚：逆序交换回去，victim 最终回到新元素的指纹
        for (auto it = path.rbegin(); it != path.rend(); ++it) {
            std::swap(table_[it->bucket * bucket_size_ + it->slot], victim);
        }
        ++failed_inserts_;
        return false;
    }

    bool Contains(std::string_view item) const {
        uint32_t fp;
        size_t i1, i2;
        Locate(item, fp, i1, i2);
        return FindInBucket(i1, fp) != kNotFound || FindInBucket(i2, fp) != kNotFound;
    }

    /**
     * @brief 删除元素
     * @return 是否删除了一个指纹
     * @note 只能删除确实插入过的元素，否则可能误删同指纹的其他元素
     */
    bool Remove(std::string_view item) {
        uint32_t fp;
        size_t i1, i2;
        Locate(item, fp, i1, i2);
        for (size_t bucket : {i1, i2}) {
            size_t slot = FindInBucket(bucket, fp);
            if (slot != kNotFound) {
                table_[bucket * bucket_size_ + slot] = kEmpty;
                --count_;
                return true;
            }
        }
        return false;
    }

    void Reset() override {
        std::fill(table_.begin(), table_.end(), kEmpty);
        count_ = 0;
        failed_inserts_ = 0;
        rng_.Seed(seed_);
    }

    Info GetInfo() const {
        Info info;
        info.size = size_;
        info.bucket_size = bucket_size_;
        info.fingerprint_size = fingerprint_size_;
        info.count = count_;
        info.total_slots = table_.size();
        info.load_factor = static_cast<double>(count_) / static_cast<double>(info.total_slots);
        info.estimated_false_positive_rate = std::min(
            1.0, 2.0 * static_cast<double>(bucket_size_) * info.load_factor
                     / std::ldexp(1.0, static_cast<int>(fingerprint_size_)));
        info.failed_inserts = failed_inserts_;
        info.memory_usage_bytes = table_.size() * sizeof(uint32_t);
        info.hash_function = hasher_->name();
        return info;
    }

    InfoMap Describe() const override {
        auto info = GetInfo();
        InfoMap map;
        map["size"] = static_cast<uint64_t>(info.size);
        map["bucket_size"] = static_cast<uint64_t>(info.bucket_size);
        map["fingerprint_size"] = static_cast<uint64_t>(info.fingerprint_size);
        map["count"] = static_cast<uint64_t>(info.count);
        map["total_slots"] = static_cast<uint64_t>(info.total_slots);
        map["load_factor"] = info.load_factor;
        map["estimated_false_positive_rate"] = info.estimated_false_positive_rate;
        map["failed_inserts"] = info.failed_inserts;
        map["memory_usage_bytes"] = static_cast<uint64_t>(info.memory_usage_bytes);
        map["hash_function"] = info.hash_function;
        return map;
    }

    size_t size() const { return size_; }

    size_t bucket_size() const { return bucket_size_; }

    size_t count() const { return count_; }

    uint64_t failed_inserts() const { return failed_inserts_; }

private:
    static constexpr uint32_t kEmpty = 0;
    static constexpr size_t kNotFound = static_cast<size_t>(-1);
    static constexpr uint64_t kFingerprintSeed = 0x5bd1e995ULL;

    // ceil(capacity / bucket_size * 1.05) 向上取整到 2 的幂
    static size_t CalcSize(size_t capacity, size_t bucket_size) {
        double buckets = std::ceil(static_cast<double>(capacity) / static_cast<double>(bucket_size) * 1.05);
        size_t base = std::max<size_t>(1, static_cast<size_t>(buckets));
        size_t size = 1;
        while (size < base) {
            size <<= 1;
        }
        return size;
    }

    void Locate(std::string_view item, uint32_t& fp, size_t& i1, size_t& i2) const {
        uint64_t h = hasher_->Hash(item, 0);
        fp = static_cast<uint32_t>(h >> 32) & fingerprint_mask_;
        if (fp == kEmpty) {
            fp = 1;  // 全零指纹表示空槽
        }
        i1 = static_cast<size_t>(h & (size_ - 1));
        i2 = AltIndex(i1, fp);
    }

    size_t AltIndex(size_t index, uint32_t fp) const {
        char bytes[sizeof(fp)];
        memcpy(bytes, &fp, sizeof(fp));
        uint64_t h = hasher_->Hash(std::string_view(bytes, sizeof(bytes)), kFingerprintSeed);
        return (index ^ static_cast<size_t>(h)) & (size_ - 1);
    }

    bool InsertIntoBucket(size_t bucket, uint32_t fp) {
        uint32_t* slots = &table_[bucket * bucket_size_];
        for (size_t j = 0; j < bucket_size_; ++j) {
            if (slots[j] == kEmpty) {
                slots[j] = fp;
                return true;
            }
        }
        return false;
    }

    size_t FindInBucket(size_t bucket, uint32_t fp) const {
        const uint32_t* slots = &table_[bucket * bucket_size_];
        for (size_t j = 0; j < bucket_size_; ++j) {
            if (slots[j] == fp) {
                return j;
            }
        }
        return kNotFound;
    }

private:
    size_t capacity_;
    size_t bucket_size_;
    size_t fingerprint_size_;
    size_t max_relocations_;
    uint64_t seed_;
    utils::HasherPtr hasher_;
    utils::Random rng_;                 ///< 踢出时的随机选择
    size_t size_{0};                    ///< 桶数（2 的幂）
    uint32_t fingerprint_mask_{0};
    std::vector<uint32_t> table_;       ///< size_ * bucket_size_ 个槽，0 表示空
    size_t count_{0};
    uint64_t failed_inserts_{0};
};

}  // namespace filter
}  // namespace sketchkit
