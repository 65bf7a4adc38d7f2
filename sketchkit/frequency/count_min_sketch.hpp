#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sketchkit/sketch.hpp"
#include "sketchkit/utils/error.hpp"
#include "sketchkit/utils/hasher.hpp"
#include "sketchkit/utils/random.hpp"

namespace sketchkit {

namespace frequency {

/**
 * @brief Count-Min Sketch 频率估计
 *
 * depth 行 × width 列的计数器，每行一个种子：
 * - Add：每行哈希到一列，计数器加 count
 * - EstimateCount：取 depth 个计数器的最小值，永远 >= 真实频率
 *
 * 以 1 - e^-depth 的概率，高估量不超过 (e / width) * total_items。
 * 只保存计数器，不保存任何 key。
 */
class CountMinSketch : public Sketch {
public:
    struct Info {
        size_t width;
        size_t depth;
        uint64_t total_items;
        double error_bound;          ///< (e / width) * total_items
        double error_rate;           ///< e / width
        double failure_probability;  ///< e^-depth
        size_t memory_usage_bytes;
        std::string hash_function;
    };

    /**
     * @param width 每行计数器个数
     * @param depth 行数（哈希函数个数）
     * @param seed 行种子由它派生，种子相同的两个 sketch 才能合并
     * @throw ConfigurationError width 或 depth 为 0
     */
    CountMinSketch(size_t width = 1000, size_t depth = 5, uint64_t seed = 0,
                   utils::HasherPtr hasher = utils::DefaultHasher())
        : width_(width), depth_(depth), seed_(seed), hasher_(std::move(hasher)) {
        if (width_ == 0 || depth_ == 0) {
            throw ConfigurationError("count-min sketch width and depth must be positive");
        }
        if (!hasher_) {
            throw ConfigurationError("count-min sketch requires a hash function");
        }
        data_.assign(width_ * depth_, 0);
        utils::Random rng(seed_);
        row_seeds_.reserve(depth_);
        for (size_t i = 0; i < depth_; i++) {
            row_seeds_.emplace_back(rng.Next());
        }
    }

    SketchType type() const override { return SketchType::kCountMinSketch; }

    void Add(std::string_view item, uint64_t count = 1) {
        for (size_t i = 0; i < depth_; i++) {
            data_[i * width_ + Column(item, i)] += count;
        }
        total_items_ += count;
    }

    uint64_t EstimateCount(std::string_view item) const {
        uint64_t res = data_[Column(item, 0)];
        for (size_t i = 1; i < depth_; i++) {
            res = std::min(res, data_[i * width_ + Column(item, i)]);
        }
        return res;
    }

    uint64_t Estimate(std::string_view item) const {
        return EstimateCount(item);
    }

    double EstimateRelativeFrequency(std::string_view item) const {
        if (total_items_ == 0) {
            return 0.0;
        }
        return static_cast<double>(EstimateCount(item)) / static_cast<double>(total_items_);
    }

    /**
     * @brief 逐元素相加
     * @throw IncompatibleStructureError 宽度、深度或行种子不同
     */
    void Merge(const CountMinSketch& other) {
        if (width_ != other.width_ || depth_ != other.depth_) {
            throw IncompatibleStructureError("cannot merge count-min sketches with different dimensions");
        }
        if (row_seeds_ != other.row_seeds_ || hasher_->name() != other.hasher_->name()) {
            throw IncompatibleStructureError("cannot merge count-min sketches with different hash functions");
        }
        for (size_t i = 0; i < data_.size(); i++) {
            data_[i] += other.data_[i];
        }
        total_items_ += other.total_items_;
    }

    void Reset() override {
        std::fill(data_.begin(), data_.end(), 0);
        total_items_ = 0;
    }

    Info GetInfo() const {
        Info info;
        info.width = width_;
        info.depth = depth_;
        info.total_items = total_items_;
        info.error_rate = std::exp(1.0) / static_cast<double>(width_);
        info.error_bound = info.error_rate * static_cast<double>(total_items_);
        info.failure_probability = std::exp(-static_cast<double>(depth_));
        info.memory_usage_bytes = data_.size() * sizeof(uint64_t);
        info.hash_function = hasher_->name();
        return info;
    }

    InfoMap Describe() const override {
        auto info = GetInfo();
        InfoMap map;
        map["width"] = static_cast<uint64_t>(info.width);
        map["depth"] = static_cast<uint64_t>(info.depth);
        map["total_items"] = info.total_items;
        map["error_bound"] = info.error_bound;
        map["error_rate"] = info.error_rate;
        map["failure_probability"] = info.failure_probability;
        map["memory_usage_bytes"] = static_cast<uint64_t>(info.memory_usage_bytes);
        map["hash_function"] = info.hash_function;
        return map;
    }

    size_t width() const { return width_; }

    size_t depth() const { return depth_; }

    uint64_t seed() const { return seed_; }

    uint64_t total_items() const { return total_items_; }

private:
    size_t Column(std::string_view item, size_t row) const {
        return static_cast<size_t>(hasher_->Hash(item, row_seeds_[row]) % width_);
    }

private:
    size_t width_;
    size_t depth_;
    uint64_t seed_;
    utils::HasherPtr hasher_;
    std::vector<uint64_t> row_seeds_;
    std::vector<uint64_t> data_;        ///< 行优先，depth_ * width_
    uint64_t total_items_{0};
};

} // frequency
} // sketchkit
