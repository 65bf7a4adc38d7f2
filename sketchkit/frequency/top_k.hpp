#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sketchkit/frequency/count_min_sketch.hpp"
#include "sketchkit/sketch.hpp"
#include "sketchkit/utils/error.hpp"

namespace sketchkit {

namespace frequency {

/**
 * @brief 近似 Top-K 高频元素
 *
 * 频率由内部的 CountMinSketch 估计，另外维护一个最多 k 项、
 * 按估计值降序排列的列表。流中边界附近的元素可能进出列表，这是近似结果，不算错误。
 */
class TopK : public Sketch {
public:
    using Entry = std::pair<std::string, uint64_t>;

    struct Info {
        size_t k;
        size_t items_tracked;
        size_t memory_usage_bytes;      ///< sketch 计数器 + 跟踪列表
        CountMinSketch::Info sketch_info;
    };

    /**
     * @param k 跟踪的元素个数
     * @param width 内部 CountMinSketch 宽度
     * @param depth 内部 CountMinSketch 深度
     * @throw ConfigurationError k 为 0，或 sketch 参数非法
     */
    TopK(size_t k = 10, size_t width = 1000, size_t depth = 5, uint64_t seed = 0,
         utils::HasherPtr hasher = utils::DefaultHasher())
        : k_(k), sketch_(width, depth, seed, std::move(hasher)) {
        if (k_ == 0) {
            throw ConfigurationError("topk k must be positive");
        }
        top_items_.reserve(k_ + 1);
    }

    SketchType type() const override { return SketchType::kTopK; }

    void Add(std::string_view item, uint64_t count = 1) {
        sketch_.Add(item, count);
        uint64_t estimate = sketch_.EstimateCount(item);

        auto it = std::find_if(top_items_.begin(), top_items_.end(),
                               [item](const Entry& entry) { return entry.first == item; });
        if (it != top_items_.end()) {
            it->second = estimate;
            Sort();
            return;
        }
        if (top_items_.size() < k_) {
            top_items_.emplace_back(std::string(item), estimate);
            Sort();
            return;
        }
        // 只有严格大于当前最小值才替换
        if (estimate > top_items_.back().second) {
            top_items_.back() = Entry(std::string(item), estimate);
            Sort();
        }
    }

    /// @brief 当前的 Top-K 列表（按估计值降序）
    std::vector<Entry> GetTopK() const {
        return top_items_;
    }

    void Reset() override {
        sketch_.Reset();
        top_items_.clear();
    }

    Info GetInfo() const {
        Info info;
        info.k = k_;
        info.items_tracked = top_items_.size();
        info.sketch_info = sketch_.GetInfo();
        info.memory_usage_bytes = info.sketch_info.memory_usage_bytes + TrackedBytes();
        return info;
    }

    InfoMap Describe() const override {
        InfoMap map;
        map["k"] = static_cast<uint64_t>(k_);
        map["items_tracked"] = static_cast<uint64_t>(top_items_.size());
        map["memory_usage_bytes"] = static_cast<uint64_t>(sketch_.GetInfo().memory_usage_bytes + TrackedBytes());
        for (auto& [key, value] : sketch_.Describe()) {
            map["sketch_" + key] = value;
        }
        return map;
    }

    size_t k() const { return k_; }

    const CountMinSketch& sketch() const { return sketch_; }

private:
    size_t TrackedBytes() const {
        size_t bytes = top_items_.size() * sizeof(Entry);
        for (auto& entry : top_items_) {
            bytes += entry.first.size();
        }
        return bytes;
    }

    // 估计值相同的元素保持先来后到
    void Sort() {
        std::stable_sort(top_items_.begin(), top_items_.end(),
                         [](const Entry& a, const Entry& b) { return a.second > b.second; });
    }

private:
    size_t k_;
    CountMinSketch sketch_;
    std::vector<Entry> top_items_;
};

} // frequency
} // sketchkit
