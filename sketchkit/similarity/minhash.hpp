/**
 * @file minhash.hpp
 * @brief MinHash 相似度估计
 *
 * 用 num_perm 个线性置换 (a_i * h + b_i) mod P 模拟随机排列，
 * 签名第 i 位保存集合在第 i 个置换下的最小值。
 * 两个签名相等位的比例是 Jaccard 相似度的无偏估计，标准误差约 1/sqrt(num_perm)。
 *
 * P 取梅森素数 2^61 - 1，乘法用 128 位中间结果。
 */

#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "sketchkit/sketch.hpp"
#include "sketchkit/utils/error.hpp"
#include "sketchkit/utils/hasher.hpp"
#include "sketchkit/utils/random.hpp"

namespace sketchkit {
namespace similarity {

class MinHash : public Sketch {
public:
    static constexpr uint64_t kMersennePrime = (uint64_t{1} << 61) - 1;
    /// @brief 空签名的初始值（正无穷）
    static constexpr uint64_t kMaxHash = std::numeric_limits<uint64_t>::max();

    struct Info {
        size_t num_permutations;
        uint64_t seed;
        double standard_error;
        size_t memory_usage_bytes;
        std::string hash_function;
    };

    /**
     * @param num_perm 置换个数，越大越准，内存与之成正比
     * @param seed 置换参数与元素哈希的种子
     * @throw ConfigurationError num_perm 为 0
     */
    explicit MinHash(size_t num_perm = 128, uint64_t seed = 42,
                     utils::HasherPtr hasher = utils::DefaultHasher())
        : num_perm_(num_perm), seed_(seed), hasher_(std::move(hasher)) {
        if (num_perm_ == 0) {
            throw ConfigurationError("minhash num_perm must be positive");
        }
        if (!hasher_) {
            throw ConfigurationError("minhash requires a hash function");
        }
        signature_.assign(num_perm_, kMaxHash);
        utils::Random rng(seed_);
        params_.reserve(num_perm_);
        for (size_t i = 0; i < num_perm_; ++i) {
            uint64_t a = rng.Uniform(1, kMersennePrime - 1);
            uint64_t b = rng.Uniform(0, kMersennePrime - 1);
            params_.emplace_back(a, b);
        }
    }

    SketchType type() const override { return SketchType::kMinHash; }

    /// @brief 加入一个元素
    void Update(std::string_view item) {
        uint64_t h = hasher_->Hash(item, seed_);
        for (size_t i = 0; i < num_perm_; ++i) {
            uint64_t v = Permute(h, i);
            if (v < signature_[i]) {
                signature_[i] = v;
            }
        }
    }

    /**
     * @brief 加入一组元素，签名在多次调用间累积
     * @tparam Container 元素可转换为 std::string_view 的容器
     */
    template <typename Container,
              typename = std::enable_if_t<!std::is_convertible_v<const Container&, std::string_view>>>
    void Update(const Container& items) {
        for (const auto& item : items) {
            Update(std::string_view(item));
        }
    }

    /**
     * @brief 估计 Jaccard 相似度
     * @throw IncompatibleStructureError num_perm 或种子不同
     */
    double Jaccard(const MinHash& other) const {
        CheckCompatible(other, "compare");
        size_t matches = 0;
        for (size_t i = 0; i < num_perm_; ++i) {
            if (signature_[i] == other.signature_[i]) {
                ++matches;
            }
        }
        return static_cast<double>(matches) / static_cast<double>(num_perm_);
    }

    /// @brief 合并为并集的签名（逐位取最小）
    void Merge(const MinHash& other) {
        CheckCompatible(other, "merge");
        for (size_t i = 0; i < num_perm_; ++i) {
            signature_[i] = std::min(signature_[i], other.signature_[i]);
        }
    }

    void Reset() override {
        std::fill(signature_.begin(), signature_.end(), kMaxHash);
    }

    Info GetInfo() const {
        Info info;
        info.num_permutations = num_perm_;
        info.seed = seed_;
        info.standard_error = 1.0 / std::sqrt(static_cast<double>(num_perm_));
        info.memory_usage_bytes = signature_.size() * sizeof(uint64_t)
                                + params_.size() * sizeof(std::pair<uint64_t, uint64_t>);
        info.hash_function = hasher_->name();
        return info;
    }

    InfoMap Describe() const override {
        auto info = GetInfo();
        InfoMap map;
        map["num_permutations"] = static_cast<uint64_t>(info.num_permutations);
        map["seed"] = info.seed;
        map["standard_error"] = info.standard_error;
        map["memory_usage_bytes"] = static_cast<uint64_t>(info.memory_usage_bytes);
        map["hash_function"] = info.hash_function;
        return map;
    }

    size_t num_perm() const { return num_perm_; }

    uint64_t seed() const { return seed_; }

    const std::vector<uint64_t>& signature() const { return signature_; }

    /// @brief 是否还没有见过任何元素
    bool empty() const {
        return std::all_of(signature_.begin(), signature_.end(),
                           [](uint64_t v) { return v == kMaxHash; });
    }

private:
    // (a * h + b) mod (2^61 - 1)
    uint64_t Permute(uint64_t h, size_t i) const {
        unsigned __int128 x = static_cast<unsigned __int128>(params_[i].first) * h + params_[i].second;
        uint64_t lo = static_cast<uint64_t>(x & kMersennePrime);
        uint64_t hi = static_cast<uint64_t>(x >> 61);
        // 2^61 ≡ 1 (mod P)，hi 最多 64 位，再折叠一次
        unsigned __int128 y = static_cast<unsigned __int128>(lo) + hi;
        uint64_t r = static_cast<uint64_t>(y & kMersennePrime) + static_cast<uint64_t>(y >> 61);
        return r >= kMersennePrime ? r - kMersennePrime : r;
    }

    void CheckCompatible(const MinHash& other, const char* op) const {
        if (num_perm_ != other.num_perm_) {
            throw IncompatibleStructureError(std::string("cannot ") + op
                                             + " minhash signatures with different numbers of permutations");
        }
        if (seed_ != other.seed_ || hasher_->name() != other.hasher_->name()) {
            throw IncompatibleStructureError(std::string("cannot ") + op
                                             + " minhash signatures built with different seeds");
        }
    }

private:
    size_t num_perm_;
    uint64_t seed_;
    utils::HasherPtr hasher_;
    std::vector<std::pair<uint64_t, uint64_t>> params_;   ///< 每个置换的 (a, b)
    std::vector<uint64_t> signature_;
};

}  // namespace similarity
}  // namespace sketchkit
