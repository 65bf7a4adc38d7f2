#pragma once
#include <cstddef>
#include <cstdint>
#include <random>

namespace sketchkit {
namespace utils {

/**
 * @brief 可复现的伪随机源
 *
 * 所有需要随机性的结构（Cuckoo 过滤器踢出、MinHash 置换参数、
 * CountMinSketch 行种子）都显式持有一个 Random，没有进程级全局状态，
 * 同一个种子在任何平台上产生同一序列。
 */
class Random {
public:
    explicit Random(uint64_t seed = 0) : engine_(MixSeed(seed)) {}

    /// @brief 下一个 64 位随机数
    uint64_t Next() {
        return engine_();
    }

    /**
     * @brief [lo, hi] 区间内的随机数
     *
     * 不用 std::uniform_int_distribution，因为它的输出依赖标准库实现，
     * 不同平台上同一种子会得到不同结果。
     */
    uint64_t Uniform(uint64_t lo, uint64_t hi);

    /// @brief [0, n) 区间内的随机下标，n 必须大于 0
    size_t Index(size_t n) {
        return static_cast<size_t>(Next() % n);
    }

    void Seed(uint64_t seed) {
        engine_.seed(MixSeed(seed));
    }

    /// @brief splitmix64，把相邻的小种子打散到整个 64 位空间
    static uint64_t MixSeed(uint64_t seed);

private:
    std::mt19937_64 engine_;
};

}  // namespace utils
}  // namespace sketchkit
