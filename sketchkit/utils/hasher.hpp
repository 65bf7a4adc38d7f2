/**
 * @file hasher.hpp
 * @brief 带种子的哈希函数接口
 *
 * 每个概率数据结构都持有一个 Hasher（共享、不可变）：
 * - 同一 (算法, seed, 输入) 永远得到同一个 64 位结果
 * - 只要求分布均匀，不要求抗碰撞
 *
 * @section double_hashing 双重哈希
 *
 * 需要 k 个哈希值时，不计算 k 次哈希，而是用两种不同算法得到 h1、h2：
 *   g_i(x) = (h1 + i * h2) mod range
 * 这是 Kirsch-Mitzenmacher 技巧，误判率与 k 个独立哈希渐近相同。
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace sketchkit {
namespace utils {

class Hasher {
public:
    virtual ~Hasher() = default;

    /**
     * @brief 计算 key 的 64 位哈希
     * @param key 任意字节串
     * @param seed 种子，不同种子视为不同的哈希函数
     */
    virtual uint64_t Hash(std::string_view key, uint64_t seed) const = 0;

    /// @brief 算法名，用于诊断信息
    virtual std::string name() const = 0;
};

/// @brief xxHash64 算法
class XXH64Hasher : public Hasher {
public:
    uint64_t Hash(std::string_view key, uint64_t seed) const override;
    std::string name() const override { return "xxh64"; }
};

/// @brief 64 位 FNV-1a，种子在 key 之前折叠进状态，输出经过 xxh64 的 avalanche 混合
class FNV1aHasher : public Hasher {
public:
    uint64_t Hash(std::string_view key, uint64_t seed) const override;
    std::string name() const override { return "fnv1a"; }
};

using HasherPtr = std::shared_ptr<const Hasher>;

/**
 * @brief 按名字创建哈希函数
 * @param name "xxh64" 或 "fnv1a"
 * @throw ConfigurationError 未知算法名
 */
HasherPtr MakeHasher(const std::string& name);

/// @brief 默认哈希函数（xxh64），进程内共享一个实例
HasherPtr DefaultHasher();

/// @brief 双重哈希使用的第二种算法（fnv1a）
const Hasher& SecondaryHasher();

/**
 * @brief 双重哈希的一对基值
 *
 * 使用示例：
 * @code
 * auto hashes = DoubleHash(*hasher, key, m);
 * for (size_t i = 0; i < k; ++i) {
 *     size_t pos = hashes.Nth(i, m);
 * }
 * @endcode
 */
struct HashPair {
    uint64_t h1;
    uint64_t h2;

    /// @brief 第 i 个派生位置 (h1 + i * h2) mod range
    size_t Nth(size_t i, size_t range) const {
        return static_cast<size_t>((h1 + static_cast<uint64_t>(i) * h2) % range);
    }
};

/**
 * @brief 用主哈希与 FNV-1a 计算 (h1, h2)
 *
 * h1、h2 都先对 range 取模，避免 i * h2 在 64 位上溢出后分布变差；
 * h2 取模后为 0 时置 1，保证 k 个位置不会全部重合。
 */
HashPair DoubleHash(const Hasher& primary, std::string_view key, size_t range);

}  // namespace utils
}  // namespace sketchkit
