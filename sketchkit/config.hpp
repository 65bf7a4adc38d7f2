/**
 * @file config.hpp
 * @brief SketchKit 配置类
 *
 * 提供统一的配置管理，支持：
 * - 各结构的默认构造参数（注册表创建结构时省略的参数取这里）
 * - 随机种子与哈希算法
 * - 日志配置
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace sketchkit {

/**
 * @brief SketchKit 配置
 */
struct SketchConfig {
    // ============ 布隆过滤器 ============
    size_t bloom_capacity = 10000;             ///< 预期元素数
    double bloom_false_positive_rate = 0.01;   ///< 目标误判率

    // ============ HyperLogLog ============
    int hll_precision = 14;                    ///< 精度 p，寄存器数 2^p

    // ============ Count-Min Sketch ============
    size_t cms_width = 1000;                   ///< 每行计数器数
    size_t cms_depth = 5;                      ///< 行数

    // ============ Cuckoo 过滤器 ============
    size_t cuckoo_capacity = 10000;            ///< 预期元素数
    size_t cuckoo_bucket_size = 4;             ///< 每桶槽位数
    size_t cuckoo_fingerprint_size = 8;        ///< 指纹位数
    size_t cuckoo_max_relocations = 500;       ///< 单次插入最多踢出次数

    // ============ MinHash ============
    size_t minhash_num_perm = 128;             ///< 置换个数
    uint64_t minhash_seed = 42;                ///< 置换参数种子

    // ============ Top-K ============
    size_t topk_k = 10;                        ///< 跟踪的元素个数
    size_t topk_width = 1000;                  ///< 内部 sketch 宽度
    size_t topk_depth = 5;                     ///< 内部 sketch 深度

    // ============ 通用 ============
    uint64_t seed = 0;                         ///< CMS 行种子、Cuckoo 踢出的随机种子
    std::string hash_function = "xxh64";      ///< xxh64 或 fnv1a

    // ============ 日志配置 ============
    bool verbose_logging = false;              ///< 详细日志
    std::string log_level = "INFO";            ///< DEBUG / INFO / WARN / ERROR

    /**
     * @brief 验证配置有效性
     * @return true 配置有效，false 配置无效
     */
    bool Validate() const {
        if (bloom_capacity == 0) {
            return false;
        }
        if (!(bloom_false_positive_rate > 0.0 && bloom_false_positive_rate < 1.0)) {
            return false;
        }
        if (hll_precision < 4 || hll_precision > 16) {
            return false;
        }
        if (cms_width == 0 || cms_depth == 0) {
            return false;
        }
        if (cuckoo_capacity == 0 || cuckoo_bucket_size == 0) {
            return false;
        }
        if (cuckoo_fingerprint_size == 0 || cuckoo_fingerprint_size > 32) {
            return false;
        }
        if (minhash_num_perm == 0) {
            return false;
        }
        if (topk_k == 0 || topk_width == 0 || topk_depth == 0) {
            return false;
        }
        if (hash_function != "xxh64" && hash_function != "fnv1a") {
            return false;
        }
        if (LogLevelRank(log_level) < 0) {
            return false;
        }
        return true;
    }

    /**
     * @brief level 级别的日志是否输出
     *
     * verbose_logging 关闭时什么都不输出；打开时输出不低于 log_level 的日志。
     */
    bool ShouldLog(const std::string& level) const {
        return verbose_logging && LogLevelRank(level) >= LogLevelRank(log_level);
    }

    /// @brief DEBUG=0, INFO=1, WARN=2, ERROR=3，未知级别为 -1
    static int LogLevelRank(const std::string& level) {
        if (level == "DEBUG") {
            return 0;
        }
        if (level == "INFO") {
            return 1;
        }
        if (level == "WARN") {
            return 2;
        }
        if (level == "ERROR") {
            return 3;
        }
        return -1;
    }

    /**
     * @brief 从文件加载配置
     * @param path 配置文件路径，每行 key = value，# 开头为注释
     * @return true 加载成功，false 文件无法读取或存在非法值
     */
    bool LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief 设置单个配置项
     * @return false 值无法解析；未知 key 打印警告后忽略，返回 true
     */
    bool Set(const std::string& key, const std::string& value);

    /**
     * @brief 从环境变量加载配置
     *
     * 每个配置项对应 SKETCHKIT_<大写 key>，例如：
     * - SKETCHKIT_HLL_PRECISION
     * - SKETCHKIT_CMS_WIDTH
     * - SKETCHKIT_VERBOSE_LOGGING
     */
    void LoadFromEnv();
};

/**
 * @brief 默认配置
 * @return 默认配置实例
 */
inline SketchConfig DefaultConfig() {
    return SketchConfig();
}

}  // namespace sketchkit
