/**
 * @file registry.hpp
 * @brief 概率数据结构注册表
 *
 * 按名字创建、查找、删除各种结构，并统一导出诊断信息、统一清空。
 * 注册表是普通的值对象，由调用方构造并传递，没有进程级单例；
 * 和各结构一样不做内部同步，多线程使用需要调用方加锁。
 *
 * @section duplicate_name 重名策略
 * 用已存在的名字再次创建会覆盖：旧结构被销毁，新结构替换它。
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "sketchkit/cardinality/hyperloglog.hpp"
#include "sketchkit/config.hpp"
#include "sketchkit/filter/bloom_filter.hpp"
#include "sketchkit/filter/cuckoo_filter.hpp"
#include "sketchkit/frequency/count_min_sketch.hpp"
#include "sketchkit/frequency/top_k.hpp"
#include "sketchkit/similarity/minhash.hpp"
#include "sketchkit/sketch.hpp"
#include "sketchkit/utils/error.hpp"
#include "sketchkit/utils/hasher.hpp"

namespace sketchkit {

class StructureRegistry {
public:
    /**
     * @param config 默认参数与日志配置
     * @throw ConfigurationError 配置非法
     */
    explicit StructureRegistry(const SketchConfig& config = DefaultConfig());

    StructureRegistry(const StructureRegistry&) = delete;
    StructureRegistry& operator=(const StructureRegistry&) = delete;
    StructureRegistry(StructureRegistry&&) = default;
    StructureRegistry& operator=(StructureRegistry&&) = default;

    // ============ 创建 ============
    // 省略的参数取 config 中的默认值

    filter::BloomFilter& CreateBloomFilter(const std::string& name);
    filter::BloomFilter& CreateBloomFilter(const std::string& name, size_t capacity,
                                           double false_positive_rate);

    cardinality::HyperLogLog& CreateHyperLogLog(const std::string& name);
    cardinality::HyperLogLog& CreateHyperLogLog(const std::string& name, int precision);

    frequency::CountMinSketch& CreateCountMinSketch(const std::string& name);
    frequency::CountMinSketch& CreateCountMinSketch(const std::string& name, size_t width, size_t depth);

    filter::CuckooFilter& CreateCuckooFilter(const std::string& name);
    filter::CuckooFilter& CreateCuckooFilter(const std::string& name, size_t capacity, size_t bucket_size);

    similarity::MinHash& CreateMinHash(const std::string& name);
    similarity::MinHash& CreateMinHash(const std::string& name, size_t num_perm);

    frequency::TopK& CreateTopK(const std::string& name);
    frequency::TopK& CreateTopK(const std::string& name, size_t k, size_t width, size_t depth);

    // ============ 查找 / 删除 ============

    /// @throw NotFoundError 名字不存在
    Sketch& Get(const std::string& name);
    const Sketch& Get(const std::string& name) const;

    /**
     * @brief 按类型获取
     * @throw NotFoundError 名字不存在或类型不符
     */
    template <typename T>
    T& Get(const std::string& name) {
        auto* ptr = dynamic_cast<T*>(&Get(name));
        if (ptr == nullptr) {
            throw NotFoundError("structure '" + name + "' has a different type");
        }
        return *ptr;
    }

    /// @throw NotFoundError 名字不存在
    void Remove(const std::string& name);

    bool Has(const std::string& name) const {
        return structures_.count(name) > 0;
    }

    size_t size() const { return structures_.size(); }

    /// @brief 所有名字（有序）
    std::vector<std::string> names() const;

    // ============ 批量操作 ============

    /// @brief 名字 -> 该结构的诊断信息
    std::map<std::string, InfoMap> GetAllInfo() const;

    /// @brief 清空所有结构到初始状态
    void ResetAll();

    const SketchConfig& config() const { return config_; }

private:
    template <typename T>
    T& Register(const std::string& name, std::unique_ptr<T> structure) {
        T& ref = *structure;
        auto it = structures_.find(name);
        if (it != structures_.end()) {
            if (config_.ShouldLog("INFO")) {
                std::cout << "registry: replace " << SketchTypeName(it->second->type())
                          << " '" << name << "'" << std::endl;
            }
            it->second = std::move(structure);
        } else {
            structures_.emplace(name, std::move(structure));
        }
        if (config_.ShouldLog("INFO")) {
            std::cout << "registry: create " << SketchTypeName(ref.type()) << " '" << name << "'" << std::endl;
        }
        return ref;
    }

private:
    SketchConfig config_;
    utils::HasherPtr hasher_;       ///< 按 config.hash_function 创建，所有结构共享
    std::unordered_map<std::string, std::unique_ptr<Sketch>> structures_;
};

}  // namespace sketchkit
