/**
 * @file sketch.hpp
 * @brief 概率数据结构公共基类
 *
 * 注册表只通过这个接口管理各种结构：
 * - type()：结构类型
 * - Reset()：清空到刚构造时的状态
 * - Describe()：扁平化的诊断信息，字段名与各结构 GetInfo() 一致
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace sketchkit {

using InfoValue = std::variant<bool, uint64_t, double, std::string>;
using InfoMap = std::map<std::string, InfoValue>;

/// @brief 诊断值转字符串（日志用）
std::string ToString(const InfoValue& value);

enum class SketchType {
    kBloomFilter,
    kHyperLogLog,
    kCountMinSketch,
    kCuckooFilter,
    kMinHash,
    kTopK,
};

const char* SketchTypeName(SketchType type);

class Sketch {
public:
    virtual ~Sketch() = default;

    virtual SketchType type() const = 0;

    virtual void Reset() = 0;

    virtual InfoMap Describe() const = 0;
};

}  // namespace sketchkit
