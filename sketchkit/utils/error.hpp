/**
 * @file error.hpp
 * @brief SketchKit 异常类型
 *
 * 所有概率数据结构共用的错误分类：
 * - ConfigurationError：构造参数非法（精度越界、宽度为 0 等）
 * - IncompatibleStructureError：合并/并集/交集时结构尺寸不一致
 * - NotFoundError：注册表中不存在该名字
 *
 * 容量溢出（Cuckoo 过滤器重定位失败、布隆过滤器超载）不是异常，
 * 通过返回值和 GetInfo() 暴露。
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sketchkit {

class SketchError : public std::runtime_error {
public:
    explicit SketchError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigurationError : public SketchError {
public:
    explicit ConfigurationError(const std::string& what) : SketchError(what) {}
};

class IncompatibleStructureError : public SketchError {
public:
    explicit IncompatibleStructureError(const std::string& what) : SketchError(what) {}
};

class NotFoundError : public SketchError {
public:
    explicit NotFoundError(const std::string& what) : SketchError(what) {}
};

}  // namespace sketchkit
