#include "sketchkit/registry.hpp"

#include <algorithm>
#include <iostream>

namespace sketchkit {

StructureRegistry::StructureRegistry(const SketchConfig& config) : config_(config) {
    if (!config_.Validate()) {
        throw ConfigurationError("invalid sketch config");
    }
    hasher_ = utils::MakeHasher(config_.hash_function);
}

filter::BloomFilter& StructureRegistry::CreateBloomFilter(const std::string& name) {
    return CreateBloomFilter(name, config_.bloom_capacity, config_.bloom_false_positive_rate);
}

filter::BloomFilter& StructureRegistry::CreateBloomFilter(const std::string& name, size_t capacity,
                                                          double false_positive_rate) {
    return Register(name, std::make_unique<filter::BloomFilter>(capacity, false_positive_rate, hasher_));
}

cardinality::HyperLogLog& StructureRegistry::CreateHyperLogLog(const std::string& name) {
    return CreateHyperLogLog(name, config_.hll_precision);
}

cardinality::HyperLogLog& StructureRegistry::CreateHyperLogLog(const std::string& name, int precision) {
    return Register(name, std::make_unique<cardinality::HyperLogLog>(precision, hasher_));
}

frequency::CountMinSketch& StructureRegistry::CreateCountMinSketch(const std::string& name) {
    return CreateCountMinSketch(name, config_.cms_width, config_.cms_depth);
}

frequency::CountMinSketch& StructureRegistry::CreateCountMinSketch(const std::string& name, size_t width,
                                                                   size_t depth) {
    return Register(name, std::make_unique<frequency::CountMinSketch>(width, depth, config_.seed, hasher_));
}

filter::CuckooFilter& StructureRegistry::CreateCuckooFilter(const std::string& name) {
    return CreateCuckooFilter(name, config_.cuckoo_capacity, config_.cuckoo_bucket_size);
}

filter::CuckooFilter& StructureRegistry::CreateCuckooFilter(const std::string& name, size_t capacity,
                                                            size_t bucket_size) {
    return Register(name, std::make_unique<filter::CuckooFilter>(
        capacity, bucket_size, config_.cuckoo_fingerprint_size, config_.cuckoo_max_relocations,
        config_.seed, hasher_));
}

similarity::MinHash& StructureRegistry::CreateMinHash(const std::string& name) {
    return CreateMinHash(name, config_.minhash_num_perm);
}

similarity::MinHash& StructureRegistry::CreateMinHash(const std::string& name, size_t num_perm) {
    return Register(name, std::make_unique<similarity::MinHash>(num_perm, config_.minhash_seed, hasher_));
}

frequency::TopK& StructureRegistry::CreateTopK(const std::string& name) {
    return CreateTopK(name, config_.topk_k, config_.topk_width, config_.topk_depth);
}

frequency::TopK& StructureRegistry::CreateTopK(const std::string& name, size_t k, size_t width, size_t depth) {
    return Register(name, std::make_unique<frequency::TopK>(k, width, depth, config_.seed, hasher_));
}

Sketch& StructureRegistry::Get(const std::string& name) {
    auto it = structures_.find(name);
    if (it == structures_.end()) {
        throw NotFoundError("structure '" + name + "' not found");
    }
    return *it->second;
}

const Sketch& StructureRegistry::Get(const std::string& name) const {
    auto it = structures_.find(name);
    if (it == structures_.end()) {
        throw NotFoundError("structure '" + name + "' not found");
    }
    return *it->second;
}

void StructureRegistry::Remove(const std::string& name) {
    auto it = structures_.find(name);
    if (it == structures_.end()) {
        throw NotFoundError("structure '" + name + "' not found");
    }
    if (config_.ShouldLog("INFO")) {
        std::cout << "registry: remove " << SketchTypeName(it->second->type()) << " '" << name << "'" << std::endl;
    }
    structures_.erase(it);
}

std::vector<std::string> StructureRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(structures_.size());
    for (auto& [name, structure] : structures_) {
        result.emplace_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::map<std::string, InfoMap> StructureRegistry::GetAllInfo() const {
    std::map<std::string, InfoMap> result;
    for (auto& [name, structure] : structures_) {
        InfoMap info = structure->Describe();
        info["type"] = std::string(SketchTypeName(structure->type()));
        result.emplace(name, std::move(info));
    }
    return result;
}

void StructureRegistry::ResetAll() {
    for (auto& [name, structure] : structures_) {
        structure->Reset();
    }
    if (config_.ShouldLog("INFO")) {
        std::cout << "registry: reset " << structures_.size() << " structures" << std::endl;
    }
}

}  // namespace sketchkit
