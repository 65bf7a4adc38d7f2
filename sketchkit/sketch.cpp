#include "sketchkit/sketch.hpp"

#include <sstream>
#include <type_traits>

namespace sketchkit {

std::string ToString(const InfoValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::ostringstream os;
            os << v;
            return os.str();
        }
    }, value);
}

const char* SketchTypeName(SketchType type) {
    switch (type) {
        case SketchType::kBloomFilter:
            return "bloom_filter";
        case SketchType::kHyperLogLog:
            return "hyperloglog";
        case SketchType::kCountMinSketch:
            return "count_min_sketch";
        case SketchType::kCuckooFilter:
            return "cuckoo_filter";
        case SketchType::kMinHash:
            return "minhash";
        case SketchType::kTopK:
            return "topk";
    }
    return "unknown";
}

}  // namespace sketchkit
