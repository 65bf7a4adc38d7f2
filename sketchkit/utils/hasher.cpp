#include "sketchkit/utils/hasher.hpp"

#include <cstring>

#include "sketchkit/utils/error.hpp"

namespace sketchkit {
namespace utils {

namespace {

constexpr uint64_t kPrime1 = 11400714785074694791ULL;
constexpr uint64_t kPrime2 = 14029467366897019727ULL;
constexpr uint64_t kPrime3 = 1609587929392839161ULL;
constexpr uint64_t kPrime4 = 9650029242287828579ULL;
constexpr uint64_t kPrime5 = 2870177450012600261ULL;

constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

// 第二个哈希使用不同的种子，主哈希同为 fnv1a 时 h1 != h2
constexpr uint64_t kSecondarySeed = 0x9e3779b97f4a7c15ULL;

inline uint64_t Rotl(uint64_t x, int r) {
    return (x << r) | (x >> (64 - r));
}

// 按小端读取
inline uint64_t Read64(const char* p) {
    uint64_t v;
    memcpy(&v, p, sizeof(v));
    return v;
}

inline uint32_t Read32(const char* p) {
    uint32_t v;
    memcpy(&v, p, sizeof(v));
    return v;
}

inline uint64_t Round(uint64_t acc, uint64_t input) {
    acc += input * kPrime2;
    acc = Rotl(acc, 31);
    return acc * kPrime1;
}

inline uint64_t MergeRound(uint64_t acc, uint64_t val) {
    acc ^= Round(0, val);
    return acc * kPrime1 + kPrime4;
}

// 每个输入位都影响每个输出位
inline uint64_t Avalanche(uint64_t h) {
    h ^= h >> 33;
    h *= kPrime2;
    h ^= h >> 29;
    h *= kPrime3;
    h ^= h >> 32;
    return h;
}

}  // namespace

uint64_t XXH64Hasher::Hash(std::string_view key, uint64_t seed) const {
    const char* p = key.data();
    const char* const end = p + key.size();
    uint64_t h;

    if (key.size() >= 32) {
        const char* const limit = end - 32;
        uint64_t v1 = seed + kPrime1 + kPrime2;
        uint64_t v2 = seed + kPrime2;
        uint64_t v3 = seed;
        uint64_t v4 = seed - kPrime1;
        do {
            v1 = Round(v1, Read64(p));
            v2 = Round(v2, Read64(p + 8));
            v3 = Round(v3, Read64(p + 16));
            v4 = Round(v4, Read64(p + 24));
            p += 32;
        } while (p <= limit);
        h = Rotl(v1, 1) + Rotl(v2, 7) + Rotl(v3, 12) + Rotl(v4, 18);
        h = MergeRound(h, v1);
        h = MergeRound(h, v2);
        h = MergeRound(h, v3);
        h = MergeRound(h, v4);
    } else {
        h = seed + kPrime5;
    }

    h += static_cast<uint64_t>(key.size());

    while (p + 8 <= end) {
        h ^= Round(0, Read64(p));
        h = Rotl(h, 27) * kPrime1 + kPrime4;
        p += 8;
    }
    if (p + 4 <= end) {
        h ^= static_cast<uint64_t>(Read32(p)) * kPrime1;
        h = Rotl(h, 23) * kPrime2 + kPrime3;
        p += 4;
    }
    while (p < end) {
        h ^= static_cast<uint64_t>(static_cast<uint8_t>(*p)) * kPrime5;
        h = Rotl(h, 11) * kPrime1;
        ++p;
    }

    return Avalanche(h);
}

uint64_t FNV1aHasher::Hash(std::string_view key, uint64_t seed) const {
    uint64_t h = kFnvOffset;
    for (size_t i = 0; i < sizeof(seed); ++i) {
        h = (h ^ ((seed >> (i * 8)) & 0xff)) * kFnvPrime;
    }
    for (char c : key) {
        h = (h ^ static_cast<uint8_t>(c)) * kFnvPrime;
    }
    // FNV-1a 的低位只受输入低位影响，按低位取桶的结构需要再混合一次
    return Avalanche(h);
}

HasherPtr MakeHasher(const std::string& name) {
    if (name == "xxh64") {
        return std::make_shared<XXH64Hasher>();
    }
    if (name == "fnv1a") {
        return std::make_shared<FNV1aHasher>();
    }
    throw ConfigurationError("unknown hash function: " + name);
}

HasherPtr DefaultHasher() {
    static HasherPtr hasher = std::make_shared<XXH64Hasher>();
    return hasher;
}

const Hasher& SecondaryHasher() {
    static FNV1aHasher hasher;
    return hasher;
}

HashPair DoubleHash(const Hasher& primary, std::string_view key, size_t range) {
    HashPair pair;
    pair.h1 = primary.Hash(key, 0) % range;
    pair.h2 = SecondaryHasher().Hash(key, kSecondarySeed) % range;
    if (pair.h2 == 0) {
        pair.h2 = 1;
    }
    return pair;
}

}  // namespace utils
}  // namespace sketchkit
