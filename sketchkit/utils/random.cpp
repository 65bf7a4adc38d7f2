#include "sketchkit/utils/random.hpp"

namespace sketchkit {

namespace utils {

uint64_t Random::MixSeed(uint64_t seed) {
    uint64_t z = seed + 0x9e3779b97f4a7c15ULL;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

uint64_t Random::Uniform(uint64_t lo, uint64_t hi) {
    uint64_t span = hi - lo + 1;
    if (span == 0) {
        // [0, UINT64_MAX]
        return Next();
    }
    return lo + Next() % span;
}

} // utils
} // sketchkit
