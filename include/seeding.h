#ifndef POKER_COACH_SEEDING_H
#define POKER_COACH_SEEDING_H

#include <cstdint>
#include <string>

namespace poker_coach {

// SplitMix64 finalizer. Turns structured inputs (seed, key, index) into
// well-spread 64-bit seeds for independent std::mt19937_64 streams.
inline uint64_t splitmix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

// 64-bit FNV-1a, stable across platforms (unlike std::hash).
inline uint64_t fnv1a(const std::string& text) {
    uint64_t hash = 0xCBF29CE484222325ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 0x100000001B3ULL;
    }
    return hash;
}

// Seed for one Monte Carlo trial. Depends only on its inputs, so trials can
// run on any thread in any order.
inline uint64_t trial_seed(uint64_t base_seed, uint64_t key_hash, uint64_t trial_index) {
    return splitmix64(splitmix64(base_seed ^ key_hash) + trial_index);
}

} // namespace poker_coach

#endif // POKER_COACH_SEEDING_H
