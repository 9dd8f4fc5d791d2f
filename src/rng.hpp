#pragma once
#include <cstddef>
#include <cstdint>

// FNV-1a over a byte string. Used to turn readable tags into seed salts.
constexpr uint32_t fnv1a32(const char* data, std::size_t len) {
    uint32_t h = 2166136261u;
    for (std::size_t i = 0; i < len; ++i) {
        h = (h ^ static_cast<unsigned char>(data[i])) * 16777619u;
    }
    return h;
}

// tag32("LEVEL") hashes the literal without its terminator.
template <std::size_t N>
constexpr uint32_t tag32(const char (&str)[N]) {
    return fnv1a32(str, N - 1);
}

// xorshift32. Same sequence on every platform, which save files and replays
// rely on. The whole generator state is the single `state` word.
struct RNG {
    static constexpr uint32_t ZERO_SEED_STATE = 0x12345678u;

    uint32_t state;

    explicit RNG(uint32_t seed = ZERO_SEED_STATE) : state(seed != 0 ? seed : ZERO_SEED_STATE) {}

    uint32_t nextU32() {
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        return state;
    }

    // Uniform-ish integer in [lo, hiInclusive]; returns lo for an empty range.
    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        const uint32_t span = static_cast<uint32_t>(hiInclusive - lo) + 1u;
        return lo + static_cast<int>(nextU32() % span);
    }

    // [0, 1)
    float next01() {
        return static_cast<float>(nextU32() >> 8) * (1.0f / 16777216.0f);
    }

    bool chance(float p) { return next01() < p; }
};

// Integer avalanche mix.
inline uint32_t hash32(uint32_t x) {
    x = (x ^ (x >> 16)) * 0x7feb352du;
    x = (x ^ (x >> 15)) * 0x846ca68bu;
    return x ^ (x >> 16);
}

inline uint32_t hashCombine(uint32_t a, uint32_t b) {
    return hash32(a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2)));
}

// hashCombine(seed, tag32("LEVEL"), depth) and friends.
inline uint32_t hashCombine(uint32_t a, uint32_t b, uint32_t c) {
    return hashCombine(hashCombine(a, b), c);
}
