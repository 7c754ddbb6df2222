#pragma once
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <random>
#include <string>

// FNV-1a, used to derive a per-material stream from a run seed:
//   RNG rng(hashCombine(runSeed, fnv1a32(name)));
constexpr uint32_t fnv1a32(const char* data, std::size_t len) {
    uint32_t h = 2166136261u; // FNV offset basis
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint8_t>(static_cast<unsigned char>(data[i]));
        h *= 16777619u; // FNV prime
    }
    return h;
}

inline uint32_t fnv1a32(const std::string& s) {
    return fnv1a32(s.data(), s.size());
}

// A tiny integer hash for seed mixing.
inline uint32_t hash32(uint32_t x) {
    // Thomas Wang-ish mix
    x ^= x >> 16;
    x *= 0x7feb352du;
    x ^= x >> 15;
    x *= 0x846ca68bu;
    x ^= x >> 16;
    return x;
}

inline uint32_t hashCombine(uint32_t a, uint32_t b) {
    return hash32(a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2)));
}

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure.
//
// Every generator takes an RNG& instead of touching process-wide state, so a
// fixed seed reproduces a texture bit-for-bit.
struct RNG {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    // Unseeded provider: differs from run to run.
    static RNG fromEntropy() {
        return RNG(entropySeed());
    }

    static uint32_t entropySeed() {
        std::random_device rd;
        const auto ticks = static_cast<uint64_t>(
            std::chrono::steady_clock::now().time_since_epoch().count());
        uint32_t s = hashCombine(rd(), static_cast<uint32_t>(ticks ^ (ticks >> 32)));
        return s ? s : 0x12345678u;
    }

    uint32_t nextU32() {
        // xorshift32
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }

    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    float next01() {
        // [0,1)
        return (nextU32() / (static_cast<float>(std::numeric_limits<uint32_t>::max()) + 1.0f));
    }

    bool chance(float p) {
        return next01() < p;
    }
};
