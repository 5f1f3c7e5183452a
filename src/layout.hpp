#pragma once

#include <algorithm>
#include <cstdint>
#include <random>
#include <vector>

#include "structures.hpp"

// ==================== Seeded layout ====================

// Lower / upper bound of generated coordinates (keeps a margin from the unit square edge)
constexpr double LAYOUT_MIN = 0.1;
constexpr double LAYOUT_MAX = 0.9;

/*
* Seed sequence running the reference MT19937 init_by_array over a key of
* 32-bit words. Passed to std::mt19937::seed, it yields the same engine state
* as seeding CPython's random module with the integer the key was split from.
*/
class ArraySeedSeq {
public:
    typedef std::uint32_t result_type;

    explicit ArraySeedSeq(std::vector<std::uint32_t> key);

    // Key of |seed| split into 32-bit words, least significant first; {0} for 0
    static ArraySeedSeq fromInteger(std::int64_t seed);

    size_t size() const { return key_.size(); }

    template<typename It>
    void generate(It first, It last) const;

private:
    std::vector<std::uint32_t> key_;
};

template<typename It>
void ArraySeedSeq::generate(It first, It last) const {
    const size_t n = static_cast<size_t>(last - first);
    if (n == 0) return;
    std::vector<std::uint32_t> mt(n);

    mt[0] = 19650218u;
    for (size_t i = 1; i < n; ++i) {
        mt[i] = 1812433253u * (mt[i - 1] ^ (mt[i - 1] >> 30)) + static_cast<std::uint32_t>(i);
    }

    size_t i = 1, j = 0;
    for (size_t k = std::max(n, key_.size()); k > 0; --k) {
        mt[i] = (mt[i] ^ ((mt[i - 1] ^ (mt[i - 1] >> 30)) * 1664525u))
            + key_[j] + static_cast<std::uint32_t>(j);
        ++i;
        ++j;
        if (i >= n) { mt[0] = mt[n - 1]; i = 1; }
        if (j >= key_.size()) j = 0;
    }
    for (size_t k = n - 1; k > 0; --k) {
        mt[i] = (mt[i] ^ ((mt[i - 1] ^ (mt[i - 1] >> 30)) * 1566083941u))
            - static_cast<std::uint32_t>(i);
        ++i;
        if (i >= n) { mt[0] = mt[n - 1]; i = 1; }
    }
    mt[0] = 0x80000000u; // MSB set, state is never all zero

    std::copy(mt.begin(), mt.end(), first);
}

/*
* Explicit pseudo-random state for point layout.
* The engine is seeded through ArraySeedSeq and next() builds its doubles
* from 53 raw bits instead of going through std::uniform_real_distribution,
* so a seed gives the same points on every standard library, and the same
* points as the original layout generator for that seed.
*/
class LayoutRng {
public:
    explicit LayoutRng(std::int64_t seed);

    // Uniform double in [0, 1)
    double next();

    // Uniform double in [lo, hi)
    double uniform(double lo, double hi);

    std::int64_t seed() const { return seed_; }

private:
    std::int64_t seed_;
    std::mt19937 engine_;
};

// Draw n points uniformly from [LAYOUT_MIN, LAYOUT_MAX]^2, x before y for each point
std::vector<Point> generatePoints(size_t n, LayoutRng& rng);
