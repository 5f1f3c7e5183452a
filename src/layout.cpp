#include "layout.hpp"
#include "debug.hpp"

#include <utility>

ArraySeedSeq::ArraySeedSeq(std::vector<std::uint32_t> key) : key_(std::move(key)) {
    if (key_.empty()) key_.push_back(0);
}

ArraySeedSeq ArraySeedSeq::fromInteger(std::int64_t seed) {
    // Magnitude only; negating in unsigned arithmetic also covers INT64_MIN
    auto bits = static_cast<std::uint64_t>(seed);
    if (seed < 0) bits = ~bits + 1;

    std::vector<std::uint32_t> key;
    do {
        key.push_back(static_cast<std::uint32_t>(bits & 0xffffffffu));
        bits >>= 32;
    } while (bits != 0);
    return ArraySeedSeq(std::move(key));
}

LayoutRng::LayoutRng(std::int64_t seed) : seed_(seed) {
    ArraySeedSeq seq = ArraySeedSeq::fromInteger(seed);
    engine_.seed(seq);
}

double LayoutRng::next() {
    // 27 + 26 bits -> 53-bit mantissa
    std::uint32_t a = engine_() >> 5;
    std::uint32_t b = engine_() >> 6;
    return (a * 67108864.0 + b) * (1.0 / 9007199254740992.0);
}

double LayoutRng::uniform(double lo, double hi) {
    return lo + (hi - lo) * next();
}

std::vector<Point> generatePoints(size_t n, LayoutRng& rng) {
    std::vector<Point> points;
    points.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        double x = rng.uniform(LAYOUT_MIN, LAYOUT_MAX);
        double y = rng.uniform(LAYOUT_MIN, LAYOUT_MAX);
        points.emplace_back(x, y);
        DBG("Point " << i << ": (" << x << ", " << y << ")");
    }
    return points;
}
