#pragma once

#include <cstdint>
#include <utility>
#include <vector>

namespace settlegen {
namespace utils {

/**
 * SeededRandom - Deterministic scalar stream for settlement generation
 *
 * Linear congruential generator (glibc constants, 31-bit state). Each
 * generator call owns its own instance so settlements can be generated
 * on independent threads without sharing state.
 */
class SeededRandom {
public:
    explicit SeededRandom(uint32_t seed = 1) { reseed(seed); }

    void reseed(uint32_t seed) { state_ = seed & kMask; }

    uint32_t state() const { return state_; }

    // Uniform in [0, 1)
    double next() {
        state_ = (state_ * kMultiplier + kIncrement) & kMask;
        return static_cast<double>(state_) / kModulus;
    }

    float nextFloat() { return static_cast<float>(next()); }

    float range(float min, float max) {
        return min + nextFloat() * (max - min);
    }

    // Integer in [min, max] inclusive
    int rangeInt(int min, int max) {
        if (max <= min) return min;
        int v = min + static_cast<int>(next() * (max - min + 1));
        return v > max ? max : v;
    }

    // Index in [0, count)
    size_t index(size_t count) {
        if (count == 0) return 0;
        size_t i = static_cast<size_t>(next() * static_cast<double>(count));
        return i >= count ? count - 1 : i;
    }

    bool chance(double probability) { return next() < probability; }

    // Fisher-Yates shuffle driven by this stream
    template <typename T>
    void shuffle(std::vector<T>& items) {
        for (size_t i = items.size(); i > 1; --i) {
            size_t j = index(i);
            std::swap(items[i - 1], items[j]);
        }
    }

private:
    static constexpr uint32_t kMultiplier = 1103515245u;
    static constexpr uint32_t kIncrement = 12345u;
    static constexpr uint32_t kMask = 0x7fffffffu;
    static constexpr double kModulus = 2147483648.0;

    uint32_t state_ = 1;
};

} // namespace utils
} // namespace settlegen
