#pragma once

#include <cstdint>
#include <mutex>
#include <random>

namespace halbrain {

/**
 * Seedable generator shared by concurrent walks.
 *
 * Satisfies UniformRandomBitGenerator; every draw takes an internal lock so
 * readers holding the brain's shared lock can use one instance safely.
 */
class RandomSource {
public:
    using result_type = std::mt19937::result_type;

    RandomSource() : engine_(std::random_device{}()) {}
    explicit RandomSource(uint32_t seed) : engine_(seed) {}

    static constexpr result_type min() { return std::mt19937::min(); }
    static constexpr result_type max() { return std::mt19937::max(); }

    result_type operator()() {
        std::lock_guard<std::mutex> lock(mutex_);
        return engine_();
    }

    void seed(uint32_t s) {
        std::lock_guard<std::mutex> lock(mutex_);
        engine_.seed(s);
    }

    // Uniform draw from [0, bound). bound must be positive.
    uint32_t below(uint32_t bound) {
        std::uniform_int_distribution<uint32_t> dist(0, bound - 1);
        return dist(*this);
    }

private:
    std::mt19937 engine_;
    std::mutex mutex_;
};

} // namespace halbrain
