// utils/noise.hpp
#pragma once

#include <cmath>
#include <cstdint>
#include <random>

namespace utils {

/**
 * NoiseGenerator - Stateful random source for simulated sensor noise
 *
 * One instance per sensor, so a seeded run is reproducible regardless of
 * how many sensors are configured.
 */
class NoiseGenerator {
public:
    explicit NoiseGenerator(uint64_t seed = 0)
        : gen_(seed == 0 ? std::random_device{}() : seed),
          normal_(0.0, 1.0),
          unit_(0.0, 1.0)
    {}

    /**
     * Gaussian white noise: N(0, stddev)
     */
    double gaussian(double stddev) {
        if (stddev <= 0.0) return 0.0;
        return normal_(gen_) * stddev;
    }

    /**
     * True with probability p (clamped to [0, 1])
     */
    bool chance(double p) {
        if (p <= 0.0) return false;
        if (p >= 1.0) return true;
        return unit_(gen_) < p;
    }

private:
    std::mt19937_64 gen_;
    std::normal_distribution<double> normal_;
    std::uniform_real_distribution<double> unit_;
};

/**
 * Quantizer - Simulates the ranging resolution of the sensor
 */
class Quantizer {
public:
    explicit Quantizer(double resolution = 0.0)
        : resolution_(resolution)
    {}

    double quantize(double value) const {
        if (resolution_ <= 0.0) return value;

        // Round to nearest quantum
        return std::round(value / resolution_) * resolution_;
    }

private:
    double resolution_;
};

/**
 * RateLimiter - Simulates finite sensor update rate
 */
class RateLimiter {
public:
    explicit RateLimiter(double update_hz = 0.0)
        : period_(update_hz > 0.0 ? 1.0 / update_hz : 0.0),
          next_update_(0.0)
    {}

    /**
     * Returns true when a new sample is due at time t
     */
    bool due(double t) {
        if (period_ <= 0.0) {
            return true;
        }

        if (t >= next_update_) {
            next_update_ = t + period_;
            return true;
        }

        return false;
    }

    void reset(double t = 0.0) {
        next_update_ = t;
    }

private:
    double period_;
    double next_update_;
};

} // namespace utils
