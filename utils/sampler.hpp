// utils/sampler.hpp
#pragma once

#include <cmath>
#include <cstdint>
#include <random>

namespace utils {

/**
 * RandomSampler - Seeded random source for profile perturbation and
 * randomized property tests.
 *
 * seed == 0 draws a seed from std::random_device.
 */
class RandomSampler {
public:
    explicit RandomSampler(uint64_t seed = 0)
        : gen_(seed == 0 ? std::random_device{}() : seed),
          normal_(0.0, 1.0)
    {}

    /**
     * Uniform random in [lo, hi)
     */
    double uniform(double lo, double hi) {
        if (hi <= lo) return lo;
        std::uniform_real_distribution<double> dist(lo, hi);
        return dist(gen_);
    }

    /**
     * Gaussian N(mean, stddev)
     */
    double gaussian(double mean, double stddev) {
        if (stddev <= 0.0) return mean;
        return mean + normal_(gen_) * stddev;
    }

    /**
     * Uniform integer in [lo, hi]
     */
    int uniform_int(int lo, int hi) {
        if (hi <= lo) return lo;
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(gen_);
    }

    /**
     * Multiplicative perturbation: value * (1 + N(0, rel_stddev)), floored at 0
     */
    double perturb_nonnegative(double value, double rel_stddev) {
        if (rel_stddev <= 0.0) return value;
        const double v = value * (1.0 + normal_(gen_) * rel_stddev);
        return v < 0.0 ? 0.0 : v;
    }

private:
    std::mt19937_64 gen_;
    std::normal_distribution<double> normal_;
};

/**
 * Quantizer - Rounds to a fixed resolution (0.01 -> two decimals)
 */
class Quantizer {
public:
    explicit Quantizer(double resolution = 0.0)
        : resolution_(resolution)
    {}

    double quantize(double value) const {
        if (resolution_ <= 0.0) return value;

        // Round to nearest quantum
        const double q = std::round(value / resolution_) * resolution_;
        return q == 0.0 ? 0.0 : q;  // no negative zero
    }

    void set_resolution(double res) { resolution_ = res; }
    double get_resolution() const { return resolution_; }

private:
    double resolution_;
};

} // namespace utils
