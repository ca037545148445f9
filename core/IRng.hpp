#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace senate {

class IRng {
public:
    virtual ~IRng() = default;

    // Draw in [min, max).
    virtual double uniform(double min = 0.0, double max = 1.0) = 0;
    // Draw in [min, max].
    virtual int uniformInt(int min, int max) = 0;
};

class StandardRng : public IRng {
private:
    std::mt19937 gen_;

public:
    StandardRng() : gen_(std::random_device{}()) {}
    explicit StandardRng(uint32_t seed) : gen_(seed) {}

    double uniform(double min = 0.0, double max = 1.0) override {
        std::uniform_real_distribution<double> dist(min, max);
        return dist(gen_);
    }

    int uniformInt(int min, int max) override {
        std::uniform_int_distribution<int> dist(min, max);
        return dist(gen_);
    }
};

// Uniform index into a collection of `size` elements. `size` must be > 0.
inline std::size_t pickIndex(IRng& rng, std::size_t size) {
    return static_cast<std::size_t>(rng.uniformInt(0, static_cast<int>(size) - 1));
}

// Index drawn proportionally to `weights`. Non-positive weights are never picked
// unless every weight is non-positive, in which case the draw is uniform.
inline std::size_t weightedIndex(IRng& rng, const std::vector<double>& weights) {
    double total = 0.0;
    for (double w : weights) {
        if (w > 0.0) total += w;
    }
    if (total <= 0.0) {
        return pickIndex(rng, weights.size());
    }

    double target = rng.uniform(0.0, total);
    double cumulative = 0.0;
    std::size_t last = 0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        if (weights[i] <= 0.0) continue;
        cumulative += weights[i];
        last = i;
        if (target < cumulative) {
            return i;
        }
    }
    return last;
}

} // namespace senate
