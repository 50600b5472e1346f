#pragma once

#include <random>
#include <cstdint>
#include <vector>
#include <algorithm>

namespace prediction {

// Seeded random source. One instance per game, passed by reference to every
// component that needs randomness; nothing reads a global engine.
class Random {
public:
    explicit Random(uint64_t seed = 42) : gen_(seed) {}

    // Uniform distribution [min, max)
    double uniform(double min, double max) {
        if (max <= min) return min;
        std::uniform_real_distribution<double> dist(min, max);
        return dist(gen_);
    }
    
    // Uniform integer [min, max]
    int uniformInt(int min, int max) {
        if (max <= min) return min;
        std::uniform_int_distribution<int> dist(min, max);
        return dist(gen_);
    }
    
    // Bernoulli (coin flip with probability p)
    bool bernoulli(double p) {
        std::bernoulli_distribution dist(std::clamp(p, 0.0, 1.0));
        return dist(gen_);
    }

    // Raw 64-bit draw (identifiers)
    uint64_t next() {
        return gen_();
    }

    // k distinct elements of `pool`, returned in ascending order
    template<typename T>
    std::vector<T> sample(std::vector<T> pool, size_t k) {
        k = std::min(k, pool.size());
        for (size_t i = 0; i < k; ++i) {
            int j = uniformInt(static_cast<int>(i), static_cast<int>(pool.size() - 1));
            std::swap(pool[i], pool[static_cast<size_t>(j)]);
        }
        pool.resize(k);
        std::sort(pool.begin(), pool.end());
        return pool;
    }

private:
    std::mt19937_64 gen_;
};

} // namespace prediction
