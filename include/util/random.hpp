#pragma once

#include <random>
#include <vector>

/**
 * @brief Wrapper around std::mt19937 for reproducible random values.
 */
class RandomGenerator {
public:
    /** @brief Seed with std::random_device for non-deterministic runs. */
    RandomGenerator();

    /** @brief Seed with a fixed value for deterministic runs. */
    explicit RandomGenerator(unsigned int seed);

    /**
     * @brief Real range [min, max) using uniform_real_distribution.
     */
    double uniformReal(double min, double max);

    /** @brief Normal draw; stddev 0 returns mean. */
    double normal(double mean, double stddev);

    /** @brief Normal draw clamped to [lo, hi]. */
    double clampedNormal(double mean, double stddev, double lo, double hi);

    /** @brief Exponential draw with the given rate (events per unit). */
    double exponential(double rate);

    /** @brief True with probability p. */
    bool bernoulli(double p);

    /**
     * @brief Index drawn proportionally to weights.
     * @return -1 if weights is empty or sums to zero.
     */
    int weightedIndex(const std::vector<double>& weights);

private:
    std::mt19937 engine;
};
