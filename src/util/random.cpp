#include "util/random.hpp"

#include <algorithm>
#include <numeric>

RandomGenerator::RandomGenerator() : engine(std::random_device{}()) {}

RandomGenerator::RandomGenerator(unsigned int seed) : engine(seed) {}

double RandomGenerator::uniformReal(double min, double max) {
    std::uniform_real_distribution<double> dist(min, max);
    return dist(engine);
}

double RandomGenerator::normal(double mean, double stddev) {
    if (stddev <= 0.0) {
        return mean;
    }
    std::normal_distribution<double> dist(mean, stddev);
    return dist(engine);
}

double RandomGenerator::clampedNormal(double mean, double stddev, double lo, double hi) {
    return std::clamp(normal(mean, stddev), lo, hi);
}

double RandomGenerator::exponential(double rate) {
    std::exponential_distribution<double> dist(rate);
    return dist(engine);
}

bool RandomGenerator::bernoulli(double p) {
    std::bernoulli_distribution dist(std::clamp(p, 0.0, 1.0));
    return dist(engine);
}

int RandomGenerator::weightedIndex(const std::vector<double>& weights) {
    double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (weights.empty() || total <= 0.0) {
        return -1;
    }
    std::discrete_distribution<int> dist(weights.begin(), weights.end());
    return dist(engine);
}
