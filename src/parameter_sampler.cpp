#include "../include/parameter_sampler.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace ParameterSampler {

std::vector<long> sample_uniform_ints(size_t n, long lo, long hi, std::mt19937& rng) {
    if (lo > hi) {
        throw std::invalid_argument("Invalid sampling range [" + std::to_string(lo) + ", " +
                                    std::to_string(hi) + "]");
    }
    std::uniform_int_distribution<long> dist(lo, hi);
    std::vector<long> values(n);
    for (auto& v : values) {
        v = dist(rng);
    }
    return values;
}

std::vector<int> sample_signs(size_t n, std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    std::vector<int> signs(n);
    for (auto& s : signs) {
        s = dist(rng) < 0.5 ? -1 : 1;
    }
    return signs;
}

std::vector<bool> sample_bernoulli(size_t n, double p, std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    std::vector<bool> outcomes(n);
    for (size_t i = 0; i < n; ++i) {
        outcomes[i] = dist(rng) < p;
    }
    return outcomes;
}

std::vector<size_t> sample_without_replacement(size_t population, size_t k, std::mt19937& rng) {
    if (k > population) {
        throw std::invalid_argument("Cannot pick " + std::to_string(k) + " distinct items from " +
                                    std::to_string(population));
    }
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    std::vector<float> keys(population);
    for (auto& key : keys) {
        key = dist(rng);
    }

    std::vector<size_t> order(population);
    std::iota(order.begin(), order.end(), 0);
    std::partial_sort(order.begin(), order.begin() + k, order.end(),
                      [&keys](size_t a, size_t b) { return keys[a] < keys[b]; });
    order.resize(k);
    return order;
}

} // namespace ParameterSampler
