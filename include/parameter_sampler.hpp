#pragma once

#include <cstddef>
#include <random>
#include <vector>

/**
 * @file parameter_sampler.hpp
 * @brief Per-example parameter draws for batched augmentations.
 *
 * Every function returns one independent value per example. Augmentations
 * draw all of their parameters through these helpers before rewriting the
 * batch, so results under a fixed seed do not depend on how the rewrite is
 * parallelised.
 */
namespace ParameterSampler {

/**
 * @brief Draws n integers uniformly from [lo, hi] (both inclusive).
 */
std::vector<long> sample_uniform_ints(size_t n, long lo, long hi, std::mt19937& rng);

/**
 * @brief Draws n signs, each -1 or +1 with probability 0.5.
 */
std::vector<int> sample_signs(size_t n, std::mt19937& rng);

/**
 * @brief Draws n independent Bernoulli(p) outcomes.
 */
std::vector<bool> sample_bernoulli(size_t n, double p, std::mt19937& rng);

/**
 * @brief Picks k distinct indices from [0, population) uniformly.
 *
 * Sorts population random keys and keeps the indices of the k smallest.
 * The result is in key order, not index order.
 */
std::vector<size_t> sample_without_replacement(size_t population, size_t k, std::mt19937& rng);

} // namespace ParameterSampler
