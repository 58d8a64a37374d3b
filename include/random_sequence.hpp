#pragma once

#include "sequence_batch.hpp"
#include <cstddef>
#include <random>
#include <vector>

/**
 * @brief Generates random one-hot sequence fragments.
 *
 * Each position is drawn independently and uniformly over the alphabet.
 * Deletion, insertion and mutation use these fragments to fill edited
 * regions so that batches keep a uniform shape.
 */
class RandomSequenceGenerator {
  public:
    /**
     * @brief Draws n symbol indices uniformly from [0, alphabet_size).
     * @throws ShapeError if alphabet_size is zero and n is not
     */
    static std::vector<size_t> symbols(size_t n, size_t alphabet_size, std::mt19937& rng);

    /**
     * @brief Generates num_fragments independent one-hot fragments.
     * @param num_fragments Number of fragments (N)
     * @param alphabet_size Number of symbols (A)
     * @param length Positions per fragment; negative lengths are rejected
     * @param rng Random number generator
     * @return Batch of shape (num_fragments, alphabet_size, length)
     * @throws ConfigurationError if length is negative
     */
    static SequenceBatch fragments(size_t num_fragments, size_t alphabet_size, long length,
                                   std::mt19937& rng);
};
