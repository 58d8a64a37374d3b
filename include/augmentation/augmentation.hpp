#pragma once

#include "../sequence_batch.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <random>
#include <string>

/**
 * @brief Base class for randomized batch augmentations.
 *
 * An augmentation maps a batch of shape (N, A, L) to a new batch of the
 * same shape. Parameters are fixed at construction; every call draws fresh
 * per-example randomness from the generator it is given. Features include:
 * - Injected random number generator for reproducible runs
 * - JSON description for configuration files
 * - Polymorphic copies for pipelines
 */
class Augmentation {
  public:
    virtual ~Augmentation() = default;

    /**
     * @brief Applies the augmentation to a batch.
     * @param x Input batch of shape (N, A, L); left unmodified
     * @param rng Source of per-example randomness
     * @return New batch of shape (N, A, L)
     * @throws ShapeError if the batch has no positions or no alphabet
     * @throws ConfigurationError if a bound does not fit the batch length
     */
    virtual SequenceBatch apply(const SequenceBatch& x, std::mt19937& rng) const = 0;

    /**
     * @brief Applies the augmentation using an internally seeded generator.
     */
    SequenceBatch operator()(const SequenceBatch& x) const {
        return apply(x, gen);
    }

    /**
     * @brief Short type name, as used in configuration files.
     */
    virtual std::string name() const = 0;

    /**
     * @brief Describes the augmentation as {"type": name(), <parameters>}.
     */
    virtual nlohmann::json to_json() const = 0;

    virtual std::unique_ptr<Augmentation> clone() const = 0;

    /**
     * @brief Builds an augmentation from its JSON description.
     *
     * Missing parameters take their defaults.
     *
     * @throws ConfigurationError for an unknown "type" or invalid bounds
     */
    static std::unique_ptr<Augmentation> from_json(const nlohmann::json& j);

  protected:
    /// Rejects batches that cannot be augmented at all
    static void check_batch(const SequenceBatch& x, const std::string& who);

    /// Rejects negative bounds and min > max
    static void check_range(long min_value, long max_value, const std::string& min_name,
                            const std::string& max_name);

    /// Rejects values outside [0, 1]
    static void check_probability(double value, const std::string& param_name);

    /// Rejects a maximum edit length larger than the sequence length
    static void check_fits_length(long max_value, const std::string& max_name, size_t length);

  private:
    mutable std::mt19937 gen{std::random_device{}()}; ///< Used by operator()
};
