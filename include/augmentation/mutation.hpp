#pragma once

#include "augmentation.hpp"

/**
 * @brief Substitutes random symbols at random positions of each sequence.
 *
 * A substitution picks the original symbol again 1 time in 4 for DNA, so
 * round(mutate_frac / 0.75 * L) distinct positions are rewritten per example
 * to change about mutate_frac of the positions.
 */
class RandomMutation : public Augmentation {
  public:
    explicit RandomMutation(double mutate_frac = 0.1);

    SequenceBatch apply(const SequenceBatch& x, std::mt19937& rng) const override;

    std::string name() const override {
        return "mutation";
    }

    nlohmann::json to_json() const override;

    std::unique_ptr<Augmentation> clone() const override {
        return std::make_unique<RandomMutation>(*this);
    }

    /**
     * @brief Number of positions rewritten per example for a given length.
     *
     * Ties round to even. Capped at length.
     */
    size_t num_mutations(size_t length) const;

    double mutate_frac() const {
        return mutate_frac_;
    }

  private:
    double mutate_frac_;
};
