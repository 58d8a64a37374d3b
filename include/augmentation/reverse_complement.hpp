#pragma once

#include "augmentation.hpp"

/**
 * @brief Reverse-complements whole sequences with probability rc_prob.
 *
 * Both axes of a selected example are flipped; other examples are copied
 * through unchanged.
 */
class RandomRC : public Augmentation {
  public:
    explicit RandomRC(double rc_prob = 0.5);

    SequenceBatch apply(const SequenceBatch& x, std::mt19937& rng) const override;

    std::string name() const override {
        return "rc";
    }

    nlohmann::json to_json() const override;

    std::unique_ptr<Augmentation> clone() const override {
        return std::make_unique<RandomRC>(*this);
    }

    double rc_prob() const {
        return rc_prob_;
    }

  private:
    double rc_prob_;
};
