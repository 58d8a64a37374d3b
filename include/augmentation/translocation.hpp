#pragma once

#include "augmentation.hpp"

/**
 * @brief Circularly shifts each sequence by a random signed amount.
 *
 * The magnitude is drawn from [shift_min, shift_max] and negated with
 * probability 0.5. Length is unchanged by construction.
 */
class RandomTranslocation : public Augmentation {
  public:
    explicit RandomTranslocation(long shift_min = 0, long shift_max = 30);

    SequenceBatch apply(const SequenceBatch& x, std::mt19937& rng) const override;

    std::string name() const override {
        return "translocation";
    }

    nlohmann::json to_json() const override;

    std::unique_ptr<Augmentation> clone() const override {
        return std::make_unique<RandomTranslocation>(*this);
    }

    long shift_min() const {
        return shift_min_;
    }

    long shift_max() const {
        return shift_max_;
    }

  private:
    long shift_min_;
    long shift_max_;
};
