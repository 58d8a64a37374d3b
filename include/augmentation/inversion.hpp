#pragma once

#include "augmentation.hpp"

/**
 * @brief Reverse-complements a random contiguous stretch of each sequence.
 *
 * Within [start, start + invert_len) both the position order and the
 * alphabet order are reversed. start is drawn from [0, L - invert_max] so
 * the interval stays inside the sequence for every realised length.
 */
class RandomInversion : public Augmentation {
  public:
    explicit RandomInversion(long invert_min = 0, long invert_max = 30);

    SequenceBatch apply(const SequenceBatch& x, std::mt19937& rng) const override;

    std::string name() const override {
        return "inversion";
    }

    nlohmann::json to_json() const override;

    std::unique_ptr<Augmentation> clone() const override {
        return std::make_unique<RandomInversion>(*this);
    }

    long invert_min() const {
        return invert_min_;
    }

    long invert_max() const {
        return invert_max_;
    }

  private:
    long invert_min_;
    long invert_max_;
};
