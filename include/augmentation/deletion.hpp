#pragma once

#include "augmentation.hpp"

/**
 * @brief Deletes a random contiguous stretch from each sequence.
 *
 * Each example loses delete_len ~ U[delete_min, delete_max] positions
 * starting at an index drawn from [0, L - delete_max]. The removed length
 * is made up with random symbols: floor(delete_len / 2) in front of the
 * sequence and the rest behind it, both taken from one random fragment of
 * delete_max symbols per example.
 */
class RandomDeletion : public Augmentation {
  public:
    explicit RandomDeletion(long delete_min = 0, long delete_max = 30);

    SequenceBatch apply(const SequenceBatch& x, std::mt19937& rng) const override;

    std::string name() const override {
        return "deletion";
    }

    nlohmann::json to_json() const override;

    std::unique_ptr<Augmentation> clone() const override {
        return std::make_unique<RandomDeletion>(*this);
    }

    long delete_min() const {
        return delete_min_;
    }

    long delete_max() const {
        return delete_max_;
    }

  private:
    long delete_min_;
    long delete_max_;
};
