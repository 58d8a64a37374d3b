#pragma once

#include "augmentation.hpp"

/**
 * @brief Inserts a random contiguous stretch into each sequence.
 *
 * One random fragment of insert_max symbols is drawn per example and split
 * into a front pad, the inserted content (insert_len ~ U[insert_min,
 * insert_max]) and a back pad. The content goes in at an index drawn from
 * [0, L]. The padded result has L + insert_max positions; the output keeps
 * its centred window of L positions, so a zero-length insertion returns the
 * sequence unchanged.
 */
class RandomInsertion : public Augmentation {
  public:
    explicit RandomInsertion(long insert_min = 0, long insert_max = 30);

    SequenceBatch apply(const SequenceBatch& x, std::mt19937& rng) const override;

    std::string name() const override {
        return "insertion";
    }

    nlohmann::json to_json() const override;

    std::unique_ptr<Augmentation> clone() const override {
        return std::make_unique<RandomInsertion>(*this);
    }

    long insert_min() const {
        return insert_min_;
    }

    long insert_max() const {
        return insert_max_;
    }

  private:
    long insert_min_;
    long insert_max_;
};
