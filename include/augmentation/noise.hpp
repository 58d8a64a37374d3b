#pragma once

#include "augmentation.hpp"

/**
 * @brief Adds independent Gaussian noise to every element of the batch.
 *
 * The output is no longer one-hot; pipelines usually apply this last.
 */
class RandomNoise : public Augmentation {
  public:
    explicit RandomNoise(float noise_mean = 0.0f, float noise_std = 0.2f);

    SequenceBatch apply(const SequenceBatch& x, std::mt19937& rng) const override;

    std::string name() const override {
        return "noise";
    }

    nlohmann::json to_json() const override;

    std::unique_ptr<Augmentation> clone() const override {
        return std::make_unique<RandomNoise>(*this);
    }

    float noise_mean() const {
        return noise_mean_;
    }

    float noise_std() const {
        return noise_std_;
    }

  private:
    float noise_mean_;
    float noise_std_;
};
