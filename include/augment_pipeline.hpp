#pragma once

#include "augmentation/augmentation.hpp"
#include "sequence_batch.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <random>
#include <string>
#include <vector>

/**
 * @brief Applies an ordered list of augmentations to a batch.
 *
 * The pipeline is a fold over its augmentations: each one receives the
 * previous one's output. Optionally only a random subset is applied per call
 * (max_augs_per_batch), always in list order. The first batch that is
 * augmented successfully fixes the alphabet size and length; later batches
 * must match them. A call that throws leaves the recorded shape untouched.
 */
class AugmentPipeline {
  public:
    AugmentPipeline() = default;

    /**
     * @brief Constructs a pipeline from augmentations in application order.
     * @param augmentations Ordered augmentations
     * @param max_augs_per_batch Subset size bound per call, 0 applies all
     * @param hard_aug Always apply exactly max_augs_per_batch augmentations
     * @throws ConfigurationError if max_augs_per_batch exceeds the list size
     */
    explicit AugmentPipeline(std::vector<std::unique_ptr<Augmentation>> augmentations,
                             size_t max_augs_per_batch = 0, bool hard_aug = true);

    AugmentPipeline(const AugmentPipeline& other);
    AugmentPipeline& operator=(const AugmentPipeline& other);
    AugmentPipeline(AugmentPipeline&&) = default;
    AugmentPipeline& operator=(AugmentPipeline&&) = default;

    /**
     * @brief Appends an augmentation to the end of the pipeline.
     */
    AugmentPipeline& add(std::unique_ptr<Augmentation> augmentation);

    /**
     * @brief Runs the batch through the pipeline.
     * @param x Input batch of shape (N, A, L)
     * @param rng Source of randomness for subset selection and augmentations
     * @return Batch of shape (N, A, L)
     * @throws ShapeError if A or L differ from the first batch seen
     */
    SequenceBatch apply(const SequenceBatch& x, std::mt19937& rng);

    /**
     * @brief Indices of the augmentations to apply on the next call.
     *
     * All indices when max_augs_per_batch is 0. Otherwise a sorted subset of
     * size max_augs_per_batch (hard_aug) or uniform in [1, max_augs_per_batch].
     */
    std::vector<size_t> select_augmentations(std::mt19937& rng) const;

    size_t size() const {
        return augmentations_.size();
    }

    std::vector<std::string> names() const;

    const Augmentation& at(size_t index) const;

    size_t max_augs_per_batch() const {
        return max_augs_per_batch_;
    }

    bool hard_aug() const {
        return hard_aug_;
    }

    bool has_established_shape() const {
        return shape_established_;
    }

    /**
     * @brief Forgets the alphabet size and length fixed by earlier batches.
     */
    void reset_shape() {
        shape_established_ = false;
    }

    nlohmann::json to_json() const;

    /**
     * @brief Builds a pipeline from {"augmentations": [...],
     * "max_augs_per_batch": k, "hard_aug": b}.
     * @throws ConfigurationError on malformed entries
     */
    static AugmentPipeline from_json(const nlohmann::json& j);

  private:
    void check_shape(const SequenceBatch& x) const;
    void record_shape(const SequenceBatch& x);

    std::vector<std::unique_ptr<Augmentation>> augmentations_;
    size_t max_augs_per_batch_ = 0;
    bool hard_aug_ = true;

    bool shape_established_ = false;
    size_t alphabet_size_ = 0;
    size_t length_ = 0;
};
