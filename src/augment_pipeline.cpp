#include "../include/augment_pipeline.hpp"
#include "../include/augment_errors.hpp"
#include "../include/logger.hpp"
#include "../include/parameter_sampler.hpp"
#include <algorithm>
#include <stdexcept>

AugmentPipeline::AugmentPipeline(std::vector<std::unique_ptr<Augmentation>> augmentations,
                                 size_t max_augs_per_batch, bool hard_aug)
    : augmentations_(std::move(augmentations)),
      max_augs_per_batch_(max_augs_per_batch),
      hard_aug_(hard_aug) {
    for (const auto& aug : augmentations_) {
        if (!aug) {
            throw ConfigurationError("pipeline contains a null augmentation");
        }
    }
    if (max_augs_per_batch_ > augmentations_.size()) {
        throw ConfigurationError("max_augs_per_batch (" + std::to_string(max_augs_per_batch_) +
                                 ") exceeds the number of augmentations (" +
                                 std::to_string(augmentations_.size()) + ")");
    }
}

AugmentPipeline::AugmentPipeline(const AugmentPipeline& other)
    : max_augs_per_batch_(other.max_augs_per_batch_),
      hard_aug_(other.hard_aug_),
      shape_established_(other.shape_established_),
      alphabet_size_(other.alphabet_size_),
      length_(other.length_) {
    for (const auto& aug : other.augmentations_) {
        augmentations_.push_back(aug->clone());
    }
}

AugmentPipeline& AugmentPipeline::operator=(const AugmentPipeline& other) {
    if (this != &other) {
        AugmentPipeline copy(other);
        *this = std::move(copy);
    }
    return *this;
}

AugmentPipeline& AugmentPipeline::add(std::unique_ptr<Augmentation> augmentation) {
    if (!augmentation) {
        throw ConfigurationError("cannot add a null augmentation");
    }
    augmentations_.push_back(std::move(augmentation));
    return *this;
}

void AugmentPipeline::check_shape(const SequenceBatch& x) const {
    if (!shape_established_) {
        return;
    }
    if (x.alphabet_size() != alphabet_size_ || x.length() != length_) {
        throw ShapeError("batch " + x.shape_string() + " does not match pipeline shape (N, " +
                         std::to_string(alphabet_size_) + ", " + std::to_string(length_) + ")");
    }
}

void AugmentPipeline::record_shape(const SequenceBatch& x) {
    if (shape_established_) {
        return;
    }
    alphabet_size_ = x.alphabet_size();
    length_ = x.length();
    shape_established_ = true;
    Logger::getInstance().log("Augment pipeline fixed to alphabet size " +
                              std::to_string(alphabet_size_) + " and length " +
                              std::to_string(length_));
}

std::vector<size_t> AugmentPipeline::select_augmentations(std::mt19937& rng) const {
    if (max_augs_per_batch_ == 0) {
        std::vector<size_t> all(augmentations_.size());
        for (size_t i = 0; i < all.size(); ++i) {
            all[i] = i;
        }
        return all;
    }

    size_t count = max_augs_per_batch_;
    if (!hard_aug_) {
        count = static_cast<size_t>(ParameterSampler::sample_uniform_ints(
            1, 1, static_cast<long>(max_augs_per_batch_), rng)[0]);
    }
    auto chosen = ParameterSampler::sample_without_replacement(augmentations_.size(), count, rng);
    std::sort(chosen.begin(), chosen.end());
    return chosen;
}

SequenceBatch AugmentPipeline::apply(const SequenceBatch& x, std::mt19937& rng) {
    check_shape(x);

    SequenceBatch current = x;
    for (size_t index : select_augmentations(rng)) {
        current = augmentations_[index]->apply(current, rng);
        if (!current.same_shape(x)) {
            throw ShapeError(augmentations_[index]->name() + " changed batch shape from " +
                             x.shape_string() + " to " + current.shape_string());
        }
    }
    // Only a batch that made it through every step fixes the shape
    record_shape(x);
    return current;
}

std::vector<std::string> AugmentPipeline::names() const {
    std::vector<std::string> result;
    result.reserve(augmentations_.size());
    for (const auto& aug : augmentations_) {
        result.push_back(aug->name());
    }
    return result;
}

const Augmentation& AugmentPipeline::at(size_t index) const {
    if (index >= augmentations_.size()) {
        throw std::out_of_range("Pipeline index " + std::to_string(index) + " out of range");
    }
    return *augmentations_[index];
}

nlohmann::json AugmentPipeline::to_json() const {
    nlohmann::json augs = nlohmann::json::array();
    for (const auto& aug : augmentations_) {
        augs.push_back(aug->to_json());
    }
    return {{"augmentations", augs},
            {"max_augs_per_batch", max_augs_per_batch_},
            {"hard_aug", hard_aug_}};
}

AugmentPipeline AugmentPipeline::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("augmentations") || !j["augmentations"].is_array()) {
        throw ConfigurationError("pipeline description needs an \"augmentations\" array");
    }

    std::vector<std::unique_ptr<Augmentation>> augs;
    for (const auto& entry : j["augmentations"]) {
        augs.push_back(Augmentation::from_json(entry));
    }

    try {
        return AugmentPipeline(std::move(augs), j.value("max_augs_per_batch", size_t{0}),
                               j.value("hard_aug", true));
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigurationError(std::string("bad pipeline option: ") + e.what());
    }
}
