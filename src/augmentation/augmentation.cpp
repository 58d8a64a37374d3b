#include "../../include/augmentations.hpp"
#include "../../include/augment_errors.hpp"
#include <string>

void Augmentation::check_batch(const SequenceBatch& x, const std::string& who) {
    if (x.alphabet_size() == 0 || x.length() == 0) {
        throw ShapeError(who + " needs a batch with a non-empty alphabet and length, got " +
                         x.shape_string());
    }
}

void Augmentation::check_range(long min_value, long max_value, const std::string& min_name,
                               const std::string& max_name) {
    if (min_value < 0 || max_value < 0) {
        throw ConfigurationError(min_name + " and " + max_name + " must be non-negative, got " +
                                 std::to_string(min_value) + " and " +
                                 std::to_string(max_value));
    }
    if (min_value > max_value) {
        throw ConfigurationError(min_name + " (" + std::to_string(min_value) +
                                 ") must not exceed " + max_name + " (" +
                                 std::to_string(max_value) + ")");
    }
}

void Augmentation::check_probability(double value, const std::string& param_name) {
    // Negated comparison so NaN is rejected too
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ConfigurationError(param_name + " must lie in [0, 1], got " + std::to_string(value));
    }
}

void Augmentation::check_fits_length(long max_value, const std::string& max_name, size_t length) {
    if (static_cast<size_t>(max_value) > length) {
        throw ConfigurationError(max_name + " (" + std::to_string(max_value) +
                                 ") exceeds sequence length " + std::to_string(length));
    }
}

std::unique_ptr<Augmentation> Augmentation::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        throw ConfigurationError("augmentation entry needs a string \"type\": " + j.dump());
    }

    const std::string type = j["type"].get<std::string>();
    try {
        if (type == "deletion") {
            return std::make_unique<RandomDeletion>(j.value("delete_min", 0L),
                                                    j.value("delete_max", 30L));
        }
        if (type == "insertion") {
            return std::make_unique<RandomInsertion>(j.value("insert_min", 0L),
                                                     j.value("insert_max", 30L));
        }
        if (type == "translocation") {
            return std::make_unique<RandomTranslocation>(j.value("shift_min", 0L),
                                                         j.value("shift_max", 30L));
        }
        if (type == "inversion") {
            return std::make_unique<RandomInversion>(j.value("invert_min", 0L),
                                                     j.value("invert_max", 30L));
        }
        if (type == "mutation") {
            return std::make_unique<RandomMutation>(j.value("mutate_frac", 0.1));
        }
        if (type == "rc") {
            return std::make_unique<RandomRC>(j.value("rc_prob", 0.5));
        }
        if (type == "noise") {
            return std::make_unique<RandomNoise>(j.value("noise_mean", 0.0f),
                                                 j.value("noise_std", 0.2f));
        }
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigurationError("bad parameter type in " + type + " entry: " + e.what());
    }

    throw ConfigurationError("unknown augmentation type \"" + type + "\"");
}
