#ifndef SEQAUG_AUGMENT_CONFIG_HPP
#define SEQAUG_AUGMENT_CONFIG_HPP

#include "augment_pipeline.hpp"
#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>
#include <vector>

struct DeletionConfig {
    long delete_min = 0;
    long delete_max = 30;
};

struct InsertionConfig {
    long insert_min = 0;
    long insert_max = 30;
};

struct TranslocationConfig {
    long shift_min = 0;
    long shift_max = 30;
};

struct InversionConfig {
    long invert_min = 0;
    long invert_max = 30;
};

struct MutationConfig {
    double mutate_frac = 0.1;
};

struct ReverseComplementConfig {
    double rc_prob = 0.5;
};

struct NoiseConfig {
    float noise_mean = 0.0f;
    float noise_std = 0.2f;
};

/**
 * @brief Configuration for a sequence augmentation pipeline.
 *
 * Holds the bounds of every augmentation, the order in which the enabled
 * ones are applied and the optional random subset settings. The JSON layout
 * mirrors the struct:
 *
 *     {
 *       "deletion": {"delete_min": 0, "delete_max": 30},
 *       ...
 *       "pipeline": {"order": ["deletion", "rc"], "max_augs_per_batch": 0,
 *                    "hard_aug": true},
 *       "seed": 42,
 *       "logging": {"file": "logs/seqaug.log", "console": false}
 *     }
 *
 * Every section is optional; missing values keep their defaults.
 */
struct AugmentConfig {
    DeletionConfig deletion;
    InsertionConfig insertion;
    TranslocationConfig translocation;
    InversionConfig inversion;
    MutationConfig mutation;
    ReverseComplementConfig reverse_complement;
    NoiseConfig noise;

    // Pipeline settings
    std::vector<std::string> order = {"deletion", "insertion", "translocation", "inversion",
                                      "mutation",  "rc",        "noise"};
    size_t max_augs_per_batch = 0;
    bool hard_aug = true;

    std::optional<unsigned int> seed;

    // Logging
    std::string log_file;
    bool log_to_console = false;

    /**
     * @brief Loads configuration from a JSON file.
     * @param config_path Path to the JSON file
     * @throws std::runtime_error if the file cannot be opened or parsed
     * @throws ConfigurationError if any bound is invalid
     */
    void load_from_json(const std::string& config_path);

    /**
     * @brief Writes the configuration to a JSON file.
     * @throws std::runtime_error if the file cannot be written
     */
    void save_to_json(const std::string& config_path) const;

    nlohmann::json to_json() const;
    static AugmentConfig from_json(const nlohmann::json& j);

    /**
     * @brief Checks every bound by constructing the augmentations.
     * @throws ConfigurationError describing the first invalid bound
     */
    void validate() const;

    /**
     * @brief Creates the augmentation named in the pipeline order.
     * @throws ConfigurationError for an unknown name
     */
    std::unique_ptr<Augmentation> make_augmentation(const std::string& name) const;

    /**
     * @brief Creates the pipeline described by this configuration.
     */
    AugmentPipeline build_pipeline() const;

    /**
     * @brief Creates the generator for the pipeline, seeded when seed is set.
     */
    std::mt19937 make_rng() const;

    /**
     * @brief Starts the logger according to the logging section.
     */
    void configure_logging() const;
};

#endif // SEQAUG_AUGMENT_CONFIG_HPP
