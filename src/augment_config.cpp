#include "../include/augment_config.hpp"
#include "../include/augment_errors.hpp"
#include "../include/augmentations.hpp"
#include "../include/logger.hpp"
#include <fstream>
#include <stdexcept>

void AugmentConfig::load_from_json(const std::string& config_path) {
    Logger& logger = Logger::getInstance();

    std::ifstream file(config_path);
    if (!file.is_open()) {
        logger.log("Could not open augmentation config: " + config_path, true);
        throw std::runtime_error("Could not open config file: " + config_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        logger.log("Failed to parse " + config_path + ": " + e.what(), true);
        throw std::runtime_error("Failed to parse config file " + config_path + ": " + e.what());
    }

    try {
        *this = from_json(j);
        validate();
    } catch (const ConfigurationError& e) {
        logger.log(std::string(e.what()) + " (in " + config_path + ")", true);
        throw;
    }

    logger.log("Loaded augmentation config from " + config_path + " with " +
               std::to_string(order.size()) + " augmentations");
}

void AugmentConfig::save_to_json(const std::string& config_path) const {
    std::ofstream file(config_path);
    if (!file.is_open()) {
        Logger::getInstance().log("Could not write augmentation config: " + config_path, true);
        throw std::runtime_error("Could not open config file for writing: " + config_path);
    }
    file << to_json().dump(4) << std::endl;
}

nlohmann::json AugmentConfig::to_json() const {
    nlohmann::json j;

    j["deletion"] = {{"delete_min", deletion.delete_min}, {"delete_max", deletion.delete_max}};
    j["insertion"] = {{"insert_min", insertion.insert_min},
                      {"insert_max", insertion.insert_max}};
    j["translocation"] = {{"shift_min", translocation.shift_min},
                          {"shift_max", translocation.shift_max}};
    j["inversion"] = {{"invert_min", inversion.invert_min},
                      {"invert_max", inversion.invert_max}};
    j["mutation"] = {{"mutate_frac", mutation.mutate_frac}};
    j["rc"] = {{"rc_prob", reverse_complement.rc_prob}};
    j["noise"] = {{"noise_mean", noise.noise_mean}, {"noise_std", noise.noise_std}};

    j["pipeline"] = {{"order", order},
                     {"max_augs_per_batch", max_augs_per_batch},
                     {"hard_aug", hard_aug}};

    if (seed) {
        j["seed"] = *seed;
    }
    j["logging"] = {{"file", log_file}, {"console", log_to_console}};
    return j;
}

AugmentConfig AugmentConfig::from_json(const nlohmann::json& j) {
    AugmentConfig config;
    if (!j.is_object()) {
        throw ConfigurationError("augmentation config must be a JSON object");
    }

    try {
        if (j.contains("deletion")) {
            const auto& d = j["deletion"];
            config.deletion.delete_min = d.value("delete_min", config.deletion.delete_min);
            config.deletion.delete_max = d.value("delete_max", config.deletion.delete_max);
        }

        if (j.contains("insertion")) {
            const auto& ins = j["insertion"];
            config.insertion.insert_min = ins.value("insert_min", config.insertion.insert_min);
            config.insertion.insert_max = ins.value("insert_max", config.insertion.insert_max);
        }

        if (j.contains("translocation")) {
            const auto& t = j["translocation"];
            config.translocation.shift_min = t.value("shift_min", config.translocation.shift_min);
            config.translocation.shift_max = t.value("shift_max", config.translocation.shift_max);
        }

        if (j.contains("inversion")) {
            const auto& inv = j["inversion"];
            config.inversion.invert_min = inv.value("invert_min", config.inversion.invert_min);
            config.inversion.invert_max = inv.value("invert_max", config.inversion.invert_max);
        }

        if (j.contains("mutation")) {
            config.mutation.mutate_frac =
                j["mutation"].value("mutate_frac", config.mutation.mutate_frac);
        }

        if (j.contains("rc")) {
            config.reverse_complement.rc_prob =
                j["rc"].value("rc_prob", config.reverse_complement.rc_prob);
        }

        if (j.contains("noise")) {
            const auto& nz = j["noise"];
            config.noise.noise_mean = nz.value("noise_mean", config.noise.noise_mean);
            config.noise.noise_std = nz.value("noise_std", config.noise.noise_std);
        }

        if (j.contains("pipeline")) {
            const auto& p = j["pipeline"];
            config.order = p.value("order", config.order);
            config.max_augs_per_batch = p.value("max_augs_per_batch", config.max_augs_per_batch);
            config.hard_aug = p.value("hard_aug", config.hard_aug);
        }

        if (j.contains("seed") && !j["seed"].is_null()) {
            config.seed = j["seed"].get<unsigned int>();
        }

        if (j.contains("logging")) {
            const auto& lg = j["logging"];
            config.log_file = lg.value("file", config.log_file);
            config.log_to_console = lg.value("console", config.log_to_console);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("malformed augmentation config: ") + e.what());
    }

    return config;
}

std::unique_ptr<Augmentation> AugmentConfig::make_augmentation(const std::string& name) const {
    if (name == "deletion") {
        return std::make_unique<RandomDeletion>(deletion.delete_min, deletion.delete_max);
    }
    if (name == "insertion") {
        return std::make_unique<RandomInsertion>(insertion.insert_min, insertion.insert_max);
    }
    if (name == "translocation") {
        return std::make_unique<RandomTranslocation>(translocation.shift_min,
                                                     translocation.shift_max);
    }
    if (name == "inversion") {
        return std::make_unique<RandomInversion>(inversion.invert_min, inversion.invert_max);
    }
    if (name == "mutation") {
        return std::make_unique<RandomMutation>(mutation.mutate_frac);
    }
    if (name == "rc") {
        return std::make_unique<RandomRC>(reverse_complement.rc_prob);
    }
    if (name == "noise") {
        return std::make_unique<RandomNoise>(noise.noise_mean, noise.noise_std);
    }
    throw ConfigurationError("unknown augmentation \"" + name + "\" in pipeline order");
}

void AugmentConfig::validate() const {
    build_pipeline();
}

AugmentPipeline AugmentConfig::build_pipeline() const {
    std::vector<std::unique_ptr<Augmentation>> augs;
    augs.reserve(order.size());
    for (const auto& name : order) {
        augs.push_back(make_augmentation(name));
    }
    return AugmentPipeline(std::move(augs), max_augs_per_batch, hard_aug);
}

std::mt19937 AugmentConfig::make_rng() const {
    if (seed) {
        return std::mt19937(*seed);
    }
    return std::mt19937(std::random_device{}());
}

void AugmentConfig::configure_logging() const {
    Logger& logger = Logger::getInstance();
    logger.enableConsole(log_to_console);
    if (!log_file.empty()) {
        logger.startLogging(log_file);
    }
}
