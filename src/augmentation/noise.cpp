#include "../../include/augmentation/noise.hpp"
#include "../../include/augment_errors.hpp"
#include <cmath>
#include <string>

RandomNoise::RandomNoise(float noise_mean, float noise_std)
    : noise_mean_(noise_mean), noise_std_(noise_std) {
    if (!std::isfinite(noise_mean_)) {
        throw ConfigurationError("noise_mean must be finite");
    }
    if (!(noise_std_ >= 0.0f) || !std::isfinite(noise_std_)) {
        throw ConfigurationError("noise_std must be a finite non-negative value, got " +
                                 std::to_string(noise_std_));
    }
}

SequenceBatch RandomNoise::apply(const SequenceBatch& x, std::mt19937& rng) const {
    check_batch(x, "RandomNoise");

    SequenceBatch out = x;
    auto& values = out.data();

    // normal_distribution requires a strictly positive stddev
    if (noise_std_ == 0.0f) {
        for (auto& v : values) {
            v += noise_mean_;
        }
        return out;
    }

    std::normal_distribution<float> dist(noise_mean_, noise_std_);
    for (auto& v : values) {
        v += dist(rng);
    }
    return out;
}

nlohmann::json RandomNoise::to_json() const {
    return {{"type", name()}, {"noise_mean", noise_mean_}, {"noise_std", noise_std_}};
}
