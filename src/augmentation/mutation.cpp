#include "../../include/augmentation/mutation.hpp"
#include "../../include/parameter_sampler.hpp"
#include "../../include/random_sequence.hpp"
#include <algorithm>
#include <cmath>
#include <omp.h>
#include <vector>

RandomMutation::RandomMutation(double mutate_frac) : mutate_frac_(mutate_frac) {
    check_probability(mutate_frac_, "mutate_frac");
}

size_t RandomMutation::num_mutations(size_t length) const {
    // 1 in 4 substitutions are silent, nearbyint rounds ties to even
    const double expected = mutate_frac_ / 0.75 * static_cast<double>(length);
    const size_t count = static_cast<size_t>(std::nearbyint(expected));
    return std::min(count, length);
}

SequenceBatch RandomMutation::apply(const SequenceBatch& x, std::mt19937& rng) const {
    check_batch(x, "RandomMutation");

    const size_t N = x.batch_size();
    const size_t A = x.alphabet_size();
    const size_t k = num_mutations(x.length());

    std::vector<std::vector<size_t>> positions(N);
    std::vector<std::vector<size_t>> symbols(N);
    for (size_t n = 0; n < N; ++n) {
        positions[n] = ParameterSampler::sample_without_replacement(x.length(), k, rng);
    }
    for (size_t n = 0; n < N; ++n) {
        symbols[n] = RandomSequenceGenerator::symbols(k, A, rng);
    }

    SequenceBatch out = x;

#pragma omp parallel for
    for (size_t n = 0; n < N; ++n) {
        for (size_t i = 0; i < k; ++i) {
            const size_t l = positions[n][i];
            for (size_t a = 0; a < A; ++a) {
                out.channel(n, a)[l] = (a == symbols[n][i]) ? 1.0f : 0.0f;
            }
        }
    }

    return out;
}

nlohmann::json RandomMutation::to_json() const {
    return {{"type", name()}, {"mutate_frac", mutate_frac_}};
}
