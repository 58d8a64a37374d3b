#include "../../include/augmentation/translocation.hpp"
#include "../../include/parameter_sampler.hpp"
#include <omp.h>

RandomTranslocation::RandomTranslocation(long shift_min, long shift_max)
    : shift_min_(shift_min), shift_max_(shift_max) {
    check_range(shift_min_, shift_max_, "shift_min", "shift_max");
}

SequenceBatch RandomTranslocation::apply(const SequenceBatch& x, std::mt19937& rng) const {
    check_batch(x, "RandomTranslocation");

    const size_t N = x.batch_size();
    auto shifts = ParameterSampler::sample_uniform_ints(N, shift_min_, shift_max_, rng);
    auto signs = ParameterSampler::sample_signs(N, rng);

    SequenceBatch out = x;

#pragma omp parallel for
    for (size_t n = 0; n < N; ++n) {
        out.roll_example(n, signs[n] * shifts[n]);
    }

    return out;
}

nlohmann::json RandomTranslocation::to_json() const {
    return {{"type", name()}, {"shift_min", shift_min_}, {"shift_max", shift_max_}};
}
