#include "../../include/augmentation/inversion.hpp"
#include "../../include/parameter_sampler.hpp"
#include <omp.h>

RandomInversion::RandomInversion(long invert_min, long invert_max)
    : invert_min_(invert_min), invert_max_(invert_max) {
    check_range(invert_min_, invert_max_, "invert_min", "invert_max");
}

SequenceBatch RandomInversion::apply(const SequenceBatch& x, std::mt19937& rng) const {
    check_batch(x, "RandomInversion");
    check_fits_length(invert_max_, "invert_max", x.length());

    const size_t N = x.batch_size();
    const long L = static_cast<long>(x.length());

    auto invert_lens = ParameterSampler::sample_uniform_ints(N, invert_min_, invert_max_, rng);
    auto invert_inds = ParameterSampler::sample_uniform_ints(N, 0, L - invert_max_, rng);

    SequenceBatch out = x;

#pragma omp parallel for
    for (size_t n = 0; n < N; ++n) {
        const size_t begin = static_cast<size_t>(invert_inds[n]);
        out.flip_example(n, begin, begin + static_cast<size_t>(invert_lens[n]));
    }

    return out;
}

nlohmann::json RandomInversion::to_json() const {
    return {{"type", name()}, {"invert_min", invert_min_}, {"invert_max", invert_max_}};
}
