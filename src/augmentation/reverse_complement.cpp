#include "../../include/augmentation/reverse_complement.hpp"
#include "../../include/parameter_sampler.hpp"
#include <omp.h>

RandomRC::RandomRC(double rc_prob) : rc_prob_(rc_prob) {
    check_probability(rc_prob_, "rc_prob");
}

SequenceBatch RandomRC::apply(const SequenceBatch& x, std::mt19937& rng) const {
    check_batch(x, "RandomRC");

    const size_t N = x.batch_size();
    auto selected = ParameterSampler::sample_bernoulli(N, rc_prob_, rng);

    SequenceBatch out = x;

#pragma omp parallel for
    for (size_t n = 0; n < N; ++n) {
        if (selected[n]) {
            out.flip_example(n, 0, out.length());
        }
    }

    return out;
}

nlohmann::json RandomRC::to_json() const {
    return {{"type", name()}, {"rc_prob", rc_prob_}};
}
