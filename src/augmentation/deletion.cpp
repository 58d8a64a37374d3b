#include "../../include/augmentation/deletion.hpp"
#include "../../include/parameter_sampler.hpp"
#include "../../include/random_sequence.hpp"
#include <algorithm>
#include <omp.h>

RandomDeletion::RandomDeletion(long delete_min, long delete_max)
    : delete_min_(delete_min), delete_max_(delete_max) {
    check_range(delete_min_, delete_max_, "delete_min", "delete_max");
}

SequenceBatch RandomDeletion::apply(const SequenceBatch& x, std::mt19937& rng) const {
    check_batch(x, "RandomDeletion");
    check_fits_length(delete_max_, "delete_max", x.length());

    const size_t N = x.batch_size();
    const size_t A = x.alphabet_size();
    const long L = static_cast<long>(x.length());

    SequenceBatch padding = RandomSequenceGenerator::fragments(N, A, delete_max_, rng);
    auto delete_lens = ParameterSampler::sample_uniform_ints(N, delete_min_, delete_max_, rng);
    // Start is bounded by delete_max so every realised length stays in bounds
    auto delete_inds = ParameterSampler::sample_uniform_ints(N, 0, L - delete_max_, rng);

    SequenceBatch out(N, A, x.length());

#pragma omp parallel for
    for (size_t n = 0; n < N; ++n) {
        const long len = delete_lens[n];
        const long start = delete_inds[n];
        const long pad_front = len / 2;
        const long pad_back = len - pad_front;

        for (size_t a = 0; a < A; ++a) {
            const float* src = x.channel(n, a);
            const float* pad = padding.channel(n, a);
            float* dst = out.channel(n, a);

            dst = std::copy(pad, pad + pad_front, dst);
            dst = std::copy(src, src + start, dst);
            dst = std::copy(src + start + len, src + L, dst);
            std::copy(pad + delete_max_ - pad_back, pad + delete_max_, dst);
        }
    }

    return out;
}

nlohmann::json RandomDeletion::to_json() const {
    return {{"type", name()}, {"delete_min", delete_min_}, {"delete_max", delete_max_}};
}
