#include "../../include/augmentation/insertion.hpp"
#include "../../include/parameter_sampler.hpp"
#include "../../include/random_sequence.hpp"
#include <algorithm>
#include <omp.h>
#include <vector>

RandomInsertion::RandomInsertion(long insert_min, long insert_max)
    : insert_min_(insert_min), insert_max_(insert_max) {
    check_range(insert_min_, insert_max_, "insert_min", "insert_max");
}

SequenceBatch RandomInsertion::apply(const SequenceBatch& x, std::mt19937& rng) const {
    check_batch(x, "RandomInsertion");
    check_fits_length(insert_max_, "insert_max", x.length());

    const size_t N = x.batch_size();
    const size_t A = x.alphabet_size();
    const long L = static_cast<long>(x.length());

    SequenceBatch insertions = RandomSequenceGenerator::fragments(N, A, insert_max_, rng);
    auto insert_lens = ParameterSampler::sample_uniform_ints(N, insert_min_, insert_max_, rng);
    auto insert_inds = ParameterSampler::sample_uniform_ints(N, 0, L, rng);

    // Offset of the L-long window inside the (L + insert_max)-long padded sequence
    const long window_start = insert_max_ / 2;

    SequenceBatch out(N, A, x.length());

#pragma omp parallel for
    for (size_t n = 0; n < N; ++n) {
        const long len = insert_lens[n];
        const long ind = insert_inds[n];
        const long pad_front = (insert_max_ - len) / 2;

        std::vector<float> padded(static_cast<size_t>(L + insert_max_));
        for (size_t a = 0; a < A; ++a) {
            const float* src = x.channel(n, a);
            const float* frag = insertions.channel(n, a);

            auto it = std::copy(frag, frag + pad_front, padded.begin());
            it = std::copy(src, src + ind, it);
            it = std::copy(frag + pad_front, frag + pad_front + len, it);
            it = std::copy(src + ind, src + L, it);
            std::copy(frag + pad_front + len, frag + insert_max_, it);

            std::copy(padded.begin() + window_start, padded.begin() + window_start + L,
                      out.channel(n, a));
        }
    }

    return out;
}

nlohmann::json RandomInsertion::to_json() const {
    return {{"type", name()}, {"insert_min", insert_min_}, {"insert_max", insert_max_}};
}
