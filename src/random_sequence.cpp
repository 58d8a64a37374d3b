#include "../include/random_sequence.hpp"
#include "../include/augment_errors.hpp"
#include <string>

std::vector<size_t> RandomSequenceGenerator::symbols(size_t n, size_t alphabet_size,
                                                     std::mt19937& rng) {
    if (n == 0) {
        return {};
    }
    if (alphabet_size == 0) {
        throw ShapeError("cannot draw symbols from an empty alphabet");
    }
    std::uniform_int_distribution<size_t> dist(0, alphabet_size - 1);
    std::vector<size_t> out(n);
    for (auto& s : out) {
        s = dist(rng);
    }
    return out;
}

SequenceBatch RandomSequenceGenerator::fragments(size_t num_fragments, size_t alphabet_size,
                                                 long length, std::mt19937& rng) {
    if (length < 0) {
        throw ConfigurationError("random fragment length must be non-negative, got " +
                                 std::to_string(length));
    }
    const size_t L = static_cast<size_t>(length);
    SequenceBatch out(num_fragments, alphabet_size, L);
    for (size_t n = 0; n < num_fragments; ++n) {
        auto drawn = symbols(L, alphabet_size, rng);
        for (size_t l = 0; l < L; ++l) {
            out.channel(n, drawn[l])[l] = 1.0f;
        }
    }
    return out;
}
