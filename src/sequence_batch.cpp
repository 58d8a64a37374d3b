#include "../include/sequence_batch.hpp"
#include "../include/augment_errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

SequenceBatch::SequenceBatch(size_t batch_size, size_t alphabet_size, size_t length)
    : dims_{batch_size, alphabet_size, length} {
    data_.resize(batch_size * alphabet_size * length, 0.0f);
}

SequenceBatch SequenceBatch::from_indices(const std::vector<std::vector<size_t>>& indices,
                                          size_t alphabet_size) {
    const size_t length = indices.empty() ? 0 : indices.front().size();
    SequenceBatch batch(indices.size(), alphabet_size, length);

    for (size_t n = 0; n < indices.size(); ++n) {
        if (indices[n].size() != length) {
            throw ShapeError("example " + std::to_string(n) + " has length " +
                             std::to_string(indices[n].size()) + ", expected " +
                             std::to_string(length));
        }
        for (size_t l = 0; l < length; ++l) {
            if (indices[n][l] >= alphabet_size) {
                throw std::out_of_range("Symbol index " + std::to_string(indices[n][l]) +
                                        " out of range for alphabet of size " +
                                        std::to_string(alphabet_size));
            }
            batch.channel(n, indices[n][l])[l] = 1.0f;
        }
    }
    return batch;
}

std::vector<std::vector<size_t>> SequenceBatch::to_indices() const {
    std::vector<std::vector<size_t>> indices(batch_size(), std::vector<size_t>(length(), 0));
    for (size_t n = 0; n < batch_size(); ++n) {
        for (size_t l = 0; l < length(); ++l) {
            float best = channel(n, 0)[l];
            for (size_t a = 1; a < alphabet_size(); ++a) {
                if (channel(n, a)[l] > best) {
                    best = channel(n, a)[l];
                    indices[n][l] = a;
                }
            }
        }
    }
    return indices;
}

bool SequenceBatch::is_one_hot(float tolerance) const {
    for (size_t n = 0; n < batch_size(); ++n) {
        for (size_t l = 0; l < length(); ++l) {
            size_t hot = 0;
            for (size_t a = 0; a < alphabet_size(); ++a) {
                float v = channel(n, a)[l];
                if (std::abs(v - 1.0f) <= tolerance) {
                    ++hot;
                } else if (std::abs(v) > tolerance) {
                    return false;
                }
            }
            if (hot != 1) {
                return false;
            }
        }
    }
    return true;
}

float& SequenceBatch::at(size_t n, size_t a, size_t l) {
    if (n >= dims_[0] || a >= dims_[1] || l >= dims_[2]) {
        throw std::out_of_range("SequenceBatch index out of bounds");
    }
    return data_[(n * dims_[1] + a) * dims_[2] + l];
}

float SequenceBatch::at(size_t n, size_t a, size_t l) const {
    if (n >= dims_[0] || a >= dims_[1] || l >= dims_[2]) {
        throw std::out_of_range("SequenceBatch index out of bounds");
    }
    return data_[(n * dims_[1] + a) * dims_[2] + l];
}

std::string SequenceBatch::shape_string() const {
    return "(" + std::to_string(dims_[0]) + ", " + std::to_string(dims_[1]) + ", " +
           std::to_string(dims_[2]) + ")";
}

void SequenceBatch::fill(float value) {
    std::fill(data_.begin(), data_.end(), value);
}

void SequenceBatch::roll_example(size_t n, long shift) {
    const long L = static_cast<long>(length());
    if (L == 0) {
        return;
    }
    // Normalise into [0, L) so negative shifts rotate toward lower indices
    long s = ((shift % L) + L) % L;
    if (s == 0) {
        return;
    }
    for (size_t a = 0; a < alphabet_size(); ++a) {
        float* row = channel(n, a);
        std::rotate(row, row + (L - s), row + L);
    }
}

void SequenceBatch::flip_example(size_t n, size_t begin, size_t end) {
    if (begin > end || end > length()) {
        throw std::out_of_range("Flip interval [" + std::to_string(begin) + ", " +
                                std::to_string(end) + ") outside sequence of length " +
                                std::to_string(length()));
    }
    const size_t A = alphabet_size();
    const size_t width = end - begin;
    if (width == 0 || A == 0) {
        return;
    }

    std::vector<float> block(A * width);
    for (size_t a = 0; a < A; ++a) {
        std::copy(channel(n, a) + begin, channel(n, a) + end, block.begin() + a * width);
    }
    for (size_t a = 0; a < A; ++a) {
        const float* src = block.data() + (A - 1 - a) * width;
        float* dst = channel(n, a) + begin;
        std::reverse_copy(src, src + width, dst);
    }
}
