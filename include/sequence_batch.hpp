#pragma once

#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief A batch of one-hot encoded sequences with shape (N, A, L).
 *
 * N is the number of examples, A the alphabet size and L the sequence
 * length. Data is stored row-major so each example is a contiguous A x L
 * block and each channel of an example is a contiguous run of L floats.
 * Features include:
 * - Checked element access
 * - One-hot encoding and decoding of symbol indices
 * - Per-example rotation and two-axis flips used by the augmentations
 */
class SequenceBatch {
  public:
    SequenceBatch() : dims_{0, 0, 0} {}

    /**
     * @brief Constructs a zero-filled batch.
     * @param batch_size Number of examples (N)
     * @param alphabet_size Number of symbols (A)
     * @param length Positions per sequence (L)
     */
    SequenceBatch(size_t batch_size, size_t alphabet_size, size_t length);

    /**
     * @brief Builds a one-hot batch from per-example symbol indices.
     * @param indices One vector of symbol indices per example
     * @param alphabet_size Number of symbols (A)
     * @return Batch of shape (indices.size(), alphabet_size, L)
     * @throws ShapeError if the index vectors differ in length
     * @throws std::out_of_range if an index is not below alphabet_size
     */
    static SequenceBatch from_indices(const std::vector<std::vector<size_t>>& indices,
                                      size_t alphabet_size);

    /**
     * @brief Decodes every position to the index of its largest channel.
     * @return One vector of L symbol indices per example
     */
    std::vector<std::vector<size_t>> to_indices() const;

    /**
     * @brief Checks whether every position is a one-hot vector.
     * @param tolerance Allowed deviation from exact 0 and 1
     */
    bool is_one_hot(float tolerance = 1e-6f) const;

    size_t batch_size() const {
        return dims_[0];
    }

    size_t alphabet_size() const {
        return dims_[1];
    }

    size_t length() const {
        return dims_[2];
    }

    const std::vector<size_t>& dims() const {
        return dims_;
    }

    size_t size() const {
        return data_.size();
    }

    bool empty() const {
        return data_.empty();
    }

    std::vector<float>& data() {
        return data_;
    }

    const std::vector<float>& data() const {
        return data_;
    }

    /**
     * @brief Accesses an element (mutable).
     * @throws std::out_of_range if any index is outside the batch
     */
    float& at(size_t n, size_t a, size_t l);

    /**
     * @brief Accesses an element (const).
     * @throws std::out_of_range if any index is outside the batch
     */
    float at(size_t n, size_t a, size_t l) const;

    /**
     * @brief Unchecked pointer to channel a of example n.
     */
    float* channel(size_t n, size_t a) {
        return data_.data() + (n * dims_[1] + a) * dims_[2];
    }

    const float* channel(size_t n, size_t a) const {
        return data_.data() + (n * dims_[1] + a) * dims_[2];
    }

    bool same_shape(const SequenceBatch& other) const {
        return dims_ == other.dims_;
    }

    /**
     * @brief Formats the shape as "(N, A, L)".
     */
    std::string shape_string() const;

    /**
     * @brief Sets every element to value.
     */
    void fill(float value);

    /**
     * @brief Circularly rotates example n along the length axis.
     *
     * Element at position l moves to position (l + shift) mod L, so a
     * positive shift moves content toward higher indices.
     *
     * @param n Example index
     * @param shift Signed rotation amount
     */
    void roll_example(size_t n, long shift);

    /**
     * @brief Reverses both the alphabet axis and the length axis of example
     * n within positions [begin, end).
     * @throws std::out_of_range if end exceeds L or begin > end
     */
    void flip_example(size_t n, size_t begin, size_t end);

  private:
    std::vector<size_t> dims_;  ///< (N, A, L)
    std::vector<float> data_;   ///< Flattened batch data
};
