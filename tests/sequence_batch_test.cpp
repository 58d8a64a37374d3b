#include <gtest/gtest.h>
#include "../include/augment_errors.hpp"
#include "../include/sequence_batch.hpp"
#include "test_helpers.hpp"

TEST(SequenceBatchTest, ConstructsZeroFilled) {
    SequenceBatch batch(2, 4, 10);
    EXPECT_EQ(batch.batch_size(), 2u);
    EXPECT_EQ(batch.alphabet_size(), 4u);
    EXPECT_EQ(batch.length(), 10u);
    EXPECT_EQ(batch.size(), 80u);
    EXPECT_EQ(batch.shape_string(), "(2, 4, 10)");
    EXPECT_EQ(batch.dims(), (std::vector<size_t>{2, 4, 10}));
    EXPECT_EQ(SequenceBatch().dims(), (std::vector<size_t>{0, 0, 0}));
    for (float v : batch.data()) {
        EXPECT_EQ(v, 0.0f);
    }
}

TEST(SequenceBatchTest, AtChecksBounds) {
    SequenceBatch batch(1, 4, 3);
    batch.at(0, 3, 2) = 1.0f;
    EXPECT_EQ(batch.channel(0, 3)[2], 1.0f);
    EXPECT_THROW(batch.at(1, 0, 0), std::out_of_range);
    EXPECT_THROW(batch.at(0, 4, 0), std::out_of_range);
    EXPECT_THROW(batch.at(0, 0, 3), std::out_of_range);
}

TEST(SequenceBatchTest, IndicesRoundTripThroughOneHot) {
    std::vector<std::vector<size_t>> seqs = {{0, 1, 2, 3, 0}, {3, 3, 2, 1, 1}};
    SequenceBatch batch = SequenceBatch::from_indices(seqs, 4);
    EXPECT_TRUE(batch.is_one_hot());
    EXPECT_EQ(batch.at(1, 3, 0), 1.0f);
    EXPECT_EQ(batch.to_indices(), seqs);
}

TEST(SequenceBatchTest, FromIndicesRejectsRaggedInput) {
    std::vector<std::vector<size_t>> ragged = {{0, 1, 2}, {0, 1}};
    EXPECT_THROW(SequenceBatch::from_indices(ragged, 4), ShapeError);

    std::vector<std::vector<size_t>> bad_symbol = {{0, 4}};
    EXPECT_THROW(SequenceBatch::from_indices(bad_symbol, 4), std::out_of_range);
}

TEST(SequenceBatchTest, IsOneHotDetectsNoise) {
    SequenceBatch batch = make_random_batch(2, 4, 20);
    EXPECT_TRUE(batch.is_one_hot());
    batch.at(0, 0, 0) += 0.3f;
    EXPECT_FALSE(batch.is_one_hot());
}

TEST(SequenceBatchTest, RollMovesContentTowardHigherIndices) {
    SequenceBatch batch = SequenceBatch::from_indices({{0, 1, 2, 3, 3}}, 4);
    batch.roll_example(0, 2);
    EXPECT_EQ(batch.to_indices()[0], (std::vector<size_t>{3, 3, 0, 1, 2}));
    batch.roll_example(0, -3);
    EXPECT_EQ(batch.to_indices()[0], (std::vector<size_t>{1, 2, 3, 3, 0}));
}

TEST(SequenceBatchTest, RollThenInverseRollRestoresSequence) {
    const SequenceBatch original = make_random_batch(1, 4, 37);
    for (long s = -80; s <= 80; ++s) {
        SequenceBatch rolled = original;
        rolled.roll_example(0, s);
        rolled.roll_example(0, -s);
        EXPECT_EQ(rolled.data(), original.data()) << "shift " << s;
    }
}

TEST(SequenceBatchTest, FlipReversesBothAxesInsideInterval) {
    SequenceBatch batch = SequenceBatch::from_indices({{0, 0, 1, 2, 3, 3}}, 4);
    batch.flip_example(0, 1, 4);
    // positions 1..3 were (0, 1, 2); reversed (2, 1, 0); complemented (1, 2, 3)
    EXPECT_EQ(batch.to_indices()[0], (std::vector<size_t>{0, 1, 2, 3, 3, 3}));
    EXPECT_THROW(batch.flip_example(0, 2, 7), std::out_of_range);
}
