#include <gtest/gtest.h>
#include "../include/augment_errors.hpp"
#include "../include/augment_pipeline.hpp"
#include "../include/augmentations.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <set>

namespace {

AugmentPipeline make_scenario_pipeline() {
    AugmentPipeline pipeline;
    pipeline.add(std::make_unique<RandomDeletion>(0, 30))
        .add(std::make_unique<RandomInsertion>(0, 20))
        .add(std::make_unique<RandomRC>(0.0));
    return pipeline;
}

} // namespace

TEST(AugmentPipelineTest, ScenarioKeepsShapeAndZeroProbabilityRCIsIdentity) {
    const SequenceBatch x = make_random_batch(8, 4, 200);
    AugmentPipeline pipeline = make_scenario_pipeline();

    std::mt19937 rng(314);
    SequenceBatch y = pipeline.apply(x, rng);
    EXPECT_EQ(y.shape_string(), "(8, 4, 200)");

    // Replay the same draws without the RC step
    std::mt19937 replay(314);
    SequenceBatch before_rc = RandomDeletion(0, 30).apply(x, replay);
    before_rc = RandomInsertion(0, 20).apply(before_rc, replay);
    EXPECT_EQ(y.data(), before_rc.data());
}

TEST(AugmentPipelineTest, AppliesAugmentationsInOrder) {
    const SequenceBatch x = make_random_batch(4, 4, 50);
    AugmentPipeline pipeline;
    pipeline.add(std::make_unique<RandomRC>(1.0)).add(std::make_unique<RandomInversion>(50, 50));
    EXPECT_EQ(pipeline.names(), (std::vector<std::string>{"rc", "inversion"}));

    // Full reverse-complement followed by a full-length inversion undoes itself
    std::mt19937 rng(1);
    EXPECT_EQ(pipeline.apply(x, rng).data(), x.data());
}

TEST(AugmentPipelineTest, EmptyPipelineReturnsInput) {
    const SequenceBatch x = make_random_batch(2, 4, 10);
    AugmentPipeline pipeline;
    std::mt19937 rng(2);
    EXPECT_EQ(pipeline.apply(x, rng).data(), x.data());
}

TEST(AugmentPipelineTest, RejectsBatchesWithDifferentAlphabetOrLength) {
    AugmentPipeline pipeline = make_scenario_pipeline();
    std::mt19937 rng(3);
    pipeline.apply(make_random_batch(8, 4, 200), rng);
    EXPECT_TRUE(pipeline.has_established_shape());

    // Batch size may change between calls
    EXPECT_NO_THROW(pipeline.apply(make_random_batch(3, 4, 200), rng));
    EXPECT_THROW(pipeline.apply(make_random_batch(8, 4, 150), rng), ShapeError);
    EXPECT_THROW(pipeline.apply(make_random_batch(8, 5, 200), rng), ShapeError);

    pipeline.reset_shape();
    EXPECT_NO_THROW(pipeline.apply(make_random_batch(8, 4, 150), rng));
}

TEST(AugmentPipelineTest, FailedFirstCallDoesNotFixShape) {
    AugmentPipeline pipeline;
    pipeline.add(std::make_unique<RandomDeletion>(0, 30));
    std::mt19937 rng(6);

    // delete_max exceeds the length of this batch
    EXPECT_THROW(pipeline.apply(make_random_batch(2, 4, 20), rng), ConfigurationError);
    EXPECT_FALSE(pipeline.has_established_shape());

    SequenceBatch y;
    ASSERT_NO_THROW(y = pipeline.apply(make_random_batch(2, 4, 200), rng));
    EXPECT_EQ(y.shape_string(), "(2, 4, 200)");
    EXPECT_TRUE(pipeline.has_established_shape());

    // A failing call after the shape is fixed keeps it
    EXPECT_THROW(pipeline.apply(make_random_batch(2, 4, 20), rng), ShapeError);
    EXPECT_NO_THROW(pipeline.apply(make_random_batch(5, 4, 200), rng));
}

TEST(AugmentPipelineTest, HardSelectionPicksExactlyMaxAugsInOrder) {
    std::vector<std::unique_ptr<Augmentation>> augs;
    augs.push_back(std::make_unique<RandomDeletion>());
    augs.push_back(std::make_unique<RandomInsertion>());
    augs.push_back(std::make_unique<RandomTranslocation>());
    augs.push_back(std::make_unique<RandomInversion>());
    augs.push_back(std::make_unique<RandomMutation>());
    AugmentPipeline pipeline(std::move(augs), 2, true);

    std::mt19937 rng(4);
    std::set<size_t> seen;
    for (int i = 0; i < 200; ++i) {
        auto chosen = pipeline.select_augmentations(rng);
        ASSERT_EQ(chosen.size(), 2u);
        EXPECT_TRUE(std::is_sorted(chosen.begin(), chosen.end()));
        EXPECT_LT(chosen[0], chosen[1]);
        seen.insert(chosen.begin(), chosen.end());
    }
    EXPECT_EQ(seen.size(), 5u);
}

TEST(AugmentPipelineTest, SoftSelectionPicksBetweenOneAndMaxAugs) {
    std::vector<std::unique_ptr<Augmentation>> augs;
    augs.push_back(std::make_unique<RandomDeletion>());
    augs.push_back(std::make_unique<RandomRC>());
    augs.push_back(std::make_unique<RandomNoise>());
    AugmentPipeline pipeline(std::move(augs), 3, false);

    std::mt19937 rng(5);
    std::set<size_t> sizes;
    for (int i = 0; i < 300; ++i) {
        auto chosen = pipeline.select_augmentations(rng);
        ASSERT_GE(chosen.size(), 1u);
        ASSERT_LE(chosen.size(), 3u);
        sizes.insert(chosen.size());
    }
    EXPECT_EQ(sizes, (std::set<size_t>{1, 2, 3}));
}

TEST(AugmentPipelineTest, MaxAugsLargerThanPipelineIsRejected) {
    std::vector<std::unique_ptr<Augmentation>> augs;
    augs.push_back(std::make_unique<RandomRC>());
    EXPECT_THROW(AugmentPipeline(std::move(augs), 2, true), ConfigurationError);

    AugmentPipeline pipeline;
    EXPECT_THROW(pipeline.add(nullptr), ConfigurationError);
}

TEST(AugmentPipelineTest, CopiesAreIndependent) {
    AugmentPipeline original = make_scenario_pipeline();
    AugmentPipeline copy = original;
    copy.add(std::make_unique<RandomNoise>());
    EXPECT_EQ(original.size(), 3u);
    EXPECT_EQ(copy.size(), 4u);
    EXPECT_EQ(copy.at(0).to_json(), original.at(0).to_json());
    EXPECT_THROW(original.at(3), std::out_of_range);
}

TEST(AugmentPipelineTest, JsonRoundTrip) {
    std::vector<std::unique_ptr<Augmentation>> augs;
    augs.push_back(std::make_unique<RandomTranslocation>(2, 8));
    augs.push_back(std::make_unique<RandomMutation>(0.05));
    AugmentPipeline pipeline(std::move(augs), 1, false);

    AugmentPipeline rebuilt = AugmentPipeline::from_json(pipeline.to_json());
    EXPECT_EQ(rebuilt.to_json(), pipeline.to_json());
    EXPECT_EQ(rebuilt.max_augs_per_batch(), 1u);
    EXPECT_FALSE(rebuilt.hard_aug());

    const nlohmann::json no_list = {{"max_augs_per_batch", 1}};
    EXPECT_THROW(AugmentPipeline::from_json(no_list), ConfigurationError);
}
