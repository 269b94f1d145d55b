#include <gtest/gtest.h>
#include <engine/relaxation_fabric.hpp>
#include <fabric/features.hpp>

using namespace pretenst;

namespace {

// Two joints two apart joined by one member of length one
uint32_t single_member(RelaxationFabric& fabric, IntervalClass interval_class, float countdown) {
    uint32_t alpha = fabric.create_joint(Vec3(0.0f, 1.0f, 0.0f));
    uint32_t omega = fabric.create_joint(Vec3(2.0f, 1.0f, 0.0f));
    return fabric.create_interval(alpha, omega, interval_class, 1.0f, 1.0f, 1.0f, 1.0f, countdown);
}

}  // namespace

TEST(RelaxationFabricTest, PushSettlesAtRestLength) {
    RelaxationFabric fabric(default_numeric_feature());
    uint32_t index = single_member(fabric, IntervalClass::Push, 0.0f);

    for (int i = 0; i < 50; ++i) {
        fabric.iterate(Stage::Shaping);
    }
    EXPECT_NEAR(fabric.interval_length(index), 1.0f, 1e-3f);
    EXPECT_NEAR(fabric.strain(index), 0.0f, 1e-3f);
}

TEST(RelaxationFabricTest, GrowingIsBusyDuringCountdown) {
    RelaxationFabric fabric(default_numeric_feature());
    single_member(fabric, IntervalClass::Pull, 500.0f);

    EXPECT_TRUE(fabric.busy());
    EXPECT_FALSE(fabric.iterate(Stage::Growing).has_value());

    std::optional<Stage> stage;
    for (int i = 0; i < 10 && !stage; ++i) {
        stage = fabric.iterate(Stage::Growing);
    }
    ASSERT_TRUE(stage.has_value());
    EXPECT_EQ(*stage, Stage::Growing);
    EXPECT_FALSE(fabric.busy());
}

TEST(RelaxationFabricTest, CompressedPullCarriesNoStrain) {
    RelaxationFabric fabric(default_numeric_feature());
    uint32_t alpha = fabric.create_joint(Vec3(0.0f, 1.0f, 0.0f));
    uint32_t omega = fabric.create_joint(Vec3(0.5f, 1.0f, 0.0f));
    uint32_t index = fabric.create_interval(alpha, omega, IntervalClass::Pull, 1.0f, 1.0f, 1.0f, 1.0f, 0.0f);

    fabric.tick(Stage::Shaping);
    EXPECT_FLOAT_EQ(fabric.strain(index), 0.0f);
}

TEST(RelaxationFabricTest, CompressedPushHasNegativeStrain) {
    RelaxationFabric fabric(default_numeric_feature());
    uint32_t alpha = fabric.create_joint(Vec3(0.0f, 1.0f, 0.0f));
    uint32_t omega = fabric.create_joint(Vec3(0.5f, 1.0f, 0.0f));
    uint32_t index = fabric.create_interval(alpha, omega, IntervalClass::Push, 1.0f, 1.0f, 1.0f, 1.0f, 0.0f);

    fabric.tick(Stage::Shaping);
    EXPECT_LT(fabric.strain(index), 0.0f);
}

TEST(RelaxationFabricTest, SlackIsFrozen) {
    RelaxationFabric fabric(default_numeric_feature());
    single_member(fabric, IntervalClass::Push, 0.0f);

    auto stage = fabric.iterate(Stage::Slack);
    ASSERT_TRUE(stage.has_value());
    EXPECT_EQ(*stage, Stage::Slack);
    EXPECT_FLOAT_EQ(fabric.joint_location(1).x, 2.0f);
}

TEST(RelaxationFabricTest, PretensingCompletes) {
    FeatureSet features;
    features.set(WorldFeature::PretenseTicks, 200.0f);
    RelaxationFabric fabric(features.numeric_feature());
    single_member(fabric, IntervalClass::Push, 0.0f);

    auto first = fabric.iterate(Stage::Pretensing);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, Stage::Pretensing);

    auto second = fabric.iterate(Stage::Pretensing);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, Stage::Pretenst);
}

TEST(RelaxationFabricTest, PretenseStretchesPushesAndSqueezesPulls) {
    FeatureSet features;
    features.set(WorldFeature::PretenseFactor, 0.1f);
    features.set(WorldFeature::PretenseTicks, 100000.0f);
    RelaxationFabric fabric(features.numeric_feature());
    uint32_t push = single_member(fabric, IntervalClass::Push, 0.0f);
    uint32_t pull = fabric.create_interval(0, 1, IntervalClass::Pull, 1.0f, 1.0f, 1.0f, 1.0f, 0.0f);

    EXPECT_FLOAT_EQ(fabric.stage_length(push, Stage::Shaping), 1.0f);
    EXPECT_FLOAT_EQ(fabric.stage_length(pull, Stage::Shaping), 1.0f);

    // Part way through, the squeeze has started but not finished
    fabric.iterate(Stage::Pretensing);
    float pull_length = fabric.stage_length(pull, Stage::Pretensing);
    EXPECT_LT(pull_length, 1.0f);
    EXPECT_GT(pull_length, 0.9f);
    EXPECT_GT(fabric.stage_length(push, Stage::Pretensing), 1.0f);

    EXPECT_FLOAT_EQ(fabric.stage_length(push, Stage::Pretenst), 1.1f);
    EXPECT_FLOAT_EQ(fabric.stage_length(pull, Stage::Pretenst), 0.9f);
}

TEST(RelaxationFabricTest, RemovalRepacksIntervals) {
    RelaxationFabric fabric(default_numeric_feature());
    uint32_t a = fabric.create_joint(Vec3(0.0f, 0.0f, 0.0f));
    uint32_t b = fabric.create_joint(Vec3(1.0f, 0.0f, 0.0f));
    uint32_t c = fabric.create_joint(Vec3(3.0f, 0.0f, 0.0f));
    fabric.create_interval(a, b, IntervalClass::Pull, 1.0f, 1.0f, 1.0f, 1.0f, 0.0f);
    fabric.create_interval(b, c, IntervalClass::Pull, 2.0f, 2.0f, 1.0f, 1.0f, 0.0f);

    fabric.remove_interval(0);
    EXPECT_EQ(fabric.interval_count(), 1u);
    EXPECT_FLOAT_EQ(fabric.ideal_length(0), 2.0f);
    EXPECT_THROW(fabric.remove_interval(1), std::out_of_range);
}

TEST(RelaxationFabricTest, SnapshotRestoresLengths) {
    RelaxationFabric fabric(default_numeric_feature());
    uint32_t index = single_member(fabric, IntervalClass::Push, 0.0f);
    EXPECT_THROW(fabric.restore_snapshot(), std::logic_error);

    fabric.save_snapshot();
    fabric.set_stiffness(index, 5.0f);
    fabric.set_joint_location(1, Vec3(4.0f, 1.0f, 0.0f));
    fabric.restore_snapshot();
    EXPECT_FLOAT_EQ(fabric.stiffness(index), 1.0f);
    EXPECT_FLOAT_EQ(fabric.joint_location(1).x, 2.0f);
}

TEST(RelaxationFabricTest, AdoptLengthsMakesCurrentLengthIdeal) {
    RelaxationFabric fabric(default_numeric_feature());
    uint32_t index = single_member(fabric, IntervalClass::Pull, 100.0f);
    fabric.adopt_lengths();
    EXPECT_FALSE(fabric.busy());
    EXPECT_FLOAT_EQ(fabric.ideal_length(index), 2.0f);
}

TEST(RelaxationFabricTest, SetAltitudeLiftsLowestJoint) {
    RelaxationFabric fabric(default_numeric_feature());
    fabric.create_joint(Vec3(0.0f, -3.0f, 0.0f));
    fabric.create_joint(Vec3(0.0f, 2.0f, 0.0f));
    fabric.set_altitude(0.0f);
    EXPECT_FLOAT_EQ(fabric.joint_location(0).y, 0.0f);
    EXPECT_FLOAT_EQ(fabric.joint_location(1).y, 5.0f);
}
