#include <gtest/gtest.h>
#include "stub_engine.hpp"
#include <tensegrity/mobius_builder.hpp>
#include <tensegrity/tensegrity.hpp>
#include <map>

using namespace pretenst;
using pretenst::test::StubEngine;

TEST(MobiusTest, RibbonCounts) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    MobiusBuilder(10).build(tensegrity);

    EXPECT_EQ(tensegrity.joints().size(), 20u);
    EXPECT_EQ(tensegrity.interval_count(), 50u);

    std::map<IntervalRole, size_t> roles;
    for (const auto& interval : tensegrity.intervals()) {
        roles[interval.role]++;
    }
    EXPECT_EQ(roles[IntervalRole::RibbonShort], 10u);
    EXPECT_EQ(roles[IntervalRole::RibbonLong], 20u);
    EXPECT_EQ(roles[IntervalRole::RibbonPush], 20u);
    EXPECT_EQ(roles.size(), 3u);
}

TEST(MobiusTest, EveryJointCarriesTwoPushes) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    MobiusBuilder(12).build(tensegrity);

    std::map<JointId, int> pushes;
    for (const auto& interval : tensegrity.intervals()) {
        if (interval.is_push()) {
            pushes[interval.alpha]++;
            pushes[interval.omega]++;
        }
    }
    ASSERT_EQ(pushes.size(), 24u);
    for (const auto& [joint, count] : pushes) {
        EXPECT_EQ(count, 2) << "joint " << joint;
    }
}

TEST(MobiusTest, JointsSitOnTwoRings) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    MobiusBuilder(8).build(tensegrity);

    for (JointId joint = 0; joint < 16; ++joint) {
        float y = tensegrity.joint_location(joint).y;
        EXPECT_FLOAT_EQ(y, joint % 2 == 0 ? -0.5f : 0.5f);
    }
}

TEST(MobiusTest, Preconditions) {
    EXPECT_THROW(MobiusBuilder(2), std::invalid_argument);

    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    tensegrity.create_joint(Vec3{});
    EXPECT_THROW(MobiusBuilder(5).build(tensegrity), std::logic_error);
}
