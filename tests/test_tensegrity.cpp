#include <gtest/gtest.h>
#include "stub_engine.hpp"
#include <tensegrity/tensegrity.hpp>
#include <tensegrity/tensegrity_builder.hpp>
#include <set>

using namespace pretenst;
using pretenst::test::StubEngine;

namespace {

// Every interval's index equals its position, and the stub mirrors it
void expect_indices_in_step(const Tensegrity& tensegrity, const StubEngine& engine) {
    ASSERT_EQ(tensegrity.interval_count(), engine.interval_count());
    for (size_t i = 0; i < tensegrity.interval_count(); ++i) {
        const auto& interval = tensegrity.intervals()[i];
        EXPECT_EQ(interval.index, i);
        EXPECT_EQ(engine.intervals[i].alpha, interval.alpha);
        EXPECT_EQ(engine.intervals[i].omega, interval.omega);
    }
    for (const auto& face : tensegrity.faces()) {
        for (IntervalId pull : face.pulls) {
            ASSERT_LT(pull, tensegrity.interval_count());
        }
    }
}

}  // namespace

TEST(TensegrityTest, RejectsTooFewPushes) {
    StubEngine engine;
    EXPECT_THROW(Tensegrity(engine, default_numeric_feature(), 2), std::invalid_argument);
}

TEST(TensegrityTest, CreateIntervalUsesRoleLength) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    JointId a = tensegrity.create_joint(Vec3(0.0f, 0.0f, 0.0f));
    JointId b = tensegrity.create_joint(Vec3(1.0f, 0.0f, 0.0f));

    IntervalId index = tensegrity.create_interval(a, b, IntervalRole::Ring, Percent{50.0f});
    EXPECT_EQ(index, 0u);
    EXPECT_FLOAT_EQ(engine.intervals[0].ideal_length, 0.5f * default_feature_value(WorldFeature::RingLength));
    EXPECT_FLOAT_EQ(engine.intervals[0].stiffness, 0.25f);
    EXPECT_FLOAT_EQ(engine.intervals[0].linear_density, 0.5f);
    EXPECT_EQ(engine.intervals[0].interval_class, IntervalClass::Pull);

    IntervalId push = tensegrity.create_interval(a, b, IntervalRole::RootPush, Percent{});
    EXPECT_TRUE(tensegrity.interval(push).is_push());
    EXPECT_EQ(engine.intervals[1].interval_class, IntervalClass::Push);

    EXPECT_THROW(tensegrity.create_interval(a, 7, IntervalRole::Ring, Percent{}), std::out_of_range);
}

TEST(TensegrityTest, ChangeIntervalScale) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    JointId a = tensegrity.create_joint(Vec3(0.0f, 0.0f, 0.0f));
    JointId b = tensegrity.create_joint(Vec3(1.0f, 0.0f, 0.0f));
    IntervalId index = tensegrity.create_interval(a, b, IntervalRole::Ring, Percent{80.0f});
    float rest = engine.intervals[0].rest_length;

    tensegrity.change_interval_scale(index, 0.5f);
    EXPECT_FLOAT_EQ(tensegrity.interval(index).scale.value, 40.0f);
    EXPECT_FLOAT_EQ(engine.intervals[0].rest_length, rest * 0.5f);
}

TEST(TensegrityTest, RemovalRenumbersFacePulls) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    TensegrityBuilder builder(tensegrity);
    Twist twist = builder.create_twist_at(Vec3{}, Spin::Left, Percent{});

    FaceId top = twist.face(FaceName::A);
    std::vector<IntervalId> before = tensegrity.face(top).pulls;

    // One of the base ring pulls, numbered below every top ring pull
    IntervalId doomed = tensegrity.face(twist.face(FaceName::a)).pulls[0];
    tensegrity.remove_interval(doomed);

    const auto& after = tensegrity.face(top).pulls;
    ASSERT_EQ(after.size(), before.size());
    for (size_t i = 0; i < after.size(); ++i) {
        EXPECT_EQ(after[i], before[i] - 1);
    }
    EXPECT_EQ(tensegrity.face(twist.face(FaceName::a)).pulls.size(), 2u);
    expect_indices_in_step(tensegrity, engine);
}

TEST(TensegrityTest, FaceResolvesItsBoundaryPulls) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    JointId a = tensegrity.create_joint(Vec3(0.0f, 0.0f, 0.0f));
    JointId b = tensegrity.create_joint(Vec3(1.0f, 0.0f, 0.0f));
    JointId c = tensegrity.create_joint(Vec3(0.0f, 0.0f, 1.0f));
    IntervalId ab = tensegrity.create_interval(a, b, IntervalRole::Ring, Percent{});
    IntervalId bc = tensegrity.create_interval(b, c, IntervalRole::Ring, Percent{});

    EXPECT_THROW(tensegrity.create_face({a, b, c}, false, Spin::Left, Percent{}), std::runtime_error);
    EXPECT_THROW(tensegrity.create_face({a, b}, false, Spin::Left, Percent{}), std::invalid_argument);

    IntervalId ca = tensegrity.create_interval(c, a, IntervalRole::Ring, Percent{});
    FaceId face = tensegrity.create_face({a, b, c}, false, Spin::Left, Percent{});
    EXPECT_EQ(tensegrity.face(face).pulls, (std::vector<IntervalId>{ab, bc, ca}));

    Vec3 mid = tensegrity.face_location(face);
    EXPECT_NEAR(mid.x, 1.0f / 3.0f, 1e-6f);
    EXPECT_NEAR(mid.z, 1.0f / 3.0f, 1e-6f);
}

TEST(TensegrityTest, RemoveFaceTakesItsPulls) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    TensegrityBuilder builder(tensegrity);
    Twist twist = builder.create_twist_at(Vec3{}, Spin::Right, Percent{});
    ASSERT_EQ(tensegrity.interval_count(), 12u);

    FaceId base = twist.face(FaceName::a);
    tensegrity.remove_face(base);
    EXPECT_EQ(tensegrity.interval_count(), 9u);
    EXPECT_EQ(tensegrity.face_count(), 1u);
    EXPECT_EQ(engine.face_count(), 1u);
    EXPECT_FALSE(tensegrity.has_face(base));
    EXPECT_THROW(tensegrity.face(base), std::out_of_range);
    EXPECT_THROW(tensegrity.remove_face(base), std::out_of_range);
    EXPECT_EQ(tensegrity.face(twist.face(FaceName::A)).index, 0u);
    expect_indices_in_step(tensegrity, engine);
}

TEST(TensegrityTest, FaceIdsAreNeverReused) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    TensegrityBuilder builder(tensegrity);
    Twist first = builder.create_twist_at(Vec3{}, Spin::Left, Percent{});
    tensegrity.remove_face(first.face(FaceName::A));
    Twist second = builder.create_twist_at(Vec3(0.0f, 5.0f, 0.0f), Spin::Left, Percent{});

    std::set<FaceId> ids(first.faces.begin(), first.faces.end());
    for (FaceId id : second.faces) {
        EXPECT_EQ(ids.count(id), 0u);
    }
}

TEST(TensegrityTest, AcrossPush) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    TensegrityBuilder builder(tensegrity);
    Twist twist = builder.create_twist_at(Vec3{}, Spin::Left, Percent{});

    for (IntervalId push : twist.pushes) {
        const auto& interval = tensegrity.interval(push);
        EXPECT_EQ(tensegrity.across_push(interval.alpha), interval.omega);
        EXPECT_EQ(tensegrity.across_push(interval.omega), interval.alpha);
    }
    JointId lonely = tensegrity.create_joint(Vec3(9.0f, 9.0f, 9.0f));
    EXPECT_THROW(tensegrity.across_push(lonely), std::runtime_error);
}

TEST(TensegrityTest, PullComplexSpokesAndRemoval) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    TensegrityBuilder builder(tensegrity);
    Twist one = builder.create_twist_at(Vec3{}, Spin::Left, Percent{});
    Twist two = builder.create_twist_at(Vec3(0.0f, 5.0f, 0.0f), Spin::Right, Percent{});

    const PullComplex& complex = tensegrity.create_pull_complex(one.face(FaceName::A), two.face(FaceName::a));
    EXPECT_TRUE(complex.connector);
    EXPECT_EQ(complex.alpha_spokes.size(), 3u);
    EXPECT_EQ(complex.omega_spokes.size(), 3u);
    EXPECT_EQ(tensegrity.interval(complex.hub).role, IntervalRole::ConnectorPull);
    EXPECT_EQ(engine.intervals[complex.hub].interval_class, IntervalClass::Connector);
    EXPECT_EQ(tensegrity.interval_count(), 31u);

    const PullComplex& distance = tensegrity.create_pull_complex(one.face(FaceName::a), two.face(FaceName::A),
                                                                 Percent{60.0f});
    EXPECT_FALSE(distance.connector);
    EXPECT_EQ(tensegrity.interval(distance.hub).role, IntervalRole::FaceDistancer);

    tensegrity.remove_pull_complexes();
    EXPECT_TRUE(tensegrity.pull_complexes().empty());
    EXPECT_EQ(tensegrity.interval_count(), 24u);
    expect_indices_in_step(tensegrity, engine);
}

TEST(TensegrityTest, FaceAnchorsAreRemoved) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    TensegrityBuilder builder(tensegrity);
    Twist twist = builder.create_twist_at(Vec3(0.0f, 2.0f, 0.0f), Spin::Left, Percent{});

    const FaceAnchor& anchor = tensegrity.create_face_anchor(twist.face(FaceName::a), Vec3{});
    EXPECT_EQ(anchor.pulls.size(), 3u);
    EXPECT_EQ(tensegrity.interval_count(), 15u);

    tensegrity.remove_face_anchors();
    EXPECT_TRUE(tensegrity.face_anchors().empty());
    EXPECT_EQ(tensegrity.interval_count(), 12u);
}

TEST(TensegrityTest, FabricOutputSwapsToZUp) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    tensegrity.set_name("pair");
    JointId a = tensegrity.create_joint(Vec3(1.0f, 2.0f, 3.0f));
    JointId b = tensegrity.create_joint(Vec3(1.0f, 4.0f, 3.0f));
    tensegrity.create_interval(a, b, IntervalRole::RootPush, Percent{});

    FabricOutput output = tensegrity.fabric_output(0.1f, 0.02f, 0.05f);
    EXPECT_EQ(output.name, "pair");
    ASSERT_EQ(output.joints.size(), 2u);
    EXPECT_FLOAT_EQ(output.joints[0].y, 3.0f);
    EXPECT_FLOAT_EQ(output.joints[0].z, 2.0f);
    ASSERT_EQ(output.intervals.size(), 1u);
    EXPECT_EQ(output.intervals[0].type, "Push");
    EXPECT_TRUE(output.intervals[0].is_push);
    EXPECT_FLOAT_EQ(output.intervals[0].length, 2.0f);
    EXPECT_FLOAT_EQ(output.intervals[0].radius, 0.1f);
}
