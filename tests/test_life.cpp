#include <gtest/gtest.h>
#include "stub_engine.hpp"
#include <tensegrity/tensegrity.hpp>
#include <tensegrity/tensegrity_builder.hpp>
#include <array>
#include <set>
#include <utility>
#include <vector>

using namespace pretenst;
using pretenst::test::StubEngine;

TEST(LifeTest, EveryStagePairFollowsTheTable) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    const std::array<Stage, 5> stages = {
        Stage::Growing, Stage::Shaping, Stage::Slack, Stage::Pretensing, Stage::Pretenst
    };
    const std::set<std::pair<Stage, Stage>> legal = {
        {Stage::Growing, Stage::Shaping},
        {Stage::Shaping, Stage::Slack},
        {Stage::Shaping, Stage::Pretensing},
        {Stage::Slack, Stage::Shaping},
        {Stage::Slack, Stage::Pretensing},
        {Stage::Pretensing, Stage::Pretenst},
        {Stage::Pretenst, Stage::Slack},
    };

    int succeeded = 0;
    for (Stage from : stages) {
        for (Stage to : stages) {
            Life life(tensegrity, from);
            bool allowed = from == to || legal.count({from, to}) > 0;
            if (allowed) {
                Life next = life.with_transition(LifeTransition{to});
                EXPECT_EQ(next.stage(), to) << stage_name(from) << " -> " << stage_name(to);
                succeeded++;
            } else {
                EXPECT_THROW(life.with_transition(LifeTransition{to}), std::logic_error)
                    << stage_name(from) << " -> " << stage_name(to);
            }
        }
    }
    EXPECT_EQ(succeeded, 12);
}

TEST(LifeTest, IllegalTransitionThrows) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    EXPECT_EQ(tensegrity.life().stage(), Stage::Growing);

    try {
        tensegrity.transition(LifeTransition{Stage::Slack});
        FAIL() << "expected std::logic_error";
    } catch (const std::logic_error& e) {
        EXPECT_EQ(std::string(e.what()), "No transition Growing to Slack");
    }
    EXPECT_EQ(tensegrity.life().stage(), Stage::Growing);
}

TEST(LifeTest, SameStageDoesNothing) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    Life same = tensegrity.life().with_transition(LifeTransition{Stage::Growing});
    EXPECT_EQ(same.stage(), Stage::Growing);
}

TEST(LifeTest, ObserversSeeEveryChange) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    std::vector<Stage> seen;
    tensegrity.on_life_change([&seen](const Life& life) { seen.push_back(life.stage()); });

    tensegrity.finish_growing();
    tensegrity.transition(LifeTransition{Stage::Pretensing});
    EXPECT_EQ(seen, (std::vector<Stage>{Stage::Shaping, Stage::Pretensing}));
}

TEST(LifeTest, ShapingToSlackClearsScaffolding) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    TensegrityBuilder builder(tensegrity);
    Twist one = builder.create_twist_at(Vec3(0.0f, 1.0f, 0.0f), Spin::Left, Percent{});
    Twist two = builder.create_twist_at(Vec3(0.0f, 6.0f, 0.0f), Spin::Right, Percent{});
    tensegrity.create_pull_complex(one.face(FaceName::A), two.face(FaceName::a));
    tensegrity.create_face_anchor(one.face(FaceName::a), Vec3{});
    tensegrity.finish_growing();

    tensegrity.transition(LifeTransition{Stage::Slack, true, false});
    EXPECT_EQ(tensegrity.life().stage(), Stage::Slack);
    EXPECT_TRUE(tensegrity.pull_complexes().empty());
    EXPECT_TRUE(tensegrity.face_anchors().empty());
    EXPECT_EQ(tensegrity.interval_count(), 24u);
    EXPECT_EQ(engine.adopt_count, 1);
    EXPECT_EQ(engine.altitude_count, 1);
    EXPECT_TRUE(engine.has_snapshot());
}

TEST(LifeTest, ShapingToSlackWithoutAdoptKeepsScaffolding) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    TensegrityBuilder builder(tensegrity);
    Twist one = builder.create_twist_at(Vec3(0.0f, 1.0f, 0.0f), Spin::Left, Percent{});
    Twist two = builder.create_twist_at(Vec3(0.0f, 6.0f, 0.0f), Spin::Right, Percent{});
    tensegrity.create_pull_complex(one.face(FaceName::A), two.face(FaceName::a));
    tensegrity.create_face_anchor(one.face(FaceName::a), Vec3{});
    tensegrity.finish_growing();
    size_t intervals = tensegrity.interval_count();

    tensegrity.transition(LifeTransition{Stage::Slack, false, false});
    EXPECT_EQ(tensegrity.life().stage(), Stage::Slack);
    EXPECT_EQ(tensegrity.pull_complexes().size(), 1u);
    EXPECT_EQ(tensegrity.face_anchors().size(), 1u);
    EXPECT_EQ(tensegrity.interval_count(), intervals);
    EXPECT_EQ(engine.adopt_count, 0);
    EXPECT_EQ(engine.altitude_count, 0);
    EXPECT_FALSE(engine.has_snapshot());
}

TEST(LifeTest, ShapingToSlackWithoutAnchorsKeepsAltitude) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    TensegrityBuilder builder(tensegrity);
    builder.create_twist_at(Vec3{}, Spin::Left, Percent{});
    tensegrity.finish_growing();

    tensegrity.transition(LifeTransition{Stage::Slack, true, false});
    EXPECT_EQ(engine.adopt_count, 1);
    EXPECT_EQ(engine.altitude_count, 0);
    EXPECT_TRUE(engine.has_snapshot());
}

TEST(LifeTest, PretensingBecomesPretenstThroughIterate) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    TensegrityBuilder builder(tensegrity);
    builder.create_twist_at(Vec3{}, Spin::Left, Percent{});
    tensegrity.finish_growing();

    tensegrity.request_transition(LifeTransition{Stage::Pretensing});
    EXPECT_EQ(tensegrity.life().stage(), Stage::Shaping);

    auto stage = tensegrity.iterate();
    ASSERT_TRUE(stage.has_value());
    EXPECT_EQ(*stage, Stage::Pretenst);
    EXPECT_EQ(tensegrity.life().stage(), Stage::Pretenst);
}

TEST(LifeTest, PretenstToSlackRestoresSnapshotForStiffness) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    TensegrityBuilder builder(tensegrity);
    builder.create_twist_at(Vec3(0.0f, 1.0f, 0.0f), Spin::Left, Percent{});
    tensegrity.finish_growing();
    tensegrity.transition(LifeTransition{Stage::Slack, true, false});
    tensegrity.transition(LifeTransition{Stage::Pretensing});
    tensegrity.transition(LifeTransition{Stage::Pretenst});

    tensegrity.transition(LifeTransition{Stage::Slack, false, true});
    EXPECT_EQ(tensegrity.life().stage(), Stage::Slack);
    EXPECT_EQ(engine.restore_count, 1);
    EXPECT_EQ(engine.adopt_count, 1);
}

TEST(LifeTest, PretenstToSlackAdoptsLengths) {
    StubEngine engine;
    Tensegrity tensegrity(engine, default_numeric_feature());
    tensegrity.finish_growing();
    tensegrity.transition(LifeTransition{Stage::Pretensing});
    tensegrity.transition(LifeTransition{Stage::Pretenst});

    tensegrity.transition(LifeTransition{Stage::Slack, true, false});
    EXPECT_EQ(engine.adopt_count, 1);
    EXPECT_TRUE(engine.has_snapshot());
    EXPECT_EQ(engine.restore_count, 0);
}
