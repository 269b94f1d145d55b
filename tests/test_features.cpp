#include <gtest/gtest.h>
#include <fabric/features.hpp>
#include <serialization/config_json.hpp>

using namespace pretenst;

TEST(FeaturesTest, Defaults) {
    FeatureSet features;
    EXPECT_FLOAT_EQ(features.value(WorldFeature::TicksPerFrame), 100.0f);
    EXPECT_FLOAT_EQ(features.value(WorldFeature::PushOverPull), 1.0f);
    EXPECT_TRUE(features.is_default(WorldFeature::Gravity));
}

TEST(FeaturesTest, SetAndReset) {
    FeatureSet features;
    features.set(WorldFeature::Drag, 0.2f);
    EXPECT_FLOAT_EQ(features.value(WorldFeature::Drag), 0.2f);
    EXPECT_FALSE(features.is_default(WorldFeature::Drag));

    features.reset(WorldFeature::Drag);
    EXPECT_TRUE(features.is_default(WorldFeature::Drag));
    EXPECT_FLOAT_EQ(features.value(WorldFeature::Drag), default_feature_value(WorldFeature::Drag));
}

TEST(FeaturesTest, NumericFeatureIsASnapshot) {
    FeatureSet features;
    features.set(WorldFeature::RingLength, 2.0f);
    NumericFeature nf = features.numeric_feature();
    features.set(WorldFeature::RingLength, 3.0f);
    EXPECT_FLOAT_EQ(nf(WorldFeature::RingLength), 2.0f);
}

TEST(FeaturesTest, NamesRoundTrip) {
    for (WorldFeature feature : ALL_WORLD_FEATURES) {
        auto found = feature_from_name(feature_name(feature));
        ASSERT_TRUE(found.has_value()) << feature_name(feature);
        EXPECT_EQ(*found, feature);
    }
    EXPECT_FALSE(feature_from_name("warp_speed").has_value());
}

TEST(FeaturesTest, JsonOverrides) {
    nlohmann::json j = {{"drag", 0.1}, {"pretense_ticks", 500}};
    FeatureSet features = j.get<FeatureSet>();
    EXPECT_FLOAT_EQ(features.value(WorldFeature::Drag), 0.1f);
    EXPECT_FLOAT_EQ(features.value(WorldFeature::PretenseTicks), 500.0f);
    EXPECT_TRUE(features.is_default(WorldFeature::Gravity));
}

TEST(FeaturesTest, JsonRejectsUnknownFeature) {
    nlohmann::json j = {{"warp_speed", 9.0}};
    EXPECT_THROW(j.get<FeatureSet>(), std::runtime_error);
}
