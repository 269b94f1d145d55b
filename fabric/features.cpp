#include "features.hpp"
#include <cmath>
#include <stdexcept>

namespace pretenst {

float default_feature_value(WorldFeature feature) {
    switch (feature) {
        case WorldFeature::Gravity: return 0.0002f;
        case WorldFeature::Drag: return 0.05f;
        case WorldFeature::PretenseFactor: return 0.03f;
        case WorldFeature::PretenseTicks: return 3000.0f;
        case WorldFeature::TicksPerFrame: return 100.0f;
        case WorldFeature::IntervalCountdown: return 500.0f;
        case WorldFeature::InitialStiffness: return 1.0f;
        case WorldFeature::PushOverPull: return 1.0f;
        case WorldFeature::ConnectorLength: return 0.5f;
        case WorldFeature::ConnectorRestLength: return 0.1f;
        case WorldFeature::GroundBand: return 0.01f;
        case WorldFeature::PushLength: return 2.0f * 1.618f;
        case WorldFeature::TriangleLength: return 2.123f;
        case WorldFeature::RingLength: return 1.440f;
        case WorldFeature::CrossLength: return 2.123f;
        // circumradius of a default triangle
        case WorldFeature::RadialLength: return 2.123f / std::sqrt(3.0f);
        case WorldFeature::AnchorLength: return 1.0f;
        case WorldFeature::TipPushLength: return 2.0f * 1.618f;
        case WorldFeature::TipPullLength: return 2.0f;
        case WorldFeature::InterTipLength: return 1.0f;
        case WorldFeature::RibbonPushLength: return 1.0f;
        case WorldFeature::RibbonShortLength: return 1.0f;
        case WorldFeature::RibbonLongLength: return 1.0f;
    }
    throw std::invalid_argument("default_feature_value: unknown feature");
}

const char* feature_name(WorldFeature feature) {
    switch (feature) {
        case WorldFeature::Gravity: return "gravity";
        case WorldFeature::Drag: return "drag";
        case WorldFeature::PretenseFactor: return "pretense_factor";
        case WorldFeature::PretenseTicks: return "pretense_ticks";
        case WorldFeature::TicksPerFrame: return "ticks_per_frame";
        case WorldFeature::IntervalCountdown: return "interval_countdown";
        case WorldFeature::InitialStiffness: return "initial_stiffness";
        case WorldFeature::PushOverPull: return "push_over_pull";
        case WorldFeature::ConnectorLength: return "connector_length";
        case WorldFeature::ConnectorRestLength: return "connector_rest_length";
        case WorldFeature::GroundBand: return "ground_band";
        case WorldFeature::PushLength: return "push_length";
        case WorldFeature::TriangleLength: return "triangle_length";
        case WorldFeature::RingLength: return "ring_length";
        case WorldFeature::CrossLength: return "cross_length";
        case WorldFeature::RadialLength: return "radial_length";
        case WorldFeature::AnchorLength: return "anchor_length";
        case WorldFeature::TipPushLength: return "tip_push_length";
        case WorldFeature::TipPullLength: return "tip_pull_length";
        case WorldFeature::InterTipLength: return "inter_tip_length";
        case WorldFeature::RibbonPushLength: return "ribbon_push_length";
        case WorldFeature::RibbonShortLength: return "ribbon_short_length";
        case WorldFeature::RibbonLongLength: return "ribbon_long_length";
    }
    throw std::invalid_argument("feature_name: unknown feature");
}

std::optional<WorldFeature> feature_from_name(std::string_view name) {
    for (WorldFeature feature : ALL_WORLD_FEATURES) {
        if (name == feature_name(feature)) {
            return feature;
        }
    }
    return std::nullopt;
}

float FeatureSet::value(WorldFeature feature) const {
    auto it = overrides_.find(feature);
    if (it != overrides_.end()) {
        return it->second;
    }
    return default_feature_value(feature);
}

void FeatureSet::set(WorldFeature feature, float value) {
    overrides_[feature] = value;
}

void FeatureSet::reset(WorldFeature feature) {
    overrides_.erase(feature);
}

bool FeatureSet::is_default(WorldFeature feature) const {
    float default_value = default_feature_value(feature);
    float ratio = std::abs(value(feature) / default_value);
    return std::abs(ratio - 1.0f) < 0.00001f;
}

NumericFeature FeatureSet::numeric_feature() const {
    auto overrides = overrides_;
    return [overrides](WorldFeature feature) {
        auto it = overrides.find(feature);
        return it != overrides.end() ? it->second : default_feature_value(feature);
    };
}

NumericFeature default_numeric_feature() {
    return [](WorldFeature feature) { return default_feature_value(feature); };
}

}  // namespace pretenst
