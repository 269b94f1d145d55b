#ifndef PRETENST_FABRIC_FEATURES_HPP
#define PRETENST_FABRIC_FEATURES_HPP

#include <array>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace pretenst {

// Numeric world features. Role lengths, countdowns, thresholds and the
// constants the relaxation engine runs with.
enum class WorldFeature {
    Gravity,
    Drag,
    PretenseFactor,
    PretenseTicks,
    TicksPerFrame,
    IntervalCountdown,
    InitialStiffness,
    PushOverPull,
    ConnectorLength,
    ConnectorRestLength,
    GroundBand,
    PushLength,
    TriangleLength,
    RingLength,
    CrossLength,
    RadialLength,
    AnchorLength,
    TipPushLength,
    TipPullLength,
    InterTipLength,
    RibbonPushLength,
    RibbonShortLength,
    RibbonLongLength,
};

constexpr std::array<WorldFeature, 23> ALL_WORLD_FEATURES = {
    WorldFeature::Gravity,
    WorldFeature::Drag,
    WorldFeature::PretenseFactor,
    WorldFeature::PretenseTicks,
    WorldFeature::TicksPerFrame,
    WorldFeature::IntervalCountdown,
    WorldFeature::InitialStiffness,
    WorldFeature::PushOverPull,
    WorldFeature::ConnectorLength,
    WorldFeature::ConnectorRestLength,
    WorldFeature::GroundBand,
    WorldFeature::PushLength,
    WorldFeature::TriangleLength,
    WorldFeature::RingLength,
    WorldFeature::CrossLength,
    WorldFeature::RadialLength,
    WorldFeature::AnchorLength,
    WorldFeature::TipPushLength,
    WorldFeature::TipPullLength,
    WorldFeature::InterTipLength,
    WorldFeature::RibbonPushLength,
    WorldFeature::RibbonShortLength,
    WorldFeature::RibbonLongLength,
};

// Every component that needs a feature value receives one of these.
using NumericFeature = std::function<float(WorldFeature)>;

float default_feature_value(WorldFeature feature);

// snake_case name used in config files
const char* feature_name(WorldFeature feature);
std::optional<WorldFeature> feature_from_name(std::string_view name);

// Feature values with per-feature overrides on top of the defaults.
class FeatureSet {
public:
    FeatureSet() = default;

    float value(WorldFeature feature) const;
    void set(WorldFeature feature, float value);
    void reset(WorldFeature feature);
    bool is_default(WorldFeature feature) const;

    const std::map<WorldFeature, float>& overrides() const { return overrides_; }

    // Snapshot of the current values, safe to outlive this set
    NumericFeature numeric_feature() const;

private:
    std::map<WorldFeature, float> overrides_;
};

// Defaults only
NumericFeature default_numeric_feature();

}  // namespace pretenst

#endif // PRETENST_FABRIC_FEATURES_HPP
