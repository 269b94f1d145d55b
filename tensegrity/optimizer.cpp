#include "optimizer.hpp"
#include "tensegrity.hpp"
#include <algorithm>
#include <cmath>

namespace pretenst {

namespace {

constexpr float MIN_STIFFNESS_FACTOR = 0.01f;

bool is_eligible(const Tensegrity& tensegrity, const Interval& interval, float ground_band) {
    if (is_ribbon_role(interval.role)) {
        return false;
    }
    float alpha_y = tensegrity.joint_location(interval.alpha).y;
    float omega_y = tensegrity.joint_location(interval.omega).y;
    return std::min(alpha_y, omega_y) > ground_band;
}

}  // namespace

std::vector<StiffnessAdjustment> adjusted_stiffness(const Tensegrity& tensegrity) {
    const auto& nf = tensegrity.numeric_feature();
    const auto& engine = tensegrity.engine();
    float push_over_pull = nf(WorldFeature::PushOverPull);
    float ground_band = nf(WorldFeature::GroundBand);

    std::vector<const Interval*> eligible;
    float push_total = 0.0f;
    float pull_total = 0.0f;
    int push_count = 0;
    int pull_count = 0;
    for (const auto& interval : tensegrity.intervals()) {
        if (!is_eligible(tensegrity, interval, ground_band)) {
            continue;
        }
        eligible.push_back(&interval);
        float strain = engine.strain(interval.index);
        if (interval.is_push()) {
            push_total += strain;
            push_count++;
        } else {
            pull_total += strain;
            pull_count++;
        }
    }

    std::vector<StiffnessAdjustment> adjustments;
    if (eligible.empty()) {
        return adjustments;
    }
    float push_average = push_count > 0 ? push_total / push_count : 0.0f;
    float pull_average = pull_count > 0 ? pull_total / pull_count : 0.0f;
    // Push strain is negative under compression
    float average_absolute = (-push_over_pull * push_average + pull_average) / 2.0f;
    if (average_absolute <= 0.0f) {
        return adjustments;
    }

    for (const Interval* interval : eligible) {
        float strain = engine.strain(interval->index);
        float absolute = strain * (interval->is_push() ? -push_over_pull : 1.0f);
        float factor = 1.0f + (absolute - average_absolute) / average_absolute;
        factor = std::max(factor, MIN_STIFFNESS_FACTOR);
        float stiffness = engine.stiffness(interval->index) * factor;
        adjustments.push_back({interval->index, stiffness, std::sqrt(stiffness)});
    }
    return adjustments;
}

void apply_stiffness(Tensegrity& tensegrity, const std::vector<StiffnessAdjustment>& adjustments) {
    auto& engine = tensegrity.engine();
    for (const auto& adjustment : adjustments) {
        engine.set_stiffness(adjustment.interval, adjustment.stiffness);
        engine.set_linear_density(adjustment.interval, adjustment.linear_density);
    }
}

}  // namespace pretenst
