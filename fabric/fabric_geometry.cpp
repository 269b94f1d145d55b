#include "fabric_geometry.hpp"
#include <cmath>

namespace pretenst {

Percent average_percent(std::span<const Percent> percents) {
    if (percents.empty()) {
        return Percent{};
    }
    float total = 0.0f;
    for (const auto& percent : percents) {
        total += factor_from_percent(percent);
    }
    return percent_from_factor(total / static_cast<float>(percents.size()));
}

Vec3 midpoint(std::span<const Vec3> points) {
    Vec3 sum;
    if (points.empty()) {
        return sum;
    }
    for (const auto& point : points) {
        sum += point;
    }
    return sum / static_cast<float>(points.size());
}

Vec3 normal(std::span<const Vec3> points) {
    Vec3 mid = midpoint(points);
    Vec3 sum;
    for (size_t i = 0; i < points.size(); ++i) {
        Vec3 from = points[i] - mid;
        Vec3 to = points[(i + 1) % points.size()] - mid;
        sum += from.cross(to);
    }
    return sum.normalized();
}

float role_default_length(IntervalRole role, const NumericFeature& numeric_feature) {
    return numeric_feature(role_length_feature(role));
}

float scale_to_initial_stiffness(Percent scale, const NumericFeature& numeric_feature) {
    float factor = factor_from_percent(scale);
    return factor * factor * numeric_feature(WorldFeature::InitialStiffness);
}

float stiffness_to_linear_density(float stiffness) {
    return std::sqrt(stiffness);
}

}  // namespace pretenst
