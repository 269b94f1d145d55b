#ifndef PRETENST_FABRIC_GEOMETRY_HPP
#define PRETENST_FABRIC_GEOMETRY_HPP

#include <math/vec3.hpp>
#include "features.hpp"
#include "interval_role.hpp"
#include <span>
#include <vector>

namespace pretenst {

// Scale expressed as a percentage of a role's default length
struct Percent {
    float value = 100.0f;

    constexpr bool operator==(const Percent& other) const { return value == other.value; }
};

constexpr float factor_from_percent(Percent percent) {
    return percent.value / 100.0f;
}

constexpr Percent percent_from_factor(float factor) {
    return Percent{factor * 100.0f};
}

// Mean of a set of factors, as a percentage
Percent average_percent(std::span<const Percent> percents);

Vec3 midpoint(std::span<const Vec3> points);

// Unit normal of a polygon: sum of the cross products of consecutive
// corner vectors measured from the midpoint.
Vec3 normal(std::span<const Vec3> points);

constexpr Vec3 avg(const Vec3& a, const Vec3& b) {
    return (a + b) * 0.5f;
}

float role_default_length(IntervalRole role, const NumericFeature& numeric_feature);

float scale_to_initial_stiffness(Percent scale, const NumericFeature& numeric_feature);

float stiffness_to_linear_density(float stiffness);

}  // namespace pretenst

#endif // PRETENST_FABRIC_GEOMETRY_HPP
