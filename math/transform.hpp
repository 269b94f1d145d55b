#ifndef PRETENST_MATH_TRANSFORM_HPP
#define PRETENST_MATH_TRANSFORM_HPP

#include "vec3.hpp"

namespace pretenst {

// Rigid transform expressed as an orthonormal basis and the origin it is
// measured from. apply() maps a world point into the basis frame.
struct Transform {
    Vec3 x_axis{1.0f, 0.0f, 0.0f};
    Vec3 y_axis{0.0f, 1.0f, 0.0f};
    Vec3 z_axis{0.0f, 0.0f, 1.0f};
    Vec3 origin;

    constexpr Vec3 apply(const Vec3& point) const {
        Vec3 local = point - origin;
        return {local.dot(x_axis), local.dot(y_axis), local.dot(z_axis)};
    }

    // Direction vectors ignore the origin
    constexpr Vec3 apply_direction(const Vec3& direction) const {
        return {direction.dot(x_axis), direction.dot(y_axis), direction.dot(z_axis)};
    }

    static constexpr Transform identity() { return Transform{}; }
};

}  // namespace pretenst

#endif // PRETENST_MATH_TRANSFORM_HPP
