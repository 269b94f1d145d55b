#ifndef PRETENST_MATH_VEC3_HPP
#define PRETENST_MATH_VEC3_HPP

#include <cmath>

namespace pretenst {

// Single precision point or direction. Joint locations, velocities and
// forces in the engine all use this type; y is up.
struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vec3() = default;
    constexpr Vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    static constexpr Vec3 zero() {
        return {};
    }

    // Arithmetic
    constexpr Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    constexpr Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    constexpr Vec3 operator*(float scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vec3 operator/(float scalar) const {
        return {x / scalar, y / scalar, z / scalar};
    }

    constexpr Vec3 operator-() const {
        return {-x, -y, -z};
    }

    // In place
    constexpr Vec3& operator+=(const Vec3& other) {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }

    constexpr Vec3& operator-=(const Vec3& other) {
        x -= other.x; y -= other.y; z -= other.z;
        return *this;
    }

    constexpr Vec3& operator*=(float scalar) {
        x *= scalar; y *= scalar; z *= scalar;
        return *this;
    }

    // Move along a direction, in place
    constexpr Vec3& add_scaled(const Vec3& direction, float scale) {
        x += direction.x * scale; y += direction.y * scale; z += direction.z * scale;
        return *this;
    }

    // Products
    constexpr float dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    // Right handed
    constexpr Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    // Magnitude
    float length() const {
        return std::sqrt(dot(*this));
    }

    // Zero length stays zero
    Vec3 normalized() const {
        float len = length();
        return len > 0.0f ? *this / len : Vec3{};
    }

    float distance_to(const Vec3& other) const {
        return (*this - other).length();
    }

    // Comparison
    constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr bool operator!=(const Vec3& other) const {
        return !(*this == other);
    }
};

constexpr Vec3 operator*(float scalar, const Vec3& v) {
    return v * scalar;
}

// Common directions
namespace vec3 {
    constexpr Vec3 unit_x() {
        return {1.0f, 0.0f, 0.0f};
    }

    constexpr Vec3 up() {
        return {0.0f, 1.0f, 0.0f};
    }

    constexpr Vec3 unit_z() {
        return {0.0f, 0.0f, 1.0f};
    }
}

}  // namespace pretenst

#endif // PRETENST_MATH_VEC3_HPP
