#include <gtest/gtest.h>
#include <math/vec3.hpp>
#include <math/transform.hpp>

using namespace pretenst;

TEST(Vec3Test, DefaultConstruction) {
    Vec3 v;
    EXPECT_FLOAT_EQ(v.x, 0.0f);
    EXPECT_FLOAT_EQ(v.y, 0.0f);
    EXPECT_FLOAT_EQ(v.z, 0.0f);
}

TEST(Vec3Test, Addition) {
    Vec3 a(1.0f, 2.0f, 3.0f);
    Vec3 b(4.0f, 5.0f, 6.0f);
    Vec3 c = a + b;
    EXPECT_FLOAT_EQ(c.x, 5.0f);
    EXPECT_FLOAT_EQ(c.y, 7.0f);
    EXPECT_FLOAT_EQ(c.z, 9.0f);
}

TEST(Vec3Test, DotProduct) {
    Vec3 c(1.0f, 2.0f, 3.0f);
    Vec3 d(4.0f, 5.0f, 6.0f);
    EXPECT_FLOAT_EQ(c.dot(d), 32.0f);
    EXPECT_FLOAT_EQ(vec3::unit_x().dot(vec3::up()), 0.0f);
}

TEST(Vec3Test, CrossProduct) {
    Vec3 z = vec3::unit_x().cross(vec3::up());
    EXPECT_FLOAT_EQ(z.x, 0.0f);
    EXPECT_FLOAT_EQ(z.y, 0.0f);
    EXPECT_FLOAT_EQ(z.z, 1.0f);
}

TEST(Vec3Test, Normalized) {
    Vec3 n = Vec3(3.0f, 4.0f, 0.0f).normalized();
    EXPECT_FLOAT_EQ(n.length(), 1.0f);
    EXPECT_FLOAT_EQ(n.x, 0.6f);
    EXPECT_FLOAT_EQ(n.y, 0.8f);

    // Zero stays zero
    Vec3 zero = Vec3().normalized();
    EXPECT_FLOAT_EQ(zero.length(), 0.0f);
}

TEST(Vec3Test, AddScaled) {
    Vec3 v(1.0f, 1.0f, 1.0f);
    v.add_scaled(Vec3(0.0f, 2.0f, 0.0f), 0.5f);
    EXPECT_FLOAT_EQ(v.y, 2.0f);
    EXPECT_FLOAT_EQ(v.x, 1.0f);
}

TEST(Vec3Test, DistanceAndScalarProduct) {
    Vec3 a(1.0f, 1.0f, 1.0f);
    Vec3 b = a + 2.0f * Vec3(0.0f, 3.0f, 4.0f);
    EXPECT_FLOAT_EQ(a.distance_to(b), 10.0f);
    EXPECT_FLOAT_EQ((-b).y, -7.0f);
}

TEST(TransformTest, IdentityKeepsPoints) {
    Vec3 p(1.0f, -2.0f, 3.0f);
    Vec3 q = Transform::identity().apply(p);
    EXPECT_EQ(p, q);
}

TEST(TransformTest, MapsIntoBasis) {
    Transform transform;
    transform.origin = Vec3(1.0f, 1.0f, 1.0f);
    transform.x_axis = vec3::up();
    transform.y_axis = vec3::unit_z();
    transform.z_axis = vec3::unit_x();

    Vec3 local = transform.apply(Vec3(2.0f, 3.0f, 4.0f));
    EXPECT_FLOAT_EQ(local.x, 2.0f);
    EXPECT_FLOAT_EQ(local.y, 3.0f);
    EXPECT_FLOAT_EQ(local.z, 1.0f);

    // Directions ignore the origin
    Vec3 direction = transform.apply_direction(vec3::unit_x());
    EXPECT_FLOAT_EQ(direction.z, 1.0f);
}
