/**
 * @file test_transform.cpp
 * @brief Unit tests for Euler transform composition and geometry helpers
 */

#include <gtest/gtest.h>

#include "math/Geometry.hpp"
#include "math/Transform.hpp"
#include "scene/SceneObject.hpp"

#include "../utils/TestHelpers.hpp"

#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>

using namespace FreeFly;
using namespace FreeFly::Test;

// =============================================================================
// Compose
// =============================================================================

TEST(TransformComposeTest, IdentityForDefaults) {
    glm::mat4 m = Transform::Compose(glm::vec3(0.0f), glm::vec3(0.0f), glm::vec3(1.0f));
    EXPECT_MAT4_NEAR(glm::mat4(1.0f), m, 1e-6f);
}

TEST(TransformComposeTest, AppliesScaleThenRotationThenTranslation) {
    const glm::vec3 position(1.0f, 2.0f, 3.0f);
    const glm::vec3 rotation(0.0f, glm::half_pi<float>(), 0.0f);
    const glm::vec3 scale(2.0f, 1.0f, 1.0f);

    glm::mat4 m = Transform::Compose(position, rotation, scale);
    glm::vec3 p = glm::vec3(m * glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));

    // (1,0,0) -> scaled (2,0,0) -> yaw 90 about Y gives (0,0,-2) -> translated
    EXPECT_VEC3_NEAR(glm::vec3(1.0f, 2.0f, 1.0f), p, 1e-5f);
}

TEST(TransformComposeTest, RotationOrderIsZYX) {
    const glm::vec3 euler(0.3f, -0.7f, 1.1f);

    glm::mat4 expected(1.0f);
    expected = glm::rotate(expected, euler.z, glm::vec3(0.0f, 0.0f, 1.0f));
    expected = glm::rotate(expected, euler.y, glm::vec3(0.0f, 1.0f, 0.0f));
    expected = glm::rotate(expected, euler.x, glm::vec3(1.0f, 0.0f, 0.0f));

    EXPECT_MAT4_NEAR(expected, glm::mat4(Transform::EulerToMatrix(euler)), 1e-5f);
}

// =============================================================================
// Decompose
// =============================================================================

class TransformRoundTripTest : public ::testing::TestWithParam<glm::vec3> {};

TEST_P(TransformRoundTripTest, ComposeDecomposeComposeIsStable) {
    const glm::vec3 position(-4.0f, 0.5f, 12.0f);
    const glm::vec3 scale(1.5f, 0.25f, 3.0f);
    const glm::vec3 euler = GetParam();

    glm::mat4 original = Transform::Compose(position, euler, scale);

    glm::vec3 p, r, s;
    Transform::Decompose(original, p, r, s);

    EXPECT_VEC3_NEAR(position, p, 1e-4f);
    EXPECT_VEC3_NEAR(scale, s, 1e-4f);
    EXPECT_MAT4_NEAR(original, Transform::Compose(p, r, s), 1e-4f);
}

INSTANTIATE_TEST_SUITE_P(
    EulerAngles,
    TransformRoundTripTest,
    ::testing::Values(
        glm::vec3(0.0f),
        glm::vec3(0.4f, 0.0f, 0.0f),
        glm::vec3(0.0f, -1.2f, 0.0f),
        glm::vec3(0.0f, 0.0f, 2.5f),
        glm::vec3(0.3f, -0.7f, 1.1f),
        glm::vec3(-2.9f, 1.3f, -0.2f),
        glm::vec3(1.0f, 1.5f, 3.0f)
    ));

// Inside (-pi/2, pi/2) on every axis the decomposition is unique
class TransformAngleRecoveryTest : public ::testing::TestWithParam<glm::vec3> {};

TEST_P(TransformAngleRecoveryTest, DecomposeReturnsComposedAngles) {
    const glm::vec3 euler = GetParam();
    glm::mat4 m = Transform::Compose(glm::vec3(2.0f, -1.0f, 0.5f), euler, glm::vec3(1.5f, 0.25f, 3.0f));

    glm::vec3 p, r, s;
    Transform::Decompose(m, p, r, s);

    EXPECT_VEC3_NEAR(euler, r, 1e-4f);
    EXPECT_VEC3_NEAR(glm::vec3(1.5f, 0.25f, 3.0f), s, 1e-4f);
}

INSTANTIATE_TEST_SUITE_P(
    PrincipalRange,
    TransformAngleRecoveryTest,
    ::testing::Values(
        glm::vec3(0.0f),
        glm::vec3(1.2f, 0.0f, 0.0f),
        glm::vec3(0.0f, -1.4f, 0.0f),
        glm::vec3(0.0f, 0.0f, 1.5f),
        glm::vec3(-0.5f, 0.9f, -1.3f),
        glm::vec3(1.4f, 1.4f, 1.4f),
        glm::vec3(-1.1f, -0.2f, 0.8f)
    ));

TEST(TransformDecomposeTest, RecoversAnglesAwayFromGimbalLock) {
    const glm::vec3 euler(0.3f, -0.7f, 1.1f);
    glm::vec3 p, r, s;
    Transform::Decompose(Transform::Compose(glm::vec3(0.0f), euler, glm::vec3(1.0f)), p, r, s);

    EXPECT_VEC3_NEAR(euler, r, 1e-4f);
}

TEST(TransformDecomposeTest, GimbalLockZeroesZAndKeepsMatrix) {
    const glm::vec3 euler(0.4f, glm::half_pi<float>(), 0.6f);
    glm::mat4 original = Transform::Compose(glm::vec3(1.0f), euler, glm::vec3(1.0f));

    glm::vec3 p, r, s;
    Transform::Decompose(original, p, r, s);

    EXPECT_FLOAT_EQ(0.0f, r.z);
    EXPECT_NEAR(glm::half_pi<float>(), r.y, 1e-4f);
    EXPECT_MAT4_NEAR(original, Transform::Compose(p, r, s), 1e-4f);
}

TEST(TransformDecomposeTest, MirroredMatrixReportsNegativeXScale) {
    glm::mat4 original = Transform::Compose(glm::vec3(0.0f), glm::vec3(0.2f, 0.1f, 0.0f),
                                            glm::vec3(-2.0f, 1.0f, 1.0f));
    glm::vec3 p, r, s;
    Transform::Decompose(original, p, r, s);

    EXPECT_LT(s.x, 0.0f);
    EXPECT_MAT4_NEAR(original, Transform::Compose(p, r, s), 1e-4f);
}

TEST(TransformDecomposeTest, ObjectTransformMatrixRoundTrip) {
    ObjectTransform t;
    t.position = glm::vec3(3.0f, -1.0f, 2.0f);
    t.rotation = glm::vec3(0.1f, 0.2f, 0.3f);
    t.scale = glm::vec3(2.0f);

    ObjectTransform back = ObjectTransform::FromMatrix(t.ToMatrix());
    EXPECT_VEC3_NEAR(t.position, back.position, 1e-5f);
    EXPECT_VEC3_NEAR(t.rotation, back.rotation, 1e-5f);
    EXPECT_VEC3_NEAR(t.scale, back.scale, 1e-5f);
}

// =============================================================================
// Geometry
// =============================================================================

TEST(GeometryTest, RayPlaneHitInFront) {
    auto t = Geometry::RayPlaneIntersection(glm::vec3(0.0f, 5.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f),
                                            glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    ASSERT_TRUE(t.has_value());
    EXPECT_FLOAT_EQ(5.0f, *t);
}

TEST(GeometryTest, RayPlaneParallelOrBehindMisses) {
    EXPECT_FALSE(Geometry::RayPlaneIntersection(glm::vec3(0.0f, 5.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f),
                                                glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f)).has_value());
    EXPECT_FALSE(Geometry::RayPlaneIntersection(glm::vec3(0.0f, 5.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f),
                                                glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f)).has_value());
}

TEST(GeometryTest, RayTriangleHitsEitherFace) {
    const glm::vec3 v0(-1.0f, 0.0f, -1.0f), v1(1.0f, 0.0f, -1.0f), v2(0.0f, 0.0f, 1.0f);

    auto down = Geometry::RayTriangleIntersection(glm::vec3(0.0f, 2.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f), v0, v1, v2);
    auto up = Geometry::RayTriangleIntersection(glm::vec3(0.0f, -3.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f), v0, v1, v2);

    ASSERT_TRUE(down.has_value());
    ASSERT_TRUE(up.has_value());
    EXPECT_NEAR(2.0f, *down, 1e-5f);
    EXPECT_NEAR(3.0f, *up, 1e-5f);
}

TEST(GeometryTest, RayTriangleMissOutsideEdges) {
    const glm::vec3 v0(-1.0f, 0.0f, -1.0f), v1(1.0f, 0.0f, -1.0f), v2(0.0f, 0.0f, 1.0f);
    EXPECT_FALSE(Geometry::RayTriangleIntersection(glm::vec3(5.0f, 2.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f),
                                                   v0, v1, v2).has_value());
}

TEST(GeometryTest, SafeNormalizeFallsBackOnZero) {
    EXPECT_VEC3_EQ(glm::vec3(0.0f, 0.0f, -1.0f),
                   Geometry::SafeNormalize(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, -1.0f)));
    EXPECT_VEC3_NEAR(glm::vec3(0.6f, 0.0f, 0.8f),
                     Geometry::SafeNormalize(glm::vec3(3.0f, 0.0f, 4.0f), glm::vec3(1.0f, 0.0f, 0.0f)), 1e-6f);
}

TEST(GeometryTest, AnyPerpendicularIsUnitAndOrthogonal) {
    for (const glm::vec3& v : {glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f), glm::vec3(0.3f, -0.2f, 0.9f)}) {
        glm::vec3 p = Geometry::AnyPerpendicular(v);
        EXPECT_NEAR(1.0f, glm::length(p), 1e-5f);
        EXPECT_NEAR(0.0f, glm::dot(p, glm::normalize(v)), 1e-5f);
    }
}
