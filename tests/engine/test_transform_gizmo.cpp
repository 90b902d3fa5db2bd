/**
 * @file test_transform_gizmo.cpp
 * @brief Unit tests for gizmo handles and drag mapping
 */

#include <gtest/gtest.h>

#include "editor/TransformGizmo.hpp"
#include "scene/Scene.hpp"

#include "../utils/TestHelpers.hpp"

#include <glm/gtc/constants.hpp>

#include <cmath>

using namespace FreeFly;
using namespace FreeFly::Test;

class TransformGizmoTest : public ::testing::Test {
protected:
    void SetUp() override {
        cubeId = scene.Add(MakeCube(glm::vec3(0.0f)));
    }

    SceneObject& Cube() { return *scene.Find(cubeId); }

    Scene scene;
    ObjectId cubeId = kInvalidObjectId;
    TransformGizmo gizmo;

    const glm::vec3 cameraPosition{0.0f, 0.0f, 5.0f};
    const glm::vec3 cameraFront{0.0f, 0.0f, -1.0f};
};

// =============================================================================
// Handles
// =============================================================================

TEST_F(TransformGizmoTest, SyncBuildsThreeHandlesScaledByDistance) {
    EXPECT_TRUE(gizmo.Sync(&Cube(), cameraPosition));

    ASSERT_EQ(3u, gizmo.GetHandles().size());
    EXPECT_EQ(GizmoAxis::X, gizmo.GetHandles()[0].axis);
    EXPECT_EQ(GizmoAxis::Y, gizmo.GetHandles()[1].axis);
    EXPECT_EQ(GizmoAxis::Z, gizmo.GetHandles()[2].axis);
    EXPECT_FLOAT_EQ(0.5f, gizmo.GetScreenScale());

    for (const auto& handle : gizmo.GetHandles()) {
        EXPECT_TRUE(handle.proxy.IsValid());
    }
}

TEST_F(TransformGizmoTest, SyncSkipsRebuildWhenNothingChanged) {
    ASSERT_TRUE(gizmo.Sync(&Cube(), cameraPosition));
    EXPECT_FALSE(gizmo.Sync(&Cube(), cameraPosition));

    Cube().transform.position.x = 1.0f;
    EXPECT_TRUE(gizmo.Sync(&Cube(), cameraPosition));

    EXPECT_TRUE(gizmo.Sync(&Cube(), cameraPosition + glm::vec3(0.0f, 1.0f, 0.0f)));

    gizmo.SetMode(GizmoMode::Rotate);
    EXPECT_TRUE(gizmo.Sync(&Cube(), cameraPosition + glm::vec3(0.0f, 1.0f, 0.0f)));
}

TEST_F(TransformGizmoTest, SyncWithoutSelectionClearsHandles) {
    ASSERT_TRUE(gizmo.Sync(&Cube(), cameraPosition));
    EXPECT_TRUE(gizmo.Sync(nullptr, cameraPosition));
    EXPECT_FALSE(gizmo.HasHandles());
    EXPECT_FALSE(gizmo.Sync(nullptr, cameraPosition));
}

TEST_F(TransformGizmoTest, HitTestFindsAxisUnderRay) {
    gizmo.Sync(&Cube(), cameraPosition);

    auto x = gizmo.HitTest(PickRay(glm::vec3(0.25f, 0.0f, 5.0f), cameraFront));
    ASSERT_TRUE(x.has_value());
    EXPECT_EQ(GizmoAxis::X, *x);

    auto y = gizmo.HitTest(PickRay(glm::vec3(0.0f, 0.3f, 5.0f), cameraFront));
    ASSERT_TRUE(y.has_value());
    EXPECT_EQ(GizmoAxis::Y, *y);

    EXPECT_FALSE(gizmo.HitTest(PickRay(glm::vec3(3.0f, 3.0f, 5.0f), cameraFront)).has_value());
}

TEST_F(TransformGizmoTest, RotateModeUsesRings) {
    gizmo.SetMode(GizmoMode::Rotate);
    gizmo.Sync(&Cube(), cameraPosition);

    // Z ring faces the camera; a diagonal ray through its rim misses the other two
    const float rim = GizmoConfig{}.ringRadius * gizmo.GetScreenScale() * std::sqrt(0.5f);
    auto axis = gizmo.HitTest(PickRay(glm::vec3(rim, rim, 5.0f), cameraFront));
    ASSERT_TRUE(axis.has_value());
    EXPECT_EQ(GizmoAxis::Z, *axis);
}

// =============================================================================
// Translate
// =============================================================================

TEST_F(TransformGizmoTest, TranslatePlaneFacesCamera) {
    DragPlane plane = TransformGizmo::ComputeTranslatePlane(glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f), cameraFront);
    EXPECT_NEAR(1.0f, std::abs(plane.normal.z), 1e-5f);
    EXPECT_NEAR(0.0f, glm::dot(plane.normal, glm::vec3(1.0f, 0.0f, 0.0f)), 1e-5f);
}

TEST_F(TransformGizmoTest, TranslatePlaneLookingDownAxisStillContainsAxis) {
    DragPlane plane = TransformGizmo::ComputeTranslatePlane(glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f),
                                                           glm::vec3(1.0f, 0.0f, 0.0f));
    EXPECT_NEAR(1.0f, glm::length(plane.normal), 1e-5f);
    EXPECT_NEAR(0.0f, plane.normal.x, 1e-5f);
}

TEST_F(TransformGizmoTest, TranslateDragProjectsOntoAxis) {
    gizmo.Sync(&Cube(), cameraPosition);
    ASSERT_TRUE(gizmo.BeginDrag(PickRay(glm::vec3(0.25f, 0.0f, 5.0f), cameraFront), Cube(), cameraFront));
    EXPECT_TRUE(gizmo.IsDragging());
    EXPECT_EQ(GizmoAxis::X, gizmo.GetActiveAxis());

    ASSERT_TRUE(gizmo.UpdateDrag(PickRay(glm::vec3(2.0f, 0.5f, 5.0f), cameraFront), Cube()));
    EXPECT_VEC3_NEAR(glm::vec3(2.0f, 0.0f, 0.0f), Cube().transform.position, 1e-5f);

    // Positions are relative to the drag start, not accumulated
    ASSERT_TRUE(gizmo.UpdateDrag(PickRay(glm::vec3(-1.0f, 3.0f, 5.0f), cameraFront), Cube()));
    EXPECT_VEC3_NEAR(glm::vec3(-1.0f, 0.0f, 0.0f), Cube().transform.position, 1e-5f);
}

TEST_F(TransformGizmoTest, ParallelOrBehindRayLeavesObjectAlone) {
    gizmo.BeginDrag(GizmoAxis::X, Cube(), cameraFront);

    EXPECT_FALSE(gizmo.UpdateDrag(PickRay(glm::vec3(0.0f, 0.0f, 5.0f), glm::vec3(1.0f, 0.0f, 0.0f)), Cube()));
    EXPECT_FALSE(gizmo.UpdateDrag(PickRay(glm::vec3(2.0f, 0.0f, 5.0f), glm::vec3(0.0f, 0.0f, 1.0f)), Cube()));
    EXPECT_VEC3_EQ(glm::vec3(0.0f), Cube().transform.position);
}

TEST_F(TransformGizmoTest, DragIgnoresOtherObjects) {
    gizmo.BeginDrag(GizmoAxis::X, Cube(), cameraFront);

    SceneObject other = MakeCube(glm::vec3(0.0f));
    other.id = cubeId + 100;
    EXPECT_FALSE(gizmo.UpdateDrag(PickRay(glm::vec3(2.0f, 0.0f, 5.0f), cameraFront), other));
    EXPECT_VEC3_EQ(glm::vec3(0.0f), other.transform.position);
}

TEST_F(TransformGizmoTest, EndDragRebuildsAroundNewPosition) {
    gizmo.Sync(&Cube(), cameraPosition);
    gizmo.BeginDrag(GizmoAxis::X, Cube(), cameraFront);
    ASSERT_TRUE(gizmo.UpdateDrag(PickRay(glm::vec3(2.0f, 0.0f, 5.0f), cameraFront), Cube()));

    gizmo.EndDrag(&Cube(), cameraPosition);
    EXPECT_FALSE(gizmo.IsDragging());
    EXPECT_EQ(GizmoAxis::None, gizmo.GetActiveAxis());
    EXPECT_NEAR(std::sqrt(29.0f) * 0.1f, gizmo.GetScreenScale(), 1e-5f);
    EXPECT_FALSE(gizmo.Sync(&Cube(), cameraPosition));
}

TEST_F(TransformGizmoTest, BeginDragMissingHandlesDoesNothing) {
    gizmo.Sync(&Cube(), cameraPosition);
    EXPECT_FALSE(gizmo.BeginDrag(PickRay(glm::vec3(3.0f, 3.0f, 5.0f), cameraFront), Cube(), cameraFront));
    EXPECT_FALSE(gizmo.IsDragging());
}

// =============================================================================
// Rotate
// =============================================================================

TEST_F(TransformGizmoTest, RotateDragTurnsAboutAxis) {
    gizmo.SetMode(GizmoMode::Rotate);
    gizmo.BeginDrag(GizmoAxis::Y, Cube(), cameraFront);

    const glm::vec3 down(0.0f, -1.0f, 0.0f);
    ASSERT_TRUE(gizmo.UpdateDrag(PickRay(glm::vec3(1.0f, 5.0f, 0.0f), down), Cube()));
    EXPECT_VEC3_NEAR(glm::vec3(0.0f), Cube().transform.rotation, 1e-5f);

    ASSERT_TRUE(gizmo.UpdateDrag(PickRay(glm::vec3(1.0f, 5.0f, -1.0f), down), Cube()));
    EXPECT_VEC3_NEAR(glm::vec3(0.0f, glm::quarter_pi<float>(), 0.0f), Cube().transform.rotation, 1e-4f);
    EXPECT_VEC3_NEAR(glm::vec3(0.0f), Cube().transform.position, 1e-5f);
    EXPECT_VEC3_NEAR(glm::vec3(1.0f), Cube().transform.scale, 1e-5f);
}

TEST_F(TransformGizmoTest, RotateAboutCentreKeepsOffsetObjectInPlace) {
    Cube().transform.position = glm::vec3(3.0f, 0.0f, 0.0f);
    gizmo.SetMode(GizmoMode::Rotate);
    gizmo.BeginDrag(GizmoAxis::Y, Cube(), cameraFront);

    const glm::vec3 down(0.0f, -1.0f, 0.0f);
    ASSERT_TRUE(gizmo.UpdateDrag(PickRay(glm::vec3(4.0f, 5.0f, 0.0f), down), Cube()));
    ASSERT_TRUE(gizmo.UpdateDrag(PickRay(glm::vec3(4.0f, 5.0f, -1.0f), down), Cube()));

    EXPECT_VEC3_NEAR(glm::vec3(3.0f, 0.0f, 0.0f), Cube().transform.position, 1e-4f);
    EXPECT_NEAR(glm::quarter_pi<float>(), Cube().transform.rotation.y, 1e-4f);
}

TEST_F(TransformGizmoTest, RotateIgnoresHitAtCentre) {
    gizmo.SetMode(GizmoMode::Rotate);
    gizmo.BeginDrag(GizmoAxis::Y, Cube(), cameraFront);

    EXPECT_FALSE(gizmo.UpdateDrag(PickRay(glm::vec3(0.0f, 5.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f)), Cube()));
    EXPECT_FALSE(gizmo.GetSession()->startVector.has_value());
}

TEST(GizmoNamesTest, ModeAndAxisNames) {
    EXPECT_STREQ("rotate", GizmoModeToString(GizmoMode::Rotate));
    EXPECT_STREQ("Z", GizmoAxisToString(GizmoAxis::Z));
    EXPECT_VEC3_EQ(glm::vec3(0.0f), GizmoAxisVector(GizmoAxis::None));
}
