/**
 * @file test_editor_flow.cpp
 * @brief Integration tests for editor workflows driven through EditorSession
 */

#include <gtest/gtest.h>

#include "editor/EditorSession.hpp"

#include "../utils/TestHelpers.hpp"

#include <glm/gtc/matrix_transform.hpp>
#include <vector>

using namespace FreeFly;
using namespace FreeFly::Test;

// =============================================================================
// Fixture
// =============================================================================

class EditorFlowTest : public ::testing::Test {
protected:
    EditorFlowTest()
        : session(EditorSessionConfig{}, std::make_shared<NeutralRandomSource>()) {
    }

    /**
     * @brief Pixel position (origin top-left) of a world point
     */
    glm::vec2 ToScreen(const glm::vec3& world) const {
        const Camera& camera = session.GetCamera();
        const glm::vec4 viewport = camera.GetViewport();
        const glm::vec3 window = glm::project(world, camera.GetView(), camera.GetProjection(), viewport);
        return glm::vec2(window.x, viewport.w - window.y);
    }

    void Click(const glm::vec2& screen) {
        FrameInput press;
        press.mousePosition = screen;
        press.leftPressed = true;
        session.Tick(press, kFrame);

        FrameInput release;
        release.mousePosition = screen;
        release.leftReleased = true;
        session.Tick(release, kFrame);
    }

    ObjectId AddCubeAt(const glm::vec3& position) {
        const ObjectId id = session.CreatePrimitive(PrimitiveType::Cube);
        session.GetScene().Find(id)->transform.position = position;
        session.Tick(FrameInput{}, kFrame);
        return id;
    }

    static constexpr float kFrame = 0.016f;

    EditorSession session;
};

// =============================================================================
// Creation
// =============================================================================

TEST_F(EditorFlowTest, CreatedObjectsAreSelected) {
    const ObjectId cube = session.CreatePrimitive(PrimitiveType::Cube);
    EXPECT_EQ(cube, session.GetSelection());
    EXPECT_EQ("Cube", session.GetSelectedObject()->name);

    const ObjectId terrain = session.CreateTerrain(1.0f, 2.0f);
    const SceneObject* t = session.GetScene().Find(terrain);
    ASSERT_NE(nullptr, t);
    EXPECT_EQ("Terrain_1.0x2.0km", t->name);
    EXPECT_EQ(PhysicsShape::Plane2D, t->physicsShape);
    EXPECT_EQ(PhysicsKind::Static, t->physicsKind);
    EXPECT_FLOAT_EQ(0.6f, t->material.baseColor.g);

    const ObjectId enemy = session.CreateEnemy();
    const SceneObject* e = session.GetScene().Find(enemy);
    ASSERT_NE(nullptr, e);
    EXPECT_TRUE(e->enemy.has_value());
    EXPECT_EQ(PhysicsShape::Capsule, e->physicsShape);
    EXPECT_VEC3_EQ(glm::vec3(5.0f, 1.0f, 5.0f), e->transform.position);

    EXPECT_EQ(3u, session.GetScene().GetObjectCount());
    EXPECT_EQ(enemy, session.GetSelection());
}

TEST_F(EditorFlowTest, MissingModelLeavesSceneUntouched) {
    auto error = session.LoadModel(TestFilePath("does_not_exist.obj"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(MeshLoadError::Type::FileNotFound, error->type);
    EXPECT_TRUE(session.GetScene().IsEmpty());
    EXPECT_FALSE(session.GetSelection().has_value());
}

TEST_F(EditorFlowTest, ImportedModelIsSelected) {
    const auto path = WriteTestFile("flow_quad.obj", QuadObj());
    ASSERT_FALSE(session.LoadModel(path).has_value());

    const SceneObject* selected = session.GetSelectedObject();
    ASSERT_NE(nullptr, selected);
    EXPECT_EQ("flow_quad", selected->name);
    EXPECT_EQ(ObjectSourceType::Model, selected->source.type);
    EXPECT_EQ(2u, selected->mesh.faces.size());
}

// =============================================================================
// Picking and selection
// =============================================================================

TEST_F(EditorFlowTest, ClickSelectsClosestObjectAndEmptySpaceClears) {
    const ObjectId left = AddCubeAt(glm::vec3(0.0f, 1.0f, 0.0f));
    const ObjectId right = AddCubeAt(glm::vec3(3.0f, 1.0f, 0.0f));
    session.ClearSelection();

    std::vector<std::optional<ObjectId>> changes;
    session.SetSelectionChangedCallback([&changes](std::optional<ObjectId> id) { changes.push_back(id); });

    Click(ToScreen(glm::vec3(3.0f, 1.0f, 0.0f)));
    EXPECT_EQ(right, session.GetSelection());

    Click(ToScreen(glm::vec3(-0.5f, 1.5f, 0.0f)));
    EXPECT_EQ(left, session.GetSelection());

    Click(glm::vec2(5.0f, 5.0f));
    EXPECT_FALSE(session.GetSelection().has_value());

    ASSERT_EQ(3u, changes.size());
    EXPECT_EQ(right, changes[0]);
    EXPECT_EQ(left, changes[1]);
    EXPECT_FALSE(changes[2].has_value());
}

TEST_F(EditorFlowTest, SelectingSameObjectDoesNotNotify) {
    const ObjectId id = AddCubeAt(glm::vec3(0.0f, 1.0f, 0.0f));
    int notifications = 0;
    session.SetSelectionChangedCallback([&notifications](std::optional<ObjectId>) { ++notifications; });

    EXPECT_TRUE(session.Select(id));
    EXPECT_FALSE(session.Select(9999));
    EXPECT_EQ(0, notifications);
    EXPECT_EQ(id, session.GetSelection());
}

TEST_F(EditorFlowTest, GizmoFollowsSelection) {
    AddCubeAt(glm::vec3(0.0f, 1.0f, 0.0f));
    EXPECT_TRUE(session.GetGizmo().HasHandles());
    EXPECT_NEAR(0.5f, session.GetGizmo().GetScreenScale(), 1e-4f);

    session.ClearSelection();
    EXPECT_FALSE(session.GetGizmo().HasHandles());
}

// =============================================================================
// Gizmo dragging
// =============================================================================

TEST_F(EditorFlowTest, DragTranslateArrowMovesAlongAxis) {
    const ObjectId id = AddCubeAt(glm::vec3(0.0f, 1.0f, 0.0f));

    FrameInput press;
    press.mousePosition = ToScreen(glm::vec3(0.4f, 1.0f, 0.0f));
    press.leftPressed = true;
    session.Tick(press, kFrame);

    ASSERT_TRUE(session.GetGizmo().IsDragging());
    EXPECT_EQ(GizmoAxis::X, session.GetGizmo().GetActiveAxis());
    EXPECT_EQ(id, session.GetSelection());

    FrameInput move;
    move.mousePosition = ToScreen(glm::vec3(1.4f, 1.6f, 0.0f));
    session.Tick(move, kFrame);

    const SceneObject* cube = session.GetScene().Find(id);
    EXPECT_NEAR(1.4f, cube->transform.position.x, 1e-2f);
    EXPECT_FLOAT_EQ(1.0f, cube->transform.position.y);
    EXPECT_FLOAT_EQ(0.0f, cube->transform.position.z);

    FrameInput release;
    release.mousePosition = move.mousePosition;
    release.leftReleased = true;
    session.Tick(release, kFrame);

    EXPECT_FALSE(session.GetGizmo().IsDragging());
    EXPECT_EQ(id, session.GetSelection());
    EXPECT_NEAR(1.4f, cube->transform.position.x, 1e-2f);
}

TEST_F(EditorFlowTest, SwitchingModeCancelsDrag) {
    AddCubeAt(glm::vec3(0.0f, 1.0f, 0.0f));
    session.HandlePointerDown(ToScreen(glm::vec3(0.4f, 1.0f, 0.0f)));
    ASSERT_TRUE(session.GetGizmo().IsDragging());

    session.SetGizmoMode(GizmoMode::Rotate);
    EXPECT_FALSE(session.GetGizmo().IsDragging());
    EXPECT_EQ(GizmoMode::Rotate, session.GetGizmo().GetMode());
    EXPECT_TRUE(session.GetGizmo().HasHandles());
}

TEST_F(EditorFlowTest, DeletingDraggedObjectCancelsDrag) {
    AddCubeAt(glm::vec3(0.0f, 1.0f, 0.0f));
    session.HandlePointerDown(ToScreen(glm::vec3(0.4f, 1.0f, 0.0f)));
    ASSERT_TRUE(session.GetGizmo().IsDragging());

    EXPECT_TRUE(session.DeleteSelected());
    session.Tick(FrameInput{}, kFrame);

    EXPECT_FALSE(session.GetGizmo().IsDragging());
    EXPECT_FALSE(session.GetGizmo().HasHandles());
    EXPECT_TRUE(session.GetScene().IsEmpty());
}

// =============================================================================
// Fly camera
// =============================================================================

TEST_F(EditorFlowTest, FlyCameraMovesPerTick) {
    FrameInput input;
    input.keyW = true;
    session.Tick(input, kFrame);
    EXPECT_NEAR(4.9f, session.GetCamera().GetPosition().z, 1e-5f);

    input.keyShift = true;
    session.Tick(input, kFrame);
    EXPECT_NEAR(4.7f, session.GetCamera().GetPosition().z, 1e-5f);
}

TEST_F(EditorFlowTest, MouseLookOnlyWithRightButton) {
    FrameInput input;
    input.mouseDelta = glm::vec2(20.0f, 0.0f);
    session.Tick(input, kFrame);
    EXPECT_FLOAT_EQ(-90.0f, session.GetCamera().GetYaw());

    input.rightHeld = true;
    session.Tick(input, kFrame);
    EXPECT_NEAR(-88.0f, session.GetCamera().GetYaw(), 1e-4f);
}

// =============================================================================
// Duplicate / delete / commands
// =============================================================================

TEST_F(EditorFlowTest, DuplicateSelectsOffsetCopy) {
    const ObjectId original = AddCubeAt(glm::vec3(1.0f, 2.0f, 3.0f));

    auto copy = session.DuplicateSelected();
    ASSERT_TRUE(copy.has_value());
    EXPECT_NE(original, *copy);
    EXPECT_EQ(copy, session.GetSelection());

    const SceneObject* c = session.GetScene().Find(*copy);
    EXPECT_EQ("Cube Copy", c->name);
    EXPECT_VEC3_EQ(glm::vec3(2.0f, 2.0f, 3.0f), c->transform.position);
    EXPECT_EQ(2u, session.GetScene().GetObjectCount());
}

TEST_F(EditorFlowTest, DuplicateAndDeleteNeedSelection) {
    AddCubeAt(glm::vec3(0.0f));
    session.ClearSelection();

    EXPECT_FALSE(session.DuplicateSelected().has_value());
    EXPECT_FALSE(session.DeleteSelected());
    EXPECT_EQ(1u, session.GetScene().GetObjectCount());
}

TEST_F(EditorFlowTest, QueuedEditsApplyOnNextTick) {
    const ObjectId id = AddCubeAt(glm::vec3(0.0f));

    ObjectTransform target;
    target.position = glm::vec3(4.0f, 0.0f, -2.0f);
    session.GetCommands().Push(std::make_unique<SetTransformCommand>(id, target));
    session.GetCommands().Push(std::make_unique<SetColorCommand>(id, glm::vec3(0.0f, 0.0f, 1.0f)));

    EXPECT_VEC3_EQ(glm::vec3(0.0f), session.GetScene().Find(id)->transform.position);
    session.Tick(FrameInput{}, kFrame);

    EXPECT_VEC3_EQ(target.position, session.GetScene().Find(id)->transform.position);
    EXPECT_EQ("B: 255", session.GetPropertiesView().colorLabels[2]);
    EXPECT_EQ("4.000", session.GetPropertiesView().position[0]);
    EXPECT_TRUE(session.GetCommands().IsEmpty());
}

// =============================================================================
// Scene files
// =============================================================================

TEST_F(EditorFlowTest, SaveNewLoadRoundTrip) {
    const ObjectId cube = AddCubeAt(glm::vec3(1.0f, 2.0f, 3.0f));
    session.GetScene().Find(cube)->transform.rotation = glm::vec3(0.0f, 0.5f, 0.0f);
    session.CreateTerrain(0.5f, 0.5f);
    session.GetCamera().SetPosition(glm::vec3(7.0f, 8.0f, 9.0f));

    const auto path = TestFilePath("flow_scene.json");
    ASSERT_FALSE(session.SaveScene(path).has_value());
    EXPECT_EQ("flow_scene", session.GetScene().GetName());

    session.NewScene();
    EXPECT_TRUE(session.GetScene().IsEmpty());
    EXPECT_FALSE(session.GetSelection().has_value());
    EXPECT_VEC3_EQ(glm::vec3(0.0f, 1.0f, 5.0f), session.GetCamera().GetPosition());

    ASSERT_FALSE(session.LoadScene(path).has_value());
    ASSERT_EQ(2u, session.GetScene().GetObjectCount());
    EXPECT_VEC3_EQ(glm::vec3(7.0f, 8.0f, 9.0f), session.GetCamera().GetPosition());

    const SceneObject& loaded = session.GetScene().GetObjects()[0];
    EXPECT_EQ("Cube", loaded.name);
    EXPECT_VEC3_NEAR(glm::vec3(1.0f, 2.0f, 3.0f), loaded.transform.position, 1e-5f);
    EXPECT_NEAR(0.5f, loaded.transform.rotation.y, 1e-5f);
    EXPECT_FALSE(loaded.mesh.IsEmpty());
    EXPECT_EQ(PhysicsShape::Plane2D, session.GetScene().GetObjects()[1].physicsShape);
}

TEST_F(EditorFlowTest, FailedLoadKeepsCurrentScene) {
    const ObjectId id = AddCubeAt(glm::vec3(0.0f));
    const auto path = WriteTestFile("flow_broken.json", "{ not json");

    auto error = session.LoadScene(path);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(SceneIOError::Type::ParseError, error->type);
    EXPECT_NE(nullptr, session.GetScene().Find(id));
    EXPECT_EQ(id, session.GetSelection());
}
