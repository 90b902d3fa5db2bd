/**
 * @file test_scene_serializer.cpp
 * @brief Unit tests for JSON scene save/load
 */

#include <gtest/gtest.h>

#include "persistence/SceneSerializer.hpp"

#include "../utils/TestHelpers.hpp"

#include <fstream>

using namespace FreeFly;
using namespace FreeFly::Test;

class SceneSerializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        SceneObject cube = MakeCube(glm::vec3(1.0f, 2.0f, 3.0f), PhysicsKind::RigidBody, 4.0f);
        cube.transform.rotation = glm::vec3(0.1f, 0.2f, 0.3f);
        cube.transform.scale = glm::vec3(2.0f, 1.0f, 0.5f);
        cube.material.baseColor = glm::vec4(0.2f, 0.4f, 0.6f, 0.5f);
        cubeId = scene.Add(std::move(cube));

        terrainId = scene.Add(MakeTerrain(0.5f));
        enemyId = scene.Add(MakeEnemy(5.0f, 5.0f, 1.5f));

        camera.position = glm::vec3(3.0f, 4.0f, 5.0f);
        camera.yaw = -45.0f;
        camera.pitch = 10.0f;
    }

    Scene scene;
    CameraState camera;
    ObjectId cubeId = kInvalidObjectId;
    ObjectId terrainId = kInvalidObjectId;
    ObjectId enemyId = kInvalidObjectId;
};

// =============================================================================
// Document layout
// =============================================================================

TEST_F(SceneSerializerTest, DocumentHasExpectedSections) {
    nlohmann::json doc = SceneSerializer::ToJson(scene, camera);

    EXPECT_EQ("1.0.0", doc["scene_info"]["version"]);
    EXPECT_EQ("FreeFly", doc["scene_info"]["engine"]);
    EXPECT_FLOAT_EQ(-45.0f, doc["camera"]["yaw"].get<float>());
    ASSERT_EQ(3u, doc["objects"].size());

    const auto& cube = doc["objects"][0];
    EXPECT_EQ(0, cube["id"].get<int>());
    EXPECT_TRUE(cube["model_file"].is_null());
    EXPECT_EQ("RigidBody", cube["physics"]["physics_type"]);
    EXPECT_EQ("Cube", cube["physics"]["physics_shape"]);
    EXPECT_TRUE(cube["material"]["is_transparent"].get<bool>());
    EXPECT_EQ("cube", cube["primitive_data"]["primitive_type"]);
    EXPECT_FALSE(cube.contains("terrain_data"));

    const auto& terrain = doc["objects"][1];
    EXPECT_TRUE(terrain["terrain_data"]["is_terrain"].get<bool>());
    EXPECT_FLOAT_EQ(0.5f, terrain["terrain_data"]["size_x_km"].get<float>());
    EXPECT_EQ("2DPlane", terrain["physics"]["physics_shape"]);

    const auto& enemy = doc["objects"][2];
    EXPECT_FLOAT_EQ(1.5f, enemy["enemy_data"]["speed"].get<float>());
    EXPECT_EQ("capsule", enemy["primitive_data"]["primitive_type"]);
}

// =============================================================================
// Round trip
// =============================================================================

TEST_F(SceneSerializerTest, SaveThenLoadRestoresScene) {
    const auto path = TestFilePath("roundtrip.json");
    ASSERT_FALSE(SceneSerializer::Save(scene, camera, path).has_value());

    Scene loaded;
    CameraState loadedCamera;
    ASSERT_FALSE(SceneSerializer::Load(path, loaded, loadedCamera).has_value());

    EXPECT_EQ("roundtrip", loaded.GetName());
    EXPECT_VEC3_EQ(camera.position, loadedCamera.position);
    EXPECT_FLOAT_EQ(camera.yaw, loadedCamera.yaw);
    EXPECT_FLOAT_EQ(camera.pitch, loadedCamera.pitch);

    ASSERT_EQ(3u, loaded.GetObjectCount());
    const auto& objects = loaded.GetObjects();

    const SceneObject& cube = objects[0];
    const SceneObject& original = *scene.Find(cubeId);
    EXPECT_EQ(original.name, cube.name);
    EXPECT_VEC3_EQ(original.transform.position, cube.transform.position);
    EXPECT_VEC3_EQ(original.transform.rotation, cube.transform.rotation);
    EXPECT_VEC3_EQ(original.transform.scale, cube.transform.scale);
    EXPECT_FLOAT_EQ(0.5f, cube.material.baseColor.a);
    EXPECT_EQ(PhysicsKind::RigidBody, cube.physicsKind);
    EXPECT_FLOAT_EQ(4.0f, cube.mass);
    EXPECT_EQ(ObjectSourceType::Primitive, cube.source.type);
    EXPECT_EQ(original.mesh.vertices, cube.mesh.vertices);

    const SceneObject& terrain = objects[1];
    EXPECT_TRUE(terrain.IsTerrain());
    EXPECT_FLOAT_EQ(0.5f, terrain.source.terrain.sizeXKm);
    EXPECT_EQ(PhysicsShape::Plane2D, terrain.physicsShape);
    EXPECT_EQ(4u, terrain.mesh.vertices.size());

    const SceneObject& enemy = objects[2];
    ASSERT_TRUE(enemy.IsEnemy());
    EXPECT_FLOAT_EQ(1.5f, enemy.enemy->speed);
    EXPECT_EQ(PhysicsShape::Capsule, enemy.physicsShape);
}

TEST_F(SceneSerializerTest, ModelObjectsReloadRelativeToSceneFile) {
    WriteTestFile("tile.obj", QuadObj());

    SceneObject tile;
    tile.name = "tile";
    tile.source.type = ObjectSourceType::Model;
    tile.source.modelFile = "tile.obj";
    tile.transform.position = glm::vec3(0.0f, 3.0f, 0.0f);
    scene.Add(std::move(tile));

    nlohmann::json doc = SceneSerializer::ToJson(scene, camera);
    EXPECT_EQ("tile.obj", doc["objects"][3]["model_file"]);

    Scene loaded;
    CameraState loadedCamera;
    ASSERT_FALSE(SceneSerializer::FromJson(doc, loaded, loadedCamera, TestFilePath("tile.obj").parent_path()));

    ASSERT_EQ(4u, loaded.GetObjectCount());
    const SceneObject& reloaded = loaded.GetObjects()[3];
    EXPECT_EQ(ObjectSourceType::Model, reloaded.source.type);
    EXPECT_EQ(2u, reloaded.mesh.TriangleCount());
    EXPECT_VEC3_EQ(glm::vec3(0.0f, 3.0f, 0.0f), reloaded.transform.position);
}

TEST_F(SceneSerializerTest, MissingModelIsSkipped) {
    nlohmann::json doc = SceneSerializer::ToJson(scene, camera);
    doc["objects"].push_back({
        {"id", 3},
        {"name", "ghost"},
        {"model_file", "no_such_model.obj"}
    });

    Scene loaded;
    CameraState loadedCamera;
    ASSERT_FALSE(SceneSerializer::FromJson(doc, loaded, loadedCamera, TestFilePath("x").parent_path()));
    EXPECT_EQ(3u, loaded.GetObjectCount());
}

TEST_F(SceneSerializerTest, SparseObjectUsesDefaults) {
    nlohmann::json doc = {
        {"objects", nlohmann::json::array({
            {{"primitive_data", {{"is_primitive", true}, {"primitive_type", "teapot"}}}}
        })}
    };

    Scene loaded;
    CameraState loadedCamera;
    ASSERT_FALSE(SceneSerializer::FromJson(doc, loaded, loadedCamera));

    ASSERT_EQ(1u, loaded.GetObjectCount());
    const SceneObject& object = loaded.GetObjects()[0];
    EXPECT_EQ(PrimitiveType::Cube, object.source.primitive);
    EXPECT_VEC3_EQ(glm::vec3(1.0f), object.transform.scale);
    EXPECT_EQ(PhysicsKind::None, object.physicsKind);
    EXPECT_VEC3_EQ(glm::vec3(0.0f, 1.0f, 5.0f), loadedCamera.position);
}

TEST_F(SceneSerializerTest, PhysicsShapeIsValidatedOnLoad) {
    nlohmann::json doc = SceneSerializer::ToJson(scene, camera);
    doc["objects"][0]["physics"]["physics_shape"] = "2DPlane";
    doc["objects"][0]["physics"]["mass"] = -3.0;

    Scene loaded;
    CameraState loadedCamera;
    ASSERT_FALSE(SceneSerializer::FromJson(doc, loaded, loadedCamera));

    const SceneObject& cube = loaded.GetObjects()[0];
    EXPECT_EQ(PhysicsShape::Mesh, cube.physicsShape);
    EXPECT_FLOAT_EQ(SceneObject::kMinimumMass, cube.mass);
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(SceneSerializerTest, MissingFileIsFileOpenFailed) {
    Scene loaded;
    CameraState loadedCamera;
    auto error = SceneSerializer::Load(TestFilePath("missing_scene.json"), loaded, loadedCamera);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(SceneIOError::Type::FileOpenFailed, error->type);
}

TEST_F(SceneSerializerTest, MalformedJsonIsParseError) {
    const auto path = WriteTestFile("broken.json", "{ \"objects\": [ ");
    Scene loaded;
    CameraState loadedCamera;
    auto error = SceneSerializer::Load(path, loaded, loadedCamera);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(SceneIOError::Type::ParseError, error->type);
}

TEST_F(SceneSerializerTest, WrongShapeIsInvalidFormatAndLeavesTargetAlone) {
    const auto path = WriteTestFile("wrong.json", R"({"objects": 5})");

    CameraState before = camera;
    auto error = SceneSerializer::Load(path, scene, camera);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(SceneIOError::Type::InvalidFormat, error->type);
    EXPECT_EQ(3u, scene.GetObjectCount());
    EXPECT_EQ(before, camera);
}

TEST_F(SceneSerializerTest, MistypedFieldIsInvalidFormat) {
    nlohmann::json doc = SceneSerializer::ToJson(scene, camera);
    doc["objects"][0]["name"] = 12;

    Scene loaded;
    CameraState loadedCamera;
    auto error = SceneSerializer::FromJson(doc, loaded, loadedCamera);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(SceneIOError::Type::InvalidFormat, error->type);
    EXPECT_STREQ("InvalidFormat", SceneIOErrorTypeToString(error->type));
}

TEST_F(SceneSerializerTest, UnwritablePathIsFileOpenFailed) {
    auto error = SceneSerializer::Save(scene, camera, TestFilePath("no_dir") / "nested" / "scene.json");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(SceneIOError::Type::FileOpenFailed, error->type);
}
