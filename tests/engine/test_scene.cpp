/**
 * @file test_scene.cpp
 * @brief Unit tests for the scene list, scene objects and procedural meshes
 */

#include <gtest/gtest.h>

#include "scene/MeshData.hpp"
#include "scene/MeshFactory.hpp"
#include "scene/Scene.hpp"
#include "scene/SceneObject.hpp"

#include "../utils/TestHelpers.hpp"

#include <glm/gtc/matrix_transform.hpp>

using namespace FreeFly;
using namespace FreeFly::Test;

// =============================================================================
// Scene
// =============================================================================

class SceneTest : public ::testing::Test {
protected:
    Scene scene;
};

TEST_F(SceneTest, AddAssignsIncreasingIds) {
    ObjectId a = scene.Add(MakeCube(glm::vec3(0.0f)));
    ObjectId b = scene.Add(MakeCube(glm::vec3(1.0f)));

    EXPECT_NE(kInvalidObjectId, a);
    EXPECT_GT(b, a);
    EXPECT_EQ(2u, scene.GetObjectCount());
    EXPECT_EQ(0u, scene.IndexOf(a).value());
    EXPECT_EQ(1u, scene.IndexOf(b).value());
}

TEST_F(SceneTest, IdsAreNotReusedAfterRemoveOrClear) {
    ObjectId a = scene.Add(MakeCube(glm::vec3(0.0f)));
    ASSERT_TRUE(scene.Remove(a));
    ObjectId b = scene.Add(MakeCube(glm::vec3(0.0f)));
    EXPECT_NE(a, b);

    scene.Clear();
    EXPECT_TRUE(scene.IsEmpty());
    ObjectId c = scene.Add(MakeCube(glm::vec3(0.0f)));
    EXPECT_GT(c, b);
}

TEST_F(SceneTest, IndexOfFollowsListOrderAfterRemove) {
    ObjectId a = scene.Add(MakeCube(glm::vec3(0.0f)));
    ObjectId b = scene.Add(MakeCube(glm::vec3(1.0f)));
    ObjectId c = scene.Add(MakeCube(glm::vec3(2.0f)));

    EXPECT_EQ(2u, scene.IndexOf(c).value());

    ASSERT_TRUE(scene.Remove(a));
    EXPECT_FALSE(scene.IndexOf(a).has_value());
    EXPECT_EQ(0u, scene.IndexOf(b).value());
    EXPECT_EQ(1u, scene.IndexOf(c).value());
    EXPECT_EQ(c, scene.GetObjects()[scene.IndexOf(c).value()].id);
    EXPECT_FALSE(scene.IndexOf(c + 100).has_value());
}

TEST_F(SceneTest, RemoveUnknownIdFails) {
    EXPECT_FALSE(scene.Remove(42));
    EXPECT_EQ(nullptr, scene.Find(42));
    EXPECT_FALSE(scene.IndexOf(42).has_value());
}

TEST_F(SceneTest, UnnamedObjectsGetGeneratedName) {
    SceneObject object = MakeCube(glm::vec3(0.0f));
    object.name.clear();
    ObjectId id = scene.Add(std::move(object));
    EXPECT_EQ("Object_" + std::to_string(id), scene.Find(id)->name);
}

TEST_F(SceneTest, DuplicateCopiesDeeplyAndSharesTexture) {
    SceneObject object = MakeCube(glm::vec3(2.0f, 0.0f, -1.0f), PhysicsKind::RigidBody, 3.0f);
    object.material.texture = std::make_shared<const TextureRef>(TextureRef{"crate.png"});
    ObjectId id = scene.Add(std::move(object));

    auto copyId = scene.Duplicate(id);
    ASSERT_TRUE(copyId.has_value());

    const SceneObject* original = scene.Find(id);
    const SceneObject* copy = scene.Find(*copyId);
    ASSERT_NE(nullptr, original);
    ASSERT_NE(nullptr, copy);

    EXPECT_EQ("Cube Copy", copy->name);
    EXPECT_VEC3_EQ(glm::vec3(3.0f, 0.0f, -1.0f), copy->transform.position);
    EXPECT_EQ(original->material.texture.get(), copy->material.texture.get());
    EXPECT_EQ(PhysicsKind::RigidBody, copy->physicsKind);
    EXPECT_FLOAT_EQ(3.0f, copy->mass);
    EXPECT_NE(original->mesh.vertices.data(), copy->mesh.vertices.data());
    EXPECT_EQ(original->mesh.vertices, copy->mesh.vertices);
}

TEST_F(SceneTest, DuplicateUnknownIdReturnsNullopt) {
    EXPECT_FALSE(scene.Duplicate(7).has_value());
}

// =============================================================================
// SceneObject
// =============================================================================

TEST(SceneObjectTest, NegativeMassClampsToMinimum) {
    SceneObject object;
    object.SetMass(-5.0f);
    EXPECT_FLOAT_EQ(SceneObject::kMinimumMass, object.mass);
    object.SetMass(0.0f);
    EXPECT_FLOAT_EQ(0.0f, object.mass);
    object.SetMass(12.5f);
    EXPECT_FLOAT_EQ(12.5f, object.mass);
}

TEST(SceneObjectTest, TerrainIsForcedOntoPlane2D) {
    SceneObject terrain = MakeTerrain();
    terrain.physicsShape = PhysicsShape::Sphere;
    EXPECT_TRUE(terrain.ValidatePhysicsShape());
    EXPECT_EQ(PhysicsShape::Plane2D, terrain.physicsShape);
}

TEST(SceneObjectTest, Plane2DOnSolidBecomesMesh) {
    SceneObject cube = MakeCube(glm::vec3(0.0f), PhysicsKind::Static);
    cube.physicsShape = PhysicsShape::Plane2D;
    EXPECT_TRUE(cube.ValidatePhysicsShape());
    EXPECT_EQ(PhysicsShape::Mesh, cube.physicsShape);
}

TEST(SceneObjectTest, ShapeIsLeftAloneWithoutPhysics) {
    SceneObject cube = MakeCube(glm::vec3(0.0f), PhysicsKind::None);
    cube.physicsShape = PhysicsShape::Plane2D;
    EXPECT_FALSE(cube.ValidatePhysicsShape());
    EXPECT_EQ(PhysicsShape::Plane2D, cube.physicsShape);
}

TEST(SceneObjectTest, TransparencyFollowsAlpha) {
    Material material;
    EXPECT_FALSE(material.IsTransparent());
    material.baseColor.a = 0.5f;
    EXPECT_TRUE(material.IsTransparent());
}

TEST(SceneObjectTest, WorldCenterFollowsTransform) {
    SceneObject cube = MakeCube(glm::vec3(4.0f, 1.0f, -2.0f));
    EXPECT_VEC3_NEAR(glm::vec3(4.0f, 1.0f, -2.0f), cube.GetWorldCenter(), 1e-5f);
}

TEST(SceneObjectTest, NamesRoundTrip) {
    EXPECT_STREQ("capsule", PrimitiveTypeToString(PrimitiveType::Capsule));
    EXPECT_EQ(PrimitiveType::Cone, PrimitiveTypeFromString("Cone").value());
    EXPECT_FALSE(PrimitiveTypeFromString("teapot").has_value());

    EXPECT_STREQ("2DPlane", PhysicsShapeToString(PhysicsShape::Plane2D));
    EXPECT_EQ(PhysicsShape::Box, PhysicsShapeFromString("Cube"));
    EXPECT_EQ(PhysicsShape::Box, PhysicsShapeFromString("box"));
    EXPECT_EQ(PhysicsShape::Box, PhysicsShapeFromString("Dodecahedron"));
    EXPECT_EQ(PhysicsShape::Plane2D, PhysicsShapeFromString("2DPlane"));
    EXPECT_EQ(PhysicsKind::RigidBody, PhysicsKindFromString("RigidBody").value());
    EXPECT_FALSE(PhysicsKindFromString("Floaty").has_value());
}

// =============================================================================
// MeshData / MeshFactory
// =============================================================================

namespace {

void ExpectExtents(const MeshData& mesh, const glm::vec3& min, const glm::vec3& max, float eps = 1e-4f) {
    glm::vec3 lo, hi;
    ASSERT_TRUE(mesh.ComputeExtents(lo, hi));
    EXPECT_VEC3_NEAR(min, lo, eps);
    EXPECT_VEC3_NEAR(max, hi, eps);
}

} // namespace

TEST(MeshFactoryTest, PrimitiveDimensions) {
    ExpectExtents(MeshFactory::CreatePrimitive(PrimitiveType::Cube), glm::vec3(-1.0f), glm::vec3(1.0f));
    ExpectExtents(MeshFactory::CreatePrimitive(PrimitiveType::Sphere), glm::vec3(-1.0f), glm::vec3(1.0f));
    ExpectExtents(MeshFactory::CreatePrimitive(PrimitiveType::Cylinder), glm::vec3(-1.0f), glm::vec3(1.0f));
    ExpectExtents(MeshFactory::CreatePrimitive(PrimitiveType::Capsule),
                  glm::vec3(-0.5f, -1.0f, -0.5f), glm::vec3(0.5f, 1.0f, 0.5f));
}

TEST(MeshFactoryTest, ConeBaseSitsAtMinusHalfHeight) {
    MeshData cone = MeshFactory::CreateCone(1.0f, 2.0f, 32);
    glm::vec3 lo, hi;
    ASSERT_TRUE(cone.ComputeExtents(lo, hi));
    EXPECT_NEAR(-1.0f, lo.y, 1e-5f);
    EXPECT_NEAR(1.0f, hi.y, 1e-5f);
}

TEST(MeshFactoryTest, AllPrimitivesAreValid) {
    for (PrimitiveType type : {PrimitiveType::Cube, PrimitiveType::Sphere, PrimitiveType::Cone,
                               PrimitiveType::Cylinder, PrimitiveType::Capsule}) {
        MeshData mesh = MeshFactory::CreatePrimitive(type);
        EXPECT_FALSE(mesh.IsEmpty()) << PrimitiveTypeToString(type);
        EXPECT_TRUE(mesh.IsValid()) << PrimitiveTypeToString(type);
    }
    EXPECT_TRUE(MeshFactory::CreateTorus(0.8f, 0.05f, 32, 16).IsValid());
}

TEST(MeshFactoryTest, TerrainPlaneIsFourVerticesInMetres) {
    MeshData plane = MeshFactory::CreateTerrainPlane(1.0f, 2.0f);

    ASSERT_EQ(4u, plane.vertices.size());
    ASSERT_EQ(2u, plane.faces.size());
    EXPECT_EQ(glm::uvec3(0, 2, 1), plane.faces[0]);
    EXPECT_EQ(glm::uvec3(0, 3, 2), plane.faces[1]);
    ExpectExtents(plane, glm::vec3(-500.0f, 0.0f, -1000.0f), glm::vec3(500.0f, 0.0f, 1000.0f));
}

TEST(MeshFactoryTest, AlignYToAxisMapsUp) {
    for (const glm::vec3& axis : {glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f),
                                  glm::vec3(0.0f, 1.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f)}) {
        glm::vec3 mapped = glm::vec3(MeshFactory::AlignYToAxis(axis) * glm::vec4(0.0f, 1.0f, 0.0f, 0.0f));
        EXPECT_VEC3_NEAR(axis, mapped, 1e-5f);
    }
}

TEST(MeshDataTest, AppendReindexesFaces) {
    MeshData a = MeshFactory::CreateTerrainPlane(0.001f, 0.001f);
    MeshData b = a;
    a.Append(b);

    EXPECT_EQ(8u, a.vertices.size());
    EXPECT_EQ(4u, a.TriangleCount());
    EXPECT_EQ(glm::uvec3(4, 6, 5), a.faces[2]);
    EXPECT_TRUE(a.IsValid());
}

TEST(MeshDataTest, ApplyTransformMovesCentroid) {
    MeshData cube = MeshFactory::CreateBox();
    cube.ApplyTransform(glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 3.0f, 0.0f)));
    EXPECT_VEC3_NEAR(glm::vec3(0.0f, 3.0f, 0.0f), cube.Centroid(), 1e-5f);
}

TEST(MeshDataTest, EmptyMeshHasNoExtents) {
    MeshData empty;
    glm::vec3 lo, hi;
    EXPECT_TRUE(empty.IsEmpty());
    EXPECT_FALSE(empty.ComputeExtents(lo, hi));
    EXPECT_VEC3_EQ(glm::vec3(0.0f), empty.Centroid());
}
