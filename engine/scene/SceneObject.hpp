#pragma once

#include "physics/CollisionShape.hpp"
#include "scene/MeshData.hpp"

#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace FreeFly {

/**
 * @brief Stable object identifier, never reused within a scene
 */
using ObjectId = uint64_t;
inline constexpr ObjectId kInvalidObjectId = 0;

/**
 * @brief Position, Euler rotation (radians) and scale
 */
struct ObjectTransform {
    glm::vec3 position{0.0f};
    glm::vec3 rotation{0.0f};
    glm::vec3 scale{1.0f};

    [[nodiscard]] glm::mat4 ToMatrix() const;
    [[nodiscard]] static ObjectTransform FromMatrix(const glm::mat4& matrix);

    [[nodiscard]] bool operator==(const ObjectTransform&) const = default;
};

/**
 * @brief Opaque texture reference owned by the renderer
 */
struct TextureRef {
    std::string source;
};

using TextureHandle = std::shared_ptr<const TextureRef>;

struct Material {
    static constexpr float kTransparencyThreshold = 0.99f;

    glm::vec4 baseColor{0.8f, 0.8f, 0.8f, 1.0f};
    TextureHandle texture;

    [[nodiscard]] bool IsTransparent() const noexcept { return baseColor.a < kTransparencyThreshold; }
};

enum class PrimitiveType : uint8_t {
    Cube,
    Sphere,
    Cone,
    Cylinder,
    Capsule
};

[[nodiscard]] const char* PrimitiveTypeToString(PrimitiveType type) noexcept;
[[nodiscard]] std::optional<PrimitiveType> PrimitiveTypeFromString(const std::string& str) noexcept;

enum class ObjectSourceType : uint8_t {
    Model,
    Primitive,
    Terrain
};

struct TerrainDescriptor {
    float sizeXKm = 1.0f;
    float sizeZKm = 1.0f;
};

/**
 * @brief Where the geometry came from, so it can be rebuilt on load
 */
struct ObjectSource {
    ObjectSourceType type = ObjectSourceType::Model;
    std::string modelFile;
    PrimitiveType primitive = PrimitiveType::Cube;
    TerrainDescriptor terrain;
};

struct EnemyTraits {
    float speed = 1.0f;
};

/**
 * @brief One entity in the scene list
 */
struct SceneObject {
    static constexpr float kMinimumMass = 0.1f;

    ObjectId id = kInvalidObjectId;
    std::string name;
    ObjectTransform transform;
    MeshData mesh;
    Material material;
    ObjectSource source;

    PhysicsKind physicsKind = PhysicsKind::None;
    PhysicsShape physicsShape = PhysicsShape::Box;
    float mass = 1.0f;

    std::optional<EnemyTraits> enemy;

    [[nodiscard]] glm::mat4 GetWorldMatrix() const { return transform.ToMatrix(); }

    /**
     * @brief Mesh centroid in world space
     */
    [[nodiscard]] glm::vec3 GetWorldCenter() const;

    [[nodiscard]] bool IsTerrain() const noexcept { return source.type == ObjectSourceType::Terrain; }
    [[nodiscard]] bool IsEnemy() const noexcept { return enemy.has_value(); }

    /**
     * @brief Store a mass, replacing negative values with kMinimumMass
     */
    void SetMass(float value) noexcept;

    /**
     * @brief Force terrain onto Plane2D and keep Plane2D off everything else
     * @return true if the shape was changed
     */
    bool ValidatePhysicsShape();
};

} // namespace FreeFly
