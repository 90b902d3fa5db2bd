#pragma once

#include "physics/CollisionShape.hpp"
#include "scene/MeshData.hpp"
#include "scene/SceneObject.hpp"

#include <glm/glm.hpp>
#include <vector>

namespace FreeFly {

/**
 * @brief World-space collision approximation of one object
 *
 * The AABB comes from the fully transformed vertices. radius and height
 * come from the untransformed extents scaled per axis, so rotation does not
 * change them. All positions are valid for the object at `origin`; a body
 * that has moved since can translate them by (position - origin).
 */
struct CollisionBounds {
    PhysicsShape shape = PhysicsShape::Box;

    glm::vec3 min{0.0f};
    glm::vec3 max{0.0f};
    glm::vec3 center{0.0f};       ///< AABB centre
    glm::vec3 size{0.0f};         ///< AABB size

    glm::vec3 origin{0.0f};       ///< Object position the bounds were built at
    glm::vec3 rotation{0.0f};
    glm::vec3 scale{1.0f};
    glm::vec3 localExtents{0.0f}; ///< Untransformed vertex extents

    float radius = 0.0f;
    float height = 0.0f;

    // Mesh shape only
    std::vector<glm::vec3> meshVertices;
    std::vector<glm::uvec3> meshFaces;

    [[nodiscard]] glm::vec3 MinAt(const glm::vec3& position) const { return min + (position - origin); }
    [[nodiscard]] glm::vec3 MaxAt(const glm::vec3& position) const { return max + (position - origin); }

    [[nodiscard]] bool operator==(const CollisionBounds&) const = default;
};

namespace Collision {

// Rotation magnitudes (radians) below these count as axis-aligned
inline constexpr float kBoxRotationEpsilon = 0.01f;
inline constexpr float kCylinderTiltEpsilon = 0.1f;

[[nodiscard]] CollisionBounds ComputeBounds(const ObjectTransform& transform, const MeshData& mesh,
                                            PhysicsShape shape);
[[nodiscard]] CollisionBounds ComputeBounds(const SceneObject& object);

/**
 * @brief Does a vertical cylinder (point + radius on XZ) touch the body footprint
 * @param bodyPosition Current position of the body owning `bounds`
 */
[[nodiscard]] bool OverlapsXZ(const glm::vec2& centerA, float radiusA,
                              const CollisionBounds& bounds, const glm::vec3& bodyPosition);

/**
 * @brief OverlapsXZ with the body still at the position its bounds were built at
 */
[[nodiscard]] bool OverlapsXZ(const glm::vec2& centerA, float radiusA, const CollisionBounds& bounds);

[[nodiscard]] bool CirclesOverlapXZ(const glm::vec2& a, float radiusA, const glm::vec2& b, float radiusB);

/**
 * @brief Point+radius against a box rotated about Y only
 */
[[nodiscard]] bool OverlapsOrientedBoxXZ(const glm::vec2& centerA, float radiusA,
                                         const CollisionBounds& bounds, const glm::vec3& bodyPosition);

[[nodiscard]] bool OverlapsAxisAlignedBoxXZ(const glm::vec2& centerA, float radiusA,
                                            const CollisionBounds& bounds, const glm::vec3& bodyPosition);

/**
 * @brief 3D AABB overlap of two bodies at their current positions
 */
[[nodiscard]] bool AABBOverlap(const CollisionBounds& a, const glm::vec3& positionA,
                               const CollisionBounds& b, const glm::vec3& positionB);

/**
 * @brief Sphere radius, or half the largest AABB side for other shapes
 */
[[nodiscard]] float SeparationRadius(const CollisionBounds& bounds);

/**
 * @brief Lowest point of the body along Y
 */
[[nodiscard]] float BottomHeight(const CollisionBounds& bounds, const glm::vec3& position);

/**
 * @brief Tipping resistance: base area * mass / (height + 0.1), clamped to [0, 10]
 */
[[nodiscard]] float StabilityFactor(const glm::vec3& extents, float mass);

} // namespace Collision

} // namespace FreeFly
