#include "physics/CollisionBounds.hpp"

#include <algorithm>
#include <cmath>

namespace FreeFly {

namespace Collision {

namespace {

constexpr float kStabilityHeightPadding = 0.1f;
constexpr float kMaxStability = 10.0f;

float MaxComponent(const glm::vec3& v) {
    return std::max({v.x, v.y, v.z});
}

bool IsRotationBelow(const glm::vec3& rotation, float epsilon) {
    return std::abs(rotation.x) <= epsilon && std::abs(rotation.y) <= epsilon &&
           std::abs(rotation.z) <= epsilon;
}

} // anonymous namespace

CollisionBounds ComputeBounds(const ObjectTransform& transform, const MeshData& mesh, PhysicsShape shape) {
    CollisionBounds bounds;
    bounds.shape = shape;
    bounds.origin = transform.position;
    bounds.rotation = transform.rotation;
    bounds.scale = transform.scale;

    glm::vec3 localMin;
    glm::vec3 localMax;
    if (!mesh.ComputeExtents(localMin, localMax)) {
        // No geometry: a point at the object origin
        bounds.min = bounds.max = bounds.center = transform.position;
        return bounds;
    }
    bounds.localExtents = localMax - localMin;

    const glm::mat4 world = transform.ToMatrix();
    std::vector<glm::vec3> worldVertices;
    worldVertices.reserve(mesh.vertices.size());
    for (const auto& v : mesh.vertices) {
        worldVertices.emplace_back(world * glm::vec4(v, 1.0f));
    }

    bounds.min = worldVertices.front();
    bounds.max = worldVertices.front();
    for (const auto& v : worldVertices) {
        bounds.min = glm::min(bounds.min, v);
        bounds.max = glm::max(bounds.max, v);
    }
    bounds.center = (bounds.min + bounds.max) * 0.5f;
    bounds.size = bounds.max - bounds.min;

    const glm::vec3 absScale = glm::abs(transform.scale);
    switch (shape) {
        case PhysicsShape::Sphere:
            bounds.radius = MaxComponent(bounds.localExtents) * 0.5f * MaxComponent(absScale);
            bounds.height = bounds.radius * 2.0f;
            break;
        case PhysicsShape::Cylinder:
        case PhysicsShape::Capsule:
            bounds.radius = std::max(bounds.localExtents.x, bounds.localExtents.z) * 0.5f *
                            std::max(absScale.x, absScale.z);
            bounds.height = bounds.localExtents.y * absScale.y;
            break;
        case PhysicsShape::Mesh:
            bounds.radius = MaxComponent(bounds.size) * 0.5f;
            bounds.height = bounds.size.y;
            bounds.meshVertices = std::move(worldVertices);
            bounds.meshFaces = mesh.faces;
            break;
        default:
            bounds.radius = MaxComponent(bounds.size) * 0.5f;
            bounds.height = bounds.size.y;
            break;
    }
    return bounds;
}

CollisionBounds ComputeBounds(const SceneObject& object) {
    return ComputeBounds(object.transform, object.mesh, object.physicsShape);
}

bool CirclesOverlapXZ(const glm::vec2& a, float radiusA, const glm::vec2& b, float radiusB) {
    return glm::length(a - b) < radiusA + radiusB;
}

bool OverlapsOrientedBoxXZ(const glm::vec2& centerA, float radiusA,
                           const CollisionBounds& bounds, const glm::vec3& bodyPosition) {
    // Undo the box yaw so the test runs in box space
    const glm::vec2 offset = centerA - glm::vec2(bodyPosition.x, bodyPosition.z);
    const float c = std::cos(-bounds.rotation.y);
    const float s = std::sin(-bounds.rotation.y);
    const glm::vec2 local(c * offset.x + s * offset.y, -s * offset.x + c * offset.y);

    const glm::vec2 halfSize = glm::vec2(bounds.localExtents.x * std::abs(bounds.scale.x),
                                         bounds.localExtents.z * std::abs(bounds.scale.z)) * 0.5f;
    const glm::vec2 expanded = halfSize + glm::vec2(radiusA);

    return std::abs(local.x) <= expanded.x && std::abs(local.y) <= expanded.y;
}

bool OverlapsAxisAlignedBoxXZ(const glm::vec2& centerA, float radiusA,
                              const CollisionBounds& bounds, const glm::vec3& bodyPosition) {
    const glm::vec3 bmin = bounds.MinAt(bodyPosition);
    const glm::vec3 bmax = bounds.MaxAt(bodyPosition);

    return centerA.x >= bmin.x - radiusA && centerA.x <= bmax.x + radiusA &&
           centerA.y >= bmin.z - radiusA && centerA.y <= bmax.z + radiusA;
}

bool OverlapsXZ(const glm::vec2& centerA, float radiusA,
                const CollisionBounds& bounds, const glm::vec3& bodyPosition) {
    const glm::vec2 bodyXZ(bodyPosition.x, bodyPosition.z);

    switch (bounds.shape) {
        case PhysicsShape::Sphere: {
            const float radius = bounds.radius > 0.0f ? bounds.radius : MaxComponent(bounds.size) * 0.5f;
            return CirclesOverlapXZ(centerA, radiusA, bodyXZ, radius);
        }
        case PhysicsShape::Cylinder:
        case PhysicsShape::Capsule:
            if (std::abs(bounds.rotation.x) > kCylinderTiltEpsilon ||
                std::abs(bounds.rotation.z) > kCylinderTiltEpsilon) {
                return OverlapsOrientedBoxXZ(centerA, radiusA, bounds, bodyPosition);
            }
            return CirclesOverlapXZ(centerA, radiusA, bodyXZ, bounds.radius);
        default:
            if (!IsRotationBelow(bounds.rotation, kBoxRotationEpsilon)) {
                return OverlapsOrientedBoxXZ(centerA, radiusA, bounds, bodyPosition);
            }
            return OverlapsAxisAlignedBoxXZ(centerA, radiusA, bounds, bodyPosition);
    }
}

bool OverlapsXZ(const glm::vec2& centerA, float radiusA, const CollisionBounds& bounds) {
    return OverlapsXZ(centerA, radiusA, bounds, bounds.origin);
}

bool AABBOverlap(const CollisionBounds& a, const glm::vec3& positionA,
                 const CollisionBounds& b, const glm::vec3& positionB) {
    const glm::vec3 aMin = a.MinAt(positionA);
    const glm::vec3 aMax = a.MaxAt(positionA);
    const glm::vec3 bMin = b.MinAt(positionB);
    const glm::vec3 bMax = b.MaxAt(positionB);

    return aMin.x <= bMax.x && aMax.x >= bMin.x &&
           aMin.y <= bMax.y && aMax.y >= bMin.y &&
           aMin.z <= bMax.z && aMax.z >= bMin.z;
}

float SeparationRadius(const CollisionBounds& bounds) {
    if (bounds.shape == PhysicsShape::Sphere) {
        return bounds.radius;
    }
    return MaxComponent(bounds.size) * 0.5f;
}

float BottomHeight(const CollisionBounds& bounds, const glm::vec3& position) {
    switch (bounds.shape) {
        case PhysicsShape::Sphere:
            return position.y - bounds.radius;
        case PhysicsShape::Cylinder:
        case PhysicsShape::Capsule:
            return position.y - bounds.height * 0.5f;
        case PhysicsShape::Mesh:
            return bounds.MinAt(position).y;
        default:
            return position.y - bounds.size.y * 0.5f;
    }
}

float StabilityFactor(const glm::vec3& extents, float mass) {
    const float baseArea = extents.x * extents.z;
    const float stability = (baseArea * mass) / (extents.y + kStabilityHeightPadding);
    if (!std::isfinite(stability)) {
        return 0.0f;
    }
    return std::clamp(stability, 0.0f, kMaxStability);
}

} // namespace Collision

} // namespace FreeFly
