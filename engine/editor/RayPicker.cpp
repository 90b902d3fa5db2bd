/**
 * @file RayPicker.cpp
 * @brief Implementation of ray casting and object picking
 */

#include "editor/RayPicker.hpp"
#include "math/Geometry.hpp"
#include "scene/Scene.hpp"

#include <glm/gtc/matrix_transform.hpp>

namespace FreeFly {

// ============================================================================
// Ray Generation
// ============================================================================

PickRay RayPicker::ScreenToWorldRay(const glm::vec2& screenPos,
                                    const glm::mat4& view,
                                    const glm::mat4& projection,
                                    const glm::vec4& viewport)
{
    // Window y grows downwards, GL window coordinates grow upwards
    const float windowY = viewport.w - screenPos.y;

    const glm::vec3 nearPoint = glm::unProject(glm::vec3(screenPos.x, windowY, 0.0f), view, projection, viewport);
    const glm::vec3 farPoint = glm::unProject(glm::vec3(screenPos.x, windowY, 1.0f), view, projection, viewport);

    const glm::vec3 direction = Geometry::SafeNormalize(farPoint - nearPoint, glm::vec3(0.0f, 0.0f, -1.0f));
    return PickRay(nearPoint, direction);
}

// ============================================================================
// Mesh Intersection
// ============================================================================

std::optional<PickResult> RayPicker::IntersectMesh(const PickRay& ray,
                                                   const MeshData& mesh,
                                                   const glm::mat4& worldMatrix)
{
    if (mesh.IsEmpty()) {
        return std::nullopt;
    }

    std::vector<glm::vec3> world;
    world.reserve(mesh.vertices.size());
    for (const auto& v : mesh.vertices) {
        world.push_back(glm::vec3(worldMatrix * glm::vec4(v, 1.0f)));
    }

    std::optional<PickResult> best;
    for (size_t i = 0; i < mesh.faces.size(); ++i) {
        const glm::uvec3& face = mesh.faces[i];
        if (face.x >= world.size() || face.y >= world.size() || face.z >= world.size()) {
            continue;
        }

        auto t = Geometry::RayTriangleIntersection(ray.origin, ray.direction,
                                                   world[face.x], world[face.y], world[face.z]);
        if (t && (!best || *t < best->distance)) {
            PickResult hit;
            hit.distance = *t;
            hit.hitPoint = ray.GetPoint(*t);
            hit.triangleIndex = static_cast<int>(i);
            best = hit;
        }
    }
    return best;
}

// ============================================================================
// Picking
// ============================================================================

std::optional<PickResult> RayPicker::PickClosest(const PickRay& ray, const Scene& scene) {
    std::vector<Candidate> candidates;
    candidates.reserve(scene.GetObjectCount());
    for (const auto& object : scene.GetObjects()) {
        candidates.push_back({&object.mesh, object.GetWorldMatrix(), object.id});
    }
    return PickClosest(ray, candidates);
}

std::optional<PickResult> RayPicker::PickClosest(const PickRay& ray,
                                                 const std::vector<Candidate>& candidates)
{
    std::optional<PickResult> closest;

    for (size_t i = 0; i < candidates.size(); ++i) {
        const Candidate& candidate = candidates[i];
        if (!candidate.mesh) continue;

        auto hit = IntersectMesh(ray, *candidate.mesh, candidate.worldMatrix);

        // Strict comparison keeps the earliest candidate on ties
        if (hit && (!closest || hit->distance < closest->distance)) {
            hit->index = i;
            hit->objectId = candidate.objectId;
            closest = hit;
        }
    }

    return closest;
}

} // namespace FreeFly
