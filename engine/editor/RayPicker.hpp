/**
 * @file RayPicker.hpp
 * @brief Screen-to-world rays and closest-object picking for the FreeFly editor
 */

#pragma once

#include "scene/MeshData.hpp"
#include "scene/SceneObject.hpp"

#include <glm/glm.hpp>
#include <limits>
#include <optional>
#include <vector>

namespace FreeFly {

class Scene;

/**
 * @brief Ray structure for picking operations
 */
struct PickRay {
    glm::vec3 origin{0.0f};
    glm::vec3 direction{0.0f, 0.0f, -1.0f};

    PickRay() noexcept = default;

    PickRay(const glm::vec3& o, const glm::vec3& d) noexcept
        : origin(o), direction(d) {}

    /**
     * @brief Get point along ray at distance t
     */
    [[nodiscard]] glm::vec3 GetPoint(float t) const noexcept {
        return origin + direction * t;
    }
};

/**
 * @brief Result of a picking operation
 */
struct PickResult {
    size_t index = 0;                                   // Position in the candidate list
    ObjectId objectId = kInvalidObjectId;
    glm::vec3 hitPoint{0.0f};                           // World-space hit position
    float distance = std::numeric_limits<float>::max(); // Distance from ray origin
    int triangleIndex = -1;
};

/**
 * @brief Stateless picking queries
 *
 * Nothing here changes selection; the caller decides what a hit means.
 */
class RayPicker {
public:
    /**
     * @brief Build a world ray through a window pixel
     * @param screenPos Pixel coordinates, origin top-left
     * @param viewport (x, y, width, height) in pixels
     * @return Ray starting on the near plane, direction normalized
     */
    [[nodiscard]] static PickRay ScreenToWorldRay(const glm::vec2& screenPos,
                                                  const glm::mat4& view,
                                                  const glm::mat4& projection,
                                                  const glm::vec4& viewport);

    /**
     * @brief Closest hit of the ray on a mesh placed by worldMatrix
     * @return Distance along the ray and the triangle that was hit
     */
    [[nodiscard]] static std::optional<PickResult> IntersectMesh(const PickRay& ray,
                                                                 const MeshData& mesh,
                                                                 const glm::mat4& worldMatrix);

    /**
     * @brief Closest object hit by the ray
     *
     * Equal distances keep the earlier object, so the result follows the
     * scene's iteration order.
     */
    [[nodiscard]] static std::optional<PickResult> PickClosest(const PickRay& ray, const Scene& scene);

    /**
     * @brief Same as above over an explicit list of (mesh, world matrix) candidates
     */
    struct Candidate {
        const MeshData* mesh = nullptr;
        glm::mat4 worldMatrix{1.0f};
        ObjectId objectId = kInvalidObjectId;
    };

    [[nodiscard]] static std::optional<PickResult> PickClosest(const PickRay& ray,
                                                               const std::vector<Candidate>& candidates);
};

} // namespace FreeFly
