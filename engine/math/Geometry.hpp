#pragma once

#include <glm/glm.hpp>
#include <optional>

namespace FreeFly {

namespace Geometry {

// Epsilon for floating point comparisons
inline constexpr float kEpsilon = 1e-6f;

/**
 * @brief Calculate ray-plane intersection
 * @param rayOrigin Starting point of the ray
 * @param rayDir Direction of the ray (should be normalized for accurate t)
 * @param planePoint Any point on the plane
 * @param planeNormal Normal vector of the plane
 * @return Distance along ray to intersection, or nullopt if the ray is
 *         parallel to the plane or the hit lies behind the origin
 */
[[nodiscard]] std::optional<float> RayPlaneIntersection(
    const glm::vec3& rayOrigin, const glm::vec3& rayDir,
    const glm::vec3& planePoint, const glm::vec3& planeNormal) noexcept;

/**
 * @brief Moller-Trumbore ray/triangle test, both faces
 * @return Distance along the ray for hits in front of the origin
 */
[[nodiscard]] std::optional<float> RayTriangleIntersection(
    const glm::vec3& rayOrigin, const glm::vec3& rayDir,
    const glm::vec3& v0, const glm::vec3& v1, const glm::vec3& v2) noexcept;

/**
 * @brief Normalize, or return fallback when the vector is shorter than kEpsilon
 */
[[nodiscard]] glm::vec3 SafeNormalize(const glm::vec3& v, const glm::vec3& fallback) noexcept;
[[nodiscard]] glm::vec2 SafeNormalize(const glm::vec2& v, const glm::vec2& fallback) noexcept;

/**
 * @brief Any unit vector perpendicular to v
 */
[[nodiscard]] glm::vec3 AnyPerpendicular(const glm::vec3& v) noexcept;

[[nodiscard]] bool IsFinite(const glm::vec3& v) noexcept;

} // namespace Geometry

} // namespace FreeFly
