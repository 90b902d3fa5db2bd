#include "math/Geometry.hpp"

#include <cmath>

namespace FreeFly {

namespace Geometry {

namespace {
// Barycentric slack so rays through a shared edge hit at least one triangle
constexpr float kBarycentricSlack = 1e-6f;
constexpr float kParallelEpsilon = 1e-8f;
}

std::optional<float> RayPlaneIntersection(
    const glm::vec3& rayOrigin, const glm::vec3& rayDir,
    const glm::vec3& planePoint, const glm::vec3& planeNormal) noexcept {

    const float denom = glm::dot(planeNormal, rayDir);
    if (std::abs(denom) < kEpsilon) {
        return std::nullopt;  // Ray parallel to plane
    }

    const float t = glm::dot(planePoint - rayOrigin, planeNormal) / denom;
    if (t < 0.0f) {
        return std::nullopt;  // Intersection behind ray
    }

    return t;
}

std::optional<float> RayTriangleIntersection(
    const glm::vec3& rayOrigin, const glm::vec3& rayDir,
    const glm::vec3& v0, const glm::vec3& v1, const glm::vec3& v2) noexcept {

    const glm::vec3 edge1 = v1 - v0;
    const glm::vec3 edge2 = v2 - v0;

    const glm::vec3 h = glm::cross(rayDir, edge2);
    const float a = glm::dot(edge1, h);

    // Ray parallel to triangle or degenerate triangle
    if (a > -kParallelEpsilon && a < kParallelEpsilon) {
        return std::nullopt;
    }

    const float f = 1.0f / a;
    const glm::vec3 s = rayOrigin - v0;
    const float u = f * glm::dot(s, h);
    if (u < -kBarycentricSlack || u > 1.0f + kBarycentricSlack) {
        return std::nullopt;
    }

    const glm::vec3 q = glm::cross(s, edge1);
    const float v = f * glm::dot(rayDir, q);
    if (v < -kBarycentricSlack || u + v > 1.0f + kBarycentricSlack) {
        return std::nullopt;
    }

    const float t = f * glm::dot(edge2, q);
    if (t <= kParallelEpsilon) {
        return std::nullopt;
    }
    return t;
}

glm::vec3 SafeNormalize(const glm::vec3& v, const glm::vec3& fallback) noexcept {
    const float len = glm::length(v);
    if (!(len > kEpsilon) || !std::isfinite(len)) {
        return fallback;
    }
    return v / len;
}

glm::vec2 SafeNormalize(const glm::vec2& v, const glm::vec2& fallback) noexcept {
    const float len = glm::length(v);
    if (!(len > kEpsilon) || !std::isfinite(len)) {
        return fallback;
    }
    return v / len;
}

glm::vec3 AnyPerpendicular(const glm::vec3& v) noexcept {
    const glm::vec3 reference = std::abs(v.y) < 0.9f ? glm::vec3(0.0f, 1.0f, 0.0f)
                                                     : glm::vec3(1.0f, 0.0f, 0.0f);
    return SafeNormalize(glm::cross(v, reference), glm::vec3(0.0f, 0.0f, 1.0f));
}

bool IsFinite(const glm::vec3& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

} // namespace Geometry

} // namespace FreeFly
