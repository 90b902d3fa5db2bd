#pragma once

#include <glm/glm.hpp>

namespace FreeFly {

/**
 * @brief Euler transform composition
 *
 * Rotation is a vector of Euler angles in radians applied X first, then Y,
 * then Z, so the world matrix is T * Rz * Ry * Rx * S. Every path that turns
 * a position/rotation/scale triple into a matrix (rendering, picking, bounds,
 * gizmo drags) goes through Compose().
 */
namespace Transform {

[[nodiscard]] glm::mat4 Compose(const glm::vec3& position, const glm::vec3& eulerRadians,
                                const glm::vec3& scale);

/**
 * @brief Split a matrix back into position, Euler angles and scale
 *
 * Angles come back in (-pi, pi] for X and Z and [-pi/2, pi/2] for Y.
 * At |Y| = pi/2 the decomposition is not unique; the Z angle is then
 * reported as 0 and X carries the remaining rotation. A mirrored matrix
 * (negative determinant) reports a negative X scale.
 */
void Decompose(const glm::mat4& matrix, glm::vec3& position, glm::vec3& eulerRadians,
               glm::vec3& scale);

[[nodiscard]] glm::mat3 EulerToMatrix(const glm::vec3& eulerRadians);

[[nodiscard]] glm::mat4 LookAt(const glm::vec3& position, const glm::vec3& target, const glm::vec3& up);
[[nodiscard]] glm::mat4 Perspective(float fovDegrees, float aspect, float near, float far);

} // namespace Transform

} // namespace FreeFly
