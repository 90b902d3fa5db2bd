#include "math/Transform.hpp"

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace FreeFly {

namespace Transform {

namespace {
constexpr float kScaleEpsilon = 1e-8f;
constexpr float kGimbalThreshold = 1.0f - 1e-6f;
}

glm::mat3 EulerToMatrix(const glm::vec3& eulerRadians) {
    const glm::mat4 identity(1.0f);
    glm::mat4 r = glm::rotate(identity, eulerRadians.z, glm::vec3(0.0f, 0.0f, 1.0f));
    r = glm::rotate(r, eulerRadians.y, glm::vec3(0.0f, 1.0f, 0.0f));
    r = glm::rotate(r, eulerRadians.x, glm::vec3(1.0f, 0.0f, 0.0f));
    return glm::mat3(r);
}

glm::mat4 Compose(const glm::vec3& position, const glm::vec3& eulerRadians, const glm::vec3& scale) {
    glm::mat4 translation = glm::translate(glm::mat4(1.0f), position);
    glm::mat4 rot = glm::mat4(EulerToMatrix(eulerRadians));
    glm::mat4 scl = glm::scale(glm::mat4(1.0f), scale);
    return translation * rot * scl;
}

void Decompose(const glm::mat4& matrix, glm::vec3& position, glm::vec3& eulerRadians, glm::vec3& scale) {
    position = glm::vec3(matrix[3]);

    glm::vec3 col0(matrix[0]);
    glm::vec3 col1(matrix[1]);
    glm::vec3 col2(matrix[2]);

    scale.x = glm::length(col0);
    scale.y = glm::length(col1);
    scale.z = glm::length(col2);

    if (glm::dot(glm::cross(col0, col1), col2) < 0.0f) {
        scale.x = -scale.x;
    }

    // Degenerate axes keep their direction unnormalised instead of dividing by ~0
    const glm::mat3 r(
        std::abs(scale.x) > kScaleEpsilon ? col0 / scale.x : col0,
        std::abs(scale.y) > kScaleEpsilon ? col1 / scale.y : col1,
        std::abs(scale.z) > kScaleEpsilon ? col2 / scale.z : col2
    );

    // glm is column-major: r[col][row]. For R = Rz*Ry*Rx, row 2 col 0 = -sin(y).
    const float sinY = std::clamp(-r[0][2], -1.0f, 1.0f);

    if (std::abs(sinY) < kGimbalThreshold) {
        eulerRadians.y = std::asin(sinY);
        eulerRadians.x = std::atan2(r[1][2], r[2][2]);
        eulerRadians.z = std::atan2(r[0][1], r[0][0]);
    } else {
        // Gimbal lock: fold all remaining rotation into X
        eulerRadians.y = sinY > 0.0f ? glm::half_pi<float>() : -glm::half_pi<float>();
        eulerRadians.z = 0.0f;
        eulerRadians.x = std::atan2(sinY * r[1][0], sinY * r[2][0]);
    }
}

glm::mat4 LookAt(const glm::vec3& position, const glm::vec3& target, const glm::vec3& up) {
    return glm::lookAt(position, target, up);
}

glm::mat4 Perspective(float fovDegrees, float aspect, float near, float far) {
    return glm::perspective(glm::radians(fovDegrees), aspect, near, far);
}

} // namespace Transform

} // namespace FreeFly
