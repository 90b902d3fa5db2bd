#include "scene/Camera.hpp"

#include <glm/gtc/matrix_transform.hpp>
#include <cmath>

namespace FreeFly {

Camera::Camera()
    : Camera(CameraConfig::FromConfig(Config::Instance())) {
}

Camera::Camera(const CameraConfig& config) {
    m_position = config.defaultPosition;
    m_yaw = config.defaultYaw;
    m_pitch = glm::clamp(config.defaultPitch, -kMaxPitch, kMaxPitch);
    m_moveSpeed = config.flySpeed;

    SetPerspective(config.fov, m_viewportSize.x / m_viewportSize.y, config.nearPlane, config.farPlane);
    UpdateVectors();
    UpdateViewMatrix();
}

void Camera::SetPerspective(float fovDegrees, float aspectRatio, float nearPlane, float farPlane) {
    m_fov = fovDegrees;
    m_aspectRatio = aspectRatio;
    m_nearPlane = nearPlane;
    m_farPlane = farPlane;

    m_projectionMatrix = glm::perspective(
        glm::radians(fovDegrees),
        aspectRatio,
        nearPlane,
        farPlane
    );
}

void Camera::SetViewportSize(float width, float height) {
    if (width <= 0.0f || height <= 0.0f) {
        return;
    }
    m_viewportSize = glm::vec2(width, height);
    SetPerspective(m_fov, width / height, m_nearPlane, m_farPlane);
}

void Camera::SetPosition(const glm::vec3& position) {
    m_position = position;
    UpdateViewMatrix();
}

void Camera::SetRotation(float yawDegrees, float pitchDegrees) {
    m_yaw = yawDegrees;
    m_pitch = glm::clamp(pitchDegrees, -kMaxPitch, kMaxPitch);

    UpdateVectors();
    UpdateViewMatrix();
}

void Camera::Rotate(float yawDeltaDegrees, float pitchDeltaDegrees) {
    SetRotation(m_yaw + yawDeltaDegrees, m_pitch + pitchDeltaDegrees);
}

CameraState Camera::GetState() const {
    return CameraState{m_position, m_yaw, m_pitch, m_moveSpeed};
}

void Camera::SetState(const CameraState& state) {
    m_position = state.position;
    m_moveSpeed = state.moveSpeed;
    SetRotation(state.yaw, state.pitch);
}

void Camera::UpdateViewMatrix() {
    m_viewMatrix = glm::lookAt(m_position, m_position + m_forward, m_up);
}

void Camera::UpdateVectors() {
    glm::vec3 forward;
    forward.x = std::cos(glm::radians(m_yaw)) * std::cos(glm::radians(m_pitch));
    forward.y = std::sin(glm::radians(m_pitch));
    forward.z = std::sin(glm::radians(m_yaw)) * std::cos(glm::radians(m_pitch));

    m_forward = glm::normalize(forward);
    m_right = glm::normalize(glm::cross(m_forward, m_worldUp));
    m_up = glm::normalize(glm::cross(m_right, m_forward));
}

} // namespace FreeFly
