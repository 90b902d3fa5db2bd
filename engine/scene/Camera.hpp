#pragma once

#include "config/Config.hpp"

#include <glm/glm.hpp>

namespace FreeFly {

/**
 * @brief Everything needed to put a camera back exactly where it was
 */
struct CameraState {
    glm::vec3 position{0.0f, 1.0f, 5.0f};
    float yaw = -90.0f;    // Degrees
    float pitch = 0.0f;    // Degrees
    float moveSpeed = 0.1f;

    [[nodiscard]] bool operator==(const CameraState&) const = default;
};

/**
 * @brief Yaw/pitch perspective camera
 *
 * Shared by the editor fly camera and the first-person player, whose eye
 * position is the camera position.
 */
class Camera {
public:
    Camera();
    explicit Camera(const CameraConfig& config);

    /**
     * @brief Set perspective projection
     */
    void SetPerspective(float fovDegrees, float aspectRatio, float nearPlane, float farPlane);

    /**
     * @brief Set viewport size in pixels; updates the aspect ratio
     */
    void SetViewportSize(float width, float height);

    void SetPosition(const glm::vec3& position);

    /**
     * @brief Set rotation from yaw and pitch, pitch clamped to +/-89 degrees
     */
    void SetRotation(float yawDegrees, float pitchDegrees);

    /**
     * @brief Add yaw/pitch offsets in degrees
     */
    void Rotate(float yawDeltaDegrees, float pitchDeltaDegrees);

    void SetMoveSpeed(float speed) { m_moveSpeed = speed; }

    [[nodiscard]] CameraState GetState() const;
    void SetState(const CameraState& state);

    // Getters
    const glm::vec3& GetPosition() const { return m_position; }
    const glm::vec3& GetForward() const { return m_forward; }
    const glm::vec3& GetRight() const { return m_right; }
    const glm::vec3& GetUp() const { return m_up; }

    float GetPitch() const { return m_pitch; }
    float GetYaw() const { return m_yaw; }
    float GetMoveSpeed() const { return m_moveSpeed; }

    const glm::mat4& GetView() const { return m_viewMatrix; }
    const glm::mat4& GetProjection() const { return m_projectionMatrix; }

    /**
     * @brief Viewport as (x, y, width, height)
     */
    glm::vec4 GetViewport() const { return glm::vec4(0.0f, 0.0f, m_viewportSize); }

    float GetFOV() const { return m_fov; }
    float GetAspectRatio() const { return m_aspectRatio; }
    float GetNearPlane() const { return m_nearPlane; }
    float GetFarPlane() const { return m_farPlane; }

    static constexpr float kMaxPitch = 89.0f;

private:
    void UpdateViewMatrix();
    void UpdateVectors();

    glm::vec3 m_position{0.0f, 1.0f, 5.0f};
    glm::vec3 m_forward{0.0f, 0.0f, -1.0f};
    glm::vec3 m_up{0.0f, 1.0f, 0.0f};
    glm::vec3 m_right{1.0f, 0.0f, 0.0f};
    glm::vec3 m_worldUp{0.0f, 1.0f, 0.0f};

    float m_pitch = 0.0f;  // Degrees
    float m_yaw = -90.0f;  // Degrees
    float m_moveSpeed = 0.1f;

    glm::mat4 m_viewMatrix{1.0f};
    glm::mat4 m_projectionMatrix{1.0f};

    glm::vec2 m_viewportSize{1280.0f, 720.0f};
    float m_fov = 45.0f;
    float m_aspectRatio = 16.0f / 9.0f;
    float m_nearPlane = 0.1f;
    float m_farPlane = 1000.0f;
};

} // namespace FreeFly
