#pragma once

#include "scene/Camera.hpp"

#include <glm/glm.hpp>

namespace FreeFly {

/**
 * @brief Key and mouse state driving the editor fly camera for one tick
 */
struct FlyCameraInput {
    bool forward = false;
    bool backward = false;
    bool left = false;
    bool right = false;
    bool up = false;
    bool sprint = false;
    bool look = false;            ///< Right mouse held
    glm::vec2 lookDelta{0.0f};    ///< Pixels, +y is screen down
};

/**
 * @brief Free movement controller for the editor camera
 *
 * Moves the camera by its move speed per tick (not per second), doubled
 * while sprinting. Mouse look only applies while the look button is held.
 */
class FlyCamera {
public:
    explicit FlyCamera(const CameraConfig& config = {});

    /**
     * @brief Update camera movement based on input
     * @return true if the camera moved or turned
     */
    bool Update(const FlyCameraInput& input, Camera& camera) const;

    void SetLookSpeed(float speed) { m_lookSpeed = speed; }
    void SetSprintMultiplier(float mult) { m_sprintMultiplier = mult; }

    float GetLookSpeed() const { return m_lookSpeed; }
    float GetSprintMultiplier() const { return m_sprintMultiplier; }

private:
    bool ProcessKeyboardInput(const FlyCameraInput& input, Camera& camera) const;
    bool ProcessMouseInput(const FlyCameraInput& input, Camera& camera) const;

    float m_lookSpeed = 0.1f;
    float m_sprintMultiplier = 2.0f;
};

} // namespace FreeFly
