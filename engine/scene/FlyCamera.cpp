#include "scene/FlyCamera.hpp"

namespace FreeFly {

FlyCamera::FlyCamera(const CameraConfig& config)
    : m_lookSpeed(config.lookSensitivity) {
}

bool FlyCamera::Update(const FlyCameraInput& input, Camera& camera) const {
    const bool turned = ProcessMouseInput(input, camera);
    const bool moved = ProcessKeyboardInput(input, camera);
    return turned || moved;
}

bool FlyCamera::ProcessKeyboardInput(const FlyCameraInput& input, Camera& camera) const {
    float speed = camera.GetMoveSpeed();

    // Sprint
    if (input.sprint) {
        speed *= m_sprintMultiplier;
    }

    // Movement
    glm::vec3 movement(0.0f);

    if (input.forward) {
        movement += camera.GetForward() * speed;
    }
    if (input.backward) {
        movement -= camera.GetForward() * speed;
    }
    if (input.left) {
        movement -= camera.GetRight() * speed;
    }
    if (input.right) {
        movement += camera.GetRight() * speed;
    }
    if (input.up) {
        movement += glm::vec3(0.0f, 1.0f, 0.0f) * speed;
    }

    if (glm::length(movement) > 0.0f) {
        camera.SetPosition(camera.GetPosition() + movement);
        return true;
    }
    return false;
}

bool FlyCamera::ProcessMouseInput(const FlyCameraInput& input, Camera& camera) const {
    // Only rotate when right mouse button is held
    if (!input.look) {
        return false;
    }

    if (glm::length(input.lookDelta) < 0.001f) {
        return false;
    }

    camera.Rotate(input.lookDelta.x * m_lookSpeed, -input.lookDelta.y * m_lookSpeed);
    return true;
}

} // namespace FreeFly
