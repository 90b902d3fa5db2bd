#pragma once

#include "math/Random.hpp"
#include "physics/PhysicsBody.hpp"

#include <glm/glm.hpp>
#include <memory>

namespace FreeFly {

class Camera;
class Config;
class PhysicsWorld;

/**
 * @brief First-person player tuning
 */
struct PlayerConfig {
    float eyeHeight = 1.8f;          ///< Eye above the feet; also the player's height
    float radius = 0.3f;             ///< Horizontal collision radius
    float moveSpeed = 5.0f;          ///< m/s
    float jumpVelocity = 8.0f;       ///< m/s
    float gravity = -15.0f;          ///< m/s^2
    float mass = 70.0f;              ///< kg, used for pushing
    float mouseSensitivity = 0.1f;   ///< Degrees per pixel
    float stepTolerance = 0.05f;     ///< Surfaces this close above the feet do not block
    glm::vec3 spawnPosition{0.0f, 1.8f, 0.0f};
    float spawnYaw = -90.0f;

    static PlayerConfig FromConfig(const Config& config);
};

/**
 * @brief One tick of player input
 */
struct PlayerInput {
    bool forward = false;
    bool backward = false;
    bool left = false;
    bool right = false;
    bool jump = false;
    glm::vec2 lookDelta{0.0f};       ///< Pixels, +y looks up
};

/**
 * @brief Walking first-person controller
 *
 * The camera position is the player's eye. The player is a vertical
 * cylinder of radius `radius` spanning [eye - eyeHeight, eye] and collides
 * with the footprints of Static and RigidBody physics bodies. Walking into
 * a rigid body pushes it.
 */
class PlayerController {
public:
    explicit PlayerController(const PlayerConfig& config = {},
                              std::shared_ptr<IRandomSource> random = MakeDefaultRandomSource());

    /**
     * @brief Put the camera at the spawn point, grounded
     */
    void Spawn(Camera& camera);

    /**
     * @brief Look, jump, gravity, walking and pushing for one tick
     */
    void Update(const PlayerInput& input, Camera& camera, PhysicsWorld& world, float deltaTime);

    void ApplyLook(const glm::vec2& lookDelta, Camera& camera) const;

    /**
     * @brief Eye height the player would stand at over this XZ position
     *
     * The highest of the ground plane and the tops of Static bodies under
     * the player's footprint that are not above the feet, plus eyeHeight.
     */
    [[nodiscard]] float GetGroundLevel(const glm::vec3& eyePosition, const PhysicsWorld& world) const;

    /**
     * @brief First Static or RigidBody body the player would touch with the eye at this position
     */
    [[nodiscard]] PhysicsBody* FindBlockingBody(const glm::vec3& eyePosition, PhysicsWorld& world) const;
    [[nodiscard]] bool IsBlocked(const glm::vec3& eyePosition, PhysicsWorld& world) const;

    /**
     * @brief Shove a rigid body away from the player
     *
     * Lighter bodies are pushed harder, capped at 2 * 0.1 m/s per push.
     * The random spin nudge follows the world's perturbation setting.
     */
    void ApplyPush(PhysicsBody& body, const glm::vec3& eyePosition, const PhysicsWorld& world);

    [[nodiscard]] bool IsGrounded() const noexcept { return m_grounded; }
    [[nodiscard]] float GetVerticalVelocity() const noexcept { return m_verticalVelocity; }
    [[nodiscard]] const PlayerConfig& GetConfig() const { return m_config; }

    void SetRandomSource(std::shared_ptr<IRandomSource> random);

    static constexpr float kPushScale = 0.1f;
    static constexpr float kMaxPushStrength = 2.0f;
    static constexpr float kLightBodyMass = 5.0f;
    static constexpr float kLiftNudge = 0.05f;
    static constexpr float kSpinNudge = 0.2f;

private:
    void UpdateVertical(const PlayerInput& input, Camera& camera, const PhysicsWorld& world, float deltaTime);
    void UpdateHorizontal(const PlayerInput& input, Camera& camera, PhysicsWorld& world, float deltaTime);
    bool TouchesBody(const glm::vec3& eyePosition, const PhysicsBody& body) const;

    PlayerConfig m_config;
    std::shared_ptr<IRandomSource> m_random;

    bool m_grounded = true;
    float m_verticalVelocity = 0.0f;
};

} // namespace FreeFly
