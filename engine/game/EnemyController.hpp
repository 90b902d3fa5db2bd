#pragma once

#include "physics/PhysicsBody.hpp"

#include <glm/glm.hpp>

namespace FreeFly {

class Config;
class PhysicsWorld;
class Scene;

/**
 * @brief Chaser tuning shared by every enemy
 */
struct EnemyConfig {
    float defaultSpeed = 1.0f;     ///< m/s for newly spawned enemies
    float radius = 0.5f;
    float height = 2.0f;
    float stopDistance = 0.5f;     ///< Horizontal distance at which the chase stops
    float chaseMultiplier = 2.0f;
    float stepTolerance = 0.05f;   ///< Surfaces this close above the enemy's base do not block

    static EnemyConfig FromConfig(const Config& config);
};

/**
 * @brief Drives enemy bodies toward the player
 *
 * Enemies steer by overwriting the horizontal velocity of their physics
 * body; the stepper integrates it next step. Only Static bodies block an
 * enemy. Facing is written to the scene object's Y rotation.
 */
class EnemyController {
public:
    explicit EnemyController(const EnemyConfig& config = {});

    /**
     * @brief Steer every enemy body toward the target
     * @return Number of enemies that moved this tick
     */
    int Update(Scene& scene, PhysicsWorld& world, const glm::vec3& target, float deltaTime) const;

    /**
     * @brief Steer one enemy body
     * @param yawOut Receives the new facing if the enemy moved
     * @return true if the enemy is moving
     */
    bool Steer(PhysicsBody& enemy, const PhysicsWorld& world, const glm::vec3& target,
               float deltaTime, float& yawOut) const;

    /**
     * @brief Would an enemy centred at this position overlap a Static body
     */
    [[nodiscard]] bool IsBlocked(const glm::vec3& position, const PhysicsBody& self,
                                 const PhysicsWorld& world) const;

    [[nodiscard]] const EnemyConfig& GetConfig() const { return m_config; }

private:
    EnemyConfig m_config;
};

} // namespace FreeFly
