#include "game/EnemyController.hpp"
#include "config/Config.hpp"
#include "physics/CollisionBounds.hpp"
#include "physics/PhysicsWorld.hpp"
#include "scene/Scene.hpp"

#include <cmath>

namespace FreeFly {

EnemyConfig EnemyConfig::FromConfig(const Config& config) {
    EnemyConfig c;
    c.defaultSpeed = config.Get("enemy.speed", c.defaultSpeed);
    c.radius = config.Get("enemy.radius", c.radius);
    c.height = config.Get("enemy.height", c.height);
    c.stopDistance = config.Get("enemy.stop_distance", c.stopDistance);
    c.chaseMultiplier = config.Get("enemy.chase_multiplier", c.chaseMultiplier);
    c.stepTolerance = config.Get("enemy.step_tolerance", c.stepTolerance);
    return c;
}

EnemyController::EnemyController(const EnemyConfig& config)
    : m_config(config) {
}

int EnemyController::Update(Scene& scene, PhysicsWorld& world, const glm::vec3& target, float deltaTime) const {
    int moving = 0;
    for (auto& body : world.GetBodies()) {
        if (!body.isEnemy || !body.IsDynamic()) continue;

        float yaw = 0.0f;
        if (Steer(body, world, target, deltaTime, yaw)) {
            ++moving;
            if (SceneObject* object = scene.Find(body.objectId)) {
                object->transform.rotation.y = yaw;
            }
        }
    }
    return moving;
}

bool EnemyController::Steer(PhysicsBody& enemy, const PhysicsWorld& world, const glm::vec3& target,
                            float deltaTime, float& yawOut) const {
    // Enemies never fly
    if (enemy.velocity.y > 0.0f) {
        enemy.velocity.y = 0.0f;
    }

    glm::vec3 direction(target.x - enemy.position.x, 0.0f, target.z - enemy.position.z);
    const float distance = glm::length(direction);

    if (distance <= m_config.stopDistance) {
        enemy.velocity.x = 0.0f;
        enemy.velocity.z = 0.0f;
        return false;
    }
    direction /= distance;

    const glm::vec3 nextPosition = enemy.position + direction * enemy.enemySpeed * deltaTime * m_config.chaseMultiplier;
    if (IsBlocked(nextPosition, enemy, world)) {
        enemy.velocity.x = 0.0f;
        enemy.velocity.z = 0.0f;
        return false;
    }

    const glm::vec3 velocity = direction * enemy.enemySpeed * m_config.chaseMultiplier;
    enemy.velocity.x = velocity.x;
    enemy.velocity.z = velocity.z;

    yawOut = std::atan2(direction.x, direction.z);
    return true;
}

bool EnemyController::IsBlocked(const glm::vec3& position, const PhysicsBody& self,
                                const PhysicsWorld& world) const {
    const float bottom = position.y - m_config.height * 0.5f;
    const float top = position.y + m_config.height * 0.5f;
    const glm::vec2 footprint(position.x, position.z);

    for (const auto& body : world.GetBodies()) {
        if (body.objectId == self.objectId || !body.IsStatic()) continue;

        const glm::vec3 bodyMin = body.bounds.MinAt(body.position);
        const glm::vec3 bodyMax = body.bounds.MaxAt(body.position);
        if (bottom + m_config.stepTolerance > bodyMax.y || top < bodyMin.y) continue;

        if (Collision::OverlapsXZ(footprint, m_config.radius, body.bounds, body.position)) {
            return true;
        }
    }
    return false;
}

} // namespace FreeFly
