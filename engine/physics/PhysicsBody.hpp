#pragma once

#include "physics/CollisionBounds.hpp"
#include "physics/CollisionShape.hpp"
#include "scene/SceneObject.hpp"

#include <glm/glm.hpp>

namespace FreeFly {

/**
 * @brief Simulation state for one scene object with physicsKind != None
 *
 * Owned by PhysicsWorld and linked to its object only by id.
 */
struct PhysicsBody {
    ObjectId objectId = kInvalidObjectId;
    PhysicsKind kind = PhysicsKind::Static;
    PhysicsShape shape = PhysicsShape::Box;

    glm::vec3 position{0.0f};
    glm::vec3 velocity{0.0f};
    glm::vec3 angularVelocity{0.0f};

    float mass = 0.0f;              ///< Always 0 for static bodies
    float stabilityFactor = 0.0f;
    glm::vec3 centerOfMass{0.0f};   ///< Local space

    CollisionBounds bounds;

    bool isEnemy = false;
    float enemySpeed = 1.0f;

    [[nodiscard]] bool IsDynamic() const noexcept { return kind == PhysicsKind::RigidBody; }
    [[nodiscard]] bool IsStatic() const noexcept { return kind == PhysicsKind::Static; }
};

} // namespace FreeFly
