#include "game/PlayerController.hpp"
#include "config/Config.hpp"
#include "core/Logger.hpp"
#include "math/Geometry.hpp"
#include "physics/CollisionBounds.hpp"
#include "physics/PhysicsWorld.hpp"
#include "scene/Camera.hpp"

#include <algorithm>

namespace FreeFly {

namespace {
constexpr float kGroundContactTolerance = 1e-3f;
}

PlayerConfig PlayerConfig::FromConfig(const Config& config) {
    PlayerConfig c;
    c.eyeHeight = config.Get("player.eye_height", c.eyeHeight);
    c.radius = config.Get("player.radius", c.radius);
    c.moveSpeed = config.Get("player.move_speed", c.moveSpeed);
    c.jumpVelocity = config.Get("player.jump_velocity", c.jumpVelocity);
    c.gravity = config.Get("player.gravity", c.gravity);
    c.mass = config.Get("player.mass", c.mass);
    c.mouseSensitivity = config.Get("player.mouse_sensitivity", c.mouseSensitivity);
    c.stepTolerance = config.Get("player.step_tolerance", c.stepTolerance);
    c.spawnPosition = config.Get("player.spawn_position", c.spawnPosition);
    c.spawnYaw = config.Get("player.spawn_yaw", c.spawnYaw);
    return c;
}

PlayerController::PlayerController(const PlayerConfig& config, std::shared_ptr<IRandomSource> random)
    : m_config(config)
    , m_random(random ? std::move(random) : MakeDefaultRandomSource()) {
}

void PlayerController::SetRandomSource(std::shared_ptr<IRandomSource> random) {
    m_random = random ? std::move(random) : MakeDefaultRandomSource();
}

void PlayerController::Spawn(Camera& camera) {
    camera.SetPosition(m_config.spawnPosition);
    camera.SetRotation(m_config.spawnYaw, 0.0f);
    m_grounded = true;
    m_verticalVelocity = 0.0f;
}

// =============================================================================
// Update
// =============================================================================

void PlayerController::Update(const PlayerInput& input, Camera& camera, PhysicsWorld& world, float deltaTime) {
    ApplyLook(input.lookDelta, camera);
    UpdateVertical(input, camera, world, deltaTime);
    UpdateHorizontal(input, camera, world, deltaTime);

    if (m_grounded) {
        glm::vec3 eye = camera.GetPosition();
        const float ground = GetGroundLevel(eye, world);
        if (eye.y > ground + kGroundContactTolerance) {
            // Walked off an edge
            m_grounded = false;
            m_verticalVelocity = 0.0f;
        } else if (eye.y < ground) {
            eye.y = ground;
            camera.SetPosition(eye);
        }
    }
}

void PlayerController::ApplyLook(const glm::vec2& lookDelta, Camera& camera) const {
    if (lookDelta.x == 0.0f && lookDelta.y == 0.0f) {
        return;
    }
    camera.Rotate(lookDelta.x * m_config.mouseSensitivity, lookDelta.y * m_config.mouseSensitivity);
}

void PlayerController::UpdateVertical(const PlayerInput& input, Camera& camera,
                                      const PhysicsWorld& world, float deltaTime) {
    if (input.jump && m_grounded) {
        m_verticalVelocity = m_config.jumpVelocity;
        m_grounded = false;
    }

    if (m_grounded) {
        return;
    }

    glm::vec3 eye = camera.GetPosition();
    m_verticalVelocity += m_config.gravity * deltaTime;
    const float newY = eye.y + m_verticalVelocity * deltaTime;

    const float ground = GetGroundLevel(eye, world);
    if (newY <= ground) {
        eye.y = ground;
        m_verticalVelocity = 0.0f;
        m_grounded = true;
    } else {
        eye.y = newY;
    }
    camera.SetPosition(eye);
}

void PlayerController::UpdateHorizontal(const PlayerInput& input, Camera& camera,
                                        PhysicsWorld& world, float deltaTime) {
    const glm::vec3 front = camera.GetForward();
    const glm::vec3 forward = Geometry::SafeNormalize(glm::vec3(front.x, 0.0f, front.z),
                                                      glm::vec3(0.0f, 0.0f, -1.0f));
    const glm::vec3 side = Geometry::SafeNormalize(glm::vec3(camera.GetRight().x, 0.0f, camera.GetRight().z),
                                                   glm::vec3(1.0f, 0.0f, 0.0f));

    glm::vec3 wish(0.0f);
    if (input.forward)  wish += forward;
    if (input.backward) wish -= forward;
    if (input.right)    wish += side;
    if (input.left)     wish -= side;

    if (glm::length(wish) < Geometry::kEpsilon) {
        return;
    }

    const glm::vec3 displacement = glm::normalize(wish) * m_config.moveSpeed * deltaTime;
    const glm::vec3 eye = camera.GetPosition();
    const glm::vec3 target = eye + displacement;

    PhysicsBody* blocker = FindBlockingBody(target, world);
    if (!blocker) {
        camera.SetPosition(target);
        return;
    }

    if (blocker->IsDynamic()) {
        ApplyPush(*blocker, target, world);
    }

    // Slide along whichever axis is free, X first
    const glm::vec3 alongX = eye + glm::vec3(displacement.x, 0.0f, 0.0f);
    if (displacement.x != 0.0f && !IsBlocked(alongX, world)) {
        camera.SetPosition(alongX);
        return;
    }

    const glm::vec3 alongZ = eye + glm::vec3(0.0f, 0.0f, displacement.z);
    if (displacement.z != 0.0f && !IsBlocked(alongZ, world)) {
        camera.SetPosition(alongZ);
    }
}

// =============================================================================
// Collision queries
// =============================================================================

float PlayerController::GetGroundLevel(const glm::vec3& eyePosition, const PhysicsWorld& world) const {
    float highest = world.GetConfig().groundHeight;
    const float feet = eyePosition.y - m_config.eyeHeight;
    const glm::vec2 footprint(eyePosition.x, eyePosition.z);

    for (const auto& body : world.GetBodies()) {
        if (!body.IsStatic()) continue;

        const float top = body.bounds.MaxAt(body.position).y;
        if (top > feet + m_config.stepTolerance) continue;

        if (Collision::OverlapsXZ(footprint, m_config.radius, body.bounds, body.position)) {
            highest = std::max(highest, top);
        }
    }

    return highest + m_config.eyeHeight;
}

bool PlayerController::TouchesBody(const glm::vec3& eyePosition, const PhysicsBody& body) const {
    if (!body.IsStatic() && !body.IsDynamic()) {
        return false;
    }

    const float feet = eyePosition.y - m_config.eyeHeight;
    const float top = eyePosition.y;
    const glm::vec3 bodyMin = body.bounds.MinAt(body.position);
    const glm::vec3 bodyMax = body.bounds.MaxAt(body.position);

    // The surface being stood on is not an obstacle
    if (feet + m_config.stepTolerance > bodyMax.y || top < bodyMin.y) {
        return false;
    }

    return Collision::OverlapsXZ(glm::vec2(eyePosition.x, eyePosition.z), m_config.radius,
                                 body.bounds, body.position);
}

PhysicsBody* PlayerController::FindBlockingBody(const glm::vec3& eyePosition, PhysicsWorld& world) const {
    for (auto& body : world.GetBodies()) {
        if (TouchesBody(eyePosition, body)) {
            return &body;
        }
    }
    return nullptr;
}

bool PlayerController::IsBlocked(const glm::vec3& eyePosition, PhysicsWorld& world) const {
    return FindBlockingBody(eyePosition, world) != nullptr;
}

void PlayerController::ApplyPush(PhysicsBody& body, const glm::vec3& eyePosition, const PhysicsWorld& world) {
    if (!body.IsDynamic()) {
        return;
    }

    glm::vec2 direction(body.position.x - eyePosition.x, body.position.z - eyePosition.z);
    const float distance = glm::length(direction);
    if (distance <= 0.001f) {
        return;
    }
    direction /= distance;

    const float strength = std::min(kMaxPushStrength, m_config.mass / (body.mass + 1.0f));
    body.velocity.x += direction.x * strength * kPushScale;
    body.velocity.z += direction.y * strength * kPushScale;

    if (body.mass < kLightBodyMass) {
        body.velocity.y += kLiftNudge;
    }

    if (world.GetConfig().enableRandomPerturbation) {
        body.angularVelocity.y += m_random->Centered() * kSpinNudge;
    }

    FREEFLY_LOG_TRACE("Player pushed body {} (strength {:.2f})", body.objectId, strength);
}

} // namespace FreeFly
