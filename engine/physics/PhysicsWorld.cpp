#include "physics/PhysicsWorld.hpp"
#include "config/Config.hpp"
#include "core/Logger.hpp"
#include "math/Geometry.hpp"
#include "scene/Scene.hpp"

#include <algorithm>
#include <cmath>

namespace FreeFly {

namespace {

// Gravity scaling: heavier bodies pick up speed a little faster
constexpr float kGravityMassBase = 0.8f;
constexpr float kGravityMassFactor = 0.04f;
constexpr float kGravityMassCap = 5.0f;

// Per-step velocity retention from air drag
constexpr float kAirRetentionBase = 0.98f;
constexpr float kAirRetentionPerMass = 0.001f;
constexpr float kMaxAirRetention = 0.999f;

constexpr float kAngularRetentionBase = 0.99f;
constexpr float kAngularRetentionPerMass = 0.001f;

// Tipping
constexpr float kGroundContactTolerance = 0.1f;
constexpr float kTipThresholdScale = 0.1f;
constexpr float kHeavyMass = 2.0f;
constexpr float kHeavyInstabilityScale = 0.1f;
constexpr float kRollingResistancePerMass = 0.02f;
constexpr float kRollingSpeedThreshold = 0.1f;
constexpr float kMomentumMassScale = 5.0f;
constexpr float kMomentumMaxFactor = 2.0f;
constexpr float kMomentumGain = 0.01f;

// Ground response
constexpr float kBaseRestitution = 0.5f;
constexpr float kRestitutionPerMass = 0.05f;
constexpr float kMinRestitution = 0.1f;
constexpr float kBaseFriction = 0.5f;
constexpr float kFrictionPerMass = 0.05f;
constexpr float kMaxFriction = 0.9f;
constexpr float kRollingConversion = 0.1f;
constexpr float kRollEnhancementPerMass = 0.05f;
constexpr float kImpactMass = 3.0f;
constexpr float kImpactForceThreshold = 5.0f;
constexpr float kImpactScatter = 0.2f;
constexpr float kSpinMass = 1.5f;
constexpr float kSpinScale = 0.1f;

// Centre of mass offsets for bottom-heavy shapes
constexpr float kCylinderMassDrop = 0.1f;
constexpr float kConeMassDrop = 0.3f;

const glm::vec3 kUp(0.0f, 1.0f, 0.0f);

} // anonymous namespace

PhysicsWorldConfig PhysicsWorldConfig::FromConfig(const Config& config) {
    PhysicsWorldConfig c;
    c.gravity = config.Get("physics.gravity", c.gravity);
    c.maxTimestep = config.Get("physics.max_timestep", c.maxTimestep);
    c.groundHeight = config.Get("physics.ground_height", c.groundHeight);
    c.collisionRestitution = config.Get("physics.collision_restitution", c.collisionRestitution);
    c.restingBounceThreshold = config.Get("physics.resting_bounce_threshold", c.restingBounceThreshold);
    c.minSeparationDistance = config.Get("physics.min_separation_distance", c.minSeparationDistance);
    c.enableRandomPerturbation = config.Get("physics.enable_random_perturbation", c.enableRandomPerturbation);
    return c;
}

PhysicsWorld::PhysicsWorld(const PhysicsWorldConfig& config, std::shared_ptr<IRandomSource> random)
    : m_config(config)
    , m_random(random ? std::move(random) : MakeDefaultRandomSource()) {
}

// ============================================================================
// Arena
// ============================================================================

PhysicsBody PhysicsWorld::CreateBody(const SceneObject& object) const {
    PhysicsBody body;
    body.objectId = object.id;
    body.kind = object.physicsKind;
    body.shape = object.physicsShape;
    body.position = object.transform.position;
    body.mass = body.IsDynamic() ? std::max(object.mass, 0.0f) : 0.0f;
    body.bounds = Collision::ComputeBounds(object);

    const glm::vec3 scaledExtents = body.bounds.localExtents * glm::abs(object.transform.scale);
    body.stabilityFactor = Collision::StabilityFactor(scaledExtents, body.mass);

    body.centerOfMass = object.mesh.Centroid();
    if (body.shape == PhysicsShape::Cylinder) {
        body.centerOfMass.y -= kCylinderMassDrop;
    } else if (body.shape == PhysicsShape::Cone) {
        body.centerOfMass.y -= kConeMassDrop;
    }

    if (object.enemy) {
        body.isEnemy = true;
        body.enemySpeed = object.enemy->speed;
    }
    return body;
}

void PhysicsWorld::Build(const Scene& scene) {
    m_bodies.clear();
    for (const auto& object : scene.GetObjects()) {
        if (object.physicsKind == PhysicsKind::None) {
            continue;
        }
        m_bodies.push_back(CreateBody(object));
    }
    FREEFLY_LOG_INFO("Physics world built with {} bodies", m_bodies.size());
}

void PhysicsWorld::Clear() {
    m_bodies.clear();
}

PhysicsBody* PhysicsWorld::FindBody(ObjectId id) {
    auto it = std::find_if(m_bodies.begin(), m_bodies.end(),
                           [id](const PhysicsBody& b) { return b.objectId == id; });
    return it != m_bodies.end() ? &*it : nullptr;
}

const PhysicsBody* PhysicsWorld::FindBody(ObjectId id) const {
    auto it = std::find_if(m_bodies.begin(), m_bodies.end(),
                           [id](const PhysicsBody& b) { return b.objectId == id; });
    return it != m_bodies.end() ? &*it : nullptr;
}

void PhysicsWorld::SetRandomSource(std::shared_ptr<IRandomSource> random) {
    m_random = random ? std::move(random) : MakeDefaultRandomSource();
}

float PhysicsWorld::Perturbation() {
    if (!m_config.enableRandomPerturbation) {
        return 0.0f;
    }
    return m_random->Centered();
}

// ============================================================================
// Simulation
// ============================================================================

float PhysicsWorld::ClampTimestep(float deltaTime) const {
    if (!std::isfinite(deltaTime) || deltaTime <= 0.0f) {
        return 0.0f;
    }
    return std::min(deltaTime, m_config.maxTimestep);
}

void PhysicsWorld::Step(Scene& scene, float deltaTime) {
    const float dt = ClampTimestep(deltaTime);
    if (dt <= 0.0f) {
        return;
    }

    RefreshBounds(scene);

    for (auto& body : m_bodies) {
        if (!body.IsDynamic()) {
            continue;
        }
        const glm::vec3 previous = body.position;
        IntegrateBody(body, dt);
        SanitizeBody(body, previous);
    }

    ResolveBodyCollisions();

    WriteBack(scene);
    RefreshBounds(scene);
}

void PhysicsWorld::RefreshBounds(const Scene& scene) {
    auto removed = std::remove_if(m_bodies.begin(), m_bodies.end(), [&scene](const PhysicsBody& body) {
        return scene.Find(body.objectId) == nullptr;
    });
    if (removed != m_bodies.end()) {
        FREEFLY_LOG_DEBUG("Dropping {} bodies whose objects left the scene",
                          std::distance(removed, m_bodies.end()));
        m_bodies.erase(removed, m_bodies.end());
    }

    for (auto& body : m_bodies) {
        const SceneObject* object = scene.Find(body.objectId);
        ObjectTransform transform = object->transform;
        transform.position = body.position;
        body.bounds = Collision::ComputeBounds(transform, object->mesh, body.shape);
    }
}

void PhysicsWorld::IntegrateBody(PhysicsBody& body, float deltaTime) {
    const float mass = body.mass;

    body.velocity.y += m_config.gravity * deltaTime *
                       (kGravityMassBase + std::min(mass, kGravityMassCap) * kGravityMassFactor);

    const float airRetention = std::clamp(kAirRetentionBase + mass * kAirRetentionPerMass,
                                          0.0f, kMaxAirRetention);
    body.velocity *= airRetention;

    ApplyInstability(body, deltaTime);

    body.position += body.velocity * deltaTime;

    const float angularRetention = std::clamp(kAngularRetentionBase - mass * kAngularRetentionPerMass,
                                              0.0f, 1.0f);
    body.angularVelocity *= angularRetention;

    ResolveGroundContact(body);
}

void PhysicsWorld::ApplyInstability(PhysicsBody& body, float deltaTime) {
    const float mass = body.mass;
    const bool groundContact =
        body.position.y - m_config.groundHeight <= body.bounds.size.y * 0.5f + kGroundContactTolerance;

    if (groundContact) {
        const float stability = body.stabilityFactor;
        const float horizontalSpeed = glm::length(glm::vec2(body.velocity.x, body.velocity.z));

        if (horizontalSpeed > stability * kTipThresholdScale && stability > Geometry::kEpsilon) {
            const glm::vec3 tipDirection(body.velocity.x, 0.0f, body.velocity.z);
            const float tipMagnitude = horizontalSpeed / stability;
            body.angularVelocity += glm::cross(kUp, tipDirection) * tipMagnitude * deltaTime * mass;

            if (mass > kHeavyMass) {
                const float instability = (mass - kHeavyMass) * kHeavyInstabilityScale;
                body.angularVelocity.x += Perturbation() * instability;
                body.angularVelocity.z += Perturbation() * instability;
            }
        }

        const float rollingRetention = std::clamp(1.0f - kRollingResistancePerMass * mass * deltaTime, 0.0f, 1.0f);
        if (std::abs(body.velocity.x) > kRollingSpeedThreshold) {
            body.velocity.x *= rollingRetention;
        }
        if (std::abs(body.velocity.z) > kRollingSpeedThreshold) {
            body.velocity.z *= rollingRetention;
        }
    }

    if (mass > 1.0f) {
        const float momentumFactor = std::min(mass / kMomentumMassScale, kMomentumMaxFactor);
        body.angularVelocity *= 1.0f + momentumFactor * kMomentumGain;
    }
}

bool PhysicsWorld::ResolveGroundContact(PhysicsBody& body) {
    const float ground = m_config.groundHeight;
    const float bottom = Collision::BottomHeight(body.bounds, body.position);
    if (bottom > ground) {
        return false;
    }

    body.position.y += ground - bottom;

    const float mass = body.mass;
    const float restitution = std::max(kMinRestitution, kBaseRestitution - mass * kRestitutionPerMass);
    const float friction = std::min(kMaxFriction, kBaseFriction + mass * kFrictionPerMass);

    if (body.velocity.y < 0.0f) {
        const float bounce = -body.velocity.y * restitution;
        body.velocity.y = bounce < m_config.restingBounceThreshold ? 0.0f : bounce;

        if (mass > kImpactMass && mass * std::abs(body.velocity.y) > kImpactForceThreshold) {
            body.velocity.x += Perturbation() * kImpactScatter;
            body.velocity.z += Perturbation() * kImpactScatter;
        }
    }

    const float horizontalSpeed = glm::length(glm::vec2(body.velocity.x, body.velocity.z));
    if (horizontalSpeed > kRollingSpeedThreshold) {
        body.velocity.x *= friction;
        body.velocity.z *= friction;

        // Part of the lost horizontal motion turns into rolling
        const float rolling = (1.0f - friction) * mass * kRollingConversion;
        body.angularVelocity.x += body.velocity.z * rolling;
        body.angularVelocity.z -= body.velocity.x * rolling;

        if (mass > kHeavyMass) {
            const float enhancement = 1.0f + (mass - kHeavyMass) * kRollEnhancementPerMass;
            body.angularVelocity.x *= enhancement;
            body.angularVelocity.z *= enhancement;
        }
    }

    if (mass > kSpinMass) {
        body.angularVelocity.y += Perturbation() * (mass - kSpinMass) * kSpinScale;
    }
    return true;
}

void PhysicsWorld::ResolveBodyCollisions() {
    for (size_t i = 0; i < m_bodies.size(); ++i) {
        PhysicsBody& a = m_bodies[i];
        // Terrain planes act as ground, not as obstacles
        if (a.shape == PhysicsShape::Plane2D) {
            continue;
        }
        for (size_t j = i + 1; j < m_bodies.size(); ++j) {
            PhysicsBody& b = m_bodies[j];
            if (b.shape == PhysicsShape::Plane2D || (!a.IsDynamic() && !b.IsDynamic())) {
                continue;
            }
            if (Collision::AABBOverlap(a.bounds, a.position, b.bounds, b.position)) {
                ResolvePair(a, b);
            }
        }
    }
}

void PhysicsWorld::ResolvePair(PhysicsBody& a, PhysicsBody& b) {
    glm::vec3 separation = a.position - b.position;
    float distance = glm::length(separation);

    if (!(distance >= m_config.minSeparationDistance)) {
        separation = glm::vec3(1.0f, 0.0f, 0.0f);
        distance = 1.0f;
    }
    const glm::vec3 normal = separation / distance;

    const float minDistance = Collision::SeparationRadius(a.bounds) + Collision::SeparationRadius(b.bounds);
    if (distance >= minDistance) {
        return;
    }

    const glm::vec3 offset = normal * ((minDistance - distance) * 0.5f);
    if (a.IsDynamic()) {
        a.position += offset;
    }
    if (b.IsDynamic()) {
        b.position -= offset;
    }

    if (a.IsDynamic() && b.IsDynamic()) {
        const float k = m_config.collisionRestitution;
        const float va = glm::dot(a.velocity, normal);
        const float vb = glm::dot(b.velocity, normal);

        a.velocity += normal * ((vb - va) * k);
        b.velocity += normal * ((va - vb) * k);
    }
}

void PhysicsWorld::WriteBack(Scene& scene) const {
    for (const auto& body : m_bodies) {
        if (SceneObject* object = scene.Find(body.objectId)) {
            object->transform.position = body.position;
        }
    }
}

void PhysicsWorld::SanitizeBody(PhysicsBody& body, const glm::vec3& fallbackPosition) {
    if (Geometry::IsFinite(body.position) && Geometry::IsFinite(body.velocity) &&
        Geometry::IsFinite(body.angularVelocity)) {
        return;
    }

    FREEFLY_LOG_WARN("Body {} produced a non-finite state, resetting it", body.objectId);
    body.position = Geometry::IsFinite(fallbackPosition) ? fallbackPosition : glm::vec3(0.0f);
    body.velocity = glm::vec3(0.0f);
    body.angularVelocity = glm::vec3(0.0f);
}

} // namespace FreeFly
