#pragma once

#include "physics/PhysicsBody.hpp"
#include "math/Random.hpp"

#include <glm/glm.hpp>
#include <memory>
#include <vector>

namespace FreeFly {

class Config;
class Scene;

/**
 * @brief Physics world configuration
 */
struct PhysicsWorldConfig {
    float gravity = -9.81f;
    float maxTimestep = 1.0f / 30.0f;        ///< Frame hitches are clamped to this
    float groundHeight = 0.0f;

    float collisionRestitution = 0.8f;       ///< Normal velocity exchange between rigid bodies
    float restingBounceThreshold = 0.3f;     ///< Bounces slower than this come to rest
    float minSeparationDistance = 0.001f;    ///< Below this, separate along +X

    bool enableRandomPerturbation = true;

    static PhysicsWorldConfig FromConfig(const Config& config);
};

/**
 * @brief Ad-hoc rigid body stepper
 *
 * Bodies live in an arena rebuilt from the scene by Build() and linked to
 * their objects by id. Each Step():
 *   1. syncs bounds with the scene's rotation/scale at the body positions
 *   2. integrates every rigid body (gravity, air drag, tipping, ground)
 *   3. separates overlapping pairs
 *   4. writes positions back to the scene and rebuilds bounds
 */
class PhysicsWorld {
public:
    explicit PhysicsWorld(const PhysicsWorldConfig& config = {},
                          std::shared_ptr<IRandomSource> random = MakeDefaultRandomSource());

    // Non-copyable
    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    // =========================================================================
    // Arena
    // =========================================================================

    /**
     * @brief Rebuild all bodies from the scene, zero velocities
     */
    void Build(const Scene& scene);

    void Clear();

    [[nodiscard]] PhysicsBody* FindBody(ObjectId id);
    [[nodiscard]] const PhysicsBody* FindBody(ObjectId id) const;

    [[nodiscard]] std::vector<PhysicsBody>& GetBodies() { return m_bodies; }
    [[nodiscard]] const std::vector<PhysicsBody>& GetBodies() const { return m_bodies; }
    [[nodiscard]] size_t GetBodyCount() const noexcept { return m_bodies.size(); }

    // =========================================================================
    // Simulation
    // =========================================================================

    /**
     * @brief Advance one step
     * @param deltaTime Frame time, clamped to maxTimestep
     */
    void Step(Scene& scene, float deltaTime);

    [[nodiscard]] float ClampTimestep(float deltaTime) const;

    /**
     * @brief Recompute bounds of every body from the scene at the body positions
     *
     * Bodies whose object left the scene are dropped.
     */
    void RefreshBounds(const Scene& scene);

    /**
     * @brief Gravity, drag, tipping, integration and ground contact for one body
     */
    void IntegrateBody(PhysicsBody& body, float deltaTime);

    /**
     * @brief Tipping and rolling heuristics while near the ground
     */
    void ApplyInstability(PhysicsBody& body, float deltaTime);

    /**
     * @brief Snap to the ground plane and bounce
     * @return true if the body touched the ground
     */
    bool ResolveGroundContact(PhysicsBody& body);

    /**
     * @brief Pairwise separation and velocity exchange
     */
    void ResolveBodyCollisions();

    /**
     * @brief Copy body positions (only positions) to their scene objects
     */
    void WriteBack(Scene& scene) const;

    // =========================================================================
    // Configuration
    // =========================================================================

    [[nodiscard]] const PhysicsWorldConfig& GetConfig() const { return m_config; }
    void SetConfig(const PhysicsWorldConfig& config) { m_config = config; }

    void SetRandomSource(std::shared_ptr<IRandomSource> random);

    /**
     * @brief Random value in [-0.5, 0.5], or 0 with perturbation disabled
     */
    [[nodiscard]] float Perturbation();

private:
    PhysicsBody CreateBody(const SceneObject& object) const;
    void ResolvePair(PhysicsBody& a, PhysicsBody& b);
    void SanitizeBody(PhysicsBody& body, const glm::vec3& fallbackPosition);

    PhysicsWorldConfig m_config;
    std::shared_ptr<IRandomSource> m_random;
    std::vector<PhysicsBody> m_bodies;
};

} // namespace FreeFly
