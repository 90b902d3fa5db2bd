/**
 * @file PlayMode.hpp
 * @brief Play mode for the FreeFly editor
 *
 * Start() snapshots every object's transform and the camera, builds the
 * physics world and drops the player at the spawn point. Stop() discards
 * the simulation and writes the snapshot back verbatim, so nothing done
 * while playing survives.
 */

#pragma once

#include "game/EnemyController.hpp"
#include "game/PlayerController.hpp"
#include "math/Random.hpp"
#include "physics/PhysicsWorld.hpp"
#include "scene/Camera.hpp"
#include "scene/SceneObject.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace FreeFly {

class Scene;

/**
 * @brief Current state of the play mode system
 */
enum class PlayState : uint8_t {
    Stopped = 0,    ///< Editor mode, no simulation running
    Playing         ///< Physics, player and enemies running
};

/**
 * @brief Convert PlayState to string for display
 */
[[nodiscard]] const char* PlayStateToString(PlayState state);

/**
 * @brief Why a play mode transition was refused
 */
struct PlayModeError {
    enum class Type {
        AlreadyPlaying,
        NotPlaying
    };

    Type type;
    std::string message;

    [[nodiscard]] static PlayModeError Make(Type type, std::string msg) {
        return PlayModeError{type, std::move(msg)};
    }
};

/**
 * @brief Editor state captured when play starts
 */
struct EditorSnapshot {
    std::vector<std::pair<ObjectId, ObjectTransform>> transforms;
    CameraState camera;
};

class PlayMode {
public:
    PlayMode(const PhysicsWorldConfig& physicsConfig = {},
             const PlayerConfig& playerConfig = {},
             const EnemyConfig& enemyConfig = {},
             std::shared_ptr<IRandomSource> random = MakeDefaultRandomSource());

    // Non-copyable
    PlayMode(const PlayMode&) = delete;
    PlayMode& operator=(const PlayMode&) = delete;

    /**
     * @brief Snapshot, build physics and spawn the player
     * @return Error if already playing, nullopt on success
     */
    [[nodiscard]] std::optional<PlayModeError> Start(Scene& scene, Camera& camera);

    /**
     * @brief Drop physics and restore the snapshot
     * @return Error if not playing, nullopt on success
     */
    [[nodiscard]] std::optional<PlayModeError> Stop(Scene& scene, Camera& camera);

    /**
     * @brief One play tick: player, physics step, enemy AI
     * @param deltaTime Frame time, clamped to the physics maximum for every stage
     */
    void Update(const PlayerInput& input, Scene& scene, Camera& camera, float deltaTime);

    [[nodiscard]] bool IsPlaying() const noexcept { return m_state == PlayState::Playing; }
    [[nodiscard]] PlayState GetState() const noexcept { return m_state; }

    [[nodiscard]] PhysicsWorld& GetPhysicsWorld() { return m_physics; }
    [[nodiscard]] const PhysicsWorld& GetPhysicsWorld() const { return m_physics; }
    [[nodiscard]] PlayerController& GetPlayer() { return m_player; }
    [[nodiscard]] const EnemyController& GetEnemies() const { return m_enemies; }
    [[nodiscard]] const EditorSnapshot& GetSnapshot() const { return m_snapshot; }

    void SetRandomSource(std::shared_ptr<IRandomSource> random);

private:
    PlayState m_state = PlayState::Stopped;
    EditorSnapshot m_snapshot;

    PhysicsWorld m_physics;
    PlayerController m_player;
    EnemyController m_enemies;
};

} // namespace FreeFly
