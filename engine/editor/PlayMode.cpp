/**
 * @file PlayMode.cpp
 * @brief Implementation of play mode
 */

#include "editor/PlayMode.hpp"
#include "core/Logger.hpp"
#include "scene/Scene.hpp"

namespace FreeFly {

const char* PlayStateToString(PlayState state) {
    switch (state) {
        case PlayState::Stopped: return "Stopped";
        case PlayState::Playing: return "Playing";
        default:                 return "Unknown";
    }
}

PlayMode::PlayMode(const PhysicsWorldConfig& physicsConfig,
                   const PlayerConfig& playerConfig,
                   const EnemyConfig& enemyConfig,
                   std::shared_ptr<IRandomSource> random)
    : m_physics(physicsConfig, random)
    , m_player(playerConfig, random)
    , m_enemies(enemyConfig) {
}

void PlayMode::SetRandomSource(std::shared_ptr<IRandomSource> random) {
    m_physics.SetRandomSource(random);
    m_player.SetRandomSource(random);
}

// =============================================================================
// Transitions
// =============================================================================

std::optional<PlayModeError> PlayMode::Start(Scene& scene, Camera& camera) {
    if (m_state == PlayState::Playing) {
        return PlayModeError::Make(PlayModeError::Type::AlreadyPlaying, "Play mode is already running");
    }

    m_snapshot.transforms.clear();
    m_snapshot.transforms.reserve(scene.GetObjectCount());
    for (const auto& object : scene.GetObjects()) {
        m_snapshot.transforms.emplace_back(object.id, object.transform);
    }
    m_snapshot.camera = camera.GetState();

    m_physics.Build(scene);
    m_player.Spawn(camera);

    m_state = PlayState::Playing;
    FREEFLY_LOG_INFO("Play mode started: {} objects saved, {} physics bodies",
                     m_snapshot.transforms.size(), m_physics.GetBodyCount());
    return std::nullopt;
}

std::optional<PlayModeError> PlayMode::Stop(Scene& scene, Camera& camera) {
    if (m_state != PlayState::Playing) {
        return PlayModeError::Make(PlayModeError::Type::NotPlaying, "Play mode is not running");
    }

    m_physics.Clear();

    size_t restored = 0;
    for (const auto& [id, transform] : m_snapshot.transforms) {
        if (SceneObject* object = scene.Find(id)) {
            object->transform = transform;
            ++restored;
        }
    }
    camera.SetState(m_snapshot.camera);

    m_snapshot = {};
    m_state = PlayState::Stopped;
    FREEFLY_LOG_INFO("Play mode stopped: {} transforms restored", restored);
    return std::nullopt;
}

// =============================================================================
// Update
// =============================================================================

void PlayMode::Update(const PlayerInput& input, Scene& scene, Camera& camera, float deltaTime) {
    if (m_state != PlayState::Playing) {
        return;
    }

    const float dt = m_physics.ClampTimestep(deltaTime);

    m_player.Update(input, camera, m_physics, dt);
    m_physics.Step(scene, dt);
    m_enemies.Update(scene, m_physics, camera.GetPosition(), dt);
}

} // namespace FreeFly
