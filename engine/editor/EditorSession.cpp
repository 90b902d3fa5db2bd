/**
 * @file EditorSession.cpp
 * @brief Implementation of the editor session
 */

#include "editor/EditorSession.hpp"
#include "core/Logger.hpp"
#include "scene/MeshFactory.hpp"

#include <cctype>
#include <cstdio>

namespace FreeFly {

namespace {

const glm::vec3 kEnemySpawnPosition{5.0f, 1.0f, 5.0f};
const glm::vec4 kEnemyColor{1.0f, 0.0f, 0.0f, 1.0f};

std::string PrimitiveDisplayName(PrimitiveType type) {
    std::string name = PrimitiveTypeToString(type);
    if (!name.empty()) {
        name.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(name.front())));
    }
    return name;
}

} // anonymous namespace

EditorSessionConfig EditorSessionConfig::FromConfig(const Config& config) {
    EditorSessionConfig c;
    c.camera = CameraConfig::FromConfig(config);
    c.gizmo = GizmoConfig::FromConfig(config);
    c.physics = PhysicsWorldConfig::FromConfig(config);
    c.player = PlayerConfig::FromConfig(config);
    c.enemy = EnemyConfig::FromConfig(config);
    return c;
}

EditorSession::EditorSession(const EditorSessionConfig& config, std::shared_ptr<IRandomSource> random)
    : m_config(config)
    , m_camera(config.camera)
    , m_flyCamera(config.camera)
    , m_gizmo(config.gizmo)
    , m_playMode(config.physics, config.player, config.enemy, std::move(random)) {
}

// =============================================================================
// Tick
// =============================================================================

void EditorSession::Tick(const FrameInput& input, float deltaTime) {
    // 1. Property edits queued by the UI since the last frame
    m_commands.Apply(m_scene);
    if (m_selection && !m_scene.Find(*m_selection)) {
        ClearSelection();
    }

    if (m_playMode.IsPlaying()) {
        // 2, 4, 5. Player, physics, enemies
        PlayerInput player;
        player.forward = input.keyW;
        player.backward = input.keyS;
        player.left = input.keyA;
        player.right = input.keyD;
        player.jump = input.keySpace;
        player.lookDelta = glm::vec2(input.mouseDelta.x, -input.mouseDelta.y);
        m_playMode.Update(player, m_scene, m_camera, deltaTime);
    } else {
        // 2. Fly camera and pointer
        UpdateEditInput(input);

        // 3. Gizmo drag
        if (m_gizmo.IsDragging()) {
            SceneObject* selected = GetSelectedObject();
            if (selected && selected->id == m_gizmo.GetSession()->objectId) {
                m_gizmo.UpdateDrag(MakePickRay(input.mousePosition), *selected);
            } else {
                m_gizmo.CancelDrag();
            }
        }
    }

    // 6. Handles follow the selection
    SyncGizmo();
}

void EditorSession::UpdateEditInput(const FrameInput& input) {
    FlyCameraInput fly;
    fly.forward = input.keyW;
    fly.backward = input.keyS;
    fly.left = input.keyA;
    fly.right = input.keyD;
    fly.up = input.keySpace;
    fly.sprint = input.keyShift;
    fly.look = input.rightHeld;
    fly.lookDelta = input.mouseDelta;
    m_flyCamera.Update(fly, m_camera);

    if (input.leftPressed) {
        HandlePointerDown(input.mousePosition);
    }
    if (input.leftReleased) {
        HandlePointerUp();
    }
}

// =============================================================================
// Pointer
// =============================================================================

PickRay EditorSession::MakePickRay(const glm::vec2& screenPosition) const {
    return RayPicker::ScreenToWorldRay(screenPosition, m_camera.GetView(),
                                       m_camera.GetProjection(), m_camera.GetViewport());
}

void EditorSession::HandlePointerDown(const glm::vec2& screenPosition) {
    if (m_playMode.IsPlaying()) {
        return;
    }

    const PickRay ray = MakePickRay(screenPosition);

    if (const SceneObject* selected = GetSelectedObject()) {
        SyncGizmo();
        if (m_gizmo.BeginDrag(ray, *selected, m_camera.GetForward())) {
            return;
        }
    }

    if (auto hit = RayPicker::PickClosest(ray, m_scene)) {
        Select(hit->objectId);
    } else {
        ClearSelection();
    }
}

void EditorSession::HandlePointerUp() {
    if (m_playMode.IsPlaying() || !m_gizmo.IsDragging()) {
        return;
    }
    m_gizmo.EndDrag(GetSelectedObject(), m_camera.GetPosition());
}

// =============================================================================
// Selection
// =============================================================================

bool EditorSession::Select(ObjectId id) {
    if (!m_scene.Find(id)) {
        FREEFLY_LOG_WARN("Cannot select unknown object {}", id);
        return false;
    }
    SetSelection(id);
    return true;
}

void EditorSession::ClearSelection() {
    SetSelection(std::nullopt);
}

void EditorSession::SetSelection(std::optional<ObjectId> selection) {
    if (m_selection == selection) {
        return;
    }

    m_gizmo.CancelDrag();
    m_selection = selection;
    SyncGizmo();

    if (m_onSelectionChanged) {
        m_onSelectionChanged(m_selection);
    }
}

SceneObject* EditorSession::GetSelectedObject() {
    return m_selection ? m_scene.Find(*m_selection) : nullptr;
}

const SceneObject* EditorSession::GetSelectedObject() const {
    return m_selection ? m_scene.Find(*m_selection) : nullptr;
}

void EditorSession::SyncGizmo() {
    const SceneObject* selected = m_playMode.IsPlaying() ? nullptr : GetSelectedObject();
    m_gizmo.Sync(selected, m_camera.GetPosition());
}

// =============================================================================
// Scene editing
// =============================================================================

void EditorSession::SetGizmoMode(GizmoMode mode) {
    if (mode == m_gizmo.GetMode()) {
        return;
    }
    m_gizmo.CancelDrag();
    m_gizmo.SetMode(mode);
    SyncGizmo();
}

std::optional<ObjectId> EditorSession::DuplicateSelected() {
    if (!m_selection) {
        return std::nullopt;
    }

    auto copy = m_scene.Duplicate(*m_selection);
    if (copy) {
        Select(*copy);
    }
    return copy;
}

bool EditorSession::DeleteSelected() {
    if (!m_selection) {
        return false;
    }

    const ObjectId id = *m_selection;
    ClearSelection();
    return m_scene.Remove(id);
}

void EditorSession::NewScene() {
    if (m_playMode.IsPlaying()) {
        if (auto error = StopPlay()) {
            FREEFLY_LOG_ERROR("Could not leave play mode: {}", error->message);
        }
    }

    ClearSelection();
    m_commands.Clear();
    m_scene.Clear();
    m_scene.SetName("Untitled");

    m_camera.SetState(CameraState{m_config.camera.defaultPosition, m_config.camera.defaultYaw,
                                  m_config.camera.defaultPitch, m_config.camera.flySpeed});
    FREEFLY_LOG_INFO("New scene");
}

ObjectId EditorSession::AddAndSelect(SceneObject object) {
    const ObjectId id = m_scene.Add(std::move(object));
    Select(id);
    return id;
}

ObjectId EditorSession::CreatePrimitive(PrimitiveType type) {
    SceneObject object;
    object.name = PrimitiveDisplayName(type);
    object.mesh = MeshFactory::CreatePrimitive(type);
    object.source.type = ObjectSourceType::Primitive;
    object.source.primitive = type;

    FREEFLY_LOG_INFO("Created {} primitive", object.name);
    return AddAndSelect(std::move(object));
}

ObjectId EditorSession::CreateTerrain(float sizeXKm, float sizeZKm, const glm::vec4& color) {
    char name[64];
    std::snprintf(name, sizeof(name), "Terrain_%.1fx%.1fkm",
                  static_cast<double>(sizeXKm), static_cast<double>(sizeZKm));

    SceneObject object;
    object.name = name;
    object.mesh = MeshFactory::CreateTerrainPlane(sizeXKm, sizeZKm);
    object.material.baseColor = color;
    object.source.type = ObjectSourceType::Terrain;
    object.source.terrain = TerrainDescriptor{sizeXKm, sizeZKm};
    object.physicsKind = PhysicsKind::Static;
    object.physicsShape = PhysicsShape::Plane2D;

    FREEFLY_LOG_INFO("Created terrain {}", object.name);
    return AddAndSelect(std::move(object));
}

ObjectId EditorSession::CreateEnemy() {
    SceneObject object;
    object.name = "Enemy";
    object.mesh = MeshFactory::CreatePrimitive(PrimitiveType::Capsule);
    object.source.type = ObjectSourceType::Primitive;
    object.source.primitive = PrimitiveType::Capsule;
    object.transform.position = kEnemySpawnPosition;
    object.material.baseColor = kEnemyColor;
    object.physicsKind = PhysicsKind::RigidBody;
    object.physicsShape = PhysicsShape::Capsule;
    object.mass = 1.0f;
    object.enemy = EnemyTraits{m_config.enemy.defaultSpeed};

    FREEFLY_LOG_INFO("Created enemy");
    return AddAndSelect(std::move(object));
}

std::optional<MeshLoadError> EditorSession::LoadModel(const std::filesystem::path& path) {
    MeshLoadResult result = MeshLoader::Load(path);
    if (!result) {
        return result.error;
    }

    SceneObject object;
    object.name = path.stem().string();
    object.mesh = std::move(result.model->mesh);
    object.material = std::move(result.model->material);
    object.source.type = ObjectSourceType::Model;
    object.source.modelFile = path.string();

    AddAndSelect(std::move(object));
    return std::nullopt;
}

std::optional<SceneIOError> EditorSession::SaveScene(const std::filesystem::path& path) {
    // While playing, the editor snapshot is what gets saved
    if (m_playMode.IsPlaying()) {
        const EditorSnapshot& snapshot = m_playMode.GetSnapshot();
        Scene restored;
        restored.SetName(m_scene.GetName());
        for (const auto& object : m_scene.GetObjects()) {
            SceneObject copy = object;
            for (const auto& [id, transform] : snapshot.transforms) {
                if (id == object.id) {
                    copy.transform = transform;
                    break;
                }
            }
            restored.Add(std::move(copy));
        }
        return SceneSerializer::Save(restored, snapshot.camera, path);
    }

    auto error = SceneSerializer::Save(m_scene, m_camera.GetState(), path);
    if (!error) {
        m_scene.SetName(path.stem().string());
    }
    return error;
}

std::optional<SceneIOError> EditorSession::LoadScene(const std::filesystem::path& path) {
    if (m_playMode.IsPlaying()) {
        if (auto error = StopPlay()) {
            FREEFLY_LOG_ERROR("Could not leave play mode: {}", error->message);
        }
    }

    CameraState camera = m_camera.GetState();
    Scene loaded;
    if (auto error = SceneSerializer::Load(path, loaded, camera)) {
        return error;
    }

    ClearSelection();
    m_commands.Clear();
    m_scene = std::move(loaded);
    m_camera.SetState(camera);
    return std::nullopt;
}

// =============================================================================
// Play mode
// =============================================================================

std::optional<PlayModeError> EditorSession::StartPlay() {
    if (m_playMode.IsPlaying()) {
        return PlayModeError::Make(PlayModeError::Type::AlreadyPlaying, "Play mode is already running");
    }

    m_gizmo.CancelDrag();
    ClearSelection();
    m_commands.Apply(m_scene);
    return m_playMode.Start(m_scene, m_camera);
}

std::optional<PlayModeError> EditorSession::StopPlay() {
    auto error = m_playMode.Stop(m_scene, m_camera);
    if (!error) {
        SyncGizmo();
    }
    return error;
}

} // namespace FreeFly
