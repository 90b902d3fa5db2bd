/**
 * @file EditorSession.hpp
 * @brief Editor state and the per-frame tick that ties it together
 *
 * The session owns the scene, the camera, the single selection, the
 * transform gizmo, the UI command queue and play mode. A host (a window
 * loop, a test, the headless runner) feeds it one FrameInput per frame.
 *
 * Tick order:
 * 1. Apply queued property commands
 * 2. Input: fly camera and pointer in edit mode, player controller in play mode
 * 3. Gizmo drag update
 * 4. Physics step and 5. enemy AI (play mode only)
 * 6. Gizmo handle sync
 */

#pragma once

#include "assets/MeshLoader.hpp"
#include "config/Config.hpp"
#include "editor/EditorCommand.hpp"
#include "editor/PlayMode.hpp"
#include "editor/PropertiesPanel.hpp"
#include "editor/RayPicker.hpp"
#include "editor/TransformGizmo.hpp"
#include "persistence/SceneSerializer.hpp"
#include "scene/Camera.hpp"
#include "scene/FlyCamera.hpp"
#include "scene/Scene.hpp"

#include <glm/glm.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

namespace FreeFly {

/**
 * @brief Raw input sampled for one frame
 */
struct FrameInput {
    bool keyW = false;
    bool keyA = false;
    bool keyS = false;
    bool keyD = false;
    bool keySpace = false;
    bool keyShift = false;

    glm::vec2 mousePosition{0.0f};   ///< Pixels, origin top-left
    glm::vec2 mouseDelta{0.0f};      ///< Pixels moved since last frame
    bool leftPressed = false;        ///< Left button went down this frame
    bool leftReleased = false;       ///< Left button went up this frame
    bool rightHeld = false;
};

/**
 * @brief Settings for every subsystem the session owns
 */
struct EditorSessionConfig {
    CameraConfig camera;
    GizmoConfig gizmo;
    PhysicsWorldConfig physics;
    PlayerConfig player;
    EnemyConfig enemy;

    static EditorSessionConfig FromConfig(const Config& config);
};

class EditorSession {
public:
    using SelectionChangedCallback = std::function<void(std::optional<ObjectId>)>;

    explicit EditorSession(const EditorSessionConfig& config = {},
                           std::shared_ptr<IRandomSource> random = MakeDefaultRandomSource());

    // Non-copyable
    EditorSession(const EditorSession&) = delete;
    EditorSession& operator=(const EditorSession&) = delete;

    /**
     * @brief Advance the editor by one frame
     */
    void Tick(const FrameInput& input, float deltaTime);

    // =========================================================================
    // Pointer
    // =========================================================================

    /**
     * @brief Grab a gizmo handle of the selection, else pick and select
     *
     * Ignored while playing.
     */
    void HandlePointerDown(const glm::vec2& screenPosition);

    /**
     * @brief End an active gizmo drag
     */
    void HandlePointerUp();

    // =========================================================================
    // Selection
    // =========================================================================

    bool Select(ObjectId id);
    void ClearSelection();

    [[nodiscard]] std::optional<ObjectId> GetSelection() const { return m_selection; }
    [[nodiscard]] SceneObject* GetSelectedObject();
    [[nodiscard]] const SceneObject* GetSelectedObject() const;

    void SetSelectionChangedCallback(SelectionChangedCallback callback) { m_onSelectionChanged = std::move(callback); }

    // =========================================================================
    // Scene editing
    // =========================================================================

    void SetGizmoMode(GizmoMode mode);

    /**
     * @brief Duplicate the selection and select the copy
     */
    std::optional<ObjectId> DuplicateSelected();

    /**
     * @brief Remove the selection and clear it
     * @return false if nothing was selected
     */
    bool DeleteSelected();

    /**
     * @brief Empty the scene and reset the camera
     */
    void NewScene();

    ObjectId CreatePrimitive(PrimitiveType type);

    /**
     * @brief Flat terrain plane, Static with the 2DPlane shape
     */
    ObjectId CreateTerrain(float sizeXKm, float sizeZKm,
                           const glm::vec4& color = glm::vec4(0.4f, 0.6f, 0.3f, 1.0f));

    /**
     * @brief Red capsule that chases the player in play mode
     */
    ObjectId CreateEnemy();

    /**
     * @brief Import a model as one new, selected object
     * @return Error on failure; the scene is not touched
     */
    [[nodiscard]] std::optional<MeshLoadError> LoadModel(const std::filesystem::path& path);

    [[nodiscard]] std::optional<SceneIOError> SaveScene(const std::filesystem::path& path);

    /**
     * @brief Replace the scene with a saved one
     *
     * Stops play mode first. On error the current scene is kept.
     */
    [[nodiscard]] std::optional<SceneIOError> LoadScene(const std::filesystem::path& path);

    // =========================================================================
    // Play mode
    // =========================================================================

    [[nodiscard]] std::optional<PlayModeError> StartPlay();
    [[nodiscard]] std::optional<PlayModeError> StopPlay();
    [[nodiscard]] bool IsPlaying() const noexcept { return m_playMode.IsPlaying(); }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] PropertiesView GetPropertiesView() const { return BuildPropertiesView(GetSelectedObject()); }
    [[nodiscard]] CommandQueue& GetCommands() { return m_commands; }

    [[nodiscard]] Scene& GetScene() { return m_scene; }
    [[nodiscard]] const Scene& GetScene() const { return m_scene; }
    [[nodiscard]] Camera& GetCamera() { return m_camera; }
    [[nodiscard]] const Camera& GetCamera() const { return m_camera; }
    [[nodiscard]] TransformGizmo& GetGizmo() { return m_gizmo; }
    [[nodiscard]] const TransformGizmo& GetGizmo() const { return m_gizmo; }
    [[nodiscard]] PlayMode& GetPlayMode() { return m_playMode; }
    [[nodiscard]] const PlayMode& GetPlayMode() const { return m_playMode; }

private:
    ObjectId AddAndSelect(SceneObject object);
    void SetSelection(std::optional<ObjectId> selection);
    void SyncGizmo();

    void UpdateEditInput(const FrameInput& input);
    [[nodiscard]] PickRay MakePickRay(const glm::vec2& screenPosition) const;

    EditorSessionConfig m_config;

    Scene m_scene;
    Camera m_camera;
    FlyCamera m_flyCamera;
    TransformGizmo m_gizmo;
    CommandQueue m_commands;
    PlayMode m_playMode;

    std::optional<ObjectId> m_selection;
    SelectionChangedCallback m_onSelectionChanged;
};

} // namespace FreeFly
