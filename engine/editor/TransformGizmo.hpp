/**
 * @file TransformGizmo.hpp
 * @brief Translate/rotate manipulation gizmo for the FreeFly editor
 *
 * The gizmo owns one pickable proxy mesh per axis, built in world space
 * around the selected object's centre and sized by its distance to the
 * camera. A drag maps the pointer ray onto a plane through the object
 * centre and writes the resulting transform straight into the object.
 */

#pragma once

#include "editor/RayPicker.hpp"
#include "scene/MeshData.hpp"
#include "scene/SceneObject.hpp"

#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace FreeFly {

class Config;

/**
 * @brief Gizmo operation mode
 */
enum class GizmoMode : uint8_t {
    Translate,   ///< Move objects along axes
    Rotate       ///< Rotate objects around axes
};

/**
 * @brief Individual axis identifier
 */
enum class GizmoAxis : uint8_t {
    None = 0,
    X,         ///< X axis (red)
    Y,         ///< Y axis (green)
    Z          ///< Z axis (blue)
};

[[nodiscard]] const char* GizmoModeToString(GizmoMode mode) noexcept;
[[nodiscard]] const char* GizmoAxisToString(GizmoAxis axis) noexcept;

/**
 * @brief Unit world vector of an axis, zero for None
 */
[[nodiscard]] glm::vec3 GizmoAxisVector(GizmoAxis axis) noexcept;

/**
 * @brief Handle dimensions, all multiplied by the screen scale
 */
struct GizmoConfig {
    float screenScaleFactor = 0.1f;   ///< Scale = distance(center, camera) * factor
    float axisLength = 1.0f;
    float shaftRadius = 0.05f;
    float coneRadius = 0.1f;
    float coneHeight = 0.3f;
    float ringRadius = 0.8f;
    float ringTubeRadius = 0.05f;
    int segments = 16;

    static GizmoConfig FromConfig(const Config& config);
};

/**
 * @brief Individual handle component of a gizmo
 */
struct GizmoHandle {
    GizmoAxis axis = GizmoAxis::None;
    glm::vec3 direction{0.0f};
    MeshData proxy;                 ///< World-space arrow or ring, used for picking and drawing
    glm::vec4 color{1.0f};
};

/**
 * @brief Plane the pointer ray is projected onto during a drag
 */
struct DragPlane {
    glm::vec3 point{0.0f};
    glm::vec3 normal{0.0f, 1.0f, 0.0f};
};

/**
 * @brief State of one press-drag-release cycle
 */
struct DragSession {
    GizmoAxis axis = GizmoAxis::None;
    ObjectId objectId = kInvalidObjectId;
    ObjectTransform startTransform;
    glm::mat4 startMatrix{1.0f};
    glm::vec3 startCenter{0.0f};
    DragPlane plane;
    std::optional<glm::vec3> startVector;   ///< Rotate mode, set by the first valid update
};

/**
 * @brief Transform manipulation gizmo
 *
 * Idle until BeginDrag() engages a handle, Dragging until EndDrag().
 *
 * Usage:
 *   gizmo.Sync(selectedObject, camera.GetPosition());
 *   if (mouseDown && gizmo.BeginDrag(ray, *selectedObject, camera.GetForward())) { ... }
 *   if (gizmo.IsDragging()) gizmo.UpdateDrag(ray, *selectedObject);
 *   if (mouseUp) gizmo.EndDrag(selectedObject, camera.GetPosition());
 *
 * Rotating a non-uniformly scaled object goes through a full matrix
 * decomposition and can shift its scale slightly.
 */
class TransformGizmo {
public:
    static constexpr float kParallelEpsilon = 1e-6f;
    static constexpr float kMinVectorLength = 1e-6f;

    explicit TransformGizmo(const GizmoConfig& config = {});

    // =========================================================================
    // Mode
    // =========================================================================

    void SetMode(GizmoMode mode);
    [[nodiscard]] GizmoMode GetMode() const noexcept { return m_mode; }

    // =========================================================================
    // Handles
    // =========================================================================

    /**
     * @brief Rebuild handle geometry if the selection, its transform, the mode
     *        or the camera position changed since the last build
     * @param selected Selected object, or nullptr to remove all handles
     * @return true if the handles were rebuilt
     */
    bool Sync(const SceneObject* selected, const glm::vec3& cameraPosition);

    /**
     * @brief Unconditionally rebuild handle geometry
     */
    void Rebuild(const SceneObject* selected, const glm::vec3& cameraPosition);

    void ClearHandles();

    [[nodiscard]] const std::vector<GizmoHandle>& GetHandles() const { return m_handles; }
    [[nodiscard]] bool HasHandles() const noexcept { return !m_handles.empty(); }
    [[nodiscard]] float GetScreenScale() const noexcept { return m_screenScale; }

    [[nodiscard]] float ComputeScreenScale(const glm::vec3& center, const glm::vec3& cameraPosition) const;

    /**
     * @brief Closest handle hit by the ray
     */
    [[nodiscard]] std::optional<GizmoAxis> HitTest(const PickRay& ray) const;

    // =========================================================================
    // Dragging
    // =========================================================================

    /**
     * @brief Start a drag if the ray hits one of the handles
     * @return true if a drag started
     */
    bool BeginDrag(const PickRay& ray, const SceneObject& object, const glm::vec3& cameraFront);

    /**
     * @brief Start a drag on an explicit axis
     */
    void BeginDrag(GizmoAxis axis, const SceneObject& object, const glm::vec3& cameraFront);

    /**
     * @brief Apply the pointer ray to the dragged object
     * @return true if the object's transform changed
     */
    bool UpdateDrag(const PickRay& ray, SceneObject& object);

    /**
     * @brief Finish the drag and rebuild the handles for the final transform
     */
    void EndDrag(const SceneObject* selected, const glm::vec3& cameraPosition);

    /**
     * @brief Drop the drag without touching handles (object deleted, play mode)
     */
    void CancelDrag();

    [[nodiscard]] bool IsDragging() const noexcept { return m_session.has_value(); }
    [[nodiscard]] GizmoAxis GetActiveAxis() const noexcept;
    [[nodiscard]] const std::optional<DragSession>& GetSession() const { return m_session; }

    /**
     * @brief Plane containing the axis that faces the camera the most
     */
    [[nodiscard]] static DragPlane ComputeTranslatePlane(const glm::vec3& axis, const glm::vec3& center,
                                                         const glm::vec3& cameraFront);

    [[nodiscard]] const GizmoConfig& GetConfig() const { return m_config; }

private:
    MeshData BuildArrow(const glm::vec3& center, const glm::vec3& axis, float scale) const;
    MeshData BuildRing(const glm::vec3& center, const glm::vec3& axis, float scale) const;

    bool UpdateTranslate(const glm::vec3& hit, SceneObject& object);
    bool UpdateRotate(const glm::vec3& hit, SceneObject& object);

    GizmoConfig m_config;
    GizmoMode m_mode = GizmoMode::Translate;

    std::vector<GizmoHandle> m_handles;
    float m_screenScale = 0.0f;

    // Inputs of the last build
    struct BuildKey {
        ObjectId objectId = kInvalidObjectId;
        ObjectTransform transform;
        GizmoMode mode = GizmoMode::Translate;
        glm::vec3 cameraPosition{0.0f};

        bool operator==(const BuildKey&) const = default;
    };
    std::optional<BuildKey> m_lastBuild;

    std::optional<DragSession> m_session;
};

} // namespace FreeFly
