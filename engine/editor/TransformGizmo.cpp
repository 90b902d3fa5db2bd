/**
 * @file TransformGizmo.cpp
 * @brief Implementation of the translate/rotate gizmo
 */

#include "editor/TransformGizmo.hpp"
#include "config/Config.hpp"
#include "core/Logger.hpp"
#include "math/Geometry.hpp"
#include "math/Transform.hpp"
#include "scene/MeshFactory.hpp"

#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>

namespace FreeFly {

namespace {

constexpr std::array<GizmoAxis, 3> kAxes = {GizmoAxis::X, GizmoAxis::Y, GizmoAxis::Z};

glm::vec4 AxisColor(GizmoAxis axis) {
    switch (axis) {
        case GizmoAxis::X: return {1.0f, 0.0f, 0.0f, 1.0f};
        case GizmoAxis::Y: return {0.0f, 1.0f, 0.0f, 1.0f};
        case GizmoAxis::Z: return {0.0f, 0.0f, 1.0f, 1.0f};
        default:           return {1.0f, 1.0f, 1.0f, 1.0f};
    }
}

} // anonymous namespace

// ============================================================================
// Enum helpers
// ============================================================================

const char* GizmoModeToString(GizmoMode mode) noexcept {
    switch (mode) {
        case GizmoMode::Translate: return "translate";
        case GizmoMode::Rotate:    return "rotate";
    }
    return "translate";
}

const char* GizmoAxisToString(GizmoAxis axis) noexcept {
    switch (axis) {
        case GizmoAxis::X:    return "X";
        case GizmoAxis::Y:    return "Y";
        case GizmoAxis::Z:    return "Z";
        case GizmoAxis::None: return "None";
    }
    return "None";
}

glm::vec3 GizmoAxisVector(GizmoAxis axis) noexcept {
    switch (axis) {
        case GizmoAxis::X: return {1.0f, 0.0f, 0.0f};
        case GizmoAxis::Y: return {0.0f, 1.0f, 0.0f};
        case GizmoAxis::Z: return {0.0f, 0.0f, 1.0f};
        default:           return {0.0f, 0.0f, 0.0f};
    }
}

GizmoConfig GizmoConfig::FromConfig(const Config& config) {
    GizmoConfig c;
    c.screenScaleFactor = config.Get("gizmo.screen_scale", c.screenScaleFactor);
    c.axisLength = config.Get("gizmo.axis_length", c.axisLength);
    c.shaftRadius = config.Get("gizmo.shaft_radius", c.shaftRadius);
    c.coneRadius = config.Get("gizmo.cone_radius", c.coneRadius);
    c.coneHeight = config.Get("gizmo.cone_height", c.coneHeight);
    c.ringRadius = config.Get("gizmo.ring_radius", c.ringRadius);
    c.ringTubeRadius = config.Get("gizmo.ring_tube_radius", c.ringTubeRadius);
    c.segments = std::max(3, config.Get("gizmo.segments", c.segments));
    return c;
}

// ============================================================================
// Construction / Mode
// ============================================================================

TransformGizmo::TransformGizmo(const GizmoConfig& config)
    : m_config(config) {
}

void TransformGizmo::SetMode(GizmoMode mode) {
    if (m_mode == mode) return;
    m_mode = mode;
    // Next Sync() sees a different mode and rebuilds
    m_lastBuild.reset();
}

// ============================================================================
// Handle geometry
// ============================================================================

float TransformGizmo::ComputeScreenScale(const glm::vec3& center, const glm::vec3& cameraPosition) const {
    return glm::length(center - cameraPosition) * m_config.screenScaleFactor;
}

bool TransformGizmo::Sync(const SceneObject* selected, const glm::vec3& cameraPosition) {
    if (!selected) {
        const bool hadHandles = !m_handles.empty();
        ClearHandles();
        return hadHandles;
    }

    BuildKey key{selected->id, selected->transform, m_mode, cameraPosition};
    if (m_lastBuild && *m_lastBuild == key) {
        return false;
    }

    Rebuild(selected, cameraPosition);
    return true;
}

void TransformGizmo::Rebuild(const SceneObject* selected, const glm::vec3& cameraPosition) {
    m_handles.clear();
    m_lastBuild.reset();

    if (!selected) {
        m_screenScale = 0.0f;
        return;
    }

    const glm::vec3 center = selected->GetWorldCenter();
    m_screenScale = ComputeScreenScale(center, cameraPosition);

    for (GizmoAxis axis : kAxes) {
        GizmoHandle handle;
        handle.axis = axis;
        handle.direction = GizmoAxisVector(axis);
        handle.color = AxisColor(axis);
        handle.proxy = (m_mode == GizmoMode::Translate)
            ? BuildArrow(center, handle.direction, m_screenScale)
            : BuildRing(center, handle.direction, m_screenScale);
        m_handles.push_back(std::move(handle));
    }

    m_lastBuild = BuildKey{selected->id, selected->transform, m_mode, cameraPosition};
}

void TransformGizmo::ClearHandles() {
    m_handles.clear();
    m_lastBuild.reset();
    m_screenScale = 0.0f;
}

MeshData TransformGizmo::BuildArrow(const glm::vec3& center, const glm::vec3& axis, float scale) const {
    const float length = m_config.axisLength * scale;
    const float coneHeight = m_config.coneHeight * scale;
    const glm::mat4 align = MeshFactory::AlignYToAxis(axis);

    // Shaft runs from the centre to the tip of the axis
    MeshData shaft = MeshFactory::CreateCylinder(m_config.shaftRadius * scale, length, m_config.segments);
    shaft.ApplyTransform(glm::translate(glm::mat4(1.0f), center + axis * (length * 0.5f)) * align);

    // Cone base sits on the shaft tip
    MeshData cone = MeshFactory::CreateCone(m_config.coneRadius * scale, coneHeight, m_config.segments);
    cone.ApplyTransform(glm::translate(glm::mat4(1.0f), center + axis * (length + coneHeight * 0.5f)) * align);

    shaft.Append(cone);
    return shaft;
}

MeshData TransformGizmo::BuildRing(const glm::vec3& center, const glm::vec3& axis, float scale) const {
    MeshData ring = MeshFactory::CreateTorus(m_config.ringRadius * scale, m_config.ringTubeRadius * scale,
                                             m_config.segments * 2, m_config.segments);
    ring.ApplyTransform(glm::translate(glm::mat4(1.0f), center) * MeshFactory::AlignYToAxis(axis));
    return ring;
}

std::optional<GizmoAxis> TransformGizmo::HitTest(const PickRay& ray) const {
    std::vector<RayPicker::Candidate> candidates;
    candidates.reserve(m_handles.size());
    for (const auto& handle : m_handles) {
        candidates.push_back({&handle.proxy, glm::mat4(1.0f), kInvalidObjectId});
    }

    auto hit = RayPicker::PickClosest(ray, candidates);
    if (!hit) {
        return std::nullopt;
    }
    return m_handles[hit->index].axis;
}

// ============================================================================
// Dragging
// ============================================================================

DragPlane TransformGizmo::ComputeTranslatePlane(const glm::vec3& axis, const glm::vec3& center,
                                                const glm::vec3& cameraFront) {
    DragPlane plane;
    plane.point = center;

    const glm::vec3 tangent = glm::cross(axis, cameraFront);
    const glm::vec3 normal = glm::cross(tangent, axis);

    // Looking straight down the axis leaves no face-on plane; any plane containing the axis will do
    plane.normal = Geometry::SafeNormalize(normal, Geometry::AnyPerpendicular(axis));
    return plane;
}

bool TransformGizmo::BeginDrag(const PickRay& ray, const SceneObject& object, const glm::vec3& cameraFront) {
    auto axis = HitTest(ray);
    if (!axis) {
        return false;
    }
    BeginDrag(*axis, object, cameraFront);
    return true;
}

void TransformGizmo::BeginDrag(GizmoAxis axis, const SceneObject& object, const glm::vec3& cameraFront) {
    if (axis == GizmoAxis::None) {
        return;
    }

    DragSession session;
    session.axis = axis;
    session.objectId = object.id;
    session.startTransform = object.transform;
    session.startMatrix = object.GetWorldMatrix();
    session.startCenter = object.GetWorldCenter();

    const glm::vec3 axisVec = GizmoAxisVector(axis);
    if (m_mode == GizmoMode::Translate) {
        session.plane = ComputeTranslatePlane(axisVec, session.startCenter, cameraFront);
    } else {
        session.plane.point = session.startCenter;
        session.plane.normal = axisVec;
    }

    FREEFLY_LOG_DEBUG("Gizmo drag started: {} {} on object {}",
                      GizmoModeToString(m_mode), GizmoAxisToString(axis), object.id);
    m_session = session;
}

bool TransformGizmo::UpdateDrag(const PickRay& ray, SceneObject& object) {
    if (!m_session || m_session->objectId != object.id) {
        return false;
    }

    const DragPlane& plane = m_session->plane;
    const float denom = glm::dot(ray.direction, plane.normal);
    if (std::abs(denom) < kParallelEpsilon) {
        return false;
    }

    const float t = glm::dot(plane.point - ray.origin, plane.normal) / denom;
    if (t < 0.0f) {
        return false;
    }

    const glm::vec3 hit = ray.GetPoint(t);
    if (!Geometry::IsFinite(hit)) {
        return false;
    }

    return (m_mode == GizmoMode::Translate) ? UpdateTranslate(hit, object) : UpdateRotate(hit, object);
}

bool TransformGizmo::UpdateTranslate(const glm::vec3& hit, SceneObject& object) {
    const glm::vec3 axis = GizmoAxisVector(m_session->axis);
    const glm::vec3 projection = glm::dot(hit - m_session->startCenter, axis) * axis;

    object.transform.position = m_session->startTransform.position + projection;
    return true;
}

bool TransformGizmo::UpdateRotate(const glm::vec3& hit, SceneObject& object) {
    const glm::vec3 center = m_session->startCenter;

    if (!m_session->startVector) {
        const glm::vec3 start = hit - center;
        if (glm::length(start) < kMinVectorLength) {
            return false;
        }
        m_session->startVector = glm::normalize(start);
    }

    glm::vec3 current = hit - center;
    if (glm::length(current) < kMinVectorLength) {
        return false;
    }
    current = glm::normalize(current);

    const glm::vec3& start = *m_session->startVector;
    float angle = std::acos(glm::clamp(glm::dot(start, current), -1.0f, 1.0f));
    if (glm::dot(m_session->plane.normal, glm::cross(start, current)) < 0.0f) {
        angle = -angle;
    }

    const glm::mat4 rotation = glm::translate(glm::mat4(1.0f), center)
        * glm::rotate(glm::mat4(1.0f), angle, m_session->plane.normal)
        * glm::translate(glm::mat4(1.0f), -center);
    const glm::mat4 result = rotation * m_session->startMatrix;

    ObjectTransform updated;
    Transform::Decompose(result, updated.position, updated.rotation, updated.scale);
    if (!Geometry::IsFinite(updated.position) || !Geometry::IsFinite(updated.rotation) ||
        !Geometry::IsFinite(updated.scale)) {
        FREEFLY_LOG_WARN("Gizmo rotation produced a non-finite transform, ignored");
        return false;
    }

    object.transform = updated;
    return true;
}

void TransformGizmo::EndDrag(const SceneObject* selected, const glm::vec3& cameraPosition) {
    if (!m_session) {
        return;
    }

    FREEFLY_LOG_DEBUG("Gizmo drag finished: {}", GizmoAxisToString(m_session->axis));
    m_session.reset();
    Rebuild(selected, cameraPosition);
}

void TransformGizmo::CancelDrag() {
    m_session.reset();
}

GizmoAxis TransformGizmo::GetActiveAxis() const noexcept {
    return m_session ? m_session->axis : GizmoAxis::None;
}

} // namespace FreeFly
