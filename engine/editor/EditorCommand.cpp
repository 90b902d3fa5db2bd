/**
 * @file EditorCommand.cpp
 * @brief Implementation of editor commands and the command queue
 */

#include "editor/EditorCommand.hpp"
#include "core/Logger.hpp"
#include "math/Geometry.hpp"
#include "scene/Scene.hpp"

#include <cmath>

namespace FreeFly {

// =============================================================================
// SetTransformCommand
// =============================================================================

SetTransformCommand::SetTransformCommand(ObjectId target, const ObjectTransform& transform)
    : m_target(target)
    , m_transform(transform) {
}

bool SetTransformCommand::IsValid(const ObjectTransform& transform) {
    if (!Geometry::IsFinite(transform.position) ||
        !Geometry::IsFinite(transform.rotation) ||
        !Geometry::IsFinite(transform.scale)) {
        return false;
    }
    return transform.scale.x != 0.0f && transform.scale.y != 0.0f && transform.scale.z != 0.0f;
}

bool SetTransformCommand::Execute(Scene& scene) {
    SceneObject* object = scene.Find(m_target);
    if (!object) {
        return false;
    }

    if (!IsValid(m_transform)) {
        FREEFLY_LOG_DEBUG("Rejected transform for object {}", m_target);
        return false;
    }

    object->transform = m_transform;
    return true;
}

// =============================================================================
// SetColorCommand
// =============================================================================

SetColorCommand::SetColorCommand(ObjectId target, const glm::vec3& rgb)
    : m_target(target)
    , m_rgb(rgb) {
}

bool SetColorCommand::Execute(Scene& scene) {
    SceneObject* object = scene.Find(m_target);
    if (!object || !Geometry::IsFinite(m_rgb)) {
        return false;
    }

    const glm::vec3 rgb = glm::clamp(m_rgb, glm::vec3(0.0f), glm::vec3(1.0f));
    object->material.baseColor = glm::vec4(rgb, object->material.baseColor.a);
    return true;
}

// =============================================================================
// SetPhysicsCommand
// =============================================================================

SetPhysicsCommand::SetPhysicsCommand(ObjectId target,
                                     std::optional<PhysicsKind> kind,
                                     std::optional<PhysicsShape> shape,
                                     std::optional<float> mass)
    : m_target(target)
    , m_kind(kind)
    , m_shape(shape)
    , m_mass(mass) {
}

bool SetPhysicsCommand::Execute(Scene& scene) {
    SceneObject* object = scene.Find(m_target);
    if (!object) {
        return false;
    }

    if (m_kind) {
        object->physicsKind = *m_kind;
    }
    if (m_shape) {
        object->physicsShape = *m_shape;
    }
    if (m_mass && std::isfinite(*m_mass)) {
        object->SetMass(*m_mass);
    }

    object->ValidatePhysicsShape();
    return m_kind.has_value() || m_shape.has_value() || m_mass.has_value();
}

// =============================================================================
// CommandQueue
// =============================================================================

void CommandQueue::Push(CommandPtr command) {
    if (command) {
        m_pending.push_back(std::move(command));
    }
}

size_t CommandQueue::Apply(Scene& scene) {
    // Swap out first so commands pushed during execution wait for the next tick
    std::vector<CommandPtr> pending;
    pending.swap(m_pending);

    size_t applied = 0;
    for (auto& command : pending) {
        if (command->Execute(scene)) {
            ++applied;
        } else {
            FREEFLY_LOG_TRACE("Command '{}' on object {} had no effect", command->GetName(), command->GetTarget());
        }
    }
    return applied;
}

} // namespace FreeFly
