/**
 * @file EditorCommand.hpp
 * @brief Scene edits produced by the UI and applied once per tick
 *
 * The UI never writes into scene objects directly. It builds a command,
 * pushes it onto the CommandQueue, and the editor applies the queue at the
 * start of the next tick. Commands target objects by id, so a command whose
 * object was deleted in the meantime is simply dropped.
 */

#pragma once

#include "physics/CollisionShape.hpp"
#include "scene/SceneObject.hpp"

#include <glm/glm.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace FreeFly {

class Scene;

/**
 * @brief Abstract base interface for all editor commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * @brief Apply the command to the scene
     * @return true if the scene changed
     */
    virtual bool Execute(Scene& scene) = 0;

    /**
     * @brief Get human-readable command name for logging
     */
    [[nodiscard]] virtual std::string GetName() const = 0;

    [[nodiscard]] virtual ObjectId GetTarget() const = 0;
};

/**
 * @brief Smart pointer type for commands
 */
using CommandPtr = std::unique_ptr<ICommand>;

// =============================================================================
// Commands
// =============================================================================

/**
 * @brief Replace an object's whole transform
 *
 * Rejected as a unit if any value is non-finite or any scale component is
 * zero.
 */
class SetTransformCommand : public ICommand {
public:
    SetTransformCommand(ObjectId target, const ObjectTransform& transform);

    bool Execute(Scene& scene) override;
    [[nodiscard]] std::string GetName() const override { return "Set Transform"; }
    [[nodiscard]] ObjectId GetTarget() const override { return m_target; }

    [[nodiscard]] const ObjectTransform& GetTransform() const { return m_transform; }

    [[nodiscard]] static bool IsValid(const ObjectTransform& transform);

private:
    ObjectId m_target;
    ObjectTransform m_transform;
};

/**
 * @brief Set the RGB of an object's base colour, alpha untouched
 */
class SetColorCommand : public ICommand {
public:
    SetColorCommand(ObjectId target, const glm::vec3& rgb);

    bool Execute(Scene& scene) override;
    [[nodiscard]] std::string GetName() const override { return "Set Color"; }
    [[nodiscard]] ObjectId GetTarget() const override { return m_target; }

private:
    ObjectId m_target;
    glm::vec3 m_rgb;
};

/**
 * @brief Change physics kind, shape and/or mass
 *
 * Shapes go through SceneObject::ValidatePhysicsShape, so terrain stays on
 * Plane2D. Negative masses become SceneObject::kMinimumMass.
 */
class SetPhysicsCommand : public ICommand {
public:
    SetPhysicsCommand(ObjectId target,
                      std::optional<PhysicsKind> kind,
                      std::optional<PhysicsShape> shape,
                      std::optional<float> mass);

    bool Execute(Scene& scene) override;
    [[nodiscard]] std::string GetName() const override { return "Set Physics"; }
    [[nodiscard]] ObjectId GetTarget() const override { return m_target; }

private:
    ObjectId m_target;
    std::optional<PhysicsKind> m_kind;
    std::optional<PhysicsShape> m_shape;
    std::optional<float> m_mass;
};

// =============================================================================
// Queue
// =============================================================================

/**
 * @brief FIFO of pending commands, drained once per tick
 */
class CommandQueue {
public:
    void Push(CommandPtr command);

    /**
     * @brief Execute and discard every pending command in order
     * @return Number of commands that changed the scene
     */
    size_t Apply(Scene& scene);

    void Clear() { m_pending.clear(); }

    [[nodiscard]] size_t Size() const noexcept { return m_pending.size(); }
    [[nodiscard]] bool IsEmpty() const noexcept { return m_pending.empty(); }

private:
    std::vector<CommandPtr> m_pending;
};

} // namespace FreeFly
