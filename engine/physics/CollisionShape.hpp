#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace FreeFly {

/**
 * @brief How an object takes part in simulation
 */
enum class PhysicsKind : uint8_t {
    None,       ///< Not simulated, not collidable
    Static,     ///< Collidable, never moves
    RigidBody   ///< Integrated every step
};

/**
 * @brief Collision approximation used for an object
 *
 * Cone and any unrecognised shape behave as Box in every shape-specific
 * branch. Plane2D is reserved for terrain objects.
 */
enum class PhysicsShape : uint8_t {
    Box,
    Sphere,
    Cylinder,
    Capsule,
    Cone,
    Mesh,
    Plane2D
};

[[nodiscard]] constexpr const char* PhysicsKindToString(PhysicsKind kind) noexcept {
    switch (kind) {
        case PhysicsKind::None:      return "None";
        case PhysicsKind::Static:    return "Static";
        case PhysicsKind::RigidBody: return "RigidBody";
        default:                     return "None";
    }
}

/**
 * @brief Display/persistence name ("Cube", "Sphere", ..., "2DPlane")
 */
[[nodiscard]] constexpr const char* PhysicsShapeToString(PhysicsShape shape) noexcept {
    switch (shape) {
        case PhysicsShape::Box:      return "Cube";
        case PhysicsShape::Sphere:   return "Sphere";
        case PhysicsShape::Cylinder: return "Cylinder";
        case PhysicsShape::Capsule:  return "Capsule";
        case PhysicsShape::Cone:     return "Cone";
        case PhysicsShape::Mesh:     return "Mesh";
        case PhysicsShape::Plane2D:  return "2DPlane";
        default:                     return "Cube";
    }
}

[[nodiscard]] std::optional<PhysicsKind> PhysicsKindFromString(std::string_view str) noexcept;

/**
 * @brief Parse a shape name, case-insensitive
 *
 * Accepts "Box" as an alias of "Cube". Unknown names map to Box.
 */
[[nodiscard]] PhysicsShape PhysicsShapeFromString(std::string_view str) noexcept;

} // namespace FreeFly
