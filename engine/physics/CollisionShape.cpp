#include "physics/CollisionShape.hpp"

#include <algorithm>
#include <cctype>

namespace FreeFly {

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // anonymous namespace

std::optional<PhysicsKind> PhysicsKindFromString(std::string_view str) noexcept {
    if (EqualsIgnoreCase(str, "None")) return PhysicsKind::None;
    if (EqualsIgnoreCase(str, "Static")) return PhysicsKind::Static;
    if (EqualsIgnoreCase(str, "RigidBody")) return PhysicsKind::RigidBody;
    return std::nullopt;
}

PhysicsShape PhysicsShapeFromString(std::string_view str) noexcept {
    if (EqualsIgnoreCase(str, "Cube") || EqualsIgnoreCase(str, "Box")) return PhysicsShape::Box;
    if (EqualsIgnoreCase(str, "Sphere")) return PhysicsShape::Sphere;
    if (EqualsIgnoreCase(str, "Cylinder")) return PhysicsShape::Cylinder;
    if (EqualsIgnoreCase(str, "Capsule")) return PhysicsShape::Capsule;
    if (EqualsIgnoreCase(str, "Cone")) return PhysicsShape::Cone;
    if (EqualsIgnoreCase(str, "Mesh")) return PhysicsShape::Mesh;
    if (EqualsIgnoreCase(str, "2DPlane") || EqualsIgnoreCase(str, "Plane2D")) return PhysicsShape::Plane2D;
    return PhysicsShape::Box;
}

} // namespace FreeFly
