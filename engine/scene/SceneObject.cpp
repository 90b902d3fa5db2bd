#include "scene/SceneObject.hpp"
#include "core/Logger.hpp"
#include "math/Transform.hpp"

#include <algorithm>
#include <cctype>

namespace FreeFly {

glm::mat4 ObjectTransform::ToMatrix() const {
    return Transform::Compose(position, rotation, scale);
}

ObjectTransform ObjectTransform::FromMatrix(const glm::mat4& matrix) {
    ObjectTransform result;
    Transform::Decompose(matrix, result.position, result.rotation, result.scale);
    return result;
}

const char* PrimitiveTypeToString(PrimitiveType type) noexcept {
    switch (type) {
        case PrimitiveType::Cube:     return "cube";
        case PrimitiveType::Sphere:   return "sphere";
        case PrimitiveType::Cone:     return "cone";
        case PrimitiveType::Cylinder: return "cylinder";
        case PrimitiveType::Capsule:  return "capsule";
    }
    return "cube";
}

std::optional<PrimitiveType> PrimitiveTypeFromString(const std::string& str) noexcept {
    std::string lower(str.size(), '\0');
    std::transform(str.begin(), str.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "cube") return PrimitiveType::Cube;
    if (lower == "sphere") return PrimitiveType::Sphere;
    if (lower == "cone") return PrimitiveType::Cone;
    if (lower == "cylinder") return PrimitiveType::Cylinder;
    if (lower == "capsule") return PrimitiveType::Capsule;
    return std::nullopt;
}

glm::vec3 SceneObject::GetWorldCenter() const {
    return glm::vec3(GetWorldMatrix() * glm::vec4(mesh.Centroid(), 1.0f));
}

void SceneObject::SetMass(float value) noexcept {
    mass = value < 0.0f ? kMinimumMass : value;
}

bool SceneObject::ValidatePhysicsShape() {
    if (physicsKind == PhysicsKind::None) {
        return false;
    }

    if (IsTerrain() && physicsShape != PhysicsShape::Plane2D) {
        FREEFLY_LOG_WARN("'{}': terrain objects can only use the 2DPlane physics shape", name);
        physicsShape = PhysicsShape::Plane2D;
        return true;
    }
    if (!IsTerrain() && physicsShape == PhysicsShape::Plane2D) {
        FREEFLY_LOG_WARN("'{}': 3D objects cannot use the 2DPlane physics shape, using Mesh", name);
        physicsShape = PhysicsShape::Mesh;
        return true;
    }
    return false;
}

} // namespace FreeFly
