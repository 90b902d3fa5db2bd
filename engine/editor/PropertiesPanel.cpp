/**
 * @file PropertiesPanel.cpp
 * @brief Properties inspector formatting and edit parsing
 */

#include "editor/PropertiesPanel.hpp"
#include "core/Logger.hpp"

#include <glm/gtc/constants.hpp>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace FreeFly {

namespace {

std::string FormatFloat(const char* format, float value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), format, static_cast<double>(value));
    return buffer;
}

std::string_view Trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<float> ParseField(const std::optional<std::string>& field) {
    if (!field) {
        return std::nullopt;
    }
    auto value = ParsePropertyFloat(*field);
    if (!value) {
        FREEFLY_LOG_DEBUG("Ignoring non-numeric property value '{}'", *field);
    }
    return value;
}

} // anonymous namespace

// =============================================================================
// View
// =============================================================================

PropertiesView BuildPropertiesView(const SceneObject* object) {
    PropertiesView view;
    if (!object) {
        view.colorLabels = {"R: -", "G: -", "B: -"};
        return view;
    }

    view.enabled = true;
    view.name = object->name;
    view.isTerrain = object->IsTerrain();

    const ObjectTransform& t = object->transform;
    for (int i = 0; i < 3; ++i) {
        view.position[i] = FormatFloat("%.3f", t.position[i]);
        view.rotation[i] = FormatFloat("%.2f", glm::degrees(t.rotation[i]));
        view.scale[i] = FormatFloat("%.3f", t.scale[i]);
    }

    view.color = glm::vec3(object->material.baseColor);
    static constexpr const char* kChannels[3] = {"R", "G", "B"};
    for (int i = 0; i < 3; ++i) {
        char label[32];
        std::snprintf(label, sizeof(label), "%s: %d", kChannels[i], static_cast<int>(view.color[i] * 255.0f));
        view.colorLabels[i] = label;
    }

    view.physicsKind = PhysicsKindToString(object->physicsKind);
    view.physicsShape = PhysicsShapeToString(object->physicsShape);
    view.mass = FormatFloat("%.2f", object->mass);
    return view;
}

std::vector<PhysicsShape> AllowedPhysicsShapes(const SceneObject& object) {
    if (object.IsTerrain()) {
        return {PhysicsShape::Plane2D};
    }
    return {PhysicsShape::Box, PhysicsShape::Sphere, PhysicsShape::Cylinder,
            PhysicsShape::Cone, PhysicsShape::Capsule, PhysicsShape::Mesh};
}

// =============================================================================
// Parsing
// =============================================================================

std::optional<float> ParsePropertyFloat(std::string_view text) {
    const std::string trimmed(Trim(text));
    if (trimmed.empty()) {
        return std::nullopt;
    }

    char* end = nullptr;
    const float value = std::strtof(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

CommandPtr MakeSetTransformCommand(ObjectId target, const TransformEdit& edit, const ObjectTransform& current) {
    ObjectTransform result = current;

    for (int i = 0; i < 3; ++i) {
        if (auto value = ParseField(edit.position[i])) {
            result.position[i] = *value;
        }
        if (auto degrees = ParseField(edit.rotation[i])) {
            result.rotation[i] = glm::radians(*degrees);
        }
        if (auto value = ParseField(edit.scale[i]); value && *value != 0.0f) {
            result.scale[i] = *value;
        }
    }

    return std::make_unique<SetTransformCommand>(target, result);
}

CommandPtr MakeSetPhysicsCommand(ObjectId target,
                                 const std::optional<std::string>& kind,
                                 const std::optional<std::string>& shape,
                                 const std::optional<std::string>& mass) {
    std::optional<PhysicsKind> parsedKind;
    if (kind) {
        parsedKind = PhysicsKindFromString(*kind);
        if (!parsedKind) {
            FREEFLY_LOG_DEBUG("Ignoring unknown physics type '{}'", *kind);
        }
    }

    std::optional<PhysicsShape> parsedShape;
    if (shape && !Trim(*shape).empty()) {
        parsedShape = PhysicsShapeFromString(Trim(*shape));
    }

    std::optional<float> parsedMass;
    if (mass) {
        parsedMass = ParsePropertyFloat(*mass);
        if (!parsedMass) {
            FREEFLY_LOG_DEBUG("Ignoring non-numeric mass '{}'", *mass);
        }
    }

    if (!parsedKind && !parsedShape && !parsedMass) {
        return nullptr;
    }
    return std::make_unique<SetPhysicsCommand>(target, parsedKind, parsedShape, parsedMass);
}

} // namespace FreeFly
