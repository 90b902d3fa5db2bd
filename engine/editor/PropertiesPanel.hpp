/**
 * @file PropertiesPanel.hpp
 * @brief Properties inspector model for the FreeFly editor
 *
 * The UI toolkit renders a PropertiesView and hands edited text back as
 * TransformEdit / physics strings. Parsing happens here and produces
 * commands; nothing in this file touches the scene.
 */

#pragma once

#include "editor/EditorCommand.hpp"
#include "scene/SceneObject.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace FreeFly {

/**
 * @brief Display strings for the selected object
 */
struct PropertiesView {
    bool enabled = false;                  ///< False when nothing is selected

    std::string name;
    std::array<std::string, 3> position;   ///< %.3f
    std::array<std::string, 3> rotation;   ///< Degrees, %.2f
    std::array<std::string, 3> scale;      ///< %.3f

    glm::vec3 color{0.0f};
    std::array<std::string, 3> colorLabels; ///< "R: 204"

    std::string physicsKind = "None";
    std::string physicsShape = "Cube";
    std::string mass = "0.0";

    bool isTerrain = false;
};

/**
 * @brief Build the inspector contents; a disabled, cleared view for nullptr
 */
[[nodiscard]] PropertiesView BuildPropertiesView(const SceneObject* object);

/**
 * @brief Physics shapes the inspector offers for this object
 */
[[nodiscard]] std::vector<PhysicsShape> AllowedPhysicsShapes(const SceneObject& object);

/**
 * @brief Edited transform fields; unset fields were not touched
 */
struct TransformEdit {
    std::array<std::optional<std::string>, 3> position;
    std::array<std::optional<std::string>, 3> rotation;   ///< Degrees
    std::array<std::optional<std::string>, 3> scale;
};

/**
 * @brief Parse a whole field as a finite float
 *
 * Surrounding whitespace is allowed; anything else left over rejects the field.
 */
[[nodiscard]] std::optional<float> ParsePropertyFloat(std::string_view text);

/**
 * @brief Transform command from edited fields
 *
 * Fields that are unset or fail to parse keep the value from `current`, as
 * does a zero scale component.
 */
[[nodiscard]] CommandPtr MakeSetTransformCommand(ObjectId target, const TransformEdit& edit,
                                                 const ObjectTransform& current);

/**
 * @brief Physics command from the inspector's kind/shape names and mass text
 * @return nullptr if nothing parsed
 */
[[nodiscard]] CommandPtr MakeSetPhysicsCommand(ObjectId target,
                                               const std::optional<std::string>& kind,
                                               const std::optional<std::string>& shape,
                                               const std::optional<std::string>& mass);

} // namespace FreeFly
