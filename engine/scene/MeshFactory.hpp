#pragma once

#include "scene/MeshData.hpp"
#include "scene/SceneObject.hpp"

#include <glm/glm.hpp>

namespace FreeFly {

/**
 * @brief Procedural mesh generation
 *
 * All shapes are Y-up and centred on the origin unless noted.
 */
class MeshFactory {
public:
    static MeshData CreateBox(const glm::vec3& extents = glm::vec3(2.0f));
    static MeshData CreateUVSphere(float radius = 1.0f, int segments = 32, int rings = 16);
    static MeshData CreateCylinder(float radius = 1.0f, float height = 2.0f, int segments = 32);

    /**
     * @brief Cone with its base at y = -height/2 and apex at +height/2
     */
    static MeshData CreateCone(float radius = 1.0f, float height = 2.0f, int segments = 32);

    /**
     * @brief Capsule whose total height (cap to cap) is height
     */
    static MeshData CreateCapsule(float radius = 0.5f, float height = 2.0f, int segments = 32);

    /**
     * @brief Torus around the Y axis
     * @param majorRadius Distance from the centre to the middle of the tube
     * @param minorRadius Tube radius
     */
    static MeshData CreateTorus(float majorRadius, float minorRadius, int rings = 32, int sides = 12);

    /**
     * @brief Default-sized mesh for an editor primitive
     *
     * Cube 2x2x2, sphere r 1, cone and cylinder r 1 h 2, capsule r 0.5 h 2.
     */
    static MeshData CreatePrimitive(PrimitiveType type);

    /**
     * @brief Flat 4-vertex ground plane at y = 0, sizes in kilometres
     */
    static MeshData CreateTerrainPlane(float sizeXKm, float sizeZKm);

    /**
     * @brief Rotation that maps +Y onto the given unit axis
     */
    static glm::mat4 AlignYToAxis(const glm::vec3& axis);
};

} // namespace FreeFly
