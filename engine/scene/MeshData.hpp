#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace FreeFly {

/**
 * @brief CPU-side triangle mesh
 *
 * Faces index into vertices. Normals and texCoords are either empty or
 * parallel to vertices.
 */
struct MeshData {
    std::vector<glm::vec3> vertices;
    std::vector<glm::uvec3> faces;
    std::vector<glm::vec3> normals;
    std::vector<glm::vec2> texCoords;

    [[nodiscard]] bool IsEmpty() const noexcept { return vertices.empty() || faces.empty(); }
    [[nodiscard]] size_t TriangleCount() const noexcept { return faces.size(); }

    /**
     * @brief Every face references an existing vertex
     */
    [[nodiscard]] bool IsValid() const noexcept;

    /**
     * @brief Mean of all vertex positions (origin for an empty mesh)
     */
    [[nodiscard]] glm::vec3 Centroid() const noexcept;

    /**
     * @brief Per-axis min/max of the vertex positions
     * @return false for an empty mesh
     */
    bool ComputeExtents(glm::vec3& outMin, glm::vec3& outMax) const noexcept;

    /**
     * @brief Transform positions (and normals) in place
     */
    void ApplyTransform(const glm::mat4& matrix);

    /**
     * @brief Append another mesh, re-indexing its faces
     */
    void Append(const MeshData& other);
};

} // namespace FreeFly
