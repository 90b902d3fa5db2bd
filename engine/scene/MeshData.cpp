#include "scene/MeshData.hpp"

#include <glm/gtc/matrix_inverse.hpp>
#include <limits>

namespace FreeFly {

bool MeshData::IsValid() const noexcept {
    const auto count = static_cast<uint32_t>(vertices.size());
    for (const auto& face : faces) {
        if (face.x >= count || face.y >= count || face.z >= count) {
            return false;
        }
    }
    return true;
}

glm::vec3 MeshData::Centroid() const noexcept {
    if (vertices.empty()) {
        return glm::vec3(0.0f);
    }
    glm::vec3 sum(0.0f);
    for (const auto& v : vertices) {
        sum += v;
    }
    return sum / static_cast<float>(vertices.size());
}

bool MeshData::ComputeExtents(glm::vec3& outMin, glm::vec3& outMax) const noexcept {
    if (vertices.empty()) {
        outMin = outMax = glm::vec3(0.0f);
        return false;
    }
    outMin = glm::vec3(std::numeric_limits<float>::max());
    outMax = glm::vec3(std::numeric_limits<float>::lowest());
    for (const auto& v : vertices) {
        outMin = glm::min(outMin, v);
        outMax = glm::max(outMax, v);
    }
    return true;
}

void MeshData::ApplyTransform(const glm::mat4& matrix) {
    for (auto& v : vertices) {
        v = glm::vec3(matrix * glm::vec4(v, 1.0f));
    }
    if (!normals.empty()) {
        const glm::mat3 normalMatrix = glm::inverseTranspose(glm::mat3(matrix));
        for (auto& n : normals) {
            const glm::vec3 transformed = normalMatrix * n;
            const float len = glm::length(transformed);
            n = len > 0.0f ? transformed / len : n;
        }
    }
}

void MeshData::Append(const MeshData& other) {
    const auto base = static_cast<uint32_t>(vertices.size());
    const bool keepNormals = (vertices.empty() || !normals.empty()) && !other.normals.empty();
    const bool keepTexCoords = (vertices.empty() || !texCoords.empty()) && !other.texCoords.empty();

    vertices.insert(vertices.end(), other.vertices.begin(), other.vertices.end());
    for (const auto& f : other.faces) {
        faces.emplace_back(f.x + base, f.y + base, f.z + base);
    }

    if (keepNormals) {
        normals.insert(normals.end(), other.normals.begin(), other.normals.end());
    } else {
        normals.clear();
    }
    if (keepTexCoords) {
        texCoords.insert(texCoords.end(), other.texCoords.begin(), other.texCoords.end());
    } else {
        texCoords.clear();
    }
}

} // namespace FreeFly
