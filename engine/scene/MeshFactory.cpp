#include "scene/MeshFactory.hpp"

#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>

namespace FreeFly {

namespace {

constexpr float kMetersPerKilometer = 1000.0f;

void PushFace(MeshData& mesh, uint32_t a, uint32_t b, uint32_t c) {
    mesh.faces.emplace_back(a, b, c);
}

// Latitude/longitude band between two polar angles, used by sphere and capsule
void AppendSphereBand(MeshData& mesh, float radius, float yOffset, float thetaStart, float thetaEnd,
                      int segments, int rings) {
    const auto base = static_cast<uint32_t>(mesh.vertices.size());

    for (int ring = 0; ring <= rings; ++ring) {
        const float theta = thetaStart + (thetaEnd - thetaStart) * static_cast<float>(ring) / rings;
        const float sinTheta = std::sin(theta);
        const float cosTheta = std::cos(theta);

        for (int seg = 0; seg <= segments; ++seg) {
            const float phi = static_cast<float>(seg) / segments * glm::two_pi<float>();
            const glm::vec3 normal(sinTheta * std::cos(phi), cosTheta, sinTheta * std::sin(phi));

            mesh.vertices.push_back(normal * radius + glm::vec3(0.0f, yOffset, 0.0f));
            mesh.normals.push_back(normal);
            mesh.texCoords.emplace_back(static_cast<float>(seg) / segments,
                                        1.0f - static_cast<float>(ring) / rings);
        }
    }

    for (int ring = 0; ring < rings; ++ring) {
        for (int seg = 0; seg < segments; ++seg) {
            const uint32_t current = base + ring * (segments + 1) + seg;
            const uint32_t next = current + segments + 1;

            PushFace(mesh, current, current + 1, next);
            PushFace(mesh, current + 1, next + 1, next);
        }
    }
}

} // anonymous namespace

MeshData MeshFactory::CreateBox(const glm::vec3& extents) {
    MeshData mesh;
    const glm::vec3 h = extents * 0.5f;

    struct Face {
        glm::vec3 normal;
        glm::vec3 u;
        glm::vec3 v;
    };
    const Face faces[] = {
        {{ 0,  0,  1}, {1, 0,  0}, {0, 1,  0}},
        {{ 0,  0, -1}, {-1, 0, 0}, {0, 1,  0}},
        {{ 1,  0,  0}, {0, 0, -1}, {0, 1,  0}},
        {{-1,  0,  0}, {0, 0,  1}, {0, 1,  0}},
        {{ 0,  1,  0}, {1, 0,  0}, {0, 0, -1}},
        {{ 0, -1,  0}, {1, 0,  0}, {0, 0,  1}},
    };

    for (const auto& face : faces) {
        const auto base = static_cast<uint32_t>(mesh.vertices.size());
        const glm::vec2 corners[] = {{-1, -1}, {1, -1}, {1, 1}, {-1, 1}};
        for (const auto& c : corners) {
            const glm::vec3 p = face.normal + face.u * c.x + face.v * c.y;
            mesh.vertices.push_back(p * h);
            mesh.normals.push_back(face.normal);
            mesh.texCoords.emplace_back(c.x * 0.5f + 0.5f, c.y * 0.5f + 0.5f);
        }
        PushFace(mesh, base, base + 1, base + 2);
        PushFace(mesh, base, base + 2, base + 3);
    }
    return mesh;
}

MeshData MeshFactory::CreateUVSphere(float radius, int segments, int rings) {
    MeshData mesh;
    AppendSphereBand(mesh, radius, 0.0f, 0.0f, glm::pi<float>(),
                     std::max(segments, 3), std::max(rings, 2));
    return mesh;
}

MeshData MeshFactory::CreateCylinder(float radius, float height, int segments) {
    MeshData mesh;
    segments = std::max(segments, 3);
    const float halfH = height * 0.5f;

    // Side vertices
    for (int i = 0; i <= segments; ++i) {
        const float angle = static_cast<float>(i) / segments * glm::two_pi<float>();
        const float x = std::cos(angle);
        const float z = std::sin(angle);
        const glm::vec3 normal(x, 0.0f, z);

        mesh.vertices.emplace_back(x * radius, -halfH, z * radius);
        mesh.normals.push_back(normal);
        mesh.texCoords.emplace_back(static_cast<float>(i) / segments, 0.0f);

        mesh.vertices.emplace_back(x * radius, halfH, z * radius);
        mesh.normals.push_back(normal);
        mesh.texCoords.emplace_back(static_cast<float>(i) / segments, 1.0f);
    }

    for (int i = 0; i < segments; ++i) {
        const uint32_t base = i * 2;
        PushFace(mesh, base, base + 1, base + 2);
        PushFace(mesh, base + 1, base + 3, base + 2);
    }

    // Caps
    const auto bottomCenter = static_cast<uint32_t>(mesh.vertices.size());
    mesh.vertices.emplace_back(0.0f, -halfH, 0.0f);
    mesh.normals.emplace_back(0.0f, -1.0f, 0.0f);
    mesh.texCoords.emplace_back(0.5f, 0.5f);

    const auto topCenter = static_cast<uint32_t>(mesh.vertices.size());
    mesh.vertices.emplace_back(0.0f, halfH, 0.0f);
    mesh.normals.emplace_back(0.0f, 1.0f, 0.0f);
    mesh.texCoords.emplace_back(0.5f, 0.5f);

    const uint32_t capStart = topCenter + 1;
    for (int i = 0; i <= segments; ++i) {
        const float angle = static_cast<float>(i) / segments * glm::two_pi<float>();
        const float x = std::cos(angle);
        const float z = std::sin(angle);
        const glm::vec2 uv(x * 0.5f + 0.5f, z * 0.5f + 0.5f);

        mesh.vertices.emplace_back(x * radius, -halfH, z * radius);
        mesh.normals.emplace_back(0.0f, -1.0f, 0.0f);
        mesh.texCoords.push_back(uv);

        mesh.vertices.emplace_back(x * radius, halfH, z * radius);
        mesh.normals.emplace_back(0.0f, 1.0f, 0.0f);
        mesh.texCoords.push_back(uv);
    }

    for (int i = 0; i < segments; ++i) {
        PushFace(mesh, bottomCenter, capStart + i * 2, capStart + i * 2 + 2);
        PushFace(mesh, topCenter, capStart + i * 2 + 3, capStart + i * 2 + 1);
    }
    return mesh;
}

MeshData MeshFactory::CreateCone(float radius, float height, int segments) {
    MeshData mesh;
    segments = std::max(segments, 3);
    const float halfH = height * 0.5f;

    // Apex
    mesh.vertices.emplace_back(0.0f, halfH, 0.0f);
    mesh.normals.emplace_back(0.0f, 1.0f, 0.0f);
    mesh.texCoords.emplace_back(0.5f, 1.0f);

    for (int i = 0; i <= segments; ++i) {
        const float angle = static_cast<float>(i) / segments * glm::two_pi<float>();
        const float x = std::cos(angle);
        const float z = std::sin(angle);

        mesh.vertices.emplace_back(x * radius, -halfH, z * radius);
        mesh.normals.push_back(glm::normalize(glm::vec3(x, radius / std::max(height, 1e-6f), z)));
        mesh.texCoords.emplace_back(static_cast<float>(i) / segments, 0.0f);
    }

    for (int i = 0; i < segments; ++i) {
        PushFace(mesh, 0, 2 + i, 1 + i);
    }

    // Base cap
    const auto baseCenter = static_cast<uint32_t>(mesh.vertices.size());
    mesh.vertices.emplace_back(0.0f, -halfH, 0.0f);
    mesh.normals.emplace_back(0.0f, -1.0f, 0.0f);
    mesh.texCoords.emplace_back(0.5f, 0.5f);

    for (int i = 0; i <= segments; ++i) {
        const float angle = static_cast<float>(i) / segments * glm::two_pi<float>();
        const float x = std::cos(angle);
        const float z = std::sin(angle);

        mesh.vertices.emplace_back(x * radius, -halfH, z * radius);
        mesh.normals.emplace_back(0.0f, -1.0f, 0.0f);
        mesh.texCoords.emplace_back(x * 0.5f + 0.5f, z * 0.5f + 0.5f);
    }

    for (int i = 0; i < segments; ++i) {
        PushFace(mesh, baseCenter, baseCenter + 1 + i, baseCenter + 2 + i);
    }
    return mesh;
}

MeshData MeshFactory::CreateCapsule(float radius, float height, int segments) {
    segments = std::max(segments, 3);
    const float cylinderHeight = std::max(height - 2.0f * radius, 0.0f);
    const float halfCyl = cylinderHeight * 0.5f;
    const int capRings = std::max(segments / 4, 2);

    MeshData mesh;
    AppendSphereBand(mesh, radius, halfCyl, 0.0f, glm::half_pi<float>(), segments, capRings);
    AppendSphereBand(mesh, radius, -halfCyl, glm::half_pi<float>(), glm::pi<float>(), segments, capRings);

    if (cylinderHeight > 0.0f) {
        // Open tube between the hemispheres
        const auto base = static_cast<uint32_t>(mesh.vertices.size());
        for (int i = 0; i <= segments; ++i) {
            const float angle = static_cast<float>(i) / segments * glm::two_pi<float>();
            const glm::vec3 normal(std::cos(angle), 0.0f, std::sin(angle));

            mesh.vertices.push_back(normal * radius + glm::vec3(0.0f, -halfCyl, 0.0f));
            mesh.normals.push_back(normal);
            mesh.texCoords.emplace_back(static_cast<float>(i) / segments, 0.0f);

            mesh.vertices.push_back(normal * radius + glm::vec3(0.0f, halfCyl, 0.0f));
            mesh.normals.push_back(normal);
            mesh.texCoords.emplace_back(static_cast<float>(i) / segments, 1.0f);
        }
        for (int i = 0; i < segments; ++i) {
            const uint32_t b = base + i * 2;
            PushFace(mesh, b, b + 1, b + 2);
            PushFace(mesh, b + 1, b + 3, b + 2);
        }
    }
    return mesh;
}

MeshData MeshFactory::CreateTorus(float majorRadius, float minorRadius, int rings, int sides) {
    MeshData mesh;
    rings = std::max(rings, 3);
    sides = std::max(sides, 3);

    for (int ring = 0; ring <= rings; ++ring) {
        const float theta = static_cast<float>(ring) / rings * glm::two_pi<float>();
        const float cosTheta = std::cos(theta);
        const float sinTheta = std::sin(theta);

        for (int side = 0; side <= sides; ++side) {
            const float phi = static_cast<float>(side) / sides * glm::two_pi<float>();
            const float cosPhi = std::cos(phi);
            const float sinPhi = std::sin(phi);

            mesh.vertices.emplace_back(
                (majorRadius + minorRadius * cosPhi) * cosTheta,
                minorRadius * sinPhi,
                (majorRadius + minorRadius * cosPhi) * sinTheta
            );
            mesh.normals.emplace_back(cosPhi * cosTheta, sinPhi, cosPhi * sinTheta);
            mesh.texCoords.emplace_back(static_cast<float>(ring) / rings,
                                        static_cast<float>(side) / sides);
        }
    }

    for (int ring = 0; ring < rings; ++ring) {
        for (int side = 0; side < sides; ++side) {
            const uint32_t current = ring * (sides + 1) + side;
            const uint32_t next = current + sides + 1;

            PushFace(mesh, current, next, current + 1);
            PushFace(mesh, current + 1, next, next + 1);
        }
    }
    return mesh;
}

MeshData MeshFactory::CreateTerrainPlane(float sizeXKm, float sizeZKm) {
    const float halfX = sizeXKm * kMetersPerKilometer * 0.5f;
    const float halfZ = sizeZKm * kMetersPerKilometer * 0.5f;

    MeshData mesh;
    mesh.vertices = {
        {-halfX, 0.0f, -halfZ},
        { halfX, 0.0f, -halfZ},
        { halfX, 0.0f,  halfZ},
        {-halfX, 0.0f,  halfZ},
    };
    mesh.faces = {{0, 2, 1}, {0, 3, 2}};
    mesh.normals.assign(4, glm::vec3(0.0f, 1.0f, 0.0f));
    mesh.texCoords = {{0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f}, {0.0f, 1.0f}};
    return mesh;
}

MeshData MeshFactory::CreatePrimitive(PrimitiveType type) {
    switch (type) {
        case PrimitiveType::Cube:     return CreateBox(glm::vec3(2.0f));
        case PrimitiveType::Sphere:   return CreateUVSphere(1.0f, 32, 16);
        case PrimitiveType::Cone:     return CreateCone(1.0f, 2.0f, 32);
        case PrimitiveType::Cylinder: return CreateCylinder(1.0f, 2.0f, 32);
        case PrimitiveType::Capsule:  return CreateCapsule(0.5f, 2.0f, 32);
    }
    return CreateBox(glm::vec3(2.0f));
}

glm::mat4 MeshFactory::AlignYToAxis(const glm::vec3& axis) {
    const glm::vec3 up(0.0f, 1.0f, 0.0f);
    const float d = glm::dot(up, axis);
    if (d > 1.0f - 1e-6f) {
        return glm::mat4(1.0f);
    }
    if (d < -1.0f + 1e-6f) {
        return glm::rotate(glm::mat4(1.0f), glm::pi<float>(), glm::vec3(1.0f, 0.0f, 0.0f));
    }
    const glm::vec3 rotationAxis = glm::normalize(glm::cross(up, axis));
    return glm::rotate(glm::mat4(1.0f), std::acos(d), rotationAxis);
}

} // namespace FreeFly
