#include "assets/MeshLoader.hpp"
#include "core/Logger.hpp"

#include <assimp/Importer.hpp>
#include <assimp/scene.h>
#include <assimp/postprocess.h>
#include <algorithm>
#include <cctype>
#include <system_error>

namespace FreeFly {

std::unordered_map<std::string, std::weak_ptr<const TextureRef>> MeshLoader::s_textureCache;
std::mutex MeshLoader::s_cacheMutex;

namespace {
    glm::vec3 ConvertVec3(const aiVector3D& v) {
        return glm::vec3(v.x, v.y, v.z);
    }

    MeshLoadResult Fail(MeshLoadError::Type type, std::string message, const std::filesystem::path& path) {
        FREEFLY_LOG_ERROR("Failed to load model '{}': {}", path.string(), message);
        MeshLoadResult result;
        result.error = MeshLoadError{type, std::move(message), path.string()};
        return result;
    }

    void AppendMesh(const aiMesh* mesh, MeshData& out) {
        const auto base = static_cast<uint32_t>(out.vertices.size());
        const bool hasUV = mesh->mTextureCoords[0] != nullptr;

        for (unsigned int i = 0; i < mesh->mNumVertices; ++i) {
            out.vertices.push_back(ConvertVec3(mesh->mVertices[i]));
            out.normals.push_back(mesh->HasNormals() ? ConvertVec3(mesh->mNormals[i]) : glm::vec3(0.0f, 1.0f, 0.0f));
            out.texCoords.push_back(hasUV
                ? glm::vec2(mesh->mTextureCoords[0][i].x, mesh->mTextureCoords[0][i].y)
                : glm::vec2(0.0f));
        }

        // Points and lines survive triangulation; only triangles are kept
        for (unsigned int i = 0; i < mesh->mNumFaces; ++i) {
            const aiFace& face = mesh->mFaces[i];
            if (face.mNumIndices != 3) continue;
            out.faces.emplace_back(base + face.mIndices[0], base + face.mIndices[1], base + face.mIndices[2]);
        }
    }

    glm::vec4 ReadBaseColor(const aiMaterial* mat) {
        glm::vec4 color(0.8f, 0.8f, 0.8f, 1.0f);

        aiColor4D base;
        if (mat->Get(AI_MATKEY_BASE_COLOR, base) == AI_SUCCESS) {
            return glm::vec4(base.r, base.g, base.b, base.a);
        }

        aiColor3D diffuse;
        if (mat->Get(AI_MATKEY_COLOR_DIFFUSE, diffuse) == AI_SUCCESS) {
            color = glm::vec4(diffuse.r, diffuse.g, diffuse.b, 1.0f);
        }

        float opacity = 1.0f;
        if (mat->Get(AI_MATKEY_OPACITY, opacity) == AI_SUCCESS) {
            color.a = opacity;
        }
        return color;
    }

    std::optional<std::string> ReadTextureSource(const aiMaterial* mat, const std::filesystem::path& modelPath) {
        for (aiTextureType type : {aiTextureType_BASE_COLOR, aiTextureType_DIFFUSE}) {
            if (mat->GetTextureCount(type) == 0) continue;

            aiString str;
            if (mat->GetTexture(type, 0, &str) != AI_SUCCESS) continue;

            std::string name = str.C_Str();
            if (name.empty()) continue;

            // Embedded textures are referenced as "*<index>"
            if (name.front() == '*') {
                return modelPath.string() + name;
            }
            return (modelPath.parent_path() / name).lexically_normal().string();
        }
        return std::nullopt;
    }
}

const char* MeshLoadErrorTypeToString(MeshLoadError::Type type) noexcept {
    switch (type) {
        case MeshLoadError::Type::FileNotFound:      return "FileNotFound";
        case MeshLoadError::Type::UnsupportedFormat: return "UnsupportedFormat";
        case MeshLoadError::Type::ImportFailed:      return "ImportFailed";
        case MeshLoadError::Type::EmptyMesh:         return "EmptyMesh";
    }
    return "Unknown";
}

MeshLoadResult MeshLoader::Load(const std::filesystem::path& path) {
    FREEFLY_LOG_INFO("Loading model: {}", path.string());

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Fail(MeshLoadError::Type::FileNotFound, "file does not exist", path);
    }

    Assimp::Importer importer;

    const std::string extension = path.extension().string();
    if (extension.empty() || !importer.IsExtensionSupported(extension)) {
        return Fail(MeshLoadError::Type::UnsupportedFormat, "unsupported format '" + extension + "'", path);
    }

    unsigned int flags =
        aiProcess_Triangulate |
        aiProcess_PreTransformVertices |
        aiProcess_JoinIdenticalVertices |
        aiProcess_GenSmoothNormals;

    const aiScene* scene = importer.ReadFile(path.string(), flags);

    if (!scene || scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE || !scene->mRootNode) {
        return Fail(MeshLoadError::Type::ImportFailed, importer.GetErrorString(), path);
    }

    LoadedModel model;
    model.sourcePath = path.string();

    const aiMaterial* firstMaterial = nullptr;
    for (unsigned int i = 0; i < scene->mNumMeshes; ++i) {
        const aiMesh* mesh = scene->mMeshes[i];
        if (!mesh) continue;

        AppendMesh(mesh, model.mesh);
        ++model.sourceMeshCount;

        if (!firstMaterial && mesh->mMaterialIndex < scene->mNumMaterials) {
            firstMaterial = scene->mMaterials[mesh->mMaterialIndex];
        }
    }

    if (model.mesh.IsEmpty()) {
        return Fail(MeshLoadError::Type::EmptyMesh, "model contains no triangles", path);
    }

    if (firstMaterial) {
        model.material.baseColor = ReadBaseColor(firstMaterial);
        if (auto source = ReadTextureSource(firstMaterial, path)) {
            model.material.texture = AcquireTexture(*source);
        }
    }

    FREEFLY_LOG_INFO("Loaded model with {} meshes, {} vertices and {} triangles",
                     model.sourceMeshCount, model.mesh.vertices.size(), model.mesh.TriangleCount());

    MeshLoadResult result;
    result.model = std::move(model);
    return result;
}

TextureHandle MeshLoader::AcquireTexture(const std::string& source) {
    std::lock_guard lock(s_cacheMutex);

    auto it = s_textureCache.find(source);
    if (it != s_textureCache.end()) {
        if (TextureHandle live = it->second.lock()) {
            return live;
        }
    }

    PruneExpiredLocked();

    auto texture = std::make_shared<const TextureRef>(TextureRef{source});
    s_textureCache[source] = texture;
    return texture;
}

void MeshLoader::PruneExpiredLocked() {
    for (auto it = s_textureCache.begin(); it != s_textureCache.end();) {
        if (it->second.expired()) {
            it = s_textureCache.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<std::string> MeshLoader::GetSupportedExtensions() {
    return {
        ".fbx", ".obj", ".gltf", ".glb", ".dae", ".blend",
        ".3ds", ".ply", ".stl", ".x", ".off"
    };
}

bool MeshLoader::IsSupported(const std::string& extension) {
    auto supported = GetSupportedExtensions();
    std::string ext = extension;
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(supported.begin(), supported.end(), ext) != supported.end();
}

void MeshLoader::ClearCache() {
    std::lock_guard lock(s_cacheMutex);
    s_textureCache.clear();
}

size_t MeshLoader::GetCachedTextureCount() {
    std::lock_guard lock(s_cacheMutex);
    PruneExpiredLocked();
    return s_textureCache.size();
}

} // namespace FreeFly
