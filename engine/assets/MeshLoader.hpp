#pragma once

#include "scene/MeshData.hpp"
#include "scene/SceneObject.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <glm/glm.hpp>

namespace FreeFly {

/**
 * @brief Why a model could not be turned into a scene mesh
 */
struct MeshLoadError {
    enum class Type {
        FileNotFound,
        UnsupportedFormat,
        ImportFailed,
        EmptyMesh
    };

    Type type;
    std::string message;
    std::string path;
};

[[nodiscard]] const char* MeshLoadErrorTypeToString(MeshLoadError::Type type) noexcept;

/**
 * @brief One imported model flattened into a single mesh
 */
struct LoadedModel {
    MeshData mesh;
    Material material;
    std::string sourcePath;
    size_t sourceMeshCount = 0;
};

/**
 * @brief Either a model or the reason it failed
 */
struct MeshLoadResult {
    std::optional<LoadedModel> model;
    std::optional<MeshLoadError> error;

    [[nodiscard]] bool Succeeded() const noexcept { return model.has_value(); }
    explicit operator bool() const noexcept { return Succeeded(); }
};

/**
 * @brief Model import using Assimp
 *
 * Every mesh in the file is baked into world space and merged, so a model
 * always becomes exactly one scene object. Faces are triangulated on
 * import. The material of the first mesh supplies the base colour and the
 * diffuse texture.
 */
class MeshLoader {
public:
    /**
     * @brief Load a model from file
     * @param path Path to the model file (OBJ, glTF, FBX, PLY, STL, ...)
     */
    static MeshLoadResult Load(const std::filesystem::path& path);

    /**
     * @brief Get supported file extensions
     */
    static std::vector<std::string> GetSupportedExtensions();

    /**
     * @brief Check if a file format is supported
     */
    static bool IsSupported(const std::string& extension);

    /**
     * @brief Drop cached texture handles
     *
     * Objects keep the handles they already hold.
     */
    static void ClearCache();

    /**
     * @brief Number of cached textures still held by some object
     */
    [[nodiscard]] static size_t GetCachedTextureCount();

private:
    /// Shares a live handle for the same source; released textures are rebuilt
    static TextureHandle AcquireTexture(const std::string& source);
    static void PruneExpiredLocked();

    static std::unordered_map<std::string, std::weak_ptr<const TextureRef>> s_textureCache;
    static std::mutex s_cacheMutex;
};

} // namespace FreeFly
