#pragma once

#include "scene/Camera.hpp"
#include "scene/Scene.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace FreeFly {

/**
 * @brief Why a scene file could not be read or written
 */
struct SceneIOError {
    enum class Type {
        FileOpenFailed,
        ParseError,
        InvalidFormat,
        WriteFailed
    };

    Type type;
    std::string message;
};

[[nodiscard]] const char* SceneIOErrorTypeToString(SceneIOError::Type type) noexcept;

/**
 * @brief Scene save/load as a JSON document
 *
 * Geometry is never stored. Primitives and terrain are regenerated from
 * their descriptors and models are re-imported from their source file,
 * resolved against the scene file's directory when relative. An object
 * whose model can no longer be imported is skipped with a warning; the
 * rest of the scene still loads.
 */
class SceneSerializer {
public:
    static constexpr const char* kFormatVersion = "1.0.0";
    static constexpr const char* kEngineName = "FreeFly";

    [[nodiscard]] static nlohmann::json ToJson(const Scene& scene, const CameraState& camera);

    /**
     * @brief Rebuild a scene from a parsed document
     * @param baseDirectory Directory relative model paths are resolved against
     *
     * On error neither output is modified.
     */
    [[nodiscard]] static std::optional<SceneIOError> FromJson(const nlohmann::json& document,
                                                              Scene& scene,
                                                              CameraState& camera,
                                                              const std::filesystem::path& baseDirectory = {});

    /**
     * @brief Write the scene; the scene name is taken from the file stem
     */
    [[nodiscard]] static std::optional<SceneIOError> Save(const Scene& scene,
                                                          const CameraState& camera,
                                                          const std::filesystem::path& path);

    [[nodiscard]] static std::optional<SceneIOError> Load(const std::filesystem::path& path,
                                                          Scene& scene,
                                                          CameraState& camera);

    [[nodiscard]] static nlohmann::json ObjectToJson(const SceneObject& object, size_t index);

    /**
     * @brief Recreate one object, geometry included
     * @return nullopt if the geometry could not be rebuilt
     */
    [[nodiscard]] static std::optional<SceneObject> ObjectFromJson(const nlohmann::json& json,
                                                                   const std::filesystem::path& baseDirectory);
};

} // namespace FreeFly
