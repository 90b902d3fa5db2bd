#include "persistence/SceneSerializer.hpp"
#include "assets/MeshLoader.hpp"
#include "core/Logger.hpp"
#include "scene/MeshFactory.hpp"

#include <cmath>
#include <fstream>

namespace FreeFly {

namespace {

nlohmann::json SerializeVec3(const glm::vec3& v) {
    return nlohmann::json::array({v.x, v.y, v.z});
}

nlohmann::json SerializeVec4(const glm::vec4& v) {
    return nlohmann::json::array({v.x, v.y, v.z, v.w});
}

bool IsNumberArray(const nlohmann::json& json, size_t minSize) {
    if (!json.is_array() || json.size() < minSize) {
        return false;
    }
    for (size_t i = 0; i < minSize; ++i) {
        if (!json[i].is_number()) {
            return false;
        }
    }
    return true;
}

glm::vec3 ReadVec3(const nlohmann::json& parent, const char* key, const glm::vec3& fallback) {
    if (!parent.contains(key) || !IsNumberArray(parent[key], 3)) {
        return fallback;
    }
    const auto& a = parent[key];
    return glm::vec3(a[0].get<float>(), a[1].get<float>(), a[2].get<float>());
}

/// Three-component colours get alpha 1
glm::vec4 ReadColor(const nlohmann::json& parent, const char* key, const glm::vec4& fallback) {
    if (!parent.contains(key)) {
        return fallback;
    }
    const auto& a = parent[key];
    if (IsNumberArray(a, 4)) {
        return glm::vec4(a[0].get<float>(), a[1].get<float>(), a[2].get<float>(), a[3].get<float>());
    }
    if (IsNumberArray(a, 3)) {
        return glm::vec4(a[0].get<float>(), a[1].get<float>(), a[2].get<float>(), 1.0f);
    }
    return fallback;
}

const nlohmann::json& Section(const nlohmann::json& parent, const char* key) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (parent.contains(key) && parent[key].is_object()) {
        return parent[key];
    }
    return kEmpty;
}

SceneIOError MakeError(SceneIOError::Type type, std::string message) {
    FREEFLY_LOG_ERROR("Scene I/O failed ({}): {}", SceneIOErrorTypeToString(type), message);
    return SceneIOError{type, std::move(message)};
}

} // anonymous namespace

const char* SceneIOErrorTypeToString(SceneIOError::Type type) noexcept {
    switch (type) {
        case SceneIOError::Type::FileOpenFailed: return "FileOpenFailed";
        case SceneIOError::Type::ParseError:     return "ParseError";
        case SceneIOError::Type::InvalidFormat:  return "InvalidFormat";
        case SceneIOError::Type::WriteFailed:    return "WriteFailed";
    }
    return "Unknown";
}

// =============================================================================
// Serialization
// =============================================================================

nlohmann::json SceneSerializer::ObjectToJson(const SceneObject& object, size_t index) {
    nlohmann::json json;
    json["id"] = index;
    json["name"] = object.name;

    if (object.source.type == ObjectSourceType::Model && !object.source.modelFile.empty()) {
        json["model_file"] = object.source.modelFile;
    } else {
        json["model_file"] = nullptr;
    }

    json["transform"] = {
        {"position", SerializeVec3(object.transform.position)},
        {"rotation", SerializeVec3(object.transform.rotation)},
        {"scale", SerializeVec3(object.transform.scale)}
    };

    json["material"] = {
        {"base_color", SerializeVec4(object.material.baseColor)},
        {"is_transparent", object.material.IsTransparent()}
    };

    json["physics"] = {
        {"physics_type", PhysicsKindToString(object.physicsKind)},
        {"physics_shape", PhysicsShapeToString(object.physicsShape)},
        {"mass", object.mass}
    };

    if (object.source.type == ObjectSourceType::Terrain) {
        json["terrain_data"] = {
            {"is_terrain", true},
            {"size_x_km", object.source.terrain.sizeXKm},
            {"size_y_km", object.source.terrain.sizeZKm},
            {"terrain_color", SerializeVec4(object.material.baseColor)}
        };
    }

    if (object.source.type == ObjectSourceType::Primitive) {
        json["primitive_data"] = {
            {"is_primitive", true},
            {"primitive_type", PrimitiveTypeToString(object.source.primitive)}
        };
    }

    if (object.enemy) {
        json["enemy_data"] = {{"speed", object.enemy->speed}};
    }

    return json;
}

nlohmann::json SceneSerializer::ToJson(const Scene& scene, const CameraState& camera) {
    nlohmann::json document;
    document["scene_info"] = {
        {"name", scene.GetName()},
        {"version", kFormatVersion},
        {"engine", kEngineName}
    };

    document["camera"] = {
        {"position", SerializeVec3(camera.position)},
        {"yaw", camera.yaw},
        {"pitch", camera.pitch}
    };

    nlohmann::json objects = nlohmann::json::array();
    const auto& list = scene.GetObjects();
    for (size_t i = 0; i < list.size(); ++i) {
        objects.push_back(ObjectToJson(list[i], i));
    }
    document["objects"] = std::move(objects);

    return document;
}

// =============================================================================
// Deserialization
// =============================================================================

std::optional<SceneObject> SceneSerializer::ObjectFromJson(const nlohmann::json& json,
                                                          const std::filesystem::path& baseDirectory) {
    SceneObject object;
    object.name = json.value("name", std::string("Object"));

    const auto& terrain = Section(json, "terrain_data");
    const auto& primitive = Section(json, "primitive_data");

    if (terrain.value("is_terrain", false)) {
        object.source.type = ObjectSourceType::Terrain;
        object.source.terrain.sizeXKm = terrain.value("size_x_km", 1.0f);
        object.source.terrain.sizeZKm = terrain.value("size_y_km", 1.0f);
        object.mesh = MeshFactory::CreateTerrainPlane(object.source.terrain.sizeXKm,
                                                      object.source.terrain.sizeZKm);
        object.material.baseColor = ReadColor(terrain, "terrain_color", glm::vec4(0.4f, 0.6f, 0.3f, 1.0f));
    } else if (primitive.value("is_primitive", false)) {
        const std::string typeName = primitive.value("primitive_type", std::string("cube"));
        auto type = PrimitiveTypeFromString(typeName);
        if (!type) {
            FREEFLY_LOG_WARN("'{}': unknown primitive type '{}', using cube", object.name, typeName);
        }
        object.source.type = ObjectSourceType::Primitive;
        object.source.primitive = type.value_or(PrimitiveType::Cube);
        object.mesh = MeshFactory::CreatePrimitive(object.source.primitive);
    } else {
        if (!json.contains("model_file") || !json["model_file"].is_string()) {
            FREEFLY_LOG_WARN("'{}': no model file recorded, skipping", object.name);
            return std::nullopt;
        }

        const std::string modelFile = json["model_file"].get<std::string>();
        std::filesystem::path modelPath(modelFile);
        if (modelPath.is_relative() && !baseDirectory.empty()) {
            modelPath = baseDirectory / modelPath;
        }

        MeshLoadResult result = MeshLoader::Load(modelPath);
        if (!result) {
            FREEFLY_LOG_WARN("'{}': could not reload model '{}', skipping", object.name, modelFile);
            return std::nullopt;
        }

        object.source.type = ObjectSourceType::Model;
        object.source.modelFile = modelFile;
        object.mesh = std::move(result.model->mesh);
        object.material = std::move(result.model->material);
    }

    const auto& transform = Section(json, "transform");
    object.transform.position = ReadVec3(transform, "position", glm::vec3(0.0f));
    object.transform.rotation = ReadVec3(transform, "rotation", glm::vec3(0.0f));
    object.transform.scale = ReadVec3(transform, "scale", glm::vec3(1.0f));

    const auto& material = Section(json, "material");
    object.material.baseColor = ReadColor(material, "base_color", object.material.baseColor);

    const auto& physics = Section(json, "physics");
    const std::string kindName = physics.value("physics_type", std::string("None"));
    object.physicsKind = PhysicsKindFromString(kindName).value_or(PhysicsKind::None);
    object.physicsShape = PhysicsShapeFromString(physics.value("physics_shape", std::string("Cube")));
    object.SetMass(physics.value("mass", 1.0f));
    object.ValidatePhysicsShape();

    const auto& enemy = Section(json, "enemy_data");
    if (!enemy.empty()) {
        object.enemy = EnemyTraits{enemy.value("speed", 1.0f)};
    }

    return object;
}

std::optional<SceneIOError> SceneSerializer::FromJson(const nlohmann::json& document,
                                                     Scene& scene,
                                                     CameraState& camera,
                                                     const std::filesystem::path& baseDirectory) {
    if (!document.is_object() || !document.contains("objects") || !document["objects"].is_array()) {
        return MakeError(SceneIOError::Type::InvalidFormat, "document has no 'objects' array");
    }

    Scene loaded;
    CameraState loadedCamera = camera;

    try {
        const auto& info = Section(document, "scene_info");
        loaded.SetName(info.value("name", std::string("Untitled")));

        const std::string version = info.value("version", std::string(kFormatVersion));
        if (version != kFormatVersion) {
            FREEFLY_LOG_WARN("Scene format version {} differs from {}", version, kFormatVersion);
        }

        const auto& cam = Section(document, "camera");
        loadedCamera.position = ReadVec3(cam, "position", glm::vec3(0.0f, 1.0f, 5.0f));
        loadedCamera.yaw = cam.value("yaw", -90.0f);
        loadedCamera.pitch = cam.value("pitch", 0.0f);

        size_t skipped = 0;
        for (const auto& entry : document["objects"]) {
            if (!entry.is_object()) {
                ++skipped;
                continue;
            }
            if (auto object = ObjectFromJson(entry, baseDirectory)) {
                loaded.Add(std::move(*object));
            } else {
                ++skipped;
            }
        }

        if (skipped > 0) {
            FREEFLY_LOG_WARN("{} scene objects could not be restored", skipped);
        }
    } catch (const nlohmann::json::exception& e) {
        return MakeError(SceneIOError::Type::InvalidFormat, e.what());
    }

    scene = std::move(loaded);
    camera = loadedCamera;
    return std::nullopt;
}

// =============================================================================
// File I/O
// =============================================================================

std::optional<SceneIOError> SceneSerializer::Save(const Scene& scene,
                                                 const CameraState& camera,
                                                 const std::filesystem::path& path) {
    nlohmann::json document = ToJson(scene, camera);
    document["scene_info"]["name"] = path.stem().string();

    std::ofstream file(path);
    if (!file.is_open()) {
        return MakeError(SceneIOError::Type::FileOpenFailed, "cannot open '" + path.string() + "' for writing");
    }

    file << document.dump(2);
    if (!file.good()) {
        return MakeError(SceneIOError::Type::WriteFailed, "failed writing '" + path.string() + "'");
    }

    FREEFLY_LOG_INFO("Scene saved to {} ({} objects)", path.string(), scene.GetObjectCount());
    return std::nullopt;
}

std::optional<SceneIOError> SceneSerializer::Load(const std::filesystem::path& path,
                                                 Scene& scene,
                                                 CameraState& camera) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return MakeError(SceneIOError::Type::FileOpenFailed, "cannot open '" + path.string() + "'");
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        return MakeError(SceneIOError::Type::ParseError, e.what());
    }

    if (auto error = FromJson(document, scene, camera, path.parent_path())) {
        return error;
    }

    FREEFLY_LOG_INFO("Scene loaded from {} ({} objects)", path.string(), scene.GetObjectCount());
    return std::nullopt;
}

} // namespace FreeFly
