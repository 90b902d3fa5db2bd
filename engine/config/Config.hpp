#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <shared_mutex>
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>

namespace FreeFly {

/**
 * @brief Result of a configuration file operation
 */
enum class ConfigError {
    None = 0,
    FileNotFound,
    ParseError,
    WriteError
};

[[nodiscard]] const char* ConfigErrorToString(ConfigError error) noexcept;

/**
 * @brief JSON-based configuration system for engine settings
 *
 * Values are addressed by dot-separated paths ("physics.gravity").
 * Module config structs (PhysicsWorldConfig, PlayerConfig, ...) read their
 * fields through Get() with their compiled-in defaults as fallbacks.
 */
class Config {
public:
    static Config& Instance();

    // Delete copy/move for singleton
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to configuration file (created with defaults if missing)
     */
    [[nodiscard]] ConfigError Load(const std::filesystem::path& filepath);

    /**
     * @brief Parse configuration from an in-memory JSON string
     */
    [[nodiscard]] ConfigError LoadFromString(const std::string& text);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     */
    [[nodiscard]] ConfigError Save(const std::filesystem::path& filepath = "");

    /**
     * @brief Reload configuration from disk
     */
    [[nodiscard]] ConfigError Reload();

    /**
     * @brief Drop all values
     */
    void Reset();

    /**
     * @brief Get a configuration value with type safety
     * @tparam T The expected type (arithmetic, string, glm::vec2/3/4)
     * @param key Dot-separated key path (e.g., "player.eye_height")
     * @param defaultValue Value to return if key not found or mistyped
     */
    template<typename T>
    T Get(std::string_view key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     */
    template<typename T>
    void Set(std::string_view key, const T& value);

    [[nodiscard]] bool Has(std::string_view key) const;

    /**
     * @brief Write a default configuration file
     */
    static void CreateDefault(const std::filesystem::path& filepath);

    /**
     * @brief Default configuration document
     */
    [[nodiscard]] static nlohmann::json DefaultDocument();

private:
    Config() = default;
    ~Config() = default;

    nlohmann::json m_data = nlohmann::json::object();
    std::filesystem::path m_filepath;
    mutable std::shared_mutex m_mutex;

    nlohmann::json* NavigateToKey(std::string_view key, bool create);
    const nlohmann::json* NavigateToKey(std::string_view key) const;
};

// Template implementations
template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    std::shared_lock lock(m_mutex);
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        if constexpr (std::is_same_v<T, glm::vec2>) {
            if (node->is_array() && node->size() >= 2) {
                return glm::vec2((*node)[0].get<float>(), (*node)[1].get<float>());
            }
        } else if constexpr (std::is_same_v<T, glm::vec3>) {
            if (node->is_array() && node->size() >= 3) {
                return glm::vec3(
                    (*node)[0].get<float>(),
                    (*node)[1].get<float>(),
                    (*node)[2].get<float>()
                );
            }
        } else if constexpr (std::is_same_v<T, glm::vec4>) {
            if (node->is_array() && node->size() >= 4) {
                return glm::vec4(
                    (*node)[0].get<float>(),
                    (*node)[1].get<float>(),
                    (*node)[2].get<float>(),
                    (*node)[3].get<float>()
                );
            }
        } else {
            return node->get<T>();
        }
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
    return defaultValue;
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    std::unique_lock lock(m_mutex);
    auto* node = NavigateToKey(key, true);
    if (node) {
        if constexpr (std::is_same_v<T, glm::vec2>) {
            *node = nlohmann::json::array({value.x, value.y});
        } else if constexpr (std::is_same_v<T, glm::vec3>) {
            *node = nlohmann::json::array({value.x, value.y, value.z});
        } else if constexpr (std::is_same_v<T, glm::vec4>) {
            *node = nlohmann::json::array({value.x, value.y, value.z, value.w});
        } else {
            *node = value;
        }
    }
}

/**
 * @brief Editor camera configuration defaults
 */
struct CameraConfig {
    float fov = 45.0f;           // Degrees
    float nearPlane = 0.1f;
    float farPlane = 1000.0f;
    float flySpeed = 0.1f;       // Units per tick, doubled with shift
    float lookSensitivity = 0.1f;
    glm::vec3 defaultPosition = glm::vec3(0.0f, 1.0f, 5.0f);
    float defaultYaw = -90.0f;
    float defaultPitch = 0.0f;

    static CameraConfig FromConfig(const Config& config);
};

/**
 * @brief Logging configuration defaults
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file;
    bool console = true;

    static LoggingConfig FromConfig(const Config& config);
};

} // namespace FreeFly
