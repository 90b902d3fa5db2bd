#include "config/Config.hpp"
#include "core/Logger.hpp"
#include <fstream>
#include <iomanip>

namespace FreeFly {

namespace {

std::vector<std::string> SplitKey(std::string_view key) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string_view::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));
    return parts;
}

} // anonymous namespace

const char* ConfigErrorToString(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::None:         return "None";
        case ConfigError::FileNotFound: return "FileNotFound";
        case ConfigError::ParseError:   return "ParseError";
        case ConfigError::WriteError:   return "WriteError";
    }
    return "Unknown";
}

Config& Config::Instance() {
    static Config instance;
    return instance;
}

ConfigError Config::Load(const std::filesystem::path& filepath) {
    std::unique_lock lock(m_mutex);
    m_filepath = filepath;

    if (!std::filesystem::exists(filepath)) {
        FREEFLY_LOG_WARN("Config file not found: {}. Creating default.", filepath.string());
        CreateDefault(filepath);
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        FREEFLY_LOG_ERROR("Failed to open config file: {}", filepath.string());
        return ConfigError::FileNotFound;
    }

    try {
        m_data = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        FREEFLY_LOG_ERROR("Failed to parse config file: {}", e.what());
        return ConfigError::ParseError;
    }

    FREEFLY_LOG_INFO("Loaded configuration from: {}", filepath.string());
    return ConfigError::None;
}

ConfigError Config::LoadFromString(const std::string& text) {
    std::unique_lock lock(m_mutex);
    try {
        m_data = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        FREEFLY_LOG_ERROR("Failed to parse config text: {}", e.what());
        return ConfigError::ParseError;
    }
    return ConfigError::None;
}

ConfigError Config::Save(const std::filesystem::path& filepath) {
    std::shared_lock lock(m_mutex);
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        FREEFLY_LOG_WARN("No config file path set, cannot save");
        return ConfigError::WriteError;
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        FREEFLY_LOG_ERROR("Failed to open config file for writing: {}", path.string());
        return ConfigError::WriteError;
    }

    file << std::setw(4) << m_data << std::endl;
    FREEFLY_LOG_INFO("Saved configuration to: {}", path.string());
    return ConfigError::None;
}

ConfigError Config::Reload() {
    std::filesystem::path path;
    {
        std::shared_lock lock(m_mutex);
        path = m_filepath;
    }
    if (path.empty()) {
        FREEFLY_LOG_WARN("No config file path set, cannot reload");
        return ConfigError::FileNotFound;
    }
    return Load(path);
}

void Config::Reset() {
    std::unique_lock lock(m_mutex);
    m_data = nlohmann::json::object();
    m_filepath.clear();
}

bool Config::Has(std::string_view key) const {
    std::shared_lock lock(m_mutex);
    return NavigateToKey(key) != nullptr;
}

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object()) {
            if (!create) {
                return nullptr;
            }
            *current = nlohmann::json::object();
        }
        if (!current->contains(p)) {
            if (!create) {
                return nullptr;
            }
            (*current)[p] = nlohmann::json::object();
        }
        current = &(*current)[p];
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object() || !current->contains(p)) {
            return nullptr;
        }
        current = &(*current)[p];
    }
    return current;
}

nlohmann::json Config::DefaultDocument() {
    nlohmann::json config;

    config["logging"]["level"] = "info";
    config["logging"]["file"] = "";
    config["logging"]["console"] = true;

    config["camera"]["fov"] = 45.0;
    config["camera"]["near_plane"] = 0.1;
    config["camera"]["far_plane"] = 1000.0;
    config["camera"]["fly_speed"] = 0.1;
    config["camera"]["look_sensitivity"] = 0.1;
    config["camera"]["default_position"] = {0.0, 1.0, 5.0};
    config["camera"]["default_yaw"] = -90.0;
    config["camera"]["default_pitch"] = 0.0;

    config["physics"]["gravity"] = -9.81;
    config["physics"]["max_timestep"] = 1.0 / 30.0;
    config["physics"]["ground_height"] = 0.0;
    config["physics"]["collision_restitution"] = 0.8;
    config["physics"]["resting_bounce_threshold"] = 0.3;
    config["physics"]["enable_random_perturbation"] = true;

    config["player"]["eye_height"] = 1.8;
    config["player"]["radius"] = 0.3;
    config["player"]["move_speed"] = 5.0;
    config["player"]["jump_velocity"] = 8.0;
    config["player"]["gravity"] = -15.0;
    config["player"]["mass"] = 70.0;
    config["player"]["mouse_sensitivity"] = 0.1;
    config["player"]["spawn_position"] = {0.0, 1.8, 0.0};
    config["player"]["spawn_yaw"] = -90.0;

    config["enemy"]["speed"] = 1.0;
    config["enemy"]["radius"] = 0.5;
    config["enemy"]["height"] = 2.0;
    config["enemy"]["stop_distance"] = 0.5;

    config["gizmo"]["screen_scale"] = 0.1;
    config["gizmo"]["axis_length"] = 1.0;
    config["gizmo"]["ring_radius"] = 0.8;

    return config;
}

void Config::CreateDefault(const std::filesystem::path& filepath) {
    std::error_code ec;
    if (filepath.has_parent_path()) {
        std::filesystem::create_directories(filepath.parent_path(), ec);
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        FREEFLY_LOG_ERROR("Failed to create default config: {}", filepath.string());
        return;
    }
    file << std::setw(4) << DefaultDocument() << std::endl;
    FREEFLY_LOG_INFO("Created default configuration: {}", filepath.string());
}

CameraConfig CameraConfig::FromConfig(const Config& config) {
    CameraConfig c;
    c.fov = config.Get("camera.fov", c.fov);
    c.nearPlane = config.Get("camera.near_plane", c.nearPlane);
    c.farPlane = config.Get("camera.far_plane", c.farPlane);
    c.flySpeed = config.Get("camera.fly_speed", c.flySpeed);
    c.lookSensitivity = config.Get("camera.look_sensitivity", c.lookSensitivity);
    c.defaultPosition = config.Get("camera.default_position", c.defaultPosition);
    c.defaultYaw = config.Get("camera.default_yaw", c.defaultYaw);
    c.defaultPitch = config.Get("camera.default_pitch", c.defaultPitch);
    return c;
}

LoggingConfig LoggingConfig::FromConfig(const Config& config) {
    LoggingConfig c;
    c.level = config.Get<std::string>("logging.level", c.level);
    c.file = config.Get<std::string>("logging.file", c.file);
    c.console = config.Get("logging.console", c.console);
    return c;
}

} // namespace FreeFly
