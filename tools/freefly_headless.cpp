/**
 * @file freefly_headless.cpp
 * @brief Runs a FreeFly scene in play mode without a window
 *
 * Usage:
 *   freefly_headless [scene.json] [options]
 *
 * Options:
 *   --config <file>      Engine configuration (default: freefly.json)
 *   --ticks <count>      Number of play ticks (default: 300)
 *   --dt <seconds>       Time step per tick (default: 0.016)
 *   --seed <value>       Seed the physics perturbation for repeatable runs
 *   --forward            Hold the forward key for the whole run
 *   --jump               Press jump on the first tick
 *   --save <file>        Save the scene after play stops
 *   --verbose            Debug logging
 *   --help               Show this help
 *
 * Without a scene file a small demo scene is built: terrain, a crate, a
 * falling ball and one enemy.
 */

#include "../engine/config/Config.hpp"
#include "../engine/core/Logger.hpp"
#include "../engine/editor/EditorSession.hpp"
#include "../engine/math/Random.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// ============================================================================
// Configuration
// ============================================================================

struct ToolConfig {
    std::string sceneFile;
    std::string configFile = "freefly.json";
    std::string saveFile;
    int ticks = 300;
    float deltaTime = 0.016f;
    std::optional<unsigned int> seed;
    bool forward = false;
    bool jump = false;
    bool verbose = false;
};

void PrintUsage() {
    std::cout << R"(
Usage: freefly_headless [scene.json] [options]

Options:
  --config <file>      Engine configuration (default: freefly.json)
  --ticks <count>      Number of play ticks (default: 300)
  --dt <seconds>       Time step per tick (default: 0.016)
  --seed <value>       Seed the physics perturbation for repeatable runs
  --forward            Hold the forward key for the whole run
  --jump               Press jump on the first tick
  --save <file>        Save the scene after play stops
  --verbose            Debug logging
  --help               Show this help
)";
}

bool ParseArguments(int argc, char* argv[], ToolConfig& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        else if (arg == "--config" && i + 1 < argc) {
            config.configFile = argv[++i];
        }
        else if (arg == "--ticks" && i + 1 < argc) {
            config.ticks = std::atoi(argv[++i]);
        }
        else if (arg == "--dt" && i + 1 < argc) {
            config.deltaTime = static_cast<float>(std::atof(argv[++i]));
        }
        else if (arg == "--seed" && i + 1 < argc) {
            config.seed = static_cast<unsigned int>(std::strtoul(argv[++i], nullptr, 10));
        }
        else if (arg == "--save" && i + 1 < argc) {
            config.saveFile = argv[++i];
        }
        else if (arg == "--forward") {
            config.forward = true;
        }
        else if (arg == "--jump") {
            config.jump = true;
        }
        else if (arg == "--verbose") {
            config.verbose = true;
        }
        else if (!arg.empty() && arg[0] != '-' && config.sceneFile.empty()) {
            config.sceneFile = arg;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }
    return config.ticks >= 0;
}

// ============================================================================
// Demo scene
// ============================================================================

void BuildDemoScene(FreeFly::EditorSession& session) {
    using namespace FreeFly;

    session.CreateTerrain(0.1f, 0.1f);

    const ObjectId crate = session.CreatePrimitive(PrimitiveType::Cube);
    if (SceneObject* object = session.GetScene().Find(crate)) {
        object->transform.position = glm::vec3(0.0f, 1.0f, -4.0f);
        object->physicsKind = PhysicsKind::Static;
    }

    const ObjectId ball = session.CreatePrimitive(PrimitiveType::Sphere);
    if (SceneObject* object = session.GetScene().Find(ball)) {
        object->transform.position = glm::vec3(3.0f, 5.0f, 0.0f);
        object->physicsKind = PhysicsKind::RigidBody;
        object->physicsShape = PhysicsShape::Sphere;
        object->material.baseColor = glm::vec4(0.2f, 0.4f, 1.0f, 1.0f);
    }

    session.CreateEnemy();
    session.ClearSelection();
}

void PrintObjects(const FreeFly::Scene& scene) {
    for (const auto& object : scene.GetObjects()) {
        const glm::vec3& p = object.transform.position;
        APP_LOG_INFO("  [{}] {:<20} ({:.3f}, {:.3f}, {:.3f})", object.id, object.name, p.x, p.y, p.z);
    }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    using namespace FreeFly;

    ToolConfig tool;
    if (!ParseArguments(argc, argv, tool)) {
        PrintUsage();
        return 1;
    }

    Config& config = Config::Instance();
    if (fs::exists(tool.configFile)) {
        if (ConfigError error = config.Load(tool.configFile); error != ConfigError::None) {
            std::cerr << "Failed to load config '" << tool.configFile << "': "
                      << ConfigErrorToString(error) << "\n";
            return 1;
        }
    }

    const LoggingConfig logging = LoggingConfig::FromConfig(config);
    const auto level = tool.verbose ? spdlog::level::debug : spdlog::level::from_str(logging.level);
    Logger::Initialize(logging.file, logging.console, level);

    std::shared_ptr<IRandomSource> random = MakeDefaultRandomSource();
    if (tool.seed) {
        random = std::make_shared<SeededRandomSource>(*tool.seed);
    }

    EditorSession session(EditorSessionConfig::FromConfig(config), random);

    if (tool.sceneFile.empty()) {
        APP_LOG_INFO("No scene given, building demo scene");
        BuildDemoScene(session);
    } else if (auto error = session.LoadScene(tool.sceneFile)) {
        APP_LOG_ERROR("Could not load scene '{}': {}", tool.sceneFile, error->message);
        Logger::Shutdown();
        return 1;
    }

    APP_LOG_INFO("Scene '{}' with {} objects", session.GetScene().GetName(), session.GetScene().GetObjectCount());

    if (auto error = session.StartPlay()) {
        APP_LOG_ERROR("Could not start play mode: {}", error->message);
        Logger::Shutdown();
        return 1;
    }

    for (int tick = 0; tick < tool.ticks; ++tick) {
        FrameInput input;
        input.keyW = tool.forward;
        input.keySpace = tool.jump && tick == 0;
        session.Tick(input, tool.deltaTime);
    }

    const glm::vec3 eye = session.GetCamera().GetPosition();
    APP_LOG_INFO("After {} ticks: player eye at ({:.3f}, {:.3f}, {:.3f}), grounded: {}",
                 tool.ticks, eye.x, eye.y, eye.z, session.GetPlayMode().GetPlayer().IsGrounded());
    PrintObjects(session.GetScene());

    if (auto error = session.StopPlay()) {
        APP_LOG_ERROR("Could not stop play mode: {}", error->message);
        Logger::Shutdown();
        return 1;
    }

    if (!tool.saveFile.empty()) {
        if (auto error = session.SaveScene(tool.saveFile)) {
            APP_LOG_ERROR("Could not save scene '{}': {}", tool.saveFile, error->message);
            Logger::Shutdown();
            return 1;
        }
    }

    Logger::Shutdown();
    return 0;
}
