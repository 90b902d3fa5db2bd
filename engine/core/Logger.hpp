#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace FreeFly {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Owns the engine ("FREEFLY") and application ("APP") loggers. Both share
 * the same sinks: a colour console sink and, optionally, a rotating file.
 * Logging before Initialize() is allowed and goes to a console-only logger.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     * @param level Minimum level for both loggers
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true,
                          spdlog::level::level_enum level = spdlog::level::info);

    /**
     * @brief Flush and drop both loggers
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    [[nodiscard]] static bool IsInitialized() { return s_initialized; }

    /**
     * @brief Get the engine logger
     */
    static std::shared_ptr<spdlog::logger>& GetEngineLogger();

    /**
     * @brief Get the application logger
     */
    static std::shared_ptr<spdlog::logger>& GetAppLogger();

private:
    static void EnsureFallback();

    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_appLogger;
    static bool s_initialized;
};

} // namespace FreeFly

// Convenience macros for engine logging
#define FREEFLY_LOG_TRACE(...)    ::FreeFly::Logger::GetEngineLogger()->trace(__VA_ARGS__)
#define FREEFLY_LOG_DEBUG(...)    ::FreeFly::Logger::GetEngineLogger()->debug(__VA_ARGS__)
#define FREEFLY_LOG_INFO(...)     ::FreeFly::Logger::GetEngineLogger()->info(__VA_ARGS__)
#define FREEFLY_LOG_WARN(...)     ::FreeFly::Logger::GetEngineLogger()->warn(__VA_ARGS__)
#define FREEFLY_LOG_ERROR(...)    ::FreeFly::Logger::GetEngineLogger()->error(__VA_ARGS__)
#define FREEFLY_LOG_CRITICAL(...) ::FreeFly::Logger::GetEngineLogger()->critical(__VA_ARGS__)

// Convenience macros for application logging
#define APP_LOG_TRACE(...)    ::FreeFly::Logger::GetAppLogger()->trace(__VA_ARGS__)
#define APP_LOG_DEBUG(...)    ::FreeFly::Logger::GetAppLogger()->debug(__VA_ARGS__)
#define APP_LOG_INFO(...)     ::FreeFly::Logger::GetAppLogger()->info(__VA_ARGS__)
#define APP_LOG_WARN(...)     ::FreeFly::Logger::GetAppLogger()->warn(__VA_ARGS__)
#define APP_LOG_ERROR(...)    ::FreeFly::Logger::GetAppLogger()->error(__VA_ARGS__)
#define APP_LOG_CRITICAL(...) ::FreeFly::Logger::GetAppLogger()->critical(__VA_ARGS__)
