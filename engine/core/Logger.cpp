#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace FreeFly {

std::shared_ptr<spdlog::logger> Logger::s_engineLogger;
std::shared_ptr<spdlog::logger> Logger::s_appLogger;
bool Logger::s_initialized = false;

void Logger::Initialize(const std::string& logFile, bool consoleOutput,
                        spdlog::level::level_enum level) {
    if (s_initialized) {
        return;
    }

    // Drop any console-only fallback created by early log calls
    if (s_engineLogger || s_appLogger) {
        spdlog::drop_all();
        s_engineLogger.reset();
        s_appLogger.reset();
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    if (consoleOutput) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    // File sink
    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 5 * 1024 * 1024, 3);  // 5MB max, 3 files
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    s_engineLogger = std::make_shared<spdlog::logger>("FREEFLY", sinks.begin(), sinks.end());
    s_engineLogger->set_level(level);
    s_engineLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_engineLogger);

    s_appLogger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_appLogger->set_level(level);
    s_appLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_appLogger);

    spdlog::set_default_logger(s_engineLogger);

    s_initialized = true;
}

void Logger::Shutdown() {
    if (!s_initialized) {
        return;
    }

    s_engineLogger->flush();
    s_appLogger->flush();

    spdlog::drop_all();

    s_engineLogger.reset();
    s_appLogger.reset();
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    EnsureFallback();
    s_engineLogger->set_level(level);
    s_appLogger->set_level(level);
}

std::shared_ptr<spdlog::logger>& Logger::GetEngineLogger() {
    EnsureFallback();
    return s_engineLogger;
}

std::shared_ptr<spdlog::logger>& Logger::GetAppLogger() {
    EnsureFallback();
    return s_appLogger;
}

void Logger::EnsureFallback() {
    if (s_engineLogger && s_appLogger) {
        return;
    }

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");

    if (!s_engineLogger) {
        s_engineLogger = std::make_shared<spdlog::logger>("FREEFLY", consoleSink);
        s_engineLogger->set_level(spdlog::level::info);
    }
    if (!s_appLogger) {
        s_appLogger = std::make_shared<spdlog::logger>("APP", consoleSink);
        s_appLogger->set_level(spdlog::level::info);
    }
}

} // namespace FreeFly
