#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <memory>
#include <string>

namespace Kinetic {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Two loggers share the same sinks: the core logger used by the analysis and
 * blending library, and the application logger used by tools embedding it.
 * Both are created lazily on first use if Initialize() was never called.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                           bool consoleOutput = true);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
     *
     * Unknown names map to info.
     */
    static spdlog::level::level_enum ParseLevel(const std::string& name);

    static std::shared_ptr<spdlog::logger>& GetCoreLogger();
    static std::shared_ptr<spdlog::logger>& GetAppLogger();

private:
    static std::shared_ptr<spdlog::logger> s_coreLogger;
    static std::shared_ptr<spdlog::logger> s_appLogger;
    static std::atomic<bool> s_initialized;
};

} // namespace Kinetic

// Convenience macros for library logging
#define KINETIC_LOG_TRACE(...)    ::Kinetic::Logger::GetCoreLogger()->trace(__VA_ARGS__)
#define KINETIC_LOG_DEBUG(...)    ::Kinetic::Logger::GetCoreLogger()->debug(__VA_ARGS__)
#define KINETIC_LOG_INFO(...)     ::Kinetic::Logger::GetCoreLogger()->info(__VA_ARGS__)
#define KINETIC_LOG_WARN(...)     ::Kinetic::Logger::GetCoreLogger()->warn(__VA_ARGS__)
#define KINETIC_LOG_ERROR(...)    ::Kinetic::Logger::GetCoreLogger()->error(__VA_ARGS__)
#define KINETIC_LOG_CRITICAL(...) ::Kinetic::Logger::GetCoreLogger()->critical(__VA_ARGS__)

// Convenience macros for application logging
#define APP_LOG_TRACE(...)    ::Kinetic::Logger::GetAppLogger()->trace(__VA_ARGS__)
#define APP_LOG_DEBUG(...)    ::Kinetic::Logger::GetAppLogger()->debug(__VA_ARGS__)
#define APP_LOG_INFO(...)     ::Kinetic::Logger::GetAppLogger()->info(__VA_ARGS__)
#define APP_LOG_WARN(...)     ::Kinetic::Logger::GetAppLogger()->warn(__VA_ARGS__)
#define APP_LOG_ERROR(...)    ::Kinetic::Logger::GetAppLogger()->error(__VA_ARGS__)
#define APP_LOG_CRITICAL(...) ::Kinetic::Logger::GetAppLogger()->critical(__VA_ARGS__)
