#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <string>

namespace Vigilant {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Two named loggers share the same sinks: "NET" for the protocol and
 * transport code, "GAME" for the tick driver and executables. Both are
 * created on first use if Initialize() has not been called yet.
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
     */
    static spdlog::level::level_enum ParseLevel(const std::string& name);

    /**
     * @brief Get the network logger
     */
    static std::shared_ptr<spdlog::logger>& GetNetLogger();

    /**
     * @brief Get the game logger
     */
    static std::shared_ptr<spdlog::logger>& GetGameLogger();

private:
    static std::shared_ptr<spdlog::logger> s_netLogger;
    static std::shared_ptr<spdlog::logger> s_gameLogger;
    static bool s_initialized;
};

} // namespace Vigilant

// Convenience macros for network logging
#define VIGILANT_LOG_TRACE(...)    ::Vigilant::Logger::GetNetLogger()->trace(__VA_ARGS__)
#define VIGILANT_LOG_DEBUG(...)    ::Vigilant::Logger::GetNetLogger()->debug(__VA_ARGS__)
#define VIGILANT_LOG_INFO(...)     ::Vigilant::Logger::GetNetLogger()->info(__VA_ARGS__)
#define VIGILANT_LOG_WARN(...)     ::Vigilant::Logger::GetNetLogger()->warn(__VA_ARGS__)
#define VIGILANT_LOG_ERROR(...)    ::Vigilant::Logger::GetNetLogger()->error(__VA_ARGS__)
#define VIGILANT_LOG_CRITICAL(...) ::Vigilant::Logger::GetNetLogger()->critical(__VA_ARGS__)

// Convenience macros for game logging
#define GAME_LOG_TRACE(...)    ::Vigilant::Logger::GetGameLogger()->trace(__VA_ARGS__)
#define GAME_LOG_DEBUG(...)    ::Vigilant::Logger::GetGameLogger()->debug(__VA_ARGS__)
#define GAME_LOG_INFO(...)     ::Vigilant::Logger::GetGameLogger()->info(__VA_ARGS__)
#define GAME_LOG_WARN(...)     ::Vigilant::Logger::GetGameLogger()->warn(__VA_ARGS__)
#define GAME_LOG_ERROR(...)    ::Vigilant::Logger::GetGameLogger()->error(__VA_ARGS__)
#define GAME_LOG_CRITICAL(...) ::Vigilant::Logger::GetGameLogger()->critical(__VA_ARGS__)
