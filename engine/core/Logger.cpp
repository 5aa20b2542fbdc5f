#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace Vigilant {

std::shared_ptr<spdlog::logger> Logger::s_netLogger;
std::shared_ptr<spdlog::logger> Logger::s_gameLogger;
bool Logger::s_initialized = false;

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    if (s_initialized) {
        return;
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

    s_netLogger = std::make_shared<spdlog::logger>("NET", sinks.begin(), sinks.end());
    s_netLogger->set_level(spdlog::level::info);
    s_netLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_netLogger);

    s_gameLogger = std::make_shared<spdlog::logger>("GAME", sinks.begin(), sinks.end());
    s_gameLogger->set_level(spdlog::level::info);
    s_gameLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_gameLogger);

    spdlog::set_default_logger(s_netLogger);

    s_initialized = true;
}

void Logger::Shutdown() {
    if (!s_initialized) {
        return;
    }

    s_netLogger->flush();
    s_gameLogger->flush();

    spdlog::drop_all();

    s_netLogger.reset();
    s_gameLogger.reset();
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    if (!s_initialized) {
        Initialize();
    }
    s_netLogger->set_level(level);
    s_gameLogger->set_level(level);
}

spdlog::level::level_enum Logger::ParseLevel(const std::string& name) {
    // spdlog maps unknown names to "off"; fall back to info instead
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

std::shared_ptr<spdlog::logger>& Logger::GetNetLogger() {
    if (!s_initialized) {
        Initialize();
    }
    return s_netLogger;
}

std::shared_ptr<spdlog::logger>& Logger::GetGameLogger() {
    if (!s_initialized) {
        Initialize();
    }
    return s_gameLogger;
}

} // namespace Vigilant
