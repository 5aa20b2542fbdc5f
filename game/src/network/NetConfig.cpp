#include "NetConfig.hpp"
#include "config/Config.hpp"
#include "core/Logger.hpp"
#include <limits>

namespace Spacewar {

void NetConfig::LoadFrom(const Vigilant::Config& config) {
    const NetConfig defaults;

    int configuredPort = config.Get<int>("net.port", port);
    if (configuredPort >= 0 && configuredPort <= 65535) {
        port = static_cast<uint16_t>(configuredPort);
    } else {
        GAME_LOG_WARN("net.port {} out of range, keeping {}", configuredPort, port);
    }

    int64_t staleness = config.Get<int64_t>("net.staleness_ticks", stalenessTicks);
    if (staleness > 0 && staleness <= std::numeric_limits<uint32_t>::max()) {
        stalenessTicks = static_cast<uint32_t>(staleness);
    } else {
        GAME_LOG_WARN("net.staleness_ticks {} out of range, using {}", staleness, defaults.stalenessTicks);
        stalenessTicks = defaults.stalenessTicks;
    }

    clientTimeoutSeconds = config.Get<double>("net.client_timeout_seconds", clientTimeoutSeconds);

    int64_t pingInterval = config.Get<int64_t>("net.ping_interval_ticks", pingIntervalTicks);
    if (pingInterval >= 0 && pingInterval <= std::numeric_limits<uint32_t>::max()) {
        pingIntervalTicks = static_cast<uint32_t>(pingInterval);
    } else {
        GAME_LOG_WARN("net.ping_interval_ticks {} out of range, disabling periodic pings", pingInterval);
        pingIntervalTicks = 0;
    }

    timeStep = config.Get<double>("net.time_step", timeStep);
    clientMinStep = config.Get<double>("net.client_min_step", clientMinStep);

    logLevel = config.Get<std::string>("log.level", logLevel);
    logFile = config.Get<std::string>("log.file", logFile);
}

void NetConfig::SaveTo(Vigilant::Config& config) const {
    config.Set("net.port", static_cast<int>(port));
    config.Set("net.staleness_ticks", stalenessTicks);
    config.Set("net.client_timeout_seconds", clientTimeoutSeconds);
    config.Set("net.ping_interval_ticks", pingIntervalTicks);
    config.Set("net.time_step", timeStep);
    config.Set("net.client_min_step", clientMinStep);
    config.Set("log.level", logLevel);
    config.Set("log.file", logFile);
}

bool NetConfig::LoadFromFile(const std::string& path) {
    Vigilant::Config config;
    auto loaded = config.Load(path);
    if (!loaded) {
        GAME_LOG_WARN("Could not load {} ({}), using defaults", path,
            Vigilant::ConfigErrorToString(loaded.error()));
        return false;
    }
    LoadFrom(config);
    return true;
}

bool NetConfig::SaveToFile(const std::string& path) const {
    Vigilant::Config config;
    SaveTo(config);
    return config.Save(path).has_value();
}

void NetConfig::ResetToDefaults() {
    *this = NetConfig{};
}

bool NetConfig::Validate(std::string& errorMessage) const {
    if (port == 0) {
        errorMessage = "Server port cannot be 0";
        return false;
    }

    if (stalenessTicks == 0) {
        errorMessage = "Staleness threshold must be at least one tick";
        return false;
    }

    if (clientTimeoutSeconds < 0.0) {
        errorMessage = "Client timeout cannot be negative";
        return false;
    }

    if (timeStep <= 0.0 || timeStep > 1.0) {
        errorMessage = "Time step must be in (0, 1] seconds";
        return false;
    }

    if (clientMinStep <= 0.0 || clientMinStep > 1.0) {
        errorMessage = "Client minimum step must be in (0, 1] seconds";
        return false;
    }

    return true;
}

} // namespace Spacewar
